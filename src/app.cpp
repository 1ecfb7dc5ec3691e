#include "app.hpp"
#include "cron_timer.hpp"
#include "loader.hpp"
#include "log.hpp"
#include "modbus_device.hpp"
#include "scheduler.hpp"
#include "solar_calc.hpp"
#include "variables.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <thread>

static std::atomic_bool g_stop{false};
static void on_signal(int){ g_stop = true; }

bool App::try_connect() {
    while (!g_stop) {
        try {
            mb_.connect_to(cfg_.ip, cfg_.port, cfg_.unit_id);
            Log::info("Connected to "+cfg_.ip+":"+std::to_string(cfg_.port)+" uid="+std::to_string((int)cfg_.unit_id));
            return true;
        } catch (const std::exception& e) {
            Log::warn(std::string("Connect failed: ")+e.what()+", retry in 1s...");
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }
    return false;
}

// Сохранённые правки имеют приоритет над [Schedule] из конфига
ScheduleStore App::load_store() const {
    const std::string& path = cfg_.options.state_file;
    if (path.empty() || !std::ifstream(path)) return ScheduleStore(cfg_.devices);

    try {
        ScheduleStore store(load_state_ini(path));
        std::vector<DeviceInfo> infos;
        for (auto& d : cfg_.devices) infos.push_back(DeviceInfo{d.id, d.name, d.supported});
        store.select_devices(infos);
        Log::info("[INIT] schedules loaded from "+path);
        return store;
    } catch (const std::exception& e) {
        Log::warn("state file "+path+" ignored: "+e.what());
        return ScheduleStore(cfg_.devices);
    }
}

int App::run_with_config(Config cfg) {
    cfg_ = std::move(cfg);
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    Log::set_debug(cfg_.options.log_enable);

    ScheduleStore store = load_store();
    ModbusDirectory devices(cfg_.bindings, mb_);
    CronTimer timer;
    SolarCalc solar(cfg_.location.latitude, cfg_.location.longitude);
    VariableStore vars;
    for (auto& [name, value] : cfg_.variables) vars.set(name, value);
    HubMode hub(cfg_.mode);

    SchedulerEngine eng(store, cfg_.options,
                        EngineServices{timer, solar, vars, devices, hub, [](){ return std::time(nullptr); }});

    const std::string state_file = cfg_.options.state_file;
    if (!state_file.empty()) {
        eng.on_refreshed([state_file](const std::vector<Device>& devs) {
            try { save_state_ini(state_file, devs); }
            catch (const std::exception& e) { Log::error(std::string("save state: ")+e.what()); }
        });
    }

    if (!try_connect()) return 0;
    eng.refresh();
    eng.resume_after_restart();
    if (cfg_.options.pause_all) Log::info("[INIT] pause is on, triggers not registered");

    while(!g_stop) {
        timer.tick(std::time(nullptr));
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    Log::info("Stopping...");
    return 0;
}

int App::run(int argc, char** argv) {
    try {
        std::string cfg_path = (argc>1)? argv[1] : "config/config.ini";
        Config loaded = load_config_ini(cfg_path);
        return run_with_config(std::move(loaded));
    } catch (const std::exception& e) {
        Log::error(std::string("Fatal: ")+e.what());
        return 1;
    }
}
