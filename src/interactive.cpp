#include "interactive.hpp"
#include "loader.hpp"
#include "schedule_store.hpp"
#include <iostream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <stdexcept>

static std::string ask_str(const std::string& prompt, const std::string& def="") {
    std::string s;
    std::cout << prompt;
    if (!def.empty()) std::cout << " [" << def << "]";
    std::cout << ": ";
    if (!std::getline(std::cin, s)) throw std::runtime_error("Input closed.");
    if (s.empty()) s = def;
    return s;
}
static int ask_int(const std::string& prompt, int def) {
    for (;;) {
        std::string s = ask_str(prompt, std::to_string(def));
        try { return std::stoi(s); }
        catch (const std::exception&) { std::cout << "Enter a number.\n"; }
    }
}
static double ask_double(const std::string& prompt, double def) {
    for (;;) {
        std::ostringstream d; d << def;
        std::string s = ask_str(prompt, d.str());
        try { return std::stod(s); }
        catch (const std::exception&) { std::cout << "Enter a number.\n"; }
    }
}
static bool ask_yesno(const std::string& prompt, bool def) {
    for(;;){
        std::string s = ask_str(prompt, def? "y":"n");
        std::transform(s.begin(), s.end(), s.begin(), ::tolower);
        if (s.empty()) return def;
        if (s=="y"||s=="yes") return true;
        if (s=="n"||s=="no")  return false;
        std::cout<<"Enter y/n.\n";
    }
}
static void trim(std::string& s){
    auto issp=[](unsigned char c){return std::isspace(c);};
    while(!s.empty() && issp(s.front())) s.erase(s.begin());
    while(!s.empty() && issp(s.back()))  s.pop_back();
}
static std::vector<std::string> split_csv(const std::string& s){
    std::vector<std::string> out; std::stringstream ss(s); std::string it;
    while(std::getline(ss, it, ',')){ trim(it); if(!it.empty()) out.push_back(it); }
    return out;
}
static std::optional<uint16_t> ask_reg(const std::string& prompt) {
    int v = ask_int(prompt+" (-1 to skip)", -1);
    if (v < 0 || v > 65535) return std::nullopt;
    return (uint16_t)v;
}

static void print_schedule(const Schedule& s) {
    std::cout << "  [" << s.id << "]";
    for (auto& f : kScheduleFields) {
        auto v = field_value(s, f);
        if (!v.empty()) std::cout << " " << f << "=" << v;
    }
    std::cout << "\n";
}

// Правка одного расписания командами field=value
static void edit_schedule(ScheduleStore& store, const std::string& dev_id, const std::string& sch_id) {
    std::cout << "Fields: sun..sat, days, time, sun_time, sunset, offset, use_variable, variable,\n"
                 "        earlier_later, sec_*, pause, restore, state, level, button, button_action\n";
    for (;;) {
        print_schedule(*store.find_schedule(dev_id, sch_id));
        std::string cmd = ask_str("field=value (empty to finish)");
        trim(cmd);
        if (cmd.empty()) break;
        auto eq = cmd.find('=');
        if (eq == std::string::npos) { std::cout << "Expected field=value.\n"; continue; }
        std::string f = cmd.substr(0, eq), v = cmd.substr(eq+1);
        trim(f); trim(v);
        try {
            std::cout << "  " << f << " -> " << store.edit(dev_id, sch_id, f, v) << "\n";
        } catch (const std::runtime_error& e) {
            std::cout << e.what() << "\n";
        }
    }
}

Config build_config_interactive() {
    Config cfg;

    // PLC
    cfg.ip      = ask_str("PLC IP", "127.0.0.1");
    cfg.port    = (uint16_t)ask_int("PLC port", 1502);
    cfg.unit_id = (uint8_t) ask_int("PLC unit_id", 1);

    std::cout << "\n=== Location (for sunrise/sunset) ===\n";
    cfg.location.latitude  = std::clamp(ask_double("latitude",  0.0), -90.0, 90.0);
    cfg.location.longitude = std::clamp(ask_double("longitude", 0.0), -180.0, 180.0);
    cfg.mode = ask_str("Hub mode", "Home");

    // Devices
    std::cout << "\n=== Devices ===\n";
    std::vector<DeviceInfo> infos;
    for (;;) {
        std::string id = ask_str("Device id (empty to finish)");
        if (id.empty()) break;
        if (cfg.bindings.count(id)) { std::cout << "Duplicate id.\n"; continue; }

        DeviceInfo info;
        info.id = id;
        info.name = ask_str("name", id);
        if (info.name.find(';') != std::string::npos) { std::cout << "Name must not contain ';'.\n"; continue; }

        info.supported.clear();
        for (auto& c : split_csv(ask_str("capabilities (switch,dimmer,button)", "switch"))) {
            auto pc = parse_capability(c);
            if (pc) info.supported.push_back(*pc);
            else    std::cout << "Ignoring unknown capability " << c << "\n";
        }
        if (info.supported.empty()) info.supported.push_back(Capability::Switch);

        DeviceBinding b;
        b.coil = ask_reg("coil offset (0-based)");
        if (std::count(info.supported.begin(), info.supported.end(), Capability::Dimmer))
            b.level_reg = ask_reg("level holding register");
        if (std::count(info.supported.begin(), info.supported.end(), Capability::Button)) {
            b.button_reg = ask_reg("button holding register (number, action at +1)");
            for (auto& a : split_csv(ask_str("button actions", "push,hold"))) {
                auto pa = parse_button_action(a);
                if (pa) b.buttons.push_back(*pa);
            }
        }
        cfg.bindings[id] = b;
        infos.push_back(info);
    }
    if (infos.empty())
        throw std::runtime_error("At least one device is required.");

    // Schedules
    ScheduleStore store;
    store.select_devices(infos);
    std::cout << "\n=== Schedules ===\n";
    for (auto& info : infos) {
        std::cout << "\n-- " << info.name << " (" << info.id << ") --\n";
        if (info.supported.size() > 1) {
            std::string cap = ask_str("capability to use", to_string(info.supported.front()));
            auto pc = parse_capability(cap);
            try {
                if (pc) store.set_capability(info.id, *pc);
            } catch (const std::runtime_error& e) {
                std::cout << e.what() << "\n";
            }
        }
        std::string first = store.find_device(info.id)->schedules.front().id;
        edit_schedule(store, info.id, first);
        while (ask_yesno("Add another schedule?", false)) {
            std::string sid = store.add_run(info.id).id;
            edit_schedule(store, info.id, sid);
        }
    }

    // Options
    std::cout << "\n=== Options ===\n";
    Options& o = cfg.options;
    o.mode_gate = ask_yesno("Restrict to hub modes?", false);
    if (o.mode_gate)
        for (auto& m : split_csv(ask_str("allowed modes", cfg.mode))) o.modes.insert(m);
    o.activation_switch = ask_str("activation switch device id (empty = none)");
    if (!o.activation_switch.empty()) {
        if (!cfg.bindings.count(o.activation_switch)) throw std::runtime_error("Unknown activation switch.");
        o.activation_on = ask_yesno("run only when it is on?", true);
    }
    o.on_before_level = ask_yesno("Turn dimmers on before setting level?", false);
    o.log_enable = ask_yesno("Debug logging (auto off after 60 min)?", true);

    store.assign_zones();
    cfg.devices = store.devices();

    // Summary
    std::cout << "\n=== SUMMARY ===\n";
    std::cout << "PLC " << cfg.ip << ":" << cfg.port << " uid=" << (int)cfg.unit_id << "\n";
    std::cout << "Location " << cfg.location.latitude << "," << cfg.location.longitude
              << " mode=" << cfg.mode << "\n";
    for (auto& d : cfg.devices) {
        std::cout << d.zone << ". " << d.name << " (" << d.id << ") " << to_string(d.capability)
                  << " schedules=" << d.schedules.size() << "\n";
        for (auto& s : d.schedules) print_schedule(s);
    }

    if (ask_yesno("Save to file?", true)) {
        std::string path = ask_str("path", "config/config.ini");
        save_config_ini(path, cfg);
        std::cout << "Saved " << path << "\n";
    }
    if (!ask_yesno("Start with these settings?", true))
        throw std::runtime_error("Cancelled by user.");

    return cfg;
}
