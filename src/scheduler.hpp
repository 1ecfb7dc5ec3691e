#pragma once
#include "dispatcher.hpp"
#include "gate.hpp"
#include "model.hpp"
#include "recovery.hpp"
#include "schedule_store.hpp"
#include "services.hpp"
#include <ctime>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct EngineServices {
    TriggerService&  triggers;
    SolarProvider&   solar;
    VariableSource&  vars;
    DeviceDirectory& devices;
    const HubState&  hub;
    std::function<std::time_t()> clock;
};

class SchedulerEngine {
public:
    // Неизменяемый снимок, по которому обрабатываются срабатывания
    struct Snapshot {
        Options options;
        std::vector<Device> devices;
    };

    SchedulerEngine(ScheduleStore& store, Options opts, EngineServices svc);

    // Пересчёт всех времён и перерегистрация триггеров
    void refresh();

    // Trigger callback: gates against the current snapshot, then dispatch.
    bool fire(const std::string& device_id, const std::string& schedule_id);

    // Вызвать один раз после старта (boot event)
    int resume_after_restart();

    // Edit command: applies the field and refreshes; returns the display value.
    std::string edit(const std::string& device_id, const std::string& schedule_id,
                     const std::string& field, const std::string& value);

    void set_options(Options opts);
    void on_refreshed(std::function<void(const std::vector<Device>&)> cb) { on_refreshed_ = std::move(cb); }

    std::shared_ptr<const Snapshot> snapshot() const;
    int refresh_minute() const { return refresh_minute_; }
    GateEvaluator& gates() { return gates_; }

    // First minute of `hour` not used by any compiled trigger, 0 if the hour is full.
    static int pick_refresh_minute(const std::vector<Device>& devices, int hour);

private:
    void register_all(const Snapshot& snap);

    ScheduleStore& store_;
    EngineServices svc_;
    GateEvaluator gates_;
    Dispatcher dispatcher_;
    RecoveryPlanner recovery_;

    Options options_;
    std::shared_ptr<const Snapshot> snap_;
    mutable std::mutex snap_mx_;
    std::recursive_mutex refresh_mx_;
    int refresh_minute_{-1};
    std::function<void(const std::vector<Device>&)> on_refreshed_;
};
