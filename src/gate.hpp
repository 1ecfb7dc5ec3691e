#pragma once
#include "model.hpp"
#include "services.hpp"
#include <ctime>
#include <functional>

// Порядок проверок фиксирован: первое сработавшее условие и есть причина пропуска.
enum class Gate { Pass, GlobalPause, Mode, ActivationSwitch, SchedulePause, VariableDate };

class GateEvaluator {
public:
    GateEvaluator(const HubState& hub, DeviceDirectory& devices);

    // Called with each gate right before it is checked (tests use it to observe order).
    void set_trace(std::function<void(Gate)> trace) { trace_ = std::move(trace); }

    // Глобальные условия: pause, режим хаба, выключатель активации
    Gate evaluate_global(const Options& opts);
    Gate evaluate(const Options& opts, const Schedule& s, std::time_t now);

    static const char* reason(Gate g);

private:
    void mark(Gate g) { if (trace_) trace_(g); }

    const HubState& hub_;
    DeviceDirectory& devices_;
    std::function<void(Gate)> trace_;
};
