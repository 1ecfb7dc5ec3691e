#include "gate.hpp"
#include "log.hpp"

GateEvaluator::GateEvaluator(const HubState& hub, DeviceDirectory& devices)
: hub_(hub), devices_(devices) {}

const char* GateEvaluator::reason(Gate g) {
    switch (g) {
    case Gate::GlobalPause:      return "all schedules paused";
    case Gate::Mode:             return "hub mode not allowed";
    case Gate::ActivationSwitch: return "activation switch not in required state";
    case Gate::SchedulePause:    return "schedule paused";
    case Gate::VariableDate:     return "variable date is not today";
    default:                     return "pass";
    }
}

Gate GateEvaluator::evaluate_global(const Options& opts) {
    mark(Gate::GlobalPause);
    if (opts.pause_all) return Gate::GlobalPause;

    mark(Gate::Mode);
    if (opts.mode_gate && !opts.modes.count(hub_.current_mode())) return Gate::Mode;

    mark(Gate::ActivationSwitch);
    if (!opts.activation_switch.empty()) {
        DeviceActions* sw = devices_.find(opts.activation_switch);
        if (!sw) {
            Log::warn("activation switch "+opts.activation_switch+" not found");
            return Gate::ActivationSwitch;
        }
        std::optional<bool> st;
        try { st = sw->current_state(); }
        catch (const std::exception& e) {
            Log::error(std::string("activation switch read failed: ")+e.what());
        }
        if (!st || *st != opts.activation_on) return Gate::ActivationSwitch;
    }
    return Gate::Pass;
}

Gate GateEvaluator::evaluate(const Options& opts, const Schedule& s, std::time_t now) {
    Gate g = evaluate_global(opts);
    if (g != Gate::Pass) return g;

    mark(Gate::SchedulePause);
    if (s.pause) return Gate::SchedulePause;

    mark(Gate::VariableDate);
    if (s.effective_spec().source == TimeSource::Variable && s.effective && s.effective->has_date) {
        if (s.effective->date_key() != LocalClock::date_key(now)) return Gate::VariableDate;
    }
    return Gate::Pass;
}
