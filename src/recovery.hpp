#pragma once
#include "dispatcher.hpp"
#include "gate.hpp"
#include "model.hpp"
#include <ctime>
#include <optional>
#include <utility>
#include <vector>

constexpr int kRestoreLookbackDays = 7;

struct RestoreItem {
    const Device*   device{nullptr};
    const Schedule* schedule{nullptr};
    std::time_t     at{0};
};

// Восстановление состояния устройств после перезапуска
class RecoveryPlanner {
public:
    RecoveryPlanner(GateEvaluator& gates, Dispatcher& dispatcher)
    : gates_(gates), dispatcher_(dispatcher) {}

    // Most recent theoretical firing strictly before `now`, within the lookback window.
    static std::optional<std::time_t> last_firing(const Schedule& s, std::time_t now);

    // Per device: latest candidate wins; a winner with restore=false skips the device.
    static std::vector<RestoreItem> plan(const std::vector<Device>& devices, std::time_t now);

    // Global gates once, then dispatch every planned item. Returns number of restored devices.
    int run(const std::vector<Device>& devices, const Options& opts, std::time_t now);

private:
    GateEvaluator& gates_;
    Dispatcher& dispatcher_;
};
