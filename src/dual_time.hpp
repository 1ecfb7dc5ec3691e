#pragma once
#include "model.hpp"
#include "time_resolver.hpp"
#include <optional>

struct TimeSelection {
    const TimeSpec* effective{nullptr};
    bool is_secondary{false};
    std::optional<ResolvedTime> time;     // разрешённое время выбранной стороны
};

// policy None or no secondary -> primary. Otherwise the earlier/later of the two
// resolved instants; an unresolved side loses, ties go to primary.
TimeSelection select_time(const TimeSpec& primary, const TimeSpec* secondary,
                          DualPolicy policy, const ResolveContext& ctx);

TimeSelection select_time(const Schedule& s, const ResolveContext& ctx);
