#include "trigger_compiler.hpp"

std::optional<RecurringTrigger> compile_trigger(const Stamp& wall, DaySet days) {
    if (days.empty()) return std::nullopt;

    RecurringTrigger t;
    t.hour   = wall.has_time ? wall.hour   : 0;
    t.minute = wall.has_time ? wall.minute : 0;
    t.days   = days;
    return t;
}

std::optional<RecurringTrigger> compile_trigger(const ResolvedTime& t, DaySet days) {
    return compile_trigger(t.wall, days);
}
