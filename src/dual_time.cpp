#include "dual_time.hpp"

TimeSelection select_time(const TimeSpec& primary, const TimeSpec* secondary,
                          DualPolicy policy, const ResolveContext& ctx) {
    TimeSelection out;
    out.effective = &primary;
    out.time = resolve_time(primary, ctx);

    if (policy == DualPolicy::None || !secondary) return out;

    auto second = resolve_time(*secondary, ctx);
    if (!second) return out;

    bool take_second = false;
    if (!out.time) {
        take_second = true;
    } else if (policy == DualPolicy::Earlier) {
        take_second = second->instant < out.time->instant;
    } else {
        take_second = second->instant > out.time->instant;
    }

    if (take_second) {
        out.effective = secondary;
        out.is_secondary = true;
        out.time = std::move(second);
    }
    return out;
}

TimeSelection select_time(const Schedule& s, const ResolveContext& ctx) {
    return select_time(s.primary, &s.secondary, s.earlier_later, ctx);
}
