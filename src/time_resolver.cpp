#include "time_resolver.hpp"
#include "log.hpp"

static std::optional<ResolvedTime> resolve_fixed(const TimeSpec& spec, const ResolveContext& ctx) {
    if (!spec.clock_min) return std::nullopt;

    std::tm lt = LocalClock::local_tm(ctx.now);
    std::time_t t = LocalClock::make_local(lt.tm_year+1900, lt.tm_mon+1, lt.tm_mday, *spec.clock_min);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;

    ResolvedTime out;
    out.instant = t;
    out.wall = stamp_from_local(t);
    out.text = format_stamp(out.wall);
    return out;
}

static std::optional<ResolvedTime> resolve_solar(const TimeSpec& spec, const ResolveContext& ctx) {
    if (!ctx.solar) return std::nullopt;
    auto sun = ctx.solar->sunrise_sunset(spec.offset_min, ctx.now);
    if (!sun) {
        Log::warn("no sunrise/sunset data for today");
        return std::nullopt;
    }
    ResolvedTime out;
    out.instant = spec.sunset ? sun->sunset : sun->sunrise;
    out.wall = stamp_from_local(out.instant);
    out.text = format_stamp(out.wall);
    return out;
}

static std::optional<ResolvedTime> resolve_variable(const TimeSpec& spec, const ResolveContext& ctx) {
    if (spec.variable.empty()) return std::nullopt;
    if (!ctx.vars) return std::nullopt;

    auto raw = ctx.vars->get(spec.variable);
    if (!raw) {
        Log::debug("variable "+spec.variable+" not found");
        return std::nullopt;
    }
    auto st = parse_stamp(*raw);
    if (!st) {
        Log::error("variable "+spec.variable+": cannot parse date/time '"+*raw+"'");
        return std::nullopt;
    }

    ResolvedTime out;
    if (spec.offset_min == 0) {
        out.wall = *st;
        out.text = *raw;
    } else {
        out.wall = add_minutes(*st, spec.offset_min);
        out.text = format_stamp(out.wall);
    }
    auto inst = stamp_instant(out.wall, ctx.now);
    if (!inst) {
        Log::error("variable "+spec.variable+": invalid local time '"+out.text+"'");
        return std::nullopt;
    }
    out.instant = *inst;

    // значение в чужом поясе: час/минута и дата берутся по местному времени хоста
    if (out.wall.utc_offset_min && out.wall.has_time) {
        Stamp local = stamp_from_local(out.instant);
        local.has_date = out.wall.has_date;
        out.wall = local;
    }
    return out;
}

std::optional<ResolvedTime> resolve_time(const TimeSpec& spec, const ResolveContext& ctx) {
    switch (spec.source) {
    case TimeSource::Solar:    return resolve_solar(spec, ctx);
    case TimeSource::Variable: return resolve_variable(spec, ctx);
    default:                   return resolve_fixed(spec, ctx);
    }
}
