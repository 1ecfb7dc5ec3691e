#include "recovery.hpp"
#include "log.hpp"

std::optional<std::time_t> RecoveryPlanner::last_firing(const Schedule& s, std::time_t now) {
    const std::time_t window_start = now - kRestoreLookbackDays*24*3600;

    if (s.effective_spec().source == TimeSource::Variable && s.effective && s.effective->has_date) {
        auto at = stamp_instant(*s.effective, now);
        if (!at) return std::nullopt;
        int today = LocalClock::date_key(now);
        int date  = s.effective->date_key();
        if (date > today) return std::nullopt;
        if (date == today) return (*at < now) ? at : std::nullopt;
        return (*at >= window_start) ? at : std::nullopt;
    }

    if (!s.cron) return std::nullopt;

    std::tm lt = LocalClock::local_tm(now);
    long long today = days_from_civil(lt.tm_year+1900, lt.tm_mon+1, lt.tm_mday);
    int today_wday = lt.tm_wday;
    int min_of_day = s.cron->hour*60 + s.cron->minute;

    // от сегодняшнего дня назад: первое найденное и есть самое позднее
    for (int k=0; k<=kRestoreLookbackDays; ++k) {
        int wday = ((today_wday - k) % 7 + 7) % 7;
        if (!s.cron->days.has(wday)) continue;
        int y,m,d; civil_from_days(today - k, y, m, d);
        std::time_t at = LocalClock::make_local(y, m, d, min_of_day);
        if (at >= now) continue;
        if (at < window_start) break;
        return at;
    }
    return std::nullopt;
}

std::vector<RestoreItem> RecoveryPlanner::plan(const std::vector<Device>& devices, std::time_t now) {
    std::vector<RestoreItem> out;
    for (auto& dev : devices) {
        if (dev.capability == Capability::Button) continue;

        const Schedule* best = nullptr;
        std::time_t best_at = 0;
        for (auto& s : dev.schedules) {
            if (s.pause) continue;
            auto at = last_firing(s, now);
            if (!at) continue;
            if (!best || *at > best_at) { best = &s; best_at = *at; }
        }
        if (!best) continue;
        if (!best->restore) {
            Log::debug("restore: "+dev.id+" latest schedule "+best->id+" has restore disabled, skipping device");
            continue;
        }
        out.push_back({&dev, best, best_at});
    }
    return out;
}

int RecoveryPlanner::run(const std::vector<Device>& devices, const Options& opts, std::time_t now) {
    Gate g = gates_.evaluate_global(opts);
    if (g != Gate::Pass) {
        Log::info(std::string("[INIT] restore skipped: ")+GateEvaluator::reason(g));
        return 0;
    }

    int restored = 0;
    for (auto& item : plan(devices, now)) {
        try {
            Log::info("[INIT] restore "+item.device->id+" from schedule "+item.schedule->id);
            if (dispatcher_.execute(*item.device, *item.schedule, opts)) ++restored;
        } catch (const std::exception& e) {
            Log::error("restore of "+item.device->id+" failed: "+e.what());
        }
    }
    return restored;
}
