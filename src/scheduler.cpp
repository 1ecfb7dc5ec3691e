#include "scheduler.hpp"
#include "dual_time.hpp"
#include "log.hpp"
#include "time_resolver.hpp"
#include "trigger_compiler.hpp"
#include <optional>
#include <set>

SchedulerEngine::SchedulerEngine(ScheduleStore& store, Options opts, EngineServices svc)
: store_(store), svc_(std::move(svc)), gates_(svc_.hub, svc_.devices),
  dispatcher_(svc_.devices), recovery_(gates_, dispatcher_), options_(std::move(opts)),
  snap_(std::make_shared<Snapshot>()) {
    if (!svc_.clock) svc_.clock = [](){ return std::time(nullptr); };

    svc_.vars.on_rename([this](const std::string& old_name, const std::string& new_name) {
        int n = 0;
        {
            std::lock_guard<std::recursive_mutex> lk(refresh_mx_);
            n = store_.rename_variable(old_name, new_name);
        }
        Log::debug("variable "+old_name+" renamed to "+new_name+", "+std::to_string(n)+" reference(s) updated");
        refresh();
    });
}

std::shared_ptr<const SchedulerEngine::Snapshot> SchedulerEngine::snapshot() const {
    std::lock_guard<std::mutex> lk(snap_mx_);
    return snap_;
}

void SchedulerEngine::set_options(Options opts) {
    {
        std::lock_guard<std::recursive_mutex> lk(refresh_mx_);
        options_ = std::move(opts);
    }
    refresh();
}

// Настройка неполная: триггер не нужен вовсе, в отличие от временной ошибки разрешения.
static std::optional<std::string> config_gap(const Schedule& s) {
    const bool second = s.earlier_later != DualPolicy::None && s.secondary.configured();
    if (s.primary.configured() || second) return std::nullopt;
    if (s.primary.source == TimeSource::Variable) return std::string("no variable selected");
    return std::string("no time selected");
}

int SchedulerEngine::pick_refresh_minute(const std::vector<Device>& devices, int hour) {
    std::set<int> used;
    for (auto& d : devices)
        for (auto& s : d.schedules)
            if (s.cron && !s.pause && s.cron->hour == hour) used.insert(s.cron->minute);

    for (int m=0; m<60; ++m)
        if (!used.count(m)) return m;

    Log::warn("every minute of hour "+std::to_string(hour)+" has a schedule, daily refresh at :00 may collide");
    return 0;
}

void SchedulerEngine::refresh() {
    std::lock_guard<std::recursive_mutex> lk(refresh_mx_);
    const std::time_t now = svc_.clock();

    store_.assign_zones();
    auto snap = std::make_shared<Snapshot>();
    snap->options = options_;
    snap->devices = store_.devices();

    ResolveContext ctx{now, &svc_.solar, &svc_.vars};
    for (auto& dev : snap->devices) {
        for (auto& s : dev.schedules) {
            if (auto gap = config_gap(s)) {
                Log::warn("schedule "+dev.id+"/"+s.id+": "+*gap+", not scheduled");
                s.cron.reset();
                s.effective.reset();
                continue;
            }
            auto sel = select_time(s, ctx);
            if (!sel.time) {
                Log::debug("schedule "+dev.id+"/"+s.id+": time unresolved"
                           +(s.cron ? ", keeping "+s.cron->cron() : std::string()));
                continue;
            }
            s.uses_secondary = sel.is_secondary;
            s.effective = sel.time->wall;

            auto trig = compile_trigger(*sel.time, s.days);
            if (!trig) {
                Log::warn("schedule "+dev.id+"/"+s.id+": no days selected, not scheduled");
                s.cron.reset();
                continue;
            }
            s.cron = trig;
        }
    }
    store_.apply_derived(snap->devices);

    {
        std::lock_guard<std::mutex> slk(snap_mx_);
        snap_ = snap;
    }

    svc_.triggers.cancel_all();
    svc_.vars.unsubscribe_all();
    svc_.vars.clear_all_in_use();

    if (Log::debug_enabled())
        svc_.triggers.after(3600, [](){
            Log::debug("debug logging auto disabled");
            Log::set_debug(false);
        });

    if (snap->options.pause_all) {
        Log::debug("pause is on, nothing scheduled");
        refresh_minute_ = -1;
    } else {
        register_all(*snap);
    }

    if (on_refreshed_) on_refreshed_(snap->devices);
}

void SchedulerEngine::register_all(const Snapshot& snap) {
    const int hour = snap.options.refresh_hour;
    refresh_minute_ = pick_refresh_minute(snap.devices, hour);
    RecurringTrigger daily{refresh_minute_, hour, DaySet::all()};
    svc_.triggers.add(daily, [this](){ refresh(); }, "refresh", true);

    std::set<std::string> subscribed;
    for (auto& dev : snap.devices) {
        for (auto& s : dev.schedules) {
            if (!s.cron || s.pause) continue;
            std::string dev_id = dev.id, sch_id = s.id;
            svc_.triggers.add(*s.cron, [this, dev_id, sch_id](){ fire(dev_id, sch_id); },
                              dev_id+"|"+sch_id, true);
            Log::debug("scheduled "+dev_id+"/"+sch_id+" "+s.cron->cron());

            for (const TimeSpec* t : {&s.primary, &s.secondary}) {
                if (t->source != TimeSource::Variable || t->variable.empty()) continue;
                if (t == &s.secondary && s.earlier_later == DualPolicy::None) continue;
                if (!subscribed.insert(t->variable).second) continue;
                svc_.vars.mark_in_use(t->variable);
                svc_.vars.on_change(t->variable, [this](const std::string& name) {
                    Log::debug("variable "+name+" changed");
                    refresh();
                });
            }
        }
    }
}

bool SchedulerEngine::fire(const std::string& device_id, const std::string& schedule_id) {
    auto snap = snapshot();
    const Device* dev = nullptr;
    const Schedule* sch = nullptr;
    for (auto& d : snap->devices) {
        if (d.id != device_id) continue;
        dev = &d;
        for (auto& s : d.schedules) if (s.id == schedule_id) sch = &s;
    }
    if (!dev || !sch) {
        Log::warn("trigger for unknown schedule "+device_id+"/"+schedule_id);
        return false;
    }

    Gate g = gates_.evaluate(snap->options, *sch, svc_.clock());
    if (g == Gate::GlobalPause) {
        Log::info(GateEvaluator::reason(g));
        return false;
    }
    if (g != Gate::Pass) {
        Log::info("skip "+device_id+"/"+schedule_id+": "+GateEvaluator::reason(g));
        return false;
    }
    return dispatcher_.execute(*dev, *sch, snap->options);
}

int SchedulerEngine::resume_after_restart() {
    auto snap = snapshot();
    return recovery_.run(snap->devices, snap->options, svc_.clock());
}

std::string SchedulerEngine::edit(const std::string& device_id, const std::string& schedule_id,
                                  const std::string& field, const std::string& value) {
    std::string shown;
    {
        std::lock_guard<std::recursive_mutex> lk(refresh_mx_);
        shown = store_.edit(device_id, schedule_id, field, value);
    }
    refresh();
    return shown;
}
