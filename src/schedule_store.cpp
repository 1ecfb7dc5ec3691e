#include "schedule_store.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <random>
#include <sstream>
#include <stdexcept>

const std::vector<std::string> kScheduleFields{
    "days", "time", "sun_time", "sunset", "offset", "use_variable", "variable",
    "earlier_later", "sec_time", "sec_sun_time", "sec_sunset", "sec_offset",
    "sec_use_variable", "sec_variable", "pause", "restore", "state", "level",
    "button", "button_action"
};

static inline std::string trim(std::string s) {
    auto issp = [](unsigned char c){ return std::isspace(c); };
    while(!s.empty() && issp(s.front())) s.erase(s.begin());
    while(!s.empty() && issp(s.back()))  s.pop_back();
    return s;
}

static bool to_bool(const std::string& field, const std::string& v0) {
    std::string v = v0; std::transform(v.begin(), v.end(), v.begin(), ::tolower);
    if (v=="1"||v=="true"||v=="yes"||v=="y"||v=="on")  return true;
    if (v=="0"||v=="false"||v=="no"||v=="n"||v=="off") return false;
    throw std::runtime_error("Bad boolean for "+field+": "+v0);
}

static int to_int(const std::string& field, const std::string& v, int lo, int hi) {
    int out = 0; int n = 0;
    if (std::sscanf(v.c_str(), "%d%n", &out, &n) != 1 || n != (int)v.size())
        throw std::runtime_error("Bad number for "+field+": "+v);
    if (out<lo || out>hi)
        throw std::runtime_error(field+" out of range: "+v);
    return out;
}

// "sun".."sat" -> 0..6, иначе -1
static int weekday_field(const std::string& f) {
    for (int d=0; d<7; ++d) {
        const char* n = wday_name(d);
        if (f.size()==3 && std::tolower((unsigned char)n[0])==f[0]
            && std::tolower((unsigned char)n[1])==f[1] && std::tolower((unsigned char)n[2])==f[2])
            return d;
    }
    return -1;
}

static const char* bool_str(bool b) { return b ? "true" : "false"; }

static std::string clock_str(const std::optional<int>& m) {
    if (!m) return "";
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", *m/60, *m%60);
    return buf;
}

// Поле TimeSpec без префикса "sec_"; false если поле не относится к времени
static bool apply_time_field(TimeSpec& t, const std::string& f, const std::string& v) {
    if (f=="time") {
        if (v.empty()) t.clock_min.reset();
        else           t.clock_min = LocalClock::hhmm_to_min(v);
    } else if (f=="sun_time") {
        if (to_bool(f, v))                         t.source = TimeSource::Solar;
        else if (t.source == TimeSource::Solar)    t.source = TimeSource::Fixed;
    } else if (f=="sunset") {
        t.sunset = to_bool(f, v);
    } else if (f=="offset") {
        t.offset_min = to_int(f, v, -1000, 1000);
    } else if (f=="use_variable") {
        if (to_bool(f, v))                         t.source = TimeSource::Variable;
        else if (t.source == TimeSource::Variable) t.source = TimeSource::Fixed;
    } else if (f=="variable") {
        if (v.find_first_of(";=") != std::string::npos)
            throw std::runtime_error("Bad variable name: "+v);
        t.variable = v;
    } else {
        return false;
    }
    return true;
}

static std::optional<std::string> time_field_value(const TimeSpec& t, const std::string& f) {
    if (f=="time")         return clock_str(t.clock_min);
    if (f=="sun_time")     return std::string(bool_str(t.source == TimeSource::Solar));
    if (f=="sunset")       return std::string(bool_str(t.sunset));
    if (f=="offset")       return std::to_string(t.offset_min);
    if (f=="use_variable") return std::string(bool_str(t.source == TimeSource::Variable));
    if (f=="variable")     return t.variable;
    return std::nullopt;
}

void apply_field(Schedule& s, const std::string& field, const std::string& value0) {
    const std::string value = trim(value0);

    int wd = weekday_field(field);
    if (wd >= 0) { s.days.set(wd, to_bool(field, value)); return; }
    if (field.rfind("sec_", 0) == 0) {
        if (apply_time_field(s.secondary, field.substr(4), value)) return;
        throw std::runtime_error("Unknown field: "+field);
    }
    if (apply_time_field(s.primary, field, value)) return;

    if (field=="days") {
        DaySet d;
        std::stringstream ss(value); std::string it;
        while (std::getline(ss, it, ',')) {
            it = trim(it);
            if (!it.empty()) d.set(day_to_wday(it), true);
        }
        s.days = d;
    } else if (field=="earlier_later") {
        auto p = parse_dual_policy(value);
        if (!p) throw std::runtime_error("Bad earlier_later: "+value);
        s.earlier_later = *p;
    } else if (field=="pause") {
        s.pause = to_bool(field, value);
    } else if (field=="restore") {
        s.restore = to_bool(field, value);
    } else if (field=="state") {
        if (value=="on")       s.desired_on = true;
        else if (value=="off") s.desired_on = false;
        else throw std::runtime_error("Bad state: "+value);
    } else if (field=="level") {
        s.desired_level = to_int(field, value, 0, 100);
    } else if (field=="button") {
        if (value.empty()) s.button_number.reset();
        else               s.button_number = to_int(field, value, 0, 255);
    } else if (field=="button_action") {
        if (value.empty()) { s.button_action.reset(); return; }
        auto a = parse_button_action(value);
        if (!a) throw std::runtime_error("Bad button_action: "+value);
        s.button_action = *a;
    } else {
        throw std::runtime_error("Unknown field: "+field);
    }
}

std::string field_value(const Schedule& s, const std::string& field) {
    if (field.rfind("sec_", 0) == 0) {
        if (auto v = time_field_value(s.secondary, field.substr(4))) return *v;
        throw std::runtime_error("Unknown field: "+field);
    }
    if (auto v = time_field_value(s.primary, field)) return *v;

    if (field=="days")          return s.days.to_string();
    if (field=="earlier_later") return to_string(s.earlier_later);
    if (field=="pause")         return bool_str(s.pause);
    if (field=="restore")       return bool_str(s.restore);
    if (field=="state")         return s.desired_on ? "on" : "off";
    if (field=="level")         return std::to_string(s.desired_level);
    if (field=="button")        return s.button_number ? std::to_string(*s.button_number) : "";
    if (field=="button_action") return s.button_action ? to_string(*s.button_action) : "";
    int wd = weekday_field(field);
    if (wd >= 0) return bool_str(s.days.has(wd));
    throw std::runtime_error("Unknown field: "+field);
}

bool ensure_secondary_time_config(Schedule& s, bool had_secondary_keys) {
    bool changed = false;
    if (!had_secondary_keys) {
        s.secondary = TimeSpec{};
        changed = true;
    }
    const TimeSpec& sec = s.secondary;
    bool undefined = (sec.source == TimeSource::Fixed && !sec.clock_min)
                  || (sec.source == TimeSource::Variable && sec.variable.empty());
    if (s.earlier_later != DualPolicy::None && undefined) {
        Log::warn("schedule "+s.id+": earlier/later set without a second time, disabled");
        s.earlier_later = DualPolicy::None;
        changed = true;
    }
    return changed;
}

// ---------------------------------------------------------------------------

ScheduleStore::ScheduleStore(std::vector<Device> devices) {
    for (auto& d : devices) add_device(std::move(d));
}

Device* ScheduleStore::find_device(const std::string& id) {
    for (auto& d : devices_) if (d.id == id) return &d;
    return nullptr;
}

const Device* ScheduleStore::find_device(const std::string& id) const {
    for (auto& d : devices_) if (d.id == id) return &d;
    return nullptr;
}

Schedule* ScheduleStore::find_schedule(const std::string& device_id, const std::string& schedule_id) {
    Device* d = find_device(device_id);
    if (!d) return nullptr;
    for (auto& s : d->schedules) if (s.id == schedule_id) return &s;
    return nullptr;
}

const Schedule* ScheduleStore::find_schedule(const std::string& device_id, const std::string& schedule_id) const {
    const Device* d = find_device(device_id);
    if (!d) return nullptr;
    for (auto& s : d->schedules) if (s.id == schedule_id) return &s;
    return nullptr;
}

Device& ScheduleStore::device_or_throw(const std::string& id) {
    Device* d = find_device(id);
    if (!d) throw std::runtime_error("Unknown device: "+id);
    return *d;
}

Schedule ScheduleStore::default_schedule() {
    Schedule s;
    s.id = new_id();
    return s;
}

std::string ScheduleStore::new_id() {
    static std::mt19937_64 rng{std::random_device{}()};
    uint64_t a = rng(), b = rng();
    // UUID v4
    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  (unsigned)(a>>32), (unsigned)((a>>16)&0xFFFF), (unsigned)(a&0xFFFF),
                  (unsigned)(b>>48), (unsigned long long)(b & 0xFFFFFFFFFFFFULL));
    return buf;
}

Device& ScheduleStore::add_device(Device d) {
    if (d.id.empty()) throw std::runtime_error("device without id");
    if (find_device(d.id)) throw std::runtime_error("duplicate device: "+d.id);
    if (d.supported.empty()) d.supported.push_back(d.capability);
    if (std::find(d.supported.begin(), d.supported.end(), d.capability) == d.supported.end())
        d.capability = d.supported.front();

    std::vector<Schedule> unique;
    for (auto& s : d.schedules) {
        if (s.id.empty()) s.id = new_id();
        bool dup = std::any_of(unique.begin(), unique.end(),
                               [&](const Schedule& u){ return u.id == s.id; });
        if (dup) throw std::runtime_error("duplicate schedule "+s.id+" for device "+d.id);
        unique.push_back(std::move(s));
    }
    d.schedules = std::move(unique);
    if (d.schedules.empty()) d.schedules.push_back(default_schedule());

    devices_.push_back(std::move(d));
    return devices_.back();
}

void ScheduleStore::remove_device(const std::string& id) {
    devices_.erase(std::remove_if(devices_.begin(), devices_.end(),
                                  [&](const Device& d){ return d.id == id; }),
                   devices_.end());
}

void ScheduleStore::select_devices(const std::vector<DeviceInfo>& selected) {
    std::vector<std::string> gone;
    for (auto& d : devices_) {
        bool keep = std::any_of(selected.begin(), selected.end(),
                                [&](const DeviceInfo& i){ return i.id == d.id; });
        if (!keep) gone.push_back(d.id);
    }
    for (auto& id : gone) {
        Log::debug("device "+id+" deselected, removing its schedules");
        remove_device(id);
    }

    for (auto& info : selected) {
        Device* d = find_device(info.id);
        if (d) {
            d->name = info.name;
            d->supported = info.supported.empty() ? std::vector<Capability>{Capability::Switch} : info.supported;
            if (std::find(d->supported.begin(), d->supported.end(), d->capability) == d->supported.end())
                d->capability = d->supported.front();
            continue;
        }
        Device nd;
        nd.id = info.id;
        nd.name = info.name;
        nd.supported = info.supported;
        nd.capability = info.supported.empty() ? Capability::Switch : info.supported.front();
        add_device(std::move(nd));
    }
}

Schedule& ScheduleStore::add_run(const std::string& device_id) {
    Device& d = device_or_throw(device_id);
    d.schedules.push_back(default_schedule());
    return d.schedules.back();
}

void ScheduleStore::remove_run(const std::string& device_id, const std::string& schedule_id) {
    Device& d = device_or_throw(device_id);
    auto it = std::find_if(d.schedules.begin(), d.schedules.end(),
                           [&](const Schedule& s){ return s.id == schedule_id; });
    if (it == d.schedules.end())
        throw std::runtime_error("Unknown schedule "+schedule_id+" for device "+device_id);
    d.schedules.erase(it);
    if (d.schedules.empty()) d.schedules.push_back(default_schedule());
}

void ScheduleStore::set_capability(const std::string& device_id, Capability cap) {
    Device& d = device_or_throw(device_id);
    if (std::find(d.supported.begin(), d.supported.end(), cap) == d.supported.end())
        throw std::runtime_error(std::string("Device ")+device_id+" does not support "+to_string(cap));
    d.capability = cap;
}

std::string ScheduleStore::edit(const std::string& device_id, const std::string& schedule_id,
                                const std::string& field, const std::string& value) {
    Schedule* s = find_schedule(device_id, schedule_id);
    if (!s) throw std::runtime_error("Unknown schedule "+schedule_id+" for device "+device_id);
    apply_field(*s, field, value);
    return field_value(*s, field);
}

int ScheduleStore::rename_variable(const std::string& old_name, const std::string& new_name) {
    int n = 0;
    for (auto& d : devices_) {
        for (auto& s : d.schedules) {
            if (s.primary.variable == old_name)   { s.primary.variable = new_name; ++n; }
            if (s.secondary.variable == old_name) { s.secondary.variable = new_name; ++n; }
        }
    }
    return n;
}

void ScheduleStore::assign_zones() {
    std::vector<Device*> order;
    for (auto& d : devices_) order.push_back(&d);
    auto key = [](const Device* d) {
        std::string k = d->name.empty() ? d->id : d->name;
        std::transform(k.begin(), k.end(), k.begin(), ::tolower);
        return k;
    };
    std::stable_sort(order.begin(), order.end(),
                     [&](const Device* a, const Device* b){ return key(a) < key(b); });
    for (size_t i=0; i<order.size(); ++i) order[i]->zone = (int)i + 1;
}

void ScheduleStore::apply_derived(const std::vector<Device>& computed) {
    for (auto& cd : computed) {
        for (auto& cs : cd.schedules) {
            Schedule* s = find_schedule(cd.id, cs.id);
            if (!s) continue;               // удалено во время пересчёта
            s->cron = cs.cron;
            s->uses_secondary = cs.uses_secondary;
            s->effective = cs.effective;
        }
    }
}
