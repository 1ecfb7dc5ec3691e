#include "loader.hpp"
#include "ini.hpp"
#include "log.hpp"
#include "schedule_store.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

static inline std::string trim(std::string s) {
    auto issp = [](unsigned char c){ return std::isspace(c); };
    while(!s.empty() && issp(s.front())) s.erase(s.begin());
    while(!s.empty() && issp(s.back()))  s.pop_back();
    return s;
}
static inline std::vector<std::string> split(const std::string& s, char d) {
    std::vector<std::string> out; std::stringstream ss(s); std::string it;
    while (std::getline(ss,it,d)) out.push_back(it);
    return out;
}
static inline bool ieq(const std::string& a, const std::string& b) {
    if (a.size()!=b.size()) return false;
    for (size_t i=0;i<a.size();++i)
        if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i]))
            return false;
    return true;
}
static bool to_bool(const std::string& v) {
    if (v=="1" || ieq(v,"true") || ieq(v,"yes") || ieq(v,"on"))   return true;
    if (v=="0" || ieq(v,"false") || ieq(v,"no") || ieq(v,"off"))  return false;
    throw std::runtime_error("Bad boolean: "+v);
}
static int to_int(const std::string& s, int lo, int hi) {
    size_t pos = 0;
    int v = 0;
    try { v = std::stoi(s, &pos); }
    catch (const std::exception&) { throw std::runtime_error("Bad number: "+s); }
    if (pos != s.size()) throw std::runtime_error("Bad number: "+s);
    if (v<lo || v>hi) throw std::runtime_error("Number out of range: "+s);
    return v;
}
static uint16_t to_u16(const std::string& s) { return (uint16_t)to_int(s, 0, 65535); }

static double to_double(const std::string& s, double lo, double hi) {
    size_t pos = 0;
    double v = 0;
    try { v = std::stod(s, &pos); }
    catch (const std::exception&) { throw std::runtime_error("Bad number: "+s); }
    if (pos != s.size() || v<lo || v>hi) throw std::runtime_error("Bad coordinate: "+s);
    return v;
}

// "k=v;k=v" -> упорядоченные пары
static IniLines parse_pairs(const std::string& line) {
    IniLines out;
    for (auto& p : split(line, ';')) {
        auto t = trim(p);
        if (t.empty()) continue;
        auto eq = t.find('=');
        if (eq==std::string::npos) throw std::runtime_error("Expected key=value: "+t);
        out.emplace_back(trim(t.substr(0,eq)), trim(t.substr(eq+1)));
    }
    return out;
}

static std::string join_pairs(const IniLines& kv) {
    std::string out;
    for (auto& [k, v] : kv) {
        if (!out.empty()) out += ";";
        out += k + "=" + v;
    }
    return out;
}

static Device parse_device(const std::string& id, const std::string& line, DeviceBinding& b) {
    Device d;
    d.id = id;
    d.supported.clear();
    std::optional<Capability> cap;

    for (auto& [key, val] : parse_pairs(line)) {
        if (ieq(key,"name")) d.name = val;
        else if (ieq(key,"capability")) {
            cap = parse_capability(val);
            if (!cap) throw std::runtime_error("device "+id+": unknown capability "+val);
        }
        else if (ieq(key,"caps")) {
            for (auto& c : split(val, ',')) {
                auto pc = parse_capability(trim(c));
                if (!pc) throw std::runtime_error("device "+id+": unknown capability "+c);
                d.supported.push_back(*pc);
            }
        }
        else if (ieq(key,"coil"))       b.coil = to_u16(val);
        else if (ieq(key,"level_reg"))  b.level_reg = to_u16(val);
        else if (ieq(key,"button_reg")) b.button_reg = to_u16(val);
        else if (ieq(key,"buttons")) {
            for (auto& a : split(val, ',')) {
                if (trim(a).empty()) continue;
                auto pa = parse_button_action(trim(a));
                if (!pa) throw std::runtime_error("device "+id+": unknown button action "+a);
                b.buttons.push_back(*pa);
            }
        }
        else throw std::runtime_error("device "+id+": unknown key "+key);
    }

    if (d.name.empty()) d.name = id;
    if (!cap) cap = d.supported.empty() ? Capability::Switch : d.supported.front();
    if (d.supported.empty()) d.supported.push_back(*cap);
    if (std::find(d.supported.begin(), d.supported.end(), *cap) == d.supported.end())
        throw std::runtime_error("device "+id+": capability "+to_string(*cap)+" not in caps");
    d.capability = *cap;
    return d;
}

static std::string device_line(const Device& d, const DeviceBinding* b) {
    if (d.name.find(';') != std::string::npos)
        throw std::runtime_error("device "+d.id+": name must not contain ';'");
    IniLines kv;
    kv.emplace_back("name", d.name);
    kv.emplace_back("capability", to_string(d.capability));
    std::string caps;
    for (auto c : d.supported) { if (!caps.empty()) caps += ","; caps += to_string(c); }
    kv.emplace_back("caps", caps);
    if (b) {
        if (b->coil)       kv.emplace_back("coil", std::to_string(*b->coil));
        if (b->level_reg)  kv.emplace_back("level_reg", std::to_string(*b->level_reg));
        if (b->button_reg) kv.emplace_back("button_reg", std::to_string(*b->button_reg));
        if (!b->buttons.empty()) {
            std::string acts;
            for (auto a : b->buttons) { if (!acts.empty()) acts += ","; acts += to_string(a); }
            kv.emplace_back("buttons", acts);
        }
    }
    return join_pairs(kv);
}

std::vector<Device> parse_devices(const Ini& ini, std::map<std::string,DeviceBinding>* bindings) {
    std::vector<Device> devices;
    for (auto& kv : ini.devices) {
        const std::string& id = kv.first;
        if (std::any_of(devices.begin(), devices.end(), [&](const Device& d){ return d.id == id; }))
            throw std::runtime_error("duplicate device "+id);
        DeviceBinding b;
        devices.push_back(parse_device(id, kv.second, b));
        if (bindings) (*bindings)[id] = b;
    }

    for (auto& [key, line] : ini.schedules) {
        std::string dev_id;
        Schedule s;
        bool had_secondary = false;
        for (auto& [k, v] : parse_pairs(line)) {
            if (ieq(k,"device")) { dev_id = v; continue; }
            if (ieq(k,"id"))     { s.id = v; continue; }
            if (k.rfind("sec_", 0) == 0) had_secondary = true;
            try { apply_field(s, k, v); }
            catch (const std::runtime_error& e) {
                throw std::runtime_error("schedule "+key+": "+e.what());
            }
        }
        if (dev_id.empty()) throw std::runtime_error("schedule "+key+" without device");
        auto it = std::find_if(devices.begin(), devices.end(), [&](const Device& d){ return d.id == dev_id; });
        if (it == devices.end()) throw std::runtime_error("schedule "+key+": unknown device "+dev_id);
        if (s.id.empty()) s.id = key;
        for (auto& other : it->schedules)
            if (other.id == s.id) throw std::runtime_error("schedule "+key+": duplicate id "+s.id);

        if (ensure_secondary_time_config(s, had_secondary))
            Log::debug("schedule "+s.id+": secondary time upgraded");
        it->schedules.push_back(std::move(s));
    }

    for (auto& d : devices)
        if (d.schedules.empty()) d.schedules.push_back(ScheduleStore::default_schedule());
    return devices;
}

Ini state_to_ini(const std::vector<Device>& devices, const std::map<std::string,DeviceBinding>* bindings) {
    Ini ini;
    int n = 0;
    for (auto& d : devices) {
        const DeviceBinding* b = nullptr;
        if (bindings) {
            auto it = bindings->find(d.id);
            if (it != bindings->end()) b = &it->second;
        }
        ini.devices.emplace_back(d.id, device_line(d, b));

        for (auto& s : d.schedules) {
            IniLines kv;
            kv.emplace_back("device", d.id);
            kv.emplace_back("id", s.id);
            for (auto& f : kScheduleFields) kv.emplace_back(f, field_value(s, f));
            ini.schedules.emplace_back("s"+std::to_string(++n), join_pairs(kv));
        }
    }
    return ini;
}

std::vector<Device> load_state_ini(const std::string& path) {
    return parse_devices(read_ini(path));
}

void save_state_ini(const std::string& path, const std::vector<Device>& devices) {
    write_ini(path, state_to_ini(devices));
}

Config parse_config(const Ini& ini) {
    Config c;

    // PLC
    auto plc = ini.sec.find("PLC");
    if (plc == ini.sec.end()) throw std::runtime_error("[PLC] section required");
    {
        auto& S = plc->second;
        if (S.count("ip"))      c.ip = S.at("ip");
        if (S.count("port"))    c.port = to_u16(S.at("port"));
        if (S.count("unit_id")) c.unit_id = (uint8_t)to_int(S.at("unit_id"), 0, 255);
    }

    auto opt = ini.sec.find("Options");
    if (opt != ini.sec.end()) {
        auto& O = opt->second;
        Options& o = c.options;
        if (O.count("pause"))           o.pause_all = to_bool(O.at("pause"));
        if (O.count("mode_gate"))       o.mode_gate = to_bool(O.at("mode_gate"));
        if (O.count("modes"))
            for (auto& m : split(O.at("modes"), ',')) if (!trim(m).empty()) o.modes.insert(trim(m));
        if (O.count("activation_switch")) o.activation_switch = O.at("activation_switch");
        if (O.count("activation_state")) {
            const auto& v = O.at("activation_state");
            if (ieq(v,"on"))       o.activation_on = true;
            else if (ieq(v,"off")) o.activation_on = false;
            else throw std::runtime_error("activation_state must be on/off: "+v);
        }
        if (O.count("on_before_level")) o.on_before_level = to_bool(O.at("on_before_level"));
        if (O.count("log_enable"))      o.log_enable = to_bool(O.at("log_enable"));
        if (O.count("refresh_hour"))    o.refresh_hour = to_int(O.at("refresh_hour"), 0, 23);
        if (O.count("state_file"))      o.state_file = O.at("state_file");
    }

    auto hub = ini.sec.find("Hub");
    if (hub != ini.sec.end() && hub->second.count("mode")) c.mode = hub->second.at("mode");

    auto loc = ini.sec.find("Location");
    if (loc != ini.sec.end()) {
        auto& L = loc->second;
        if (L.count("latitude"))  c.location.latitude  = to_double(L.at("latitude"), -90.0, 90.0);
        if (L.count("longitude")) c.location.longitude = to_double(L.at("longitude"), -180.0, 180.0);
    }

    c.variables = ini.variables;

    if (ini.devices.empty()) throw std::runtime_error("[Devices] section required");
    c.devices = parse_devices(ini, &c.bindings);

    if (!c.options.activation_switch.empty() && !c.bindings.count(c.options.activation_switch))
        throw std::runtime_error("activation_switch "+c.options.activation_switch+" is not a device");
    return c;
}

Config load_config_ini(const std::string& path) {
    return parse_config(read_ini(path));
}

void save_config_ini(const std::string& path, const Config& c) {
    Ini ini = state_to_ini(c.devices, &c.bindings);

    auto& P = ini.sec["PLC"];
    P["ip"] = c.ip;
    P["port"] = std::to_string(c.port);
    P["unit_id"] = std::to_string((int)c.unit_id);

    auto& O = ini.sec["Options"];
    const Options& o = c.options;
    std::string modes;
    for (auto& m : o.modes) { if (!modes.empty()) modes += ","; modes += m; }
    O["pause"] = o.pause_all ? "true" : "false";
    O["mode_gate"] = o.mode_gate ? "true" : "false";
    O["modes"] = modes;
    O["activation_switch"] = o.activation_switch;
    O["activation_state"] = o.activation_on ? "on" : "off";
    O["on_before_level"] = o.on_before_level ? "true" : "false";
    O["log_enable"] = o.log_enable ? "true" : "false";
    O["refresh_hour"] = std::to_string(o.refresh_hour);
    O["state_file"] = o.state_file;

    ini.sec["Hub"]["mode"] = c.mode;

    std::ostringstream lat, lon;
    lat << std::setprecision(9) << c.location.latitude;
    lon << std::setprecision(9) << c.location.longitude;
    ini.sec["Location"]["latitude"] = lat.str();
    ini.sec["Location"]["longitude"] = lon.str();

    ini.variables = c.variables;
    write_ini(path, ini);
}
