#include "ini.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>
#include <cctype>
#include <stdexcept>

static inline std::string trim(std::string s) {
    auto issp = [](unsigned char c){ return std::isspace(c); };
    while(!s.empty() && issp(s.front())) s.erase(s.begin());
    while(!s.empty() && issp(s.back()))  s.pop_back();
    return s;
}

Ini read_ini(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error("Cannot open config: "+path);
    return parse_ini(f);
}

Ini parse_ini(std::istream& in) {
    Ini ini;
    std::string line, cur;
    while (std::getline(in,line)) {
        line = trim(line);
        if (line.empty() || line[0]==';' || line[0]=='#') continue;
        if (line.front()=='[' && line.back()==']') {
            cur = trim(line.substr(1, line.size()-2));
            continue;
        }
        auto pos = line.find('=');
        if (pos==std::string::npos) continue;
        std::string k = trim(line.substr(0,pos));
        std::string v = trim(line.substr(pos+1));
        if      (cur=="Schedule")  ini.schedules.emplace_back(k, v);
        else if (cur=="Devices")   ini.devices.emplace_back(k, v);
        else if (cur=="Variables") ini.variables.emplace_back(k, v);
        else ini.sec[cur][k]=v;
    }
    return ini;
}

static void write_lines(std::ostream& out, const char* name, const IniLines& lines) {
    if (lines.empty()) return;
    out << "[" << name << "]\n";
    for (auto& kv : lines) out << kv.first << " = " << kv.second << "\n";
    out << "\n";
}

void write_ini(std::ostream& out, const Ini& ini) {
    for (auto& [name, kv] : ini.sec) {
        out << "[" << name << "]\n";
        for (auto& [k, v] : kv) out << k << " = " << v << "\n";
        out << "\n";
    }
    write_lines(out, "Variables", ini.variables);
    write_lines(out, "Devices",   ini.devices);
    write_lines(out, "Schedule",  ini.schedules);
}

void write_ini(const std::string& path, const Ini& ini) {
    // через временный файл, чтобы не оставить обрезанный конфиг
    std::string tmp = path + ".tmp";
    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f) throw std::runtime_error("Cannot write config: "+tmp);
        write_ini(f, ini);
        f.flush();
        if (!f) throw std::runtime_error("Write failed: "+tmp);
    }
    if (std::rename(tmp.c_str(), path.c_str()) != 0)
        throw std::runtime_error("Cannot replace config: "+path);
}
