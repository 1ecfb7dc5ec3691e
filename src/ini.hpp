#pragma once
#include <iosfwd>
#include <map>
#include <string>
#include <utility>
#include <vector>

using IniLines = std::vector<std::pair<std::string,std::string>>;

struct Ini {
    std::map<std::string, std::map<std::string,std::string>> sec;
    // Секции, где важен порядок строк
    IniLines variables;   // [Variables]
    IniLines devices;     // [Devices]:  id -> value(line)
    IniLines schedules;   // [Schedule]: key -> value(line)
};

Ini  read_ini(const std::string& path);
Ini  parse_ini(std::istream& in);
void write_ini(const std::string& path, const Ini& ini);
void write_ini(std::ostream& out, const Ini& ini);
