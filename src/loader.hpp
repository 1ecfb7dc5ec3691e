#pragma once
#include "ini.hpp"
#include "model.hpp"
#include <string>
#include <vector>

// Полный конфиг: [PLC], [Options], [Hub], [Location], [Variables], [Devices], [Schedule]
Config load_config_ini(const std::string& path);
Config parse_config(const Ini& ini);
void   save_config_ini(const std::string& path, const Config& cfg);

// Только устройства и расписания (файл состояния)
std::vector<Device> load_state_ini(const std::string& path);
std::vector<Device> parse_devices(const Ini& ini, std::map<std::string,DeviceBinding>* bindings = nullptr);
Ini  state_to_ini(const std::vector<Device>& devices, const std::map<std::string,DeviceBinding>* bindings = nullptr);
void save_state_ini(const std::string& path, const std::vector<Device>& devices);
