#include "modbus_device.hpp"
#include "log.hpp"
#include <algorithm>

ModbusDevice::ModbusDevice(std::string id, DeviceBinding binding, ModbusTcpClient& mb)
: id_(std::move(id)), binding_(std::move(binding)), mb_(mb) {}

uint16_t ModbusDevice::action_code(ButtonAction a) {
    switch (a) {
    case ButtonAction::Hold:      return 2;
    case ButtonAction::DoubleTap: return 3;
    case ButtonAction::Release:   return 4;
    default:                      return 1;
    }
}

// Ошибка транспорта: лог, попытка переподключения, результат "неуспех"
template <class F>
auto ModbusDevice::guarded(const char* what, F&& f) -> decltype(f()) {
    try {
        return f();
    } catch (const std::exception& e) {
        Log::error(id_+": "+what+" failed: "+e.what());
        try { mb_.reconnect(); }
        catch (const std::exception& re) { Log::warn(std::string("reconnect failed: ")+re.what()); }
        return decltype(f()){};
    }
}

bool ModbusDevice::turn_on() {
    if (!binding_.coil) { Log::error(id_+": no coil configured"); return false; }
    return guarded("turn_on", [&]{ return mb_.write_coil(*binding_.coil, true); });
}

bool ModbusDevice::turn_off() {
    if (!binding_.coil) { Log::error(id_+": no coil configured"); return false; }
    return guarded("turn_off", [&]{ return mb_.write_coil(*binding_.coil, false); });
}

bool ModbusDevice::set_level(int level) {
    if (!binding_.level_reg) { Log::error(id_+": no level register configured"); return false; }
    uint16_t v = uint16_t(std::clamp(level, 0, 100));
    return guarded("set_level", [&]{ return mb_.write_holding(*binding_.level_reg, v); });
}

bool ModbusDevice::invoke(ButtonAction action, int number) {
    if (!binding_.button_reg) { Log::error(id_+": no button register configured"); return false; }
    uint16_t reg = *binding_.button_reg;
    return guarded("invoke", [&]{
        return mb_.write_holding(reg, uint16_t(number))
            && mb_.write_holding(uint16_t(reg+1), action_code(action));
    });
}

std::optional<bool> ModbusDevice::current_state() {
    if (!binding_.coil) return std::nullopt;
    return guarded("read state", [&]{ return mb_.read_coil(*binding_.coil); });
}

std::optional<int> ModbusDevice::current_level() {
    if (!binding_.level_reg) return std::nullopt;
    return guarded("read level", [&]() -> std::optional<int> {
        auto v = mb_.read_holding(*binding_.level_reg, 1);
        if (v.empty()) return std::nullopt;
        return int(v[0]);
    });
}

ModbusDirectory::ModbusDirectory(const std::map<std::string,DeviceBinding>& bindings, ModbusTcpClient& mb) {
    for (auto& [id, b] : bindings)
        devices_.emplace(id, std::make_unique<ModbusDevice>(id, b, mb));
}

DeviceActions* ModbusDirectory::find(const std::string& device_id) {
    auto it = devices_.find(device_id);
    return it == devices_.end() ? nullptr : it->second.get();
}
