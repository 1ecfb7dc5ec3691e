#pragma once
#include "model.hpp"
#include "modbus_tcp.hpp"
#include "services.hpp"
#include <map>
#include <memory>
#include <string>

// Устройство на ПЛК: coil = вкл/выкл, holding = уровень, пара holding = кнопка (номер, действие).
class ModbusDevice : public DeviceActions {
public:
    ModbusDevice(std::string id, DeviceBinding binding, ModbusTcpClient& mb);

    bool turn_on() override;
    bool turn_off() override;
    bool set_level(int level) override;
    bool invoke(ButtonAction action, int number) override;
    std::optional<bool> current_state() override;
    std::optional<int>  current_level() override;
    std::vector<ButtonAction> supported_button_actions() const override { return binding_.buttons; }

    static uint16_t action_code(ButtonAction a);

private:
    template <class F> auto guarded(const char* what, F&& f) -> decltype(f());

    std::string id_;
    DeviceBinding binding_;
    ModbusTcpClient& mb_;
};

class ModbusDirectory : public DeviceDirectory {
public:
    ModbusDirectory(const std::map<std::string,DeviceBinding>& bindings, ModbusTcpClient& mb);
    DeviceActions* find(const std::string& device_id) override;

private:
    std::map<std::string, std::unique_ptr<ModbusDevice>> devices_;
};
