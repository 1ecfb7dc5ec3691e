#pragma once
#include "model.hpp"
#include "services.hpp"

// Выполняет действие расписания на устройстве. Без повторов: следующий запуск и есть повтор.
class Dispatcher {
public:
    explicit Dispatcher(DeviceDirectory& devices) : devices_(devices) {}

    // false if the device is unknown, the action is not configured or a command failed
    bool execute(const Device& dev, const Schedule& s, const Options& opts);

private:
    bool press(DeviceActions& act, const Device& dev, const Schedule& s);

    DeviceDirectory& devices_;
};
