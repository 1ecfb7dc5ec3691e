#pragma once
#include "model.hpp"
#include <ctime>
#include <functional>
#include <optional>
#include <string>
#include <vector>

// Интерфейсы внешней инфраструктуры, которыми пользуется движок расписаний.

// Recurring (minute, hour, day-of-week) trigger + one-shot delay.
class TriggerService {
public:
    virtual ~TriggerService() = default;
    virtual int  add(const RecurringTrigger& trig, std::function<void()> cb,
                     const std::string& key, bool overwrite) = 0;
    virtual void cancel_all() = 0;
    virtual void after(int seconds, std::function<void()> cb) = 0;
};

struct SunTimes {
    std::time_t sunrise{0};
    std::time_t sunset{0};
};

class SolarProvider {
public:
    virtual ~SolarProvider() = default;
    // Восход/закат для локальных суток, содержащих `day`, со смещением в минутах
    virtual std::optional<SunTimes> sunrise_sunset(int offset_min, std::time_t day) const = 0;
};

class VariableSource {
public:
    using ChangeHandler = std::function<void(const std::string& name)>;
    using RenameHandler = std::function<void(const std::string& old_name, const std::string& new_name)>;

    virtual ~VariableSource() = default;
    virtual std::optional<std::string> get(const std::string& name) const = 0;
    virtual void on_change(const std::string& name, ChangeHandler h) = 0;
    virtual void unsubscribe_all() = 0;
    virtual void mark_in_use(const std::string& name) = 0;
    virtual void clear_all_in_use() = 0;
    virtual void on_rename(RenameHandler h) = 0;
};

class DeviceActions {
public:
    virtual ~DeviceActions() = default;
    virtual bool turn_on() = 0;
    virtual bool turn_off() = 0;
    virtual bool set_level(int level) = 0;
    virtual bool invoke(ButtonAction action, int number) = 0;
    virtual std::optional<bool> current_state() = 0;
    virtual std::optional<int>  current_level() = 0;
    virtual std::vector<ButtonAction> supported_button_actions() const = 0;
};

class DeviceDirectory {
public:
    virtual ~DeviceDirectory() = default;
    virtual DeviceActions* find(const std::string& device_id) = 0;
};

class HubState {
public:
    virtual ~HubState() = default;
    virtual std::string current_mode() const = 0;
};
