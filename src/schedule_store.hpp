#pragma once
#include "model.hpp"
#include <string>
#include <vector>

// Поля расписания для edit(): "sun".."sat", "days", "time", "sun_time", "sunset", "offset",
// "use_variable", "variable", "earlier_later", "sec_*", "pause", "restore", "state",
// "level", "button", "button_action".
extern const std::vector<std::string> kScheduleFields;

// Applies one field; throws std::runtime_error on unknown field or bad value.
void        apply_field(Schedule& s, const std::string& field, const std::string& value);
std::string field_value(const Schedule& s, const std::string& field);

// Upgrades older persisted shapes; returns true if something was changed.
bool ensure_secondary_time_config(Schedule& s, bool had_secondary_keys);

struct DeviceInfo {
    std::string id;
    std::string name;
    std::vector<Capability> supported{Capability::Switch};
};

class ScheduleStore {
public:
    ScheduleStore() = default;
    explicit ScheduleStore(std::vector<Device> devices);

    const std::vector<Device>& devices() const { return devices_; }

    Device*         find_device(const std::string& id);
    const Device*   find_device(const std::string& id) const;
    Schedule*       find_schedule(const std::string& device_id, const std::string& schedule_id);
    const Schedule* find_schedule(const std::string& device_id, const std::string& schedule_id) const;

    // Creates defaults for new devices, cascade-removes devices that are no longer selected.
    void select_devices(const std::vector<DeviceInfo>& selected);
    Device& add_device(Device d);
    void    remove_device(const std::string& id);

    Schedule& add_run(const std::string& device_id);
    void      remove_run(const std::string& device_id, const std::string& schedule_id);
    void      set_capability(const std::string& device_id, Capability cap);

    std::string edit(const std::string& device_id, const std::string& schedule_id,
                     const std::string& field, const std::string& value);

    int  rename_variable(const std::string& old_name, const std::string& new_name);
    void assign_zones();

    // Copies derived runtime fields (cron, effective time) back from a computed snapshot.
    void apply_derived(const std::vector<Device>& computed);

    static Schedule    default_schedule();
    static std::string new_id();

private:
    Device& device_or_throw(const std::string& id);

    std::vector<Device> devices_;
};
