#pragma once
#include <cstdint>
#include <ctime>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "time_util.hpp"

enum Weekday { Sun=0, Mon, Tue, Wed, Thu, Fri, Sat };

// bit0=Sun..bit6=Sat
class DaySet {
public:
    DaySet() = default;
    explicit DaySet(uint8_t mask) : mask_(mask & 0x7F) {}
    static DaySet all() { return DaySet(0x7F); }

    bool has(int wday) const { return wday>=0 && wday<7 && (mask_ & (1u<<wday)); }
    void set(int wday, bool on);
    bool empty() const { return mask_ == 0; }
    uint8_t mask() const { return mask_; }

    bool sun() const { return has(Sun); }
    bool mon() const { return has(Mon); }
    bool tue() const { return has(Tue); }
    bool wed() const { return has(Wed); }
    bool thu() const { return has(Thu); }
    bool fri() const { return has(Fri); }
    bool sat() const { return has(Sat); }

    std::string to_string() const;                   // "MON,WED,FRI"
    bool operator==(const DaySet& o) const { return mask_ == o.mask_; }
    bool operator!=(const DaySet& o) const { return mask_ != o.mask_; }

private:
    uint8_t mask_{0};
};

int         day_to_wday(const std::string& s);
const char* wday_name(int wday);                     // "SUN".."SAT"

enum class TimeSource { Fixed, Solar, Variable };

struct TimeSpec {
    TimeSource source{TimeSource::Fixed};
    std::optional<int> clock_min;      // Fixed: минуты с полуночи, пусто = не выбрано
    bool sunset{true};                 // Solar
    int  offset_min{0};                // Solar / Variable
    std::string variable;              // Variable

    // false when the source has nothing selected (no time / no variable)
    bool configured() const {
        if (source == TimeSource::Fixed)    return clock_min.has_value();
        if (source == TimeSource::Variable) return !variable.empty();
        return true;
    }

    bool operator==(const TimeSpec& o) const {
        return source==o.source && clock_min==o.clock_min && sunset==o.sunset
            && offset_min==o.offset_min && variable==o.variable;
    }
};

enum class DualPolicy { None, Earlier, Later };
enum class Capability { Switch, Dimmer, Button };
enum class ButtonAction { Push, Hold, DoubleTap, Release };

const char* to_string(DualPolicy p);
const char* to_string(Capability c);
const char* to_string(ButtonAction a);
std::optional<DualPolicy>   parse_dual_policy(const std::string& s);
std::optional<Capability>   parse_capability(const std::string& s);
std::optional<ButtonAction> parse_button_action(const std::string& s);

// Recurring trigger: minute/hour on a set of weekdays
struct RecurringTrigger {
    int minute{0};
    int hour{0};
    DaySet days;

    std::string cron() const;                        // "0 0 18 ? * MON,WED,FRI *"
    bool operator==(const RecurringTrigger& o) const {
        return minute==o.minute && hour==o.hour && days==o.days;
    }
    bool operator!=(const RecurringTrigger& o) const { return !(*this == o); }
};

struct Schedule {
    std::string id;
    DaySet days{DaySet::all()};
    TimeSpec primary;
    DualPolicy earlier_later{DualPolicy::None};
    TimeSpec secondary;
    bool pause{false};
    bool restore{true};

    bool desired_on{true};
    int  desired_level{100};
    std::optional<int> button_number;
    std::optional<ButtonAction> button_action;

    // runtime, пересчитывается при refresh
    std::optional<RecurringTrigger> cron;
    bool uses_secondary{false};
    std::optional<Stamp> effective;

    const TimeSpec& effective_spec() const { return uses_secondary ? secondary : primary; }
};

struct Device {
    std::string id;
    std::string name;
    int zone{0};
    Capability capability{Capability::Switch};
    std::vector<Capability> supported{Capability::Switch};
    std::vector<Schedule> schedules;
};

struct Options {
    bool pause_all{false};
    bool mode_gate{false};
    std::set<std::string> modes;
    std::string activation_switch;     // пусто = не используется
    bool activation_on{true};
    bool on_before_level{false};
    bool log_enable{true};
    int  refresh_hour{1};
    std::string state_file;
};

struct DeviceBinding {
    std::optional<uint16_t> coil;
    std::optional<uint16_t> level_reg;
    std::optional<uint16_t> button_reg;
    std::vector<ButtonAction> buttons;
};

struct Location {
    double latitude{0.0};
    double longitude{0.0};
};

struct Config {
    std::string ip{"127.0.0.1"};
    uint16_t    port{502};
    uint8_t     unit_id{1};
    std::map<std::string,DeviceBinding> bindings;
    Options options;
    std::string mode{"Home"};
    Location location;
    std::vector<std::pair<std::string,std::string>> variables;
    std::vector<Device> devices;
};
