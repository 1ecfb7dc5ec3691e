#include "model.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

void DaySet::set(int wday, bool on) {
    if (wday<0 || wday>6) return;
    if (on) mask_ = uint8_t(mask_ | (1u<<wday));
    else    mask_ = uint8_t(mask_ & ~(1u<<wday));
}

std::string DaySet::to_string() const {
    std::string out;
    for (int d=0; d<7; ++d) {
        if (!has(d)) continue;
        if (!out.empty()) out += ",";
        out += wday_name(d);
    }
    return out;
}

const char* wday_name(int wday) {
    static const char* names[] = {"SUN","MON","TUE","WED","THU","FRI","SAT"};
    return (wday>=0 && wday<7) ? names[wday] : "?";
}

int day_to_wday(const std::string& s0){
    std::string s=s0; std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    if (s=="sun"||s=="su"||s=="sunday") return 0;
    if (s=="mon"||s=="mo"||s=="monday") return 1;
    if (s=="tue"||s=="tu"||s=="tuesday") return 2;
    if (s=="wed"||s=="we"||s=="wednesday") return 3;
    if (s=="thu"||s=="th"||s=="thursday") return 4;
    if (s=="fri"||s=="fr"||s=="friday") return 5;
    if (s=="sat"||s=="sa"||s=="saturday") return 6;
    throw std::runtime_error("Unknown day: "+s0);
}

std::string RecurringTrigger::cron() const {
    return "0 " + std::to_string(minute) + " " + std::to_string(hour) + " ? * " + days.to_string() + " *";
}

const char* to_string(DualPolicy p) {
    switch (p) {
    case DualPolicy::Earlier: return "earlier";
    case DualPolicy::Later:   return "later";
    default:                  return "-";
    }
}

const char* to_string(Capability c) {
    switch (c) {
    case Capability::Dimmer: return "dimmer";
    case Capability::Button: return "button";
    default:                 return "switch";
    }
}

const char* to_string(ButtonAction a) {
    switch (a) {
    case ButtonAction::Hold:      return "hold";
    case ButtonAction::DoubleTap: return "doubleTap";
    case ButtonAction::Release:   return "release";
    default:                      return "push";
    }
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}

std::optional<DualPolicy> parse_dual_policy(const std::string& s) {
    auto v = lower(s);
    if (v=="-" || v.empty()) return DualPolicy::None;
    if (v=="earlier")        return DualPolicy::Earlier;
    if (v=="later")          return DualPolicy::Later;
    return std::nullopt;
}

std::optional<Capability> parse_capability(const std::string& s) {
    auto v = lower(s);
    if (v=="switch") return Capability::Switch;
    if (v=="dimmer") return Capability::Dimmer;
    if (v=="button") return Capability::Button;
    return std::nullopt;
}

std::optional<ButtonAction> parse_button_action(const std::string& s) {
    auto v = lower(s);
    if (v=="push")                      return ButtonAction::Push;
    if (v=="hold")                      return ButtonAction::Hold;
    if (v=="doubletap" || v=="double")  return ButtonAction::DoubleTap;
    if (v=="release")                   return ButtonAction::Release;
    return std::nullopt;
}
