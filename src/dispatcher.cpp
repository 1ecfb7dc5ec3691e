#include "dispatcher.hpp"
#include "log.hpp"
#include <algorithm>

bool Dispatcher::press(DeviceActions& act, const Device& dev, const Schedule& s) {
    if (!s.button_number || !s.button_action) {
        Log::error("button schedule "+s.id+" for "+dev.id+" has no button/action set");
        return false;
    }
    auto acts = act.supported_button_actions();
    if (std::find(acts.begin(), acts.end(), *s.button_action) == acts.end()) {
        Log::error(std::string("device ")+dev.id+" does not support "+to_string(*s.button_action));
        return false;
    }
    bool ok = act.invoke(*s.button_action, *s.button_number);
    Log::info(std::string("[BTN] ")+dev.id+" "+to_string(*s.button_action)+" #"
              +std::to_string(*s.button_number)+(ok ? "" : " FAILED"));
    return ok;
}

bool Dispatcher::execute(const Device& dev, const Schedule& s, const Options& opts) {
    DeviceActions* act = devices_.find(dev.id);
    if (!act) {
        Log::error("no device backend for "+dev.id);
        return false;
    }

    try {
        if (dev.capability == Capability::Button) return press(*act, dev, s);

        if (dev.capability == Capability::Dimmer && s.desired_on) {
            bool ok = true;
            if (opts.on_before_level) ok = act->turn_on();
            ok = act->set_level(s.desired_level) && ok;
            Log::info("[LEVEL] "+dev.id+" level="+std::to_string(s.desired_level)+(ok ? "" : " FAILED"));
            return ok;
        }

        bool ok = s.desired_on ? act->turn_on() : act->turn_off();
        Log::info(std::string(s.desired_on ? "[ON] " : "[OFF] ")+dev.id+" schedule="+s.id+(ok ? "" : " FAILED"));
        return ok;
    } catch (const std::exception& e) {
        Log::error("command for "+dev.id+" failed: "+e.what());
        return false;
    }
}
