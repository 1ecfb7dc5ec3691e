#pragma once
#include "log.hpp"
#include "services.hpp"
#include "time_util.hpp"
#include "variables.hpp"
#include <cstdlib>
#include <ctime>
#include <map>
#include <memory>
#include <string>
#include <vector>

// Общие заглушки для тестов. Все тесты работают в UTC.

inline void use_utc() {
    setenv("TZ", "UTC", 1);
    tzset();
}

inline std::time_t at(int y, int mo, int d, int h, int mi) {
    return LocalClock::make_local(y, mo, d, h*60 + mi);
}

// 2024-01-01 is a Monday
inline std::time_t monday(int h, int mi) { return at(2024, 1, 1, h, mi); }

struct FakeTriggers : TriggerService {
    struct Reg {
        RecurringTrigger trig;
        std::function<void()> cb;
        std::string key;
    };
    std::vector<Reg> regs;
    std::vector<std::pair<int, std::function<void()>>> delays;
    int cancels{0};

    int add(const RecurringTrigger& trig, std::function<void()> cb,
            const std::string& key, bool) override {
        for (auto& r : regs) if (r.key == key) { r.trig = trig; r.cb = std::move(cb); return 1; }
        regs.push_back({trig, std::move(cb), key});
        return (int)regs.size();
    }
    void cancel_all() override { regs.clear(); delays.clear(); ++cancels; }
    void after(int seconds, std::function<void()> cb) override { delays.emplace_back(seconds, std::move(cb)); }

    const Reg* find(const std::string& key) const {
        for (auto& r : regs) if (r.key == key) return &r;
        return nullptr;
    }
};

struct FakeSolar : SolarProvider {
    std::optional<SunTimes> times;     // без смещения
    std::optional<SunTimes> sunrise_sunset(int offset_min, std::time_t) const override {
        if (!times) return std::nullopt;
        return SunTimes{times->sunrise + offset_min*60, times->sunset + offset_min*60};
    }
};

// Записывает команды в общий журнал: "D1:on", "D2:level=40", "B1:push#2"
struct FakeDevice : DeviceActions {
    std::string id;
    std::vector<std::string>* journal{nullptr};
    std::optional<bool> state;
    std::optional<int> level;
    std::vector<ButtonAction> buttons{ButtonAction::Push};
    bool fail{false};

    void note(const std::string& s) { if (journal) journal->push_back(id+":"+s); }

    bool turn_on() override  { note("on");  if (fail) return false; state = true;  return true; }
    bool turn_off() override { note("off"); if (fail) return false; state = false; return true; }
    bool set_level(int l) override { note("level="+std::to_string(l)); if (fail) return false; level = l; return true; }
    bool invoke(ButtonAction a, int n) override { note(std::string(to_string(a))+"#"+std::to_string(n)); return !fail; }
    std::optional<bool> current_state() override { return state; }
    std::optional<int>  current_level() override { return level; }
    std::vector<ButtonAction> supported_button_actions() const override { return buttons; }
};

struct FakeDirectory : DeviceDirectory {
    std::vector<std::string> journal;
    std::map<std::string, std::unique_ptr<FakeDevice>> devs;

    FakeDevice& add(const std::string& id) {
        auto d = std::make_unique<FakeDevice>();
        d->id = id;
        d->journal = &journal;
        auto& ref = *d;
        devs[id] = std::move(d);
        return ref;
    }
    DeviceActions* find(const std::string& id) override {
        auto it = devs.find(id);
        return it == devs.end() ? nullptr : it->second.get();
    }
};

// Перехват лога
struct LogCapture {
    std::vector<std::pair<Log::Level, std::string>> lines;

    LogCapture() {
        Log::set_debug(true);
        Log::set_sink([this](Log::Level l, const std::string& m){ lines.emplace_back(l, m); });
    }
    ~LogCapture() { Log::set_sink(nullptr); }

    int count(const std::string& text) const {
        int n = 0;
        for (auto& l : lines) if (l.second.find(text) != std::string::npos) ++n;
        return n;
    }
};
