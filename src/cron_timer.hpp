#pragma once
#include "services.hpp"
#include <ctime>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

// Встроенный планировщик: вызывать tick() раз в секунду из главного цикла.
class CronTimer : public TriggerService {
public:
    int  add(const RecurringTrigger& trig, std::function<void()> cb,
             const std::string& key, bool overwrite) override;
    void cancel_all() override;
    void after(int seconds, std::function<void()> cb) override;

    // Fires every trigger matching the local minute of `now` (once per minute)
    // and every due one-shot. Callbacks run outside the internal lock.
    void tick(std::time_t now);

    size_t size() const;

private:
    struct Entry {
        int id;
        std::string key;
        RecurringTrigger trig;
        std::function<void()> cb;
        long long last_minute{-1};
    };
    struct OneShot {
        std::time_t due;
        std::function<void()> cb;
    };

    mutable std::mutex mx_;
    std::vector<Entry> entries_;
    std::vector<OneShot> pending_;     // after(): срок считается от следующего tick
    std::vector<std::pair<int, std::function<void()>>> delays_;
    int next_id_{1};
    long long current_minute_{-1};   // новые триггеры не срабатывают в минуту регистрации
};
