#include "cron_timer.hpp"
#include "log.hpp"
#include "time_util.hpp"

int CronTimer::add(const RecurringTrigger& trig, std::function<void()> cb,
                   const std::string& key, bool overwrite) {
    std::lock_guard<std::mutex> lk(mx_);
    if (!key.empty()) {
        for (auto& e : entries_) {
            if (e.key != key) continue;
            if (!overwrite) return e.id;
            e.trig = trig;
            e.cb = std::move(cb);
            e.last_minute = current_minute_;
            return e.id;
        }
    }
    entries_.push_back(Entry{next_id_, key, trig, std::move(cb), current_minute_});
    return next_id_++;
}

void CronTimer::cancel_all() {
    std::lock_guard<std::mutex> lk(mx_);
    entries_.clear();
    pending_.clear();
    delays_.clear();
}

void CronTimer::after(int seconds, std::function<void()> cb) {
    std::lock_guard<std::mutex> lk(mx_);
    delays_.emplace_back(seconds, std::move(cb));
}

size_t CronTimer::size() const {
    std::lock_guard<std::mutex> lk(mx_);
    return entries_.size();
}

void CronTimer::tick(std::time_t now) {
    std::tm lt = LocalClock::local_tm(now);
    long long minute_key = (long long)(now - lt.tm_sec) / 60;

    std::vector<std::function<void()>> due;
    {
        std::lock_guard<std::mutex> lk(mx_);
        current_minute_ = minute_key;
        for (auto& d : delays_) pending_.push_back(OneShot{now + d.first, std::move(d.second)});
        delays_.clear();

        for (auto& e : entries_) {
            if (e.last_minute == minute_key) continue;
            if (e.trig.hour != lt.tm_hour || e.trig.minute != lt.tm_min) continue;
            if (!e.trig.days.has(lt.tm_wday)) continue;
            e.last_minute = minute_key;
            due.push_back(e.cb);
        }
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (it->due <= now) { due.push_back(std::move(it->cb)); it = pending_.erase(it); }
            else ++it;
        }
    }

    for (auto& cb : due) {
        try { cb(); }
        catch (const std::exception& e) { Log::error(std::string("timer callback failed: ")+e.what()); }
    }
}
