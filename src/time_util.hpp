#pragma once
#include <ctime>
#include <optional>
#include <string>
#include <utility>

struct LocalClock {
    static std::pair<std::tm,std::time_t> now_tm();
    static std::tm     local_tm(std::time_t t);
    static int  hhmm_to_min(const std::string& hhmm);
    static std::optional<int> try_hhmm_to_min(const std::string& hhmm);
    static std::time_t make_local(int y,int mo,int d,int min_of_day);
    static std::time_t day_start(std::time_t t);
    static int  date_key(std::time_t t);             // YYYYMMDD по локальному времени
};

// Значение даты/времени с необязательными частями.
// Нет даты  -> "9999-99-99", нет времени -> "99:99:99.999" (внешний формат переменных).
struct Stamp {
    bool has_date{false};
    int  year{0}, month{0}, day{0};
    bool has_time{false};
    int  hour{0}, minute{0}, second{0}, millis{0};
    std::optional<int> utc_offset_min;

    int date_key() const { return has_date ? year*10000 + month*100 + day : 0; }
};

std::optional<Stamp> parse_stamp(const std::string& s);
std::string          format_stamp(const Stamp& st);
Stamp                stamp_from_local(std::time_t t);
Stamp                add_minutes(const Stamp& st, int minutes);
// Missing date is taken from `today`, missing time is midnight.
std::optional<std::time_t> stamp_instant(const Stamp& st, std::time_t today);

long long days_from_civil(int y, int m, int d);
void      civil_from_days(long long z, int& y, int& m, int& d);
