#include "time_util.hpp"
#include <cstdio>
#include <stdexcept>
#include <vector>

std::tm LocalClock::local_tm(std::time_t t) {
    std::tm lt{};
#if defined(_WIN32)
    localtime_s(&lt, &t);
#else
    localtime_r(&t, &lt);
#endif
    return lt;
}

std::pair<std::tm,std::time_t> LocalClock::now_tm() {
    std::time_t t = std::time(nullptr);
    return {local_tm(t), t};
}

std::optional<int> LocalClock::try_hhmm_to_min(const std::string& hhmm) {
    int h=0,m=0,n=0;
    if (std::sscanf(hhmm.c_str(), "%d:%d%n", &h, &m, &n) != 2 || n != (int)hhmm.size())
        return std::nullopt;
    if (h<0||h>23||m<0||m>59)
        return std::nullopt;
    return h*60+m;
}

int LocalClock::hhmm_to_min(const std::string& hhmm) {
    auto v = try_hhmm_to_min(hhmm);
    if (!v) throw std::runtime_error("Bad time: "+hhmm);
    return *v;
}

std::time_t LocalClock::make_local(int y,int mo,int d,int min_of_day) {
    std::tm tm{};
    tm.tm_year = y-1900; tm.tm_mon = mo-1; tm.tm_mday=d;
    tm.tm_hour = min_of_day/60; tm.tm_min = min_of_day%60; tm.tm_sec=0;
    tm.tm_isdst = -1;
    return std::mktime(&tm);
}

std::time_t LocalClock::day_start(std::time_t t) {
    std::tm lt = local_tm(t);
    return make_local(lt.tm_year+1900, lt.tm_mon+1, lt.tm_mday, 0);
}

int LocalClock::date_key(std::time_t t) {
    std::tm lt = local_tm(t);
    return (lt.tm_year+1900)*10000 + (lt.tm_mon+1)*100 + lt.tm_mday;
}

// Howard Hinnant, "chrono-Compatible Low-Level Date Algorithms"
long long days_from_civil(int y, int m, int d) {
    y -= m <= 2;
    const long long era = (y >= 0 ? y : y-399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153*(m + (m > 2 ? -3 : 9)) + 2)/5 + d-1;
    const unsigned doe = yoe * 365 + yoe/4 - yoe/100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

void civil_from_days(long long z, int& y, int& m, int& d) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe/1460 + doe/36524 - doe/146096) / 365;
    const unsigned doy = doe - (365*yoe + yoe/4 - yoe/100);
    const unsigned mp = (5*doy + 2)/153;
    d = static_cast<int>(doy - (153*mp+2)/5 + 1);
    m = static_cast<int>(mp < 10 ? mp+3 : mp-9);
    y = static_cast<int>(static_cast<long long>(yoe) + era * 400 + (m <= 2));
}

namespace {

int days_in_month(int y, int m) {
    static const int dm[] = {31,28,31,30,31,30,31,31,30,31,30,31};
    if (m == 2 && ((y%4==0 && y%100!=0) || y%400==0)) return 29;
    return dm[m-1];
}

bool parse_date_part(const std::string& s, Stamp& st) {
    if (s == "9999-99-99") { st.has_date = false; return true; }
    int y=0,mo=0,d=0,n=0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2d%n", &y, &mo, &d, &n) != 3 || n != (int)s.size())
        return false;
    if (mo<1||mo>12||d<1||d>days_in_month(y,mo)) return false;
    st.has_date = true; st.year = y; st.month = mo; st.day = d;
    return true;
}

// "+HHMM", "-HHMM", "+HH:MM", "Z"
bool parse_zone(const std::string& s, Stamp& st) {
    if (s.empty()) return true;
    if (s == "Z") { st.utc_offset_min = 0; return true; }
    if (s[0] != '+' && s[0] != '-') return false;
    int hh=0,mm=0,n=0;
    std::string body = s.substr(1);
    bool ok = std::sscanf(body.c_str(), "%2d:%2d%n", &hh, &mm, &n) == 2 && n == (int)body.size();
    if (!ok && body.size() == 4)
        ok = std::sscanf(body.c_str(), "%2d%2d%n", &hh, &mm, &n) == 2 && n == 4;
    if (!ok) return false;
    if (hh>14 || mm>59) return false;
    st.utc_offset_min = (s[0]=='-' ? -1 : 1) * (hh*60+mm);
    return true;
}

bool parse_time_part(const std::string& s, Stamp& st) {
    // отделяем зону
    size_t zpos = s.find_first_of("+-Z", 8);
    std::string clock = zpos == std::string::npos ? s : s.substr(0, zpos);
    std::string zone  = zpos == std::string::npos ? "" : s.substr(zpos);
    if (!parse_zone(zone, st)) return false;

    if (clock == "99:99:99.999" || clock == "99:99:99") { st.has_time = false; return true; }

    int h=0,mi=0,se=0,ms=0,n=0;
    bool ok = std::sscanf(clock.c_str(), "%2d:%2d:%2d.%3d%n", &h, &mi, &se, &ms, &n) == 4
              && n == (int)clock.size();
    if (!ok) {
        ms = 0; n = 0;
        ok = std::sscanf(clock.c_str(), "%2d:%2d:%2d%n", &h, &mi, &se, &n) == 3 && n == (int)clock.size();
    }
    if (!ok) return false;
    if (h<0||h>23||mi<0||mi>59||se<0||se>59||ms<0) return false;
    st.has_time = true; st.hour = h; st.minute = mi; st.second = se; st.millis = ms;
    return true;
}

std::optional<Stamp> parse_date_time(const std::string& s) {
    size_t sep = s.find_first_of("T ");
    if (sep == std::string::npos) return std::nullopt;
    Stamp st;
    if (!parse_date_part(s.substr(0, sep), st)) return std::nullopt;
    if (!parse_time_part(s.substr(sep+1), st)) return std::nullopt;
    if (!st.has_date && !st.has_time) return std::nullopt;
    return st;
}

std::optional<Stamp> parse_date_only(const std::string& s) {
    Stamp st;
    if (!parse_date_part(s, st) || !st.has_date) return std::nullopt;
    return st;
}

std::optional<Stamp> parse_time_only(const std::string& s) {
    Stamp st;
    int h=0,mi=0,n=0;
    if (std::sscanf(s.c_str(), "%2d:%2d%n", &h, &mi, &n) == 2 && n == (int)s.size()) {
        if (h<0||h>23||mi<0||mi>59) return std::nullopt;
        st.has_time = true; st.hour = h; st.minute = mi;
        return st;
    }
    if (!parse_time_part(s, st) || !st.has_time) return std::nullopt;
    return st;
}

long long floor_div(long long a, long long b) {
    long long q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

} // namespace

std::optional<Stamp> parse_stamp(const std::string& s) {
    using Parser = std::optional<Stamp>(*)(const std::string&);
    static const std::vector<Parser> parsers{ parse_date_time, parse_date_only, parse_time_only };
    for (Parser p : parsers) {
        if (auto st = p(s)) return st;
    }
    return std::nullopt;
}

std::string format_stamp(const Stamp& st) {
    char buf[48];
    std::string out;
    if (st.has_date) {
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", st.year, st.month, st.day);
        out = buf;
    } else {
        out = "9999-99-99";
    }
    out += 'T';
    if (st.has_time) {
        std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03d", st.hour, st.minute, st.second, st.millis);
        out += buf;
    } else {
        out += "99:99:99.999";
    }
    if (st.utc_offset_min) {
        int off = *st.utc_offset_min;
        char sign = off < 0 ? '-' : '+';
        if (off < 0) off = -off;
        std::snprintf(buf, sizeof(buf), "%c%02d%02d", sign, off/60, off%60);
        out += buf;
    }
    return out;
}

Stamp stamp_from_local(std::time_t t) {
    std::tm lt = LocalClock::local_tm(t);
    Stamp st;
    st.has_date = true;
    st.year = lt.tm_year+1900; st.month = lt.tm_mon+1; st.day = lt.tm_mday;
    st.has_time = true;
    st.hour = lt.tm_hour; st.minute = lt.tm_min; st.second = lt.tm_sec; st.millis = 0;
    return st;
}

Stamp add_minutes(const Stamp& st, int minutes) {
    Stamp out = st;
    if (minutes == 0 || (!st.has_date && !st.has_time)) return out;

    if (!st.has_date) {
        // только время: сдвиг по кругу суток, дата не появляется
        long long m = st.hour*60 + st.minute + minutes;
        m -= floor_div(m, 1440) * 1440;
        out.hour = static_cast<int>(m/60); out.minute = static_cast<int>(m%60);
        return out;
    }

    long long total = days_from_civil(st.year, st.month, st.day) * 1440
                    + (st.has_time ? st.hour*60 + st.minute : 0) + minutes;
    long long days = floor_div(total, 1440);
    int mod = static_cast<int>(total - days*1440);
    civil_from_days(days, out.year, out.month, out.day);
    if (!st.has_time) {
        // дата без времени остаётся "без времени", пока сдвиг кратен суткам
        if (mod == 0) return out;
        out.has_time = true; out.second = 0; out.millis = 0;
    }
    out.hour = mod/60; out.minute = mod%60;
    return out;
}

std::optional<std::time_t> stamp_instant(const Stamp& st, std::time_t today) {
    Stamp b = st;
    if (!b.has_date) {
        std::tm lt = LocalClock::local_tm(today);
        b.year = lt.tm_year+1900; b.month = lt.tm_mon+1; b.day = lt.tm_mday;
    }
    if (!b.has_time) { b.hour = 0; b.minute = 0; b.second = 0; }

    if (b.utc_offset_min) {
        long long secs = days_from_civil(b.year, b.month, b.day) * 86400LL
                       + b.hour*3600LL + b.minute*60LL + b.second
                       - *b.utc_offset_min * 60LL;
        return static_cast<std::time_t>(secs);
    }
    std::time_t t = LocalClock::make_local(b.year, b.month, b.day, b.hour*60 + b.minute);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return t + b.second;
}
