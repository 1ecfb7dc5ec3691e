#include "solar_calc.hpp"
#include "time_util.hpp"
#include <cmath>

static constexpr double kPi = 3.14159265358979323846;

std::optional<SunTimes> SolarCalc::sunrise_sunset(int offset_min, std::time_t day) const {
    std::tm lt = LocalClock::local_tm(day);
    int day_of_year = lt.tm_yday + 1;

    // дробный год, радианы
    double gamma = 2.0 * kPi * (day_of_year - 1) / 365.0;

    // уравнение времени, минуты
    double eq_time = 229.18 * (0.000075 + 0.001868*std::cos(gamma) - 0.032077*std::sin(gamma)
                               - 0.014615*std::cos(2.0*gamma) - 0.040849*std::sin(2.0*gamma));

    // склонение Солнца, радианы
    double decl = 0.006918 - 0.399912*std::cos(gamma) + 0.070257*std::sin(gamma)
                - 0.006758*std::cos(2.0*gamma) + 0.000907*std::sin(2.0*gamma)
                - 0.002697*std::cos(3.0*gamma) + 0.00148*std::sin(3.0*gamma);

    // 90.833: refraction + solar disc radius
    double zenith = 90.833 * kPi / 180.0;
    double lat = lat_ * kPi / 180.0;
    double cos_ha = std::cos(zenith) / (std::cos(lat)*std::cos(decl)) - std::tan(lat)*std::tan(decl);
    if (cos_ha > 1.0 || cos_ha < -1.0) return std::nullopt;

    double ha_deg = std::acos(cos_ha) * 180.0 / kPi;
    double noon_utc    = 720.0 - 4.0*lon_ - eq_time;
    double sunrise_utc = noon_utc - ha_deg*4.0;
    double sunset_utc  = noon_utc + ha_deg*4.0;

    // минуты от полуночи UTC календарного дня
    std::time_t midnight_utc = static_cast<std::time_t>(
        days_from_civil(lt.tm_year+1900, lt.tm_mon+1, lt.tm_mday) * 86400LL);

    SunTimes out;
    out.sunrise = midnight_utc + static_cast<std::time_t>(std::lround(sunrise_utc*60.0)) + offset_min*60;
    out.sunset  = midnight_utc + static_cast<std::time_t>(std::lround(sunset_utc*60.0))  + offset_min*60;
    return out;
}
