#pragma once
#include "services.hpp"

// Восход/закат по упрощённым формулам NOAA для заданной точки.
class SolarCalc : public SolarProvider {
public:
    SolarCalc(double latitude, double longitude) : lat_(latitude), lon_(longitude) {}

    // nullopt during polar day/night
    std::optional<SunTimes> sunrise_sunset(int offset_min, std::time_t day) const override;

private:
    double lat_;
    double lon_;
};
