#pragma once

#include "frame_types.hpp"

namespace roofwatch {

// Solar altitude in degrees above the horizon. Low precision closed form
// (about 0.1 degree between 1950 and 2050), no refraction.
double solar_altitude_deg(double latitude_deg, double longitude_deg, Clock::time_point t);

struct SunGuardOptions {
    double latitude{40.0};           // degrees, north positive
    double longitude{-74.0};         // degrees, east positive
    double max_altitude_deg{-17.0};  // OPEN is only trusted while the sun is below this
};

// Daylight safety override. An OPEN roof is reported CLOSED while the sun is
// at or above the configured altitude.
class SunGuard {
public:
    explicit SunGuard(SunGuardOptions options = {}) : options_(options) {}

    double altitude(Clock::time_point t) const {
        return solar_altitude_deg(options_.latitude, options_.longitude, t);
    }

    bool blocks_open(double altitude_deg) const { return altitude_deg >= options_.max_altitude_deg; }
    bool blocks_open(Clock::time_point t) const { return blocks_open(altitude(t)); }

    const SunGuardOptions& options() const { return options_; }

private:
    SunGuardOptions options_;
};

}  // namespace roofwatch
