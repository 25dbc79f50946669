#include "roofwatch/sun_guard.hpp"

#include <cmath>

namespace roofwatch {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kDeg = kPi / 180.0;

// Unix time of J2000.0, 2000-01-01 12:00 UTC, in days.
constexpr double kJ2000UnixDays = 10957.5;

}  // namespace

double solar_altitude_deg(double latitude_deg, double longitude_deg, Clock::time_point t) {
    const double unix_sec = std::chrono::duration<double>(t.time_since_epoch()).count();
    const double d = unix_sec / 86400.0 - kJ2000UnixDays;

    const double g = std::fmod(357.529 + 0.98560028 * d, 360.0) * kDeg;   // mean anomaly
    const double q = std::fmod(280.459 + 0.98564736 * d, 360.0);          // mean longitude
    const double lambda = (q + 1.915 * std::sin(g) + 0.020 * std::sin(2.0 * g)) * kDeg;
    const double eps = (23.439 - 0.00000036 * d) * kDeg;

    const double ra = std::atan2(std::cos(eps) * std::sin(lambda), std::cos(lambda));
    const double dec = std::asin(std::sin(eps) * std::sin(lambda));

    const double gmst_h = std::fmod(18.697374558 + 24.06570982441908 * d, 24.0);
    const double hour_angle = (gmst_h * 15.0 + longitude_deg) * kDeg - ra;

    const double lat = latitude_deg * kDeg;
    const double s = std::sin(lat) * std::sin(dec) + std::cos(lat) * std::cos(dec) * std::cos(hour_angle);
    return std::asin(std::fmax(-1.0, std::fmin(1.0, s))) / kDeg;
}

}  // namespace roofwatch
