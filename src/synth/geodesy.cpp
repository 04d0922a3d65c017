#include "synth/geodesy.h"
#include <cmath>

namespace dts {

static constexpr double DEG_TO_RAD = PI / 180.0;
static constexpr double RAD_TO_DEG = 180.0 / PI;

double deg_to_rad(double deg) {
    return deg * DEG_TO_RAD;
}

double distance_m(const Coordinate& p1, const Coordinate& p2) {
    const double dlat = (p2.lat - p1.lat) * DEG_TO_RAD;
    const double dlon = (p2.lon - p1.lon) * DEG_TO_RAD;

    const double a = std::sin(dlat / 2.0) * std::sin(dlat / 2.0)
                   + std::cos(p1.lat * DEG_TO_RAD) * std::cos(p2.lat * DEG_TO_RAD)
                   * std::sin(dlon / 2.0) * std::sin(dlon / 2.0);
    const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));

    return EARTH_RADIUS_M * c;
}

double bearing_rad(const Coordinate& p1, const Coordinate& p2) {
    const double lat1 = p1.lat * DEG_TO_RAD;
    const double lat2 = p2.lat * DEG_TO_RAD;
    const double dlon = (p2.lon - p1.lon) * DEG_TO_RAD;

    const double x = std::sin(dlon) * std::cos(lat2);
    const double y = std::cos(lat1) * std::sin(lat2)
                   - std::sin(lat1) * std::cos(lat2) * std::cos(dlon);
    return std::atan2(x, y);
}

double meters_to_degrees(double meters) {
    return meters / EARTH_RADIUS_M * RAD_TO_DEG;
}

double degrees_to_meters(double degrees) {
    return degrees * EARTH_RADIUS_M * DEG_TO_RAD;
}

Coordinate clamp_step(const Coordinate& start, const Coordinate& proposed_end,
                      double max_distance_m) {
    const double dist = distance_m(start, proposed_end);
    if (dist <= max_distance_m)
        return proposed_end;

    const double ratio = max_distance_m / dist;
    return Coordinate{start.lat + (proposed_end.lat - start.lat) * ratio,
                      start.lon + (proposed_end.lon - start.lon) * ratio};
}

double normalize_degrees(double deg) {
    double d = std::fmod(deg, 360.0);
    if (d < 0.0) d += 360.0;
    return d;
}

} // namespace dts
