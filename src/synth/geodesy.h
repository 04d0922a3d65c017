#pragma once
#include "common/types.h"

namespace dts {

// (latitude, longitude) in decimal degrees. No range is enforced.
struct Coordinate {
    double lat = 0.0;
    double lon = 0.0;
};

inline bool operator==(const Coordinate& a, const Coordinate& b) {
    return a.lat == b.lat && a.lon == b.lon;
}

inline bool operator!=(const Coordinate& a, const Coordinate& b) {
    return !(a == b);
}

double deg_to_rad(double deg);

// Great-circle distance in meters (haversine, spherical Earth).
double distance_m(const Coordinate& p1, const Coordinate& p2);

// Initial compass bearing from p1 to p2 in radians, range (-pi, pi].
// Undefined for p1 == p2; callers must guard.
double bearing_rad(const Coordinate& p1, const Coordinate& p2);

// Small-angle conversion between meters on the sphere and degrees.
double meters_to_degrees(double meters);
double degrees_to_meters(double degrees);

// Limit the step start -> proposed_end to max_distance_m meters.
// Interpolates linearly in lat/lon space; returns proposed_end when
// it is already within range.
Coordinate clamp_step(const Coordinate& start, const Coordinate& proposed_end,
                      double max_distance_m);

// Normalize an angle in degrees to [0, 360).
double normalize_degrees(double deg);

} // namespace dts
