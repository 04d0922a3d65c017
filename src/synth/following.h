#pragma once
#include "synth/geodesy.h"
#include "synth/pattern_stepper.h"
#include "common/types.h"
#include <optional>
#include <vector>

namespace dts {

struct FollowingParams {
    double offset_distance_m = 10.0;
    double max_speed         = 10.0;
    double smoothing         = FOLLOW_SMOOTHING;
};

void validate_following(const FollowingParams& p);

// Produce one drone sample per entry of `reference` (indexed by tick).
// The drone starts on the vehicle's first present position and back-fills
// every earlier tick with it at speed 0. Later ticks are offset behind the
// vehicle, smoothed toward the previous drone position and clamped to
// max_speed meters. Absent reference ticks after the first stay absent.
std::vector<std::optional<PatternSample>>
generate_following(const std::vector<std::optional<Coordinate>>& reference,
                   const FollowingParams& p);

} // namespace dts
