#include "synth/following.h"
#include "common/errors.h"
#include <cmath>

namespace dts {
namespace {

double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

std::optional<Coordinate> at(const std::vector<std::optional<Coordinate>>& ref, std::size_t i) {
    if (i >= ref.size()) return std::nullopt;
    return ref[i];
}

} // anonymous namespace

void validate_following(const FollowingParams& p) {
    if (!(p.offset_distance_m >= 0.0) || !std::isfinite(p.offset_distance_m))
        throw SimError(ErrorKind::INVALID_PARAMETER,
                       "offset_distance must not be negative, got " + std::to_string(p.offset_distance_m));
    if (!(p.max_speed > 0.0) || !std::isfinite(p.max_speed))
        throw SimError(ErrorKind::INVALID_PARAMETER,
                       "max_speed must be positive, got " + std::to_string(p.max_speed));
    if (!(p.smoothing > 0.0 && p.smoothing <= 1.0))
        throw SimError(ErrorKind::INVALID_PARAMETER,
                       "smoothing must lie in (0, 1], got " + std::to_string(p.smoothing));
}

std::vector<std::optional<PatternSample>>
generate_following(const std::vector<std::optional<Coordinate>>& reference,
                   const FollowingParams& p) {
    validate_following(p);

    std::vector<std::optional<PatternSample>> out(reference.size());
    const double offset_deg = meters_to_degrees(p.offset_distance_m);

    double heading = 0.0;                 // last usable bearing, radians
    std::optional<Coordinate> previous;   // last emitted drone position
    std::size_t previous_tick = 0;

    for (std::size_t i = 0; i < reference.size(); ++i) {
        if (!reference[i]) continue;
        const Coordinate& here = *reference[i];

        // Bearing from this tick to the next, or from the previous one at the tail.
        auto next = at(reference, i + 1);
        auto prev = (i > 0) ? reference[i - 1] : std::optional<Coordinate>();
        if (next && *next != here) {
            heading = bearing_rad(here, *next);
        } else if (!next && prev && *prev != here) {
            heading = bearing_rad(*prev, here);
        }

        if (!previous) {
            // The drone takes off from the followed vehicle's first position.
            for (std::size_t k = 0; k <= i; ++k)
                out[k] = PatternSample{here, 0.0};
            previous = here;
            previous_tick = i;
            continue;
        }

        Coordinate raw{here.lat - offset_deg * std::cos(heading),
                       here.lon - offset_deg / std::cos(deg_to_rad(here.lat)) * std::sin(heading)};

        Coordinate smoothed{previous->lat + p.smoothing * (raw.lat - previous->lat),
                            previous->lon + p.smoothing * (raw.lon - previous->lon)};
        const std::size_t gap = i - previous_tick;
        Coordinate clamped = clamp_step(*previous, smoothed, p.max_speed);
        const double speed = distance_m(*previous, clamped) / static_cast<double>(gap);

        out[i] = PatternSample{clamped, round2(speed)};
        previous = clamped;
        previous_tick = i;
    }
    return out;
}

} // namespace dts
