#include "synth/pattern_stepper.h"
#include "common/errors.h"
#include <cmath>
#include <string>

namespace dts {

void validate_pattern(const std::vector<Segment>& segments, double max_speed) {
    if (!(meters_to_degrees(max_speed) > 0.0) || !std::isfinite(max_speed))
        throw SimError(ErrorKind::INVALID_PARAMETER,
                       "max_speed must be positive, got " + std::to_string(max_speed));
    if (segments.empty())
        throw SimError(ErrorKind::INVALID_PARAMETER, "pattern has no segments");

    for (std::size_t i = 0; i < segments.size(); ++i) {
        const auto& seg = segments[i];
        // Lengths are walked in degrees; one that rounds to zero there is empty
        if (!(meters_to_degrees(seg.distance_m) > 0.0) || !std::isfinite(seg.distance_m))
            throw SimError(ErrorKind::INVALID_PARAMETER,
                           "segment " + std::to_string(i) + " has non-positive length");
        if (!std::isfinite(seg.bearing_deg))
            throw SimError(ErrorKind::INVALID_PARAMETER,
                           "segment " + std::to_string(i) + " has no valid bearing");
    }
}

PatternStepper::PatternStepper(const Coordinate& start, std::vector<Segment> segments,
                               double max_speed)
    : segments_(std::move(segments)),
      position_(start),
      max_speed_(max_speed),
      step_deg_(meters_to_degrees(max_speed)) {
    validate_pattern(segments_, max_speed_);
    target_deg_ = meters_to_degrees(segments_[0].distance_m) / std::sqrt(2.0);

    for (const auto& seg : segments_) {
        const double len = meters_to_degrees(seg.distance_m);
        const double rad = deg_to_rad(seg.bearing_deg);
        lap_deg_ += len;
        lap_lat_ += len * std::cos(rad);
        lap_lon_ += len * std::sin(rad);
    }
}

PatternSample PatternStepper::next() {
    if (!started_) {
        started_ = true;
        return PatternSample{position_, 0.0};
    }

    double step_left = step_deg_;
    while (step_left > 0.0) {
        const double remaining = target_deg_ - covered_deg_;
        if (remaining <= 0.0) {
            // Landed exactly on the boundary last tick
            advance_turn();
            continue;
        }
        if (!first_leg_ && covered_deg_ == 0.0 && step_left > lap_deg_) {
            // Whole laps of the polyline fit into what is left of the step
            const double laps = std::floor(step_left / lap_deg_);
            position_.lat += laps * lap_lat_;
            position_.lon += laps * lap_lon_;
            step_left -= laps * lap_deg_;
            continue;
        }
        if (step_left <= remaining) {
            move(step_left);
            covered_deg_ += step_left;
            step_left = 0.0;
        } else {
            move(remaining);
            step_left -= remaining;
            advance_turn();
        }
    }

    return PatternSample{position_, max_speed_};
}

void PatternStepper::advance_turn() {
    first_leg_ = false;
    turn_ = (turn_ + 1) % segments_.size();
    target_deg_ = meters_to_degrees(segments_[turn_].distance_m);
    covered_deg_ = 0.0;
}

void PatternStepper::move(double distance_deg) {
    const double rad = deg_to_rad(segments_[turn_].bearing_deg);
    position_.lat += distance_deg * std::cos(rad);
    position_.lon += distance_deg * std::sin(rad);
}

std::vector<PatternSample> generate_pattern(const Coordinate& start,
                                            const std::vector<Segment>& segments,
                                            std::size_t sample_count,
                                            double max_speed) {
    PatternStepper stepper(start, segments, max_speed);

    std::vector<PatternSample> out;
    out.reserve(sample_count);
    for (std::size_t i = 0; i < sample_count; ++i) {
        out.push_back(stepper.next());
    }
    return out;
}

std::vector<PatternSample> generate_static(const Coordinate& point,
                                           std::size_t sample_count) {
    return std::vector<PatternSample>(sample_count, PatternSample{point, 0.0});
}

} // namespace dts
