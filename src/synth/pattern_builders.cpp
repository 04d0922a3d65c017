#include "synth/pattern_builders.h"
#include "common/errors.h"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace dts {
namespace {

void require_positive(double value, const char* name) {
    if (!(value > 0.0) || !std::isfinite(value))
        throw SimError(ErrorKind::INVALID_PARAMETER,
                       std::string(name) + " must be positive, got " + std::to_string(value));
}

void require_turns(int turns) {
    if (turns < 1)
        throw SimError(ErrorKind::INVALID_PARAMETER,
                       "max_turns must be at least 1, got " + std::to_string(turns));
}

} // anonymous namespace

PatternPlan build_circular(const CircularParams& p) {
    require_positive(p.radius_m, "radius_meters");
    require_positive(p.max_speed, "max_speed");

    // Angular speed in rad per tick (one tick = one second)
    const double omega = p.max_speed / p.radius_m;
    const auto steps = static_cast<std::size_t>(std::floor(2.0 * PI / omega));
    if (steps == 0)
        throw SimError(ErrorKind::INVALID_PARAMETER,
                       "radius " + std::to_string(p.radius_m) +
                       " m is too small for one step of " + std::to_string(p.max_speed) + " m");

    const double turn_deg = 360.0 / static_cast<double>(steps);
    const double r_deg = meters_to_degrees(p.radius_m);
    const double a = deg_to_rad(p.start_angle_deg);

    PatternPlan plan;
    plan.start = Coordinate{p.center.lat + r_deg * std::cos(a),
                            p.center.lon + r_deg * std::sin(a)};
    plan.max_speed = p.max_speed;
    plan.segments.reserve(steps);
    for (std::size_t i = 0; i < steps; ++i) {
        const double heading = p.start_angle_deg + 90.0 + turn_deg * static_cast<double>(i);
        plan.segments.push_back({p.max_speed, heading});
    }
    return plan;
}

PatternPlan build_angular(const AngularParams& p) {
    require_positive(p.max_length_m, "max_length");
    require_positive(p.max_speed, "max_speed");
    require_turns(p.max_turns);

    const double s = p.start_angle_deg;
    const double alpha = p.angle_alpha_deg;

    PatternPlan plan;
    plan.start = p.start_point;
    plan.max_speed = p.max_speed;
    plan.segments.reserve(static_cast<std::size_t>(p.max_turns) * 4);

    for (int turn = 0; turn < p.max_turns; ++turn) {
        plan.segments.push_back({p.max_length_m, s + alpha});
        plan.segments.push_back({p.max_length_m, 180.0 - s - alpha});
    }
    for (int turn = 0; turn < p.max_turns; ++turn) {
        plan.segments.push_back({p.max_length_m, s - alpha});
        plan.segments.push_back({p.max_length_m, 180.0 + s + alpha});
    }
    return plan;
}

PatternPlan build_tractor(const TractorParams& p) {
    require_positive(p.width_between_tracks_m, "width_between_tracks");
    require_positive(p.max_length_m, "max_length");
    require_positive(p.max_speed, "max_speed");
    require_turns(p.max_turns);

    const double base = (p.orientation == TractorOrientation::HORIZONTAL) ? 0.0 : 90.0;
    const double width = p.width_between_tracks_m;
    const double length = p.max_length_m;

    PatternPlan plan;
    plan.start = p.start_point;
    plan.max_speed = p.max_speed;

    // Outbound sweep
    plan.segments.push_back({width, base});
    for (int turn = 0; turn < p.max_turns; ++turn) {
        const double leg = (turn % 2 == 0) ? 90.0 - base : 270.0 - base;
        plan.segments.push_back({length, leg});
        plan.segments.push_back({width, base});
    }

    // Full-width return hop, then sweep back
    plan.segments.push_back({width, 180.0 + base});
    for (int turn = 0; turn < p.max_turns; ++turn) {
        const double leg = (turn % 2 == 0) ? 270.0 - base : 90.0 - base;
        plan.segments.push_back({length, leg});
        plan.segments.push_back({width, 180.0 + base});
    }
    return plan;
}

PatternPlan build_square(const SquareParams& p) {
    require_positive(p.side_length_m, "side_length");
    require_positive(p.max_speed, "max_speed");

    PatternPlan plan;
    plan.max_speed = p.max_speed;
    for (int i = 0; i < 4; ++i) {
        plan.segments.push_back({p.side_length_m, normalize_degrees(p.angle_deg - 90.0 * i)});
    }

    const double center_direction = normalize_degrees(-3.0 * p.angle_deg + 315.0);
    const double half_diagonal = meters_to_degrees(std::sqrt(2.0) * p.side_length_m / 2.0);
    const double cd = deg_to_rad(center_direction);
    plan.start = Coordinate{p.center_point.lat - half_diagonal * std::cos(cd),
                            p.center_point.lon - half_diagonal * std::sin(cd)};
    return plan;
}

PatternPlan build_generic(const GenericParams& p) {
    validate_pattern(p.segments, p.max_speed);
    return PatternPlan{p.start_point, p.segments, p.max_speed};
}

bool parse_orientation(const std::string& text, TractorOrientation& out) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "horizontal") {
        out = TractorOrientation::HORIZONTAL;
        return true;
    }
    if (lower == "vertical") {
        out = TractorOrientation::VERTICAL;
        return true;
    }
    return false;
}

const char* orientation_str(TractorOrientation o) {
    switch (o) {
        case TractorOrientation::HORIZONTAL: return "horizontal";
        case TractorOrientation::VERTICAL:   return "vertical";
    }
    return "unknown";
}

} // namespace dts
