#include "simulation/point_placement.h"
#include "common/errors.h"
#include <algorithm>
#include <cctype>

namespace dts {

const char* pattern_kind_str(PatternKind k) {
    switch (k) {
        case PatternKind::CIRCULAR: return "circular";
        case PatternKind::ANGULAR:  return "angular";
        case PatternKind::TRACTOR:  return "tractor";
        case PatternKind::STATIC:   return "static";
        case PatternKind::SQUARE:   return "square";
    }
    return "unknown";
}

bool parse_pattern_kind(const std::string& text, PatternKind& out) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "circular")      out = PatternKind::CIRCULAR;
    else if (lower == "angular")  out = PatternKind::ANGULAR;
    else if (lower == "tractor")  out = PatternKind::TRACTOR;
    else if (lower == "static")   out = PatternKind::STATIC;
    else if (lower == "square")   out = PatternKind::SQUARE;
    else return false;
    return true;
}

const char* pattern_section_name(PatternKind k) {
    switch (k) {
        case PatternKind::CIRCULAR: return "Circular";
        case PatternKind::ANGULAR:  return "Angular";
        case PatternKind::TRACTOR:  return "Tractor";
        case PatternKind::STATIC:   return "Static";
        case PatternKind::SQUARE:   return "Square";
    }
    return "Unknown";
}

CircularParams default_circular(const Coordinate& center) {
    CircularParams p;
    p.center = center;
    p.radius_m = 40.0;
    p.max_speed = 10.0;
    p.start_angle_deg = 0.0;
    return p;
}

AngularParams default_angular(const Coordinate& start) {
    AngularParams p;
    p.start_point = start;
    p.max_length_m = 40.0;
    p.start_angle_deg = 0.0;
    p.max_turns = 3;
    p.angle_alpha_deg = 30.0;
    p.max_speed = 10.0;
    return p;
}

TractorParams default_tractor(const Coordinate& start) {
    TractorParams p;
    p.start_point = start;
    p.width_between_tracks_m = 70.0;
    p.max_length_m = 100.0;
    p.max_turns = 6;
    p.orientation = TractorOrientation::VERTICAL;
    p.max_speed = 10.0;
    return p;
}

SquareParams default_square(const Coordinate& center) {
    SquareParams p;
    p.center_point = center;
    p.side_length_m = 50.0;
    p.angle_deg = 90.0;
    p.max_speed = 10.0;
    return p;
}

std::string place_drone(Simulation& sim, const Coordinate& point, PatternKind kind) {
    switch (kind) {
        case PatternKind::CIRCULAR: return sim.create_drone_circular(default_circular(point));
        case PatternKind::ANGULAR:  return sim.create_drone_angular(default_angular(point));
        case PatternKind::TRACTOR:  return sim.create_drone_tractor(default_tractor(point));
        case PatternKind::STATIC:   return sim.create_drone_static(point);
        case PatternKind::SQUARE:   return sim.create_drone_square(default_square(point));
    }
    throw SimError(ErrorKind::INVALID_PARAMETER, "unknown pattern kind");
}

} // namespace dts
