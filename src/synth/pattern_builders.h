#pragma once
#include "synth/geodesy.h"
#include "synth/pattern_stepper.h"
#include <string>
#include <vector>

namespace dts {

// Geometry handed to the stepper: where to start, what to walk, how fast.
struct PatternPlan {
    Coordinate           start;
    std::vector<Segment> segments;
    double               max_speed;
};

struct CircularParams {
    Coordinate center;
    double     radius_m        = 40.0;
    double     max_speed       = 10.0;
    double     start_angle_deg = 0.0;
};

struct AngularParams {
    Coordinate start_point;
    double     max_length_m    = 40.0;
    double     start_angle_deg = 0.0;
    int        max_turns       = 3;
    double     angle_alpha_deg = 30.0;
    double     max_speed       = 10.0;
};

enum class TractorOrientation {
    HORIZONTAL = 0,
    VERTICAL   = 1,
};

struct TractorParams {
    Coordinate         start_point;
    double             width_between_tracks_m = 70.0;
    double             max_length_m           = 100.0;
    int                max_turns              = 6;
    TractorOrientation orientation            = TractorOrientation::HORIZONTAL;
    double             max_speed              = 10.0;
};

struct SquareParams {
    Coordinate center_point;
    double     side_length_m = 50.0;
    double     angle_deg     = 90.0;
    double     max_speed     = 10.0;
};

struct GenericParams {
    Coordinate           start_point;
    std::vector<Segment> segments;
    double               max_speed = 10.0;
};

// Orbit around center at radius_m. One segment per tick of a revolution,
// each max_speed long and tangent to the circle; the per-tick turn is
// 360 / floor(2*pi*radius / max_speed) degrees so one revolution closes.
PatternPlan build_circular(const CircularParams& p);

// max_turns pairs (start+alpha, 180-start-alpha) followed by max_turns
// mirrored pairs (start-alpha, 180+start+alpha), every leg max_length_m.
PatternPlan build_angular(const AngularParams& p);

// Lawn-mower sweep: long legs joined by lateral hops of the track width,
// max_turns passes out, one return hop, max_turns passes back.
PatternPlan build_tractor(const TractorParams& p);

// Four legs of side_length_m, headings angle - 90*i. The start corner is
// offset from the center along the diagonal.
PatternPlan build_square(const SquareParams& p);

PatternPlan build_generic(const GenericParams& p);

bool parse_orientation(const std::string& text, TractorOrientation& out);
const char* orientation_str(TractorOrientation o);

} // namespace dts
