#pragma once
#include "synth/geodesy.h"
#include <cstddef>
#include <vector>

namespace dts {

// One leg of a cyclic polyline: length in meters, compass bearing in degrees.
struct Segment {
    double distance_m;
    double bearing_deg;
};

struct PatternSample {
    Coordinate position;
    double     speed_mps;
};

// Throws SimError(INVALID_PARAMETER) on an empty segment list, or a
// segment length or speed that is not positive once converted to degrees.
void validate_pattern(const std::vector<Segment>& segments, double max_speed);

// Walks a cyclic list of segments at a constant step of max_speed meters
// per tick. The step is taken in degree space along the segment bearing
// (no longitude scale correction). A step that crosses a segment boundary
// continues along the next segment with the unused remainder, so every
// tick after the first covers exactly one full step.
//
// The very first segment is shortened by sqrt(2); later passes over it
// use its full length.
class PatternStepper {
public:
    PatternStepper(const Coordinate& start, std::vector<Segment> segments,
                   double max_speed);

    // First call returns the start point at speed 0.
    PatternSample next();

    std::size_t turn() const { return turn_; }
    double covered_deg() const { return covered_deg_; }
    double target_deg() const { return target_deg_; }
    const Coordinate& position() const { return position_; }

private:
    void advance_turn();
    void move(double distance_deg);

    std::vector<Segment> segments_;
    Coordinate position_;
    double max_speed_;
    double step_deg_;
    std::size_t turn_ = 0;
    double target_deg_ = 0.0;
    double covered_deg_ = 0.0;
    bool started_ = false;
    bool first_leg_ = true;
    // One full pass over segments_: length and displacement in degrees
    double lap_deg_ = 0.0;
    double lap_lat_ = 0.0;
    double lap_lon_ = 0.0;
};

// Exactly sample_count samples; the first one is the unmodified start.
std::vector<PatternSample> generate_pattern(const Coordinate& start,
                                            const std::vector<Segment>& segments,
                                            std::size_t sample_count,
                                            double max_speed);

// Every sample at the same point with speed 0.
std::vector<PatternSample> generate_static(const Coordinate& point,
                                           std::size_t sample_count);

} // namespace dts
