#pragma once
#include "simulation/simulation.h"
#include <string>

namespace dts {

enum class PatternKind : uint8_t {
    CIRCULAR = 0,
    ANGULAR  = 1,
    TRACTOR  = 2,
    STATIC   = 3,
    SQUARE   = 4,
};

// Lower-case name used in commands and command-line points ("circular", ...).
const char* pattern_kind_str(PatternKind k);
bool parse_pattern_kind(const std::string& text, PatternKind& out);

// Section prefix of a run file ("Circular" -> DroneCircular<n>).
const char* pattern_section_name(PatternKind k);

// Parameter sets a point placed on the map gets.
CircularParams default_circular(const Coordinate& center);
AngularParams  default_angular(const Coordinate& start);
TractorParams  default_tractor(const Coordinate& start);
SquareParams   default_square(const Coordinate& center);

// Create a drone of `kind` at `point` with the defaults above.
// Returns the new agent id.
std::string place_drone(Simulation& sim, const Coordinate& point, PatternKind kind);

} // namespace dts
