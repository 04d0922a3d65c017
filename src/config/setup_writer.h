#pragma once
#include "simulation/point_placement.h"
#include "trace/trace_document.h"
#include <string>
#include <vector>

namespace dts {

struct PlacedPoint {
    Coordinate  point;
    PatternKind kind;
};

// Trace path without its extension ("maps/city.xml" -> "maps/city").
std::string trace_base_path(const std::string& trace_path);

// Render a run file for `trace_path` with one Drone<Pattern><n> section
// per placed point, numbered per pattern. Points outside `bounds` are
// dropped with a WARN record.
std::string build_setup_config(const std::string& trace_path,
                               const std::vector<PlacedPoint>& points,
                               const TraceBounds& bounds);

// Write build_setup_config() to "<trace base>.ini" and return that path.
// Throws std::runtime_error if the file cannot be written.
std::string write_setup_config(const std::string& trace_path,
                               const std::vector<PlacedPoint>& points,
                               const TraceBounds& bounds);

} // namespace dts
