#pragma once
#include "trace/trace_document.h"

namespace dts {

struct PlanarPoint {
    double x_m;
    double y_m;
};

// Equirectangular offset of (lon, lat) from (min_lon, min_lat), in meters,
// rounded to centimeters.
PlanarPoint to_planar(double lon, double lat, double min_lon, double min_lat);

// Rewrite every vehicle x/y of `doc` as meters relative to the smallest
// x and y found in it. Returns the bounds used as origin.
TraceBounds project_to_planar(TraceDocument& doc);

} // namespace dts
