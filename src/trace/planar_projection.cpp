#include "trace/planar_projection.h"
#include "synth/geodesy.h"
#include "common/types.h"
#include <cmath>

namespace dts {

PlanarPoint to_planar(double lon, double lat, double min_lon, double min_lat) {
    const double dlat = deg_to_rad(lat - min_lat);
    const double dlon = deg_to_rad(lon - min_lon);
    const double x = PLANAR_EARTH_RADIUS_M * dlon * std::cos(deg_to_rad(min_lat));
    const double y = PLANAR_EARTH_RADIUS_M * dlat;
    return PlanarPoint{std::round(x * 100.0) / 100.0, std::round(y * 100.0) / 100.0};
}

TraceBounds project_to_planar(TraceDocument& doc) {
    const TraceBounds b = doc.bounds();
    if (b.empty)
        return b;
    doc.transform_positions([&b](double& x, double& y) {
        PlanarPoint p = to_planar(x, y, b.min_x, b.min_y);
        x = p.x_m;
        y = p.y_m;
    });
    return b;
}

} // namespace dts
