#include "config/setup_writer.h"
#include "common/logger.h"
#include <cstdio>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>

namespace dts {
namespace {

std::string format_point(const Coordinate& c) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.6f, %.6f", c.lat, c.lon);
    return buf;
}

} // anonymous namespace

std::string trace_base_path(const std::string& trace_path) {
    auto slash = trace_path.find_last_of('/');
    auto dot = trace_path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash))
        return trace_path;
    return trace_path.substr(0, dot);
}

std::string build_setup_config(const std::string& trace_path,
                               const std::vector<PlacedPoint>& points,
                               const TraceBounds& bounds) {
    const std::string base = trace_base_path(trace_path);
    std::ostringstream ini;
    ini << "[Simulation]\n"
        << "trace_path = " << trace_path << "\n\n";

    std::map<PatternKind, int> counts;
    for (const auto& pp : points) {
        if (!bounds.contains(pp.point.lon, pp.point.lat)) {
            Logger::instance().log(Severity::WARN, EventCategory::CONFIG,
                                   event_name(EventId::EVT_SECTION_SKIPPED),
                                   "point " + format_point(pp.point) + " outside the trace area, ignored");
            continue;
        }

        const int n = ++counts[pp.kind];
        const std::string where = format_point(pp.point);
        ini << "[Drone" << pattern_section_name(pp.kind) << n << "]\n";
        switch (pp.kind) {
            case PatternKind::CIRCULAR: {
                CircularParams p = default_circular(pp.point);
                ini << "center = " << where << "\n"
                    << "radius_meters = " << p.radius_m << "\n"
                    << "max_speed = " << p.max_speed << "\n"
                    << "start_angle = " << p.start_angle_deg << "\n";
                break;
            }
            case PatternKind::ANGULAR: {
                AngularParams p = default_angular(pp.point);
                ini << "start_point = " << where << "\n"
                    << "max_length = " << p.max_length_m << "\n"
                    << "start_angle = " << p.start_angle_deg << "\n"
                    << "max_turns = " << p.max_turns << "\n"
                    << "angle_alpha = " << p.angle_alpha_deg << "\n"
                    << "max_speed = " << p.max_speed << "\n";
                break;
            }
            case PatternKind::TRACTOR: {
                TractorParams p = default_tractor(pp.point);
                ini << "start_point = " << where << "\n"
                    << "width_between_tracks = " << p.width_between_tracks_m << "\n"
                    << "max_length = " << p.max_length_m << "\n"
                    << "max_turns = " << p.max_turns << "\n"
                    << "orientation = " << orientation_str(p.orientation) << "\n"
                    << "max_speed = " << p.max_speed << "\n";
                break;
            }
            case PatternKind::STATIC:
                ini << "point = " << where << "\n";
                break;
            case PatternKind::SQUARE: {
                SquareParams p = default_square(pp.point);
                ini << "center_point = " << where << "\n"
                    << "side_length = " << p.side_length_m << "\n"
                    << "angle_degrees = " << p.angle_deg << "\n"
                    << "max_speed = " << p.max_speed << "\n";
                break;
            }
        }
        ini << "\n";
    }

    ini << "[ExportXML]\n"
        << "new_xml_path = " << base << "UAV.xml\n\n"
        << "[ExportVideo]\n"
        << "video_directory = " << base << "_video\n"
        << "only_vants = 0\n";
    return ini.str();
}

std::string write_setup_config(const std::string& trace_path,
                               const std::vector<PlacedPoint>& points,
                               const TraceBounds& bounds) {
    const std::string path = trace_base_path(trace_path) + ".ini";
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open())
        throw std::runtime_error("Cannot write run file: " + path);
    file << build_setup_config(trace_path, points, bounds);
    if (!file.good())
        throw std::runtime_error("Cannot write run file: " + path);

    Logger::instance().log(Severity::INFO, EventCategory::CONFIG,
                           event_name(EventId::EVT_CONFIG_CHANGE),
                           "run file written: " + path);
    return path;
}

} // namespace dts
