#pragma once
#include <cstdint>
#include <cstddef>

namespace dts {

// Mean Earth radius used by the geodesic primitives (spherical model)
constexpr double EARTH_RADIUS_M = 6371000.0;

// WGS84 semi-major axis used by the planar re-projection
constexpr double PLANAR_EARTH_RADIUS_M = 6378137.0;

constexpr double PI = 3.14159265358979323846;

// Tick 0 is reserved; trace time t is stored at tick int(t) + 1
constexpr int64_t TICK_OFFSET = 1;

// Category every generated drone belongs to
constexpr const char* UAV_CATEGORY = "UAV";

// Default smoothing factor of the following pattern
constexpr double FOLLOW_SMOOTHING = 0.4;

// Log severity
enum class Severity : uint8_t {
    DEBUG = 0,
    INFO  = 1,
    WARN  = 2,
    ALARM = 3,
    ERROR = 4,
    FATAL = 5,
};

// Event category
enum class EventCategory : uint8_t {
    INGEST    = 0,
    SYNTHESIS = 1,
    REGISTRY  = 2,
    EXPORT    = 3,
    CONFIG    = 4,
    CONTROL   = 5,
};

// Event ID
enum class EventId : uint16_t {
    EVT_TRACE_LOADED      = 0x0100,
    EVT_TRACE_EXPORTED    = 0x0101,
    EVT_PLANAR_PROJECTED  = 0x0102,
    EVT_FRAMES_EXPORTED   = 0x0103,
    EVT_VEHICLE_ADDED     = 0x0200,
    EVT_VEHICLE_REMOVED   = 0x0201,
    EVT_LEGEND_CHANGED    = 0x0202,
    EVT_DRONE_CREATED     = 0x0300,
    EVT_ID_COLLISION      = 0x0301,
    EVT_SECTION_RUN       = 0x0400,
    EVT_SECTION_SKIPPED   = 0x0401,
    EVT_CONFIG_CHANGE     = 0x0402,
};

} // namespace dts
