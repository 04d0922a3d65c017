#include "common/logger.h"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <ctime>
#include <cstring>
#include <cctype>

namespace dts {

const char* severity_str(Severity s) {
    switch (s) {
        case Severity::DEBUG: return "DEBUG";
        case Severity::INFO:  return "INFO ";
        case Severity::WARN:  return "WARN ";
        case Severity::ALARM: return "ALARM";
        case Severity::ERROR: return "ERROR";
        case Severity::FATAL: return "FATAL";
    }
    return "?????";
}

const char* category_str(EventCategory c) {
    switch (c) {
        case EventCategory::INGEST:    return "INGEST    ";
        case EventCategory::SYNTHESIS: return "SYNTHESIS ";
        case EventCategory::REGISTRY:  return "REGISTRY  ";
        case EventCategory::EXPORT:    return "EXPORT    ";
        case EventCategory::CONFIG:    return "CONFIG    ";
        case EventCategory::CONTROL:   return "CONTROL   ";
    }
    return "??????????";
}

const char* event_name(EventId id) {
    switch (id) {
        case EventId::EVT_TRACE_LOADED:     return "EVT_TRACE_LOADED";
        case EventId::EVT_TRACE_EXPORTED:   return "EVT_TRACE_EXPORTED";
        case EventId::EVT_PLANAR_PROJECTED: return "EVT_PLANAR_PROJECTED";
        case EventId::EVT_FRAMES_EXPORTED:  return "EVT_FRAMES_EXPORTED";
        case EventId::EVT_VEHICLE_ADDED:    return "EVT_VEHICLE_ADDED";
        case EventId::EVT_VEHICLE_REMOVED:  return "EVT_VEHICLE_REMOVED";
        case EventId::EVT_LEGEND_CHANGED:   return "EVT_LEGEND_CHANGED";
        case EventId::EVT_DRONE_CREATED:    return "EVT_DRONE_CREATED";
        case EventId::EVT_ID_COLLISION:     return "EVT_ID_COLLISION";
        case EventId::EVT_SECTION_RUN:      return "EVT_SECTION_RUN";
        case EventId::EVT_SECTION_SKIPPED:  return "EVT_SECTION_SKIPPED";
        case EventId::EVT_CONFIG_CHANGE:    return "EVT_CONFIG_CHANGE";
    }
    return "EVT_UNKNOWN";
}

bool parse_severity(const std::string& name, Severity& out) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);

    if (upper == "DEBUG")      out = Severity::DEBUG;
    else if (upper == "INFO")  out = Severity::INFO;
    else if (upper == "WARN")  out = Severity::WARN;
    else if (upper == "ALARM") out = Severity::ALARM;
    else if (upper == "ERROR") out = Severity::ERROR;
    else if (upper == "FATAL") out = Severity::FATAL;
    else return false;
    return true;
}

Logger::Logger() : out_(&std::cout) {}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

void Logger::set_level(Severity level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

Severity Logger::get_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::set_output(std::ostream& os) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = &os;
}

void Logger::log(Severity sev, EventCategory cat,
                 const std::string& event_name,
                 const std::string& detail) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Severity filter
    if (static_cast<uint8_t>(sev) < static_cast<uint8_t>(level_))
        return;

    if (!out_)
        return;

    // Timestamp: ISO 8601 with milliseconds
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t_now, &utc);

    // Pad event_name to 20 chars
    char evt_buf[21];
    std::memset(evt_buf, ' ', 20);
    evt_buf[20] = '\0';
    std::size_t name_len = event_name.size();
    if (name_len > 20) name_len = 20;
    std::memcpy(evt_buf, event_name.data(), name_len);

    *out_ << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
          << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z'
          << " [" << severity_str(sev) << "] "
          << "[" << category_str(cat) << "] "
          << evt_buf
          << detail << '\n';
}

} // namespace dts
