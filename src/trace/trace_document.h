#pragma once
#include "trace/vehicle.h"
#include <libxml/tree.h>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace dts {

// One <vehicle> element of a timestep.
struct VehicleRecord {
    std::string id;
    std::string type;
    Timestep    sample;   // sample.tick is the internal tick of the enclosing timestep
};

struct TimestepRecord {
    double                     time = 0.0;
    int64_t                    tick = 0;
    std::vector<VehicleRecord> vehicles;
};

struct TraceBounds {
    double min_x = 0.0;
    double max_x = 0.0;
    double min_y = 0.0;
    double max_y = 0.0;
    bool   empty = true;

    bool contains(double x, double y) const {
        return !empty && x >= min_x && x <= max_x && y >= min_y && y <= max_y;
    }
};

// Internal tick of a trace time value: int(time) + 1.
// Throws SimError(MALFORMED_INPUT) if int(time) does not fit an int64_t.
int64_t tick_of_time(double time);

// Owning wrapper around a libxml2 document holding a floating car trace:
// <root><timestep time=".."><vehicle id x y angle type speed pos lane slope/>..</timestep>..</root>
class TraceDocument {
public:
    TraceDocument(TraceDocument&&) = default;
    TraceDocument& operator=(TraceDocument&&) = default;

    // Throw SimError(MALFORMED_INPUT) if the input is not well-formed XML.
    static TraceDocument load_file(const std::string& path);
    static TraceDocument load_string(const std::string& xml);

    // Parse every timestep and its vehicle records in document order.
    // Throws SimError(MALFORMED_INPUT) on a missing or non-numeric attribute.
    std::vector<TimestepRecord> read_records() const;

    // Remove every <vehicle> child of every <timestep> and insert, for each
    // timestep, the records `by_tick` holds for its internal tick. Every
    // other node is left in place.
    void replace_vehicles(const std::map<int64_t, std::vector<VehicleRecord>>& by_tick);

    // Apply fn to the (x, y) attributes of every vehicle element.
    void transform_positions(const std::function<void(double& x, double& y)>& fn);

    // Deep copy; throws std::runtime_error if libxml2 cannot copy the tree.
    TraceDocument clone() const;

    TraceBounds bounds() const;
    std::size_t timestep_count() const;

    // Serialize with an XML declaration in UTF-8. save_file throws
    // std::runtime_error if the file cannot be written.
    void save_file(const std::string& path) const;
    std::string to_string() const;

private:
    struct DocDeleter {
        void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
    };

    explicit TraceDocument(xmlDoc* doc);

    std::vector<xmlNode*> timestep_nodes() const;

    std::unique_ptr<xmlDoc, DocDeleter> doc_;
};

} // namespace dts
