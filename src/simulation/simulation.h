#pragma once
#include "common/event_bus.h"
#include "common/types.h"
#include "synth/following.h"
#include "synth/pattern_builders.h"
#include "trace/category_table.h"
#include "trace/trace_document.h"
#include "trace/vehicle.h"
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace dts {

// Positions of one agent for ticks [0, max_tick_exclusive).
struct AgentTrack {
    std::string vehicle_id;
    std::vector<std::optional<Coordinate>> positions;
};

struct CategoryTracks {
    CategoryId category;
    std::string label;
    std::vector<AgentTrack> agents;
};

// Registry of ingested vehicles and generated drones over one trace.
class Simulation {
public:
    // Ingest every vehicle record of `doc`. Throws SimError(MALFORMED_INPUT)
    // if a record misses a required attribute.
    explicit Simulation(TraceDocument doc, std::string source_path = "");

    static std::unique_ptr<Simulation> from_file(const std::string& trace_path);

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    // Highest internal tick of the ingested trace (0 for an empty trace).
    int64_t last_ingested_tick() const { return tick_count_; }
    // Exclusive upper bound for per-tick lookups.
    int64_t max_tick_exclusive() const { return tick_count_ + 1; }

    // Drone creation. Each returns the new agent id ("drone<N>").
    // Parameters are validated before the registry or counter change.
    std::string create_drone_circular(const CircularParams& p);
    std::string create_drone_angular(const AngularParams& p);
    std::string create_drone_tractor(const TractorParams& p);
    std::string create_drone_square(const SquareParams& p);
    std::string create_drone_static(const Coordinate& point);
    std::string create_drone_generic(const GenericParams& p);
    // Throws SimError(NOT_FOUND) if vehicle_id is not registered.
    std::string create_drone_following(const std::string& vehicle_id, const FollowingParams& p);

    // Queries. Unknown ids throw SimError(NOT_FOUND).
    const Vehicle& get_vehicle(const std::string& id) const;
    bool has_vehicle(const std::string& id) const;
    std::vector<std::optional<Timestep>> vehicle_samples(const std::string& id) const;
    std::vector<CategoryTracks> coordinate_vectors() const;
    std::vector<std::string> vehicle_ids() const;
    std::size_t vehicle_count() const { return vehicles_.size(); }
    uint32_t drone_counter() const { return drone_counter_; }

    const CategoryTable& categories() const { return categories_; }
    CategoryId register_category(const std::string& name);

    // Mutation
    void add_vehicle(Vehicle vehicle);                  // DUPLICATE_ID, UNKNOWN_CATEGORY
    void remove_vehicle(const std::string& id);         // NOT_FOUND
    void change_legend(const std::string& category, const std::string& label); // UNKNOWN_CATEGORY

    // Write the trace with registry samples. geo = false re-projects all
    // positions to planar meters.
    void export_trace(const std::string& path, bool geo = true);
    std::string export_trace_string(bool geo = true);

    // Write the per-tick frame table; returns the number of rows written.
    // Throws std::runtime_error if the file cannot be opened.
    uint64_t export_frames(const std::string& path, bool only_uav = false) const;

    // One line per present sample of `id`.
    void print_vehicle_info(const std::string& id, std::ostream& os) const;

    const std::string& source_path() const { return source_path_; }

    EventBus& event_bus() { return bus_; }

private:
    void ingest();
    // Write the registry samples into doc_.
    void render();
    // Copy of doc_ re-projected to planar meters.
    TraceDocument planar_copy() const;
    std::string insert_pattern_drone(const PatternPlan& plan, const char* pattern);
    // by_tick[t] is the drone sample at tick t, if any.
    std::string insert_drone(const std::vector<std::optional<PatternSample>>& by_tick,
                             const char* pattern);
    std::string next_drone_id();
    void publish_event(EventId id, EventCategory cat, Severity sev,
                       int64_t tick, const std::string& subject,
                       const std::string& detail) const;

    TraceDocument doc_;
    std::string source_path_;
    CategoryTable categories_;
    std::map<std::string, Vehicle> vehicles_;
    std::vector<std::string> order_;    // registration order of vehicles_
    int64_t tick_count_ = 0;
    uint32_t drone_counter_ = 0;
    mutable EventBus bus_;
};

} // namespace dts
