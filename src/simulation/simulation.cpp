#include "simulation/simulation.h"
#include "common/errors.h"
#include "common/logger.h"
#include "trace/frame_table_writer.h"
#include "trace/planar_projection.h"
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace dts {
namespace {

double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

Timestep drone_timestep(int64_t tick, const PatternSample& s) {
    Timestep ts;
    ts.tick = tick;
    ts.x = s.position.lon;
    ts.y = s.position.lat;
    ts.angle = 0.0;
    ts.speed = round2(s.speed_mps);
    ts.pos = 0.0;
    ts.lane = "0";
    ts.slope = 0.0;
    return ts;
}

} // anonymous namespace

Simulation::Simulation(TraceDocument doc, std::string source_path)
    : doc_(std::move(doc)), source_path_(std::move(source_path)) {
    ingest();
}

std::unique_ptr<Simulation> Simulation::from_file(const std::string& trace_path) {
    return std::make_unique<Simulation>(TraceDocument::load_file(trace_path), trace_path);
}

void Simulation::ingest() {
    std::size_t records = 0;
    for (auto& step : doc_.read_records()) {
        if (step.tick > tick_count_)
            tick_count_ = step.tick;
        for (auto& rec : step.vehicles) {
            auto it = vehicles_.find(rec.id);
            if (it == vehicles_.end()) {
                CategoryId cat = categories_.intern(rec.type);
                it = vehicles_.emplace(rec.id, Vehicle(rec.id, cat)).first;
                order_.push_back(rec.id);
            }
            it->second.add_timestep(rec.sample);
            ++records;
        }
    }

    std::ostringstream detail;
    detail << "path=" << (source_path_.empty() ? "<memory>" : source_path_)
           << " vehicles=" << vehicles_.size()
           << " records=" << records
           << " categories=" << categories_.size()
           << " last_tick=" << tick_count_;
    publish_event(EventId::EVT_TRACE_LOADED, EventCategory::INGEST, Severity::INFO,
                  tick_count_, source_path_, detail.str());
}

// --- Drone creation ---

std::string Simulation::create_drone_circular(const CircularParams& p) {
    return insert_pattern_drone(build_circular(p), "circular");
}

std::string Simulation::create_drone_angular(const AngularParams& p) {
    return insert_pattern_drone(build_angular(p), "angular");
}

std::string Simulation::create_drone_tractor(const TractorParams& p) {
    return insert_pattern_drone(build_tractor(p), "tractor");
}

std::string Simulation::create_drone_square(const SquareParams& p) {
    return insert_pattern_drone(build_square(p), "square");
}

std::string Simulation::create_drone_generic(const GenericParams& p) {
    return insert_pattern_drone(build_generic(p), "generic");
}

std::string Simulation::create_drone_static(const Coordinate& point) {
    auto samples = generate_static(point, static_cast<std::size_t>(tick_count_));
    std::vector<std::optional<PatternSample>> by_tick(static_cast<std::size_t>(max_tick_exclusive()));
    for (std::size_t i = 0; i < samples.size(); ++i)
        by_tick[i + TICK_OFFSET] = samples[i];
    return insert_drone(by_tick, "static");
}

std::string Simulation::create_drone_following(const std::string& vehicle_id,
                                               const FollowingParams& p) {
    const Vehicle& target = get_vehicle(vehicle_id);

    std::vector<std::optional<Coordinate>> reference;
    reference.reserve(static_cast<std::size_t>(max_tick_exclusive()));
    for (int64_t t = 0; t < max_tick_exclusive(); ++t)
        reference.push_back(target.coordinate_at(t));

    return insert_drone(generate_following(reference, p), "following");
}

std::string Simulation::insert_pattern_drone(const PatternPlan& plan, const char* pattern) {
    auto samples = generate_pattern(plan.start, plan.segments,
                                    static_cast<std::size_t>(tick_count_), plan.max_speed);
    std::vector<std::optional<PatternSample>> by_tick(static_cast<std::size_t>(max_tick_exclusive()));
    for (std::size_t i = 0; i < samples.size(); ++i)
        by_tick[i + TICK_OFFSET] = samples[i];
    return insert_drone(by_tick, pattern);
}

std::string Simulation::insert_drone(const std::vector<std::optional<PatternSample>>& by_tick,
                                     const char* pattern) {
    const std::string id = next_drone_id();
    Vehicle drone(id, CategoryId::UAV);
    for (std::size_t t = 0; t < by_tick.size(); ++t) {
        if (by_tick[t])
            drone.add_timestep(drone_timestep(static_cast<int64_t>(t), *by_tick[t]));
    }

    const std::size_t count = drone.sample_count();
    vehicles_.emplace(id, std::move(drone));
    order_.push_back(id);

    publish_event(EventId::EVT_DRONE_CREATED, EventCategory::SYNTHESIS, Severity::INFO, -1, id,
                  "id=" + id + " pattern=" + pattern + " samples=" + std::to_string(count));
    return id;
}

std::string Simulation::next_drone_id() {
    for (;;) {
        ++drone_counter_;
        std::string id = "drone" + std::to_string(drone_counter_);
        if (vehicles_.count(id) == 0)
            return id;
        publish_event(EventId::EVT_ID_COLLISION, EventCategory::SYNTHESIS, Severity::WARN, -1, id,
                      "id=" + id + " already registered, skipping");
    }
}

// --- Queries ---

const Vehicle& Simulation::get_vehicle(const std::string& id) const {
    auto it = vehicles_.find(id);
    if (it == vehicles_.end())
        throw SimError(ErrorKind::NOT_FOUND, "vehicle '" + id + "'");
    return it->second;
}

bool Simulation::has_vehicle(const std::string& id) const {
    return vehicles_.count(id) != 0;
}

std::vector<std::optional<Timestep>> Simulation::vehicle_samples(const std::string& id) const {
    return get_vehicle(id).samples(max_tick_exclusive());
}

std::vector<CategoryTracks> Simulation::coordinate_vectors() const {
    std::vector<CategoryTracks> out;
    for (CategoryId cat : categories_.ids())
        out.push_back(CategoryTracks{cat, categories_.label(cat), {}});

    for (const auto& id : order_) {
        const Vehicle& v = vehicles_.at(id);
        AgentTrack track;
        track.vehicle_id = id;
        track.positions.reserve(static_cast<std::size_t>(max_tick_exclusive()));
        for (int64_t t = 0; t < max_tick_exclusive(); ++t)
            track.positions.push_back(v.coordinate_at(t));
        out[static_cast<std::size_t>(v.category())].agents.push_back(std::move(track));
    }
    return out;
}

std::vector<std::string> Simulation::vehicle_ids() const {
    return order_;
}

CategoryId Simulation::register_category(const std::string& name) {
    return categories_.intern(name);
}

// --- Mutation ---

void Simulation::add_vehicle(Vehicle vehicle) {
    if (vehicles_.count(vehicle.id()))
        throw SimError(ErrorKind::DUPLICATE_ID, "vehicle '" + vehicle.id() + "'");
    if (!categories_.contains(vehicle.category()))
        throw SimError(ErrorKind::UNKNOWN_CATEGORY,
                       "category id " + std::to_string(static_cast<unsigned>(vehicle.category())));

    const std::string id = vehicle.id();
    const std::size_t count = vehicle.sample_count();
    vehicles_.emplace(id, std::move(vehicle));
    order_.push_back(id);
    publish_event(EventId::EVT_VEHICLE_ADDED, EventCategory::REGISTRY, Severity::INFO, -1, id,
                  "id=" + id + " samples=" + std::to_string(count));
}

void Simulation::remove_vehicle(const std::string& id) {
    auto it = vehicles_.find(id);
    if (it == vehicles_.end())
        throw SimError(ErrorKind::NOT_FOUND, "vehicle '" + id + "'");
    vehicles_.erase(it);
    for (auto o = order_.begin(); o != order_.end(); ++o) {
        if (*o == id) {
            order_.erase(o);
            break;
        }
    }
    publish_event(EventId::EVT_VEHICLE_REMOVED, EventCategory::REGISTRY, Severity::INFO, -1, id,
                  "id=" + id);
}

void Simulation::change_legend(const std::string& category, const std::string& label) {
    categories_.set_label(category, label);
    publish_event(EventId::EVT_LEGEND_CHANGED, EventCategory::REGISTRY, Severity::INFO, -1, category,
                  "category=" + category + " label=" + label);
}

// --- Export ---

void Simulation::render() {
    std::map<int64_t, std::vector<VehicleRecord>> by_tick;
    for (const auto& id : order_) {
        const Vehicle& v = vehicles_.at(id);
        const std::string& type = categories_.name(v.category());
        for (const auto& kv : v.timesteps()) {
            if (kv.first > tick_count_)
                continue;
            by_tick[kv.first].push_back(VehicleRecord{id, type, kv.second});
        }
    }
    doc_.replace_vehicles(by_tick);
}

TraceDocument Simulation::planar_copy() const {
    TraceDocument planar = doc_.clone();
    TraceBounds origin = project_to_planar(planar);
    std::ostringstream detail;
    detail << "origin_x=" << format_number(origin.min_x)
           << " origin_y=" << format_number(origin.min_y);
    publish_event(EventId::EVT_PLANAR_PROJECTED, EventCategory::EXPORT, Severity::INFO, -1,
                  source_path_, detail.str());
    return planar;
}

void Simulation::export_trace(const std::string& path, bool geo) {
    render();
    if (geo)
        doc_.save_file(path);
    else
        planar_copy().save_file(path);
    publish_event(EventId::EVT_TRACE_EXPORTED, EventCategory::EXPORT, Severity::INFO, tick_count_, path,
                  "path=" + path + " vehicles=" + std::to_string(vehicles_.size()) +
                  (geo ? " geo=1" : " geo=0"));
}

std::string Simulation::export_trace_string(bool geo) {
    render();
    return geo ? doc_.to_string() : planar_copy().to_string();
}

uint64_t Simulation::export_frames(const std::string& path, bool only_uav) const {
    FrameTableWriter writer;
    if (!writer.open(path))
        throw std::runtime_error("Cannot open frame table: " + path);

    const auto tracks = coordinate_vectors();
    for (int64_t t = 0; t < max_tick_exclusive(); ++t) {
        for (const auto& cat : tracks) {
            if (only_uav && cat.category != CategoryId::UAV)
                continue;
            const std::string& name = categories_.name(cat.category);
            for (const auto& agent : cat.agents) {
                const auto& pos = agent.positions[static_cast<std::size_t>(t)];
                double x = pos ? pos->lon : 0.0;
                double y = pos ? pos->lat : 0.0;
                if (!writer.record(t, name, cat.label, agent.vehicle_id, x, y))
                    throw std::runtime_error("Cannot write frame table: " + path);
            }
        }
    }
    writer.close();

    publish_event(EventId::EVT_FRAMES_EXPORTED, EventCategory::EXPORT, Severity::INFO, -1, path,
                  "path=" + path + " rows=" + std::to_string(writer.row_count()));
    return writer.row_count();
}

void Simulation::print_vehicle_info(const std::string& id, std::ostream& os) const {
    const Vehicle& v = get_vehicle(id);
    for (int64_t t = 0; t < max_tick_exclusive(); ++t) {
        const Timestep* ts = v.get_timestep(t);
        if (ts)
            os << "id=" << id << ' ' << format_timestep(*ts) << '\n';
    }
}

void Simulation::publish_event(EventId id, EventCategory cat, Severity sev,
                               int64_t tick, const std::string& subject,
                               const std::string& detail) const {
    Logger::instance().log(sev, cat, event_name(id), detail);
    bus_.publish(EventRecord{id, cat, sev, tick, subject, detail});
}

} // namespace dts
