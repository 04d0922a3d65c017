#include "config/run_executor.h"
#include "common/errors.h"
#include "common/logger.h"

namespace dts {
namespace {

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

void log_config(Severity sev, EventId id, const std::string& detail) {
    Logger::instance().log(sev, EventCategory::CONFIG, event_name(id), detail);
}

} // anonymous namespace

RunExecutor::RunExecutor(std::ostream& out) : out_(out) {}

std::unique_ptr<Simulation> RunExecutor::run(const RunConfig& cfg) {
    const ConfigSection* sim_section = cfg.find("Simulation");
    if (!sim_section)
        throw SimError(ErrorKind::MALFORMED_INPUT, "run file has no [Simulation] section");

    auto sim = Simulation::from_file(sim_section->get("trace_path"));
    apply(cfg, *sim);
    return sim;
}

void RunExecutor::apply(const RunConfig& cfg, Simulation& sim) {
    report_ = RunReport{};
    // The report is filled from what the simulation announces
    auto created = sim.event_bus().subscribe(EventCategory::SYNTHESIS,
        [this](const EventRecord& e) {
            if (e.id == EventId::EVT_DRONE_CREATED)
                report_.created_ids.push_back(e.subject);
        });
    auto exported = sim.event_bus().subscribe(EventCategory::EXPORT,
        [this](const EventRecord& e) {
            if (e.id == EventId::EVT_TRACE_EXPORTED || e.id == EventId::EVT_FRAMES_EXPORTED)
                report_.exported_paths.push_back(e.subject);
        });
    for (const auto& s : cfg.sections) {
        if (s.name == "Simulation")
            continue;
        if (dispatch(s, sim)) {
            ++report_.sections_run;
            log_config(Severity::INFO, EventId::EVT_SECTION_RUN, "section=" + s.name);
        } else {
            ++report_.sections_skipped;
            log_config(Severity::WARN, EventId::EVT_SECTION_SKIPPED,
                       "section=" + s.name + " not recognized, skipping");
        }
    }
}

bool RunExecutor::dispatch(const ConfigSection& s, Simulation& sim) {
    const std::string& name = s.name;

    if (starts_with(name, "DroneCircular")) {
        CircularParams p;
        p.center = s.get_point("center");
        p.radius_m = s.get_number("radius_meters");
        p.max_speed = s.get_number_or("max_speed", 10.0);
        p.start_angle_deg = s.get_number_or("start_angle", 0.0);
        sim.create_drone_circular(p);
    } else if (starts_with(name, "DroneAngular")) {
        AngularParams p;
        p.start_point = s.get_point("start_point");
        p.max_length_m = s.get_number("max_length");
        p.start_angle_deg = s.get_number_or("start_angle", 0.0);
        p.max_turns = s.get_int_or("max_turns", 3);
        p.angle_alpha_deg = s.get_number_or("angle_alpha", 30.0);
        p.max_speed = s.get_number_or("max_speed", 10.0);
        sim.create_drone_angular(p);
    } else if (starts_with(name, "DroneTractor")) {
        TractorParams p;
        p.start_point = s.get_point("start_point");
        p.width_between_tracks_m = s.get_number("width_between_tracks");
        p.max_length_m = s.get_number("max_length");
        p.max_turns = s.get_int("max_turns");
        const std::string orientation = s.get_or("orientation", "horizontal");
        if (!parse_orientation(orientation, p.orientation))
            throw SimError(ErrorKind::INVALID_PARAMETER,
                           "[" + name + "] orientation: unknown value '" + orientation + "'");
        p.max_speed = s.get_number_or("max_speed", 10.0);
        sim.create_drone_tractor(p);
    } else if (starts_with(name, "DroneStatic")) {
        sim.create_drone_static(s.get_point("point"));
    } else if (starts_with(name, "DroneSquare")) {
        SquareParams p;
        p.center_point = s.get_point("center_point");
        p.side_length_m = s.get_number("side_length");
        p.angle_deg = s.get_number_or("angle_degrees", 90.0);
        p.max_speed = s.get_number_or("max_speed", 10.0);
        sim.create_drone_square(p);
    } else if (starts_with(name, "DroneFollowing")) {
        FollowingParams p;
        p.offset_distance_m = s.get_number_or("offset_distance", 10.0);
        p.max_speed = s.get_number_or("max_speed", 10.0);
        sim.create_drone_following(s.get_or("vehicle_id", "0"), p);
    } else if (starts_with(name, "DroneGeneric")) {
        GenericParams p;
        p.start_point = s.get_point("start_point");
        const auto distances = s.get_number_list("distances");
        const auto bearings = s.get_number_list("bearings");
        if (distances.size() != bearings.size())
            throw SimError(ErrorKind::INVALID_PARAMETER,
                           "[" + name + "] distances and bearings differ in length");
        for (std::size_t i = 0; i < distances.size(); ++i)
            p.segments.push_back({distances[i], bearings[i]});
        p.max_speed = s.get_number_or("max_speed", 10.0);
        sim.create_drone_generic(p);
    } else if (name == "ExportXML") {
        const std::string path = s.get("new_xml_path");
        sim.export_trace(path, s.get_int_or("geo", 1) != 0);
    } else if (name == "ExportVideo") {
        if (s.has("limits_map"))
            log_config(Severity::DEBUG, EventId::EVT_CONFIG_CHANGE,
                       "section=" + name + " limits_map is left to the renderer");
        const std::string path = s.get("video_directory") + ".csv";
        sim.export_frames(path, s.get_int_or("only_vants", 0) != 0);
    } else if (starts_with(name, "ChangeLegend")) {
        sim.change_legend(s.get("old_legend"), s.get("new_legend"));
    } else if (name == "PrintVehicleInfo") {
        sim.print_vehicle_info(s.get("vehicle_id"), out_);
    } else if (name == "RemoveVehicle") {
        sim.remove_vehicle(s.get("vehicle_id"));
    } else {
        return false;
    }
    return true;
}

} // namespace dts
