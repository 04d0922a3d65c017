#include "control/command_handler.h"
#include "common/errors.h"
#include "simulation/point_placement.h"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace dts {
namespace {

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);
    return s;
}

std::vector<std::string> split_words(const std::string& s) {
    std::istringstream iss(s);
    std::vector<std::string> out;
    std::string w;
    while (iss >> w)
        out.push_back(w);
    return out;
}

bool to_double(const std::string& s, double& out) {
    try {
        std::size_t used = 0;
        out = std::stod(s, &used);
        return used == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

} // anonymous namespace

CommandHandler::CommandHandler(Simulation& sim, Logger& logger)
    : sim_(sim), logger_(logger) {
    events_ = sim_.event_bus().subscribe_all([this](const EventRecord& e) {
        recent_.push_back(e);
        if (recent_.size() > EVENT_HISTORY)
            recent_.pop_front();
    });
}

std::string CommandHandler::handle(const std::string& command) {
    if (command.empty())
        return "ERR EMPTY_COMMAND";

    // Parse command: first word is the verb
    std::istringstream iss(command);
    std::string verb;
    iss >> verb;
    verb = upper(verb);

    std::string rest;
    std::getline(iss, rest);
    // Trim leading whitespace
    auto pos = rest.find_first_not_of(" \t");
    if (pos != std::string::npos)
        rest = rest.substr(pos);
    else
        rest.clear();

    try {
        return dispatch(verb, rest);
    } catch (const SimError& e) {
        logger_.log(Severity::WARN, EventCategory::CONTROL, verb, e.what());
        return std::string("ERR ") + error_kind_str(e.kind());
    } catch (const std::runtime_error& e) {
        logger_.log(Severity::ERROR, EventCategory::CONTROL, verb, e.what());
        return "ERR IO_FAILURE";
    }
}

std::string CommandHandler::dispatch(const std::string& verb, const std::string& args) {
    if (verb == "PLACE")  return handle_place(args);
    if (verb == "FOLLOW") return handle_follow(args);
    if (verb == "REMOVE") return handle_remove(args);
    if (verb == "LEGEND") return handle_legend(args);
    if (verb == "INFO")   return handle_info(args);
    if (verb == "EXPORT") return handle_export(args);
    if (verb == "GET")    return handle_get(args);
    if (verb == "SET")    return handle_set(args);
    return "ERR UNKNOWN_COMMAND";
}

// PLACE <pattern> <lat> <lon>
std::string CommandHandler::handle_place(const std::string& args) {
    auto words = split_words(args);
    if (words.size() != 3)
        return "ERR INVALID_ARGS";

    PatternKind kind;
    if (!parse_pattern_kind(words[0], kind))
        return "ERR UNKNOWN_PATTERN";

    Coordinate point;
    if (!to_double(words[1], point.lat) || !to_double(words[2], point.lon))
        return "ERR INVALID_ARGS";

    return "OK " + place_drone(sim_, point, kind);
}

// FOLLOW <vehicle_id> [offset_m] [max_speed]
std::string CommandHandler::handle_follow(const std::string& args) {
    auto words = split_words(args);
    if (words.empty() || words.size() > 3)
        return "ERR INVALID_ARGS";

    FollowingParams p;
    if (words.size() >= 2 && !to_double(words[1], p.offset_distance_m))
        return "ERR INVALID_ARGS";
    if (words.size() == 3 && !to_double(words[2], p.max_speed))
        return "ERR INVALID_ARGS";

    return "OK " + sim_.create_drone_following(words[0], p);
}

std::string CommandHandler::handle_remove(const std::string& args) {
    auto words = split_words(args);
    if (words.size() != 1)
        return "ERR INVALID_ARGS";
    sim_.remove_vehicle(words[0]);
    return "OK REMOVED " + words[0];
}

// LEGEND <category> <label...>
std::string CommandHandler::handle_legend(const std::string& args) {
    auto sp = args.find_first_of(" \t");
    if (sp == std::string::npos)
        return "ERR INVALID_ARGS";
    auto label_pos = args.find_first_not_of(" \t", sp);
    if (label_pos == std::string::npos)
        return "ERR INVALID_ARGS";
    std::string category = args.substr(0, sp);
    std::string label = args.substr(label_pos);

    sim_.change_legend(category, label);
    return "OK LEGEND " + category + "=" + label;
}

std::string CommandHandler::handle_info(const std::string& args) {
    auto words = split_words(args);
    if (words.size() != 1)
        return "ERR INVALID_ARGS";

    std::ostringstream oss;
    oss << "INFO " << words[0] << "\n";
    sim_.print_vehicle_info(words[0], oss);
    std::string out = oss.str();
    out.pop_back();
    return out;
}

// EXPORT <path> [geo]
std::string CommandHandler::handle_export(const std::string& args) {
    auto words = split_words(args);
    if (words.empty() || words.size() > 2)
        return "ERR INVALID_ARGS";

    bool geo = true;
    if (words.size() == 2) {
        if (words[1] == "0") geo = false;
        else if (words[1] != "1") return "ERR INVALID_ARGS";
    }
    sim_.export_trace(words[0], geo);
    return "OK EXPORTED " + words[0];
}

std::string CommandHandler::handle_get(const std::string& args) {
    std::string what = upper(args);

    if (what == "VEHICLES") {
        std::ostringstream oss;
        oss << "VEHICLES " << sim_.vehicle_count();
        for (const auto& id : sim_.vehicle_ids()) {
            const Vehicle& v = sim_.get_vehicle(id);
            oss << "\n" << id << " " << sim_.categories().name(v.category())
                << " samples=" << v.sample_count();
        }
        return oss.str();
    }

    if (what == "TICKS") {
        std::ostringstream oss;
        oss << "TICKS last=" << sim_.last_ingested_tick()
            << " max_exclusive=" << sim_.max_tick_exclusive();
        return oss.str();
    }

    if (what == "LEGENDS") {
        std::ostringstream oss;
        oss << "LEGENDS";
        const CategoryTable& cats = sim_.categories();
        for (CategoryId id : cats.ids())
            oss << "\n" << cats.name(id) << "=" << cats.label(id);
        return oss.str();
    }

    if (what == "EVENTS") {
        std::ostringstream oss;
        oss << "EVENTS " << recent_.size();
        for (const auto& e : recent_)
            oss << "\n" << event_name(e.id) << " " << e.detail;
        return oss.str();
    }

    return "ERR UNKNOWN_COMMAND";
}

std::string CommandHandler::handle_set(const std::string& args) {
    // Expect KEY=VALUE
    auto eq_pos = args.find('=');
    if (eq_pos == std::string::npos)
        return "ERR INVALID_SET_SYNTAX";

    std::string key = args.substr(0, eq_pos);
    std::string value = args.substr(eq_pos + 1);

    // Trim whitespace
    auto trim = [](std::string& s) {
        auto start = s.find_first_not_of(" \t");
        auto end = s.find_last_not_of(" \t");
        if (start == std::string::npos) { s.clear(); return; }
        s = s.substr(start, end - start + 1);
    };
    trim(key);
    trim(value);
    key = upper(key);

    if (key == "LOG_LEVEL") {
        Severity level;
        if (!parse_severity(value, level))
            return "ERR INVALID_LOG_LEVEL";

        const std::string val_upper = upper(value);
        logger_.set_level(level);
        config_[key] = val_upper;
        logger_.log(Severity::INFO, EventCategory::CONTROL,
                    event_name(EventId::EVT_CONFIG_CHANGE), "LOG_LEVEL=" + val_upper);
        return "OK LOG_LEVEL=" + val_upper;
    }

    return "ERR UNKNOWN_KEY";
}

std::string CommandHandler::get_config(const std::string& key) const {
    auto it = config_.find(key);
    if (it != config_.end())
        return it->second;
    return "";
}

} // namespace dts
