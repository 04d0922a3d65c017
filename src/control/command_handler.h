#pragma once
#include "simulation/simulation.h"
#include "common/logger.h"
#include "common/event_bus.h"
#include <cstddef>
#include <deque>
#include <string>
#include <unordered_map>

namespace dts {

// Line-oriented operator console over one Simulation.
// Replies start with OK (or the queried item) on success and
// "ERR <REASON>" on failure; core errors map to their ErrorKind name.
class CommandHandler {
public:
    // GET EVENTS lists at most this many of the newest simulation events
    static constexpr std::size_t EVENT_HISTORY = 32;

    CommandHandler(Simulation& sim, Logger& logger);

    // Process a command string, return a response string
    std::string handle(const std::string& command);

    // Get current config value (for testing)
    std::string get_config(const std::string& key) const;

private:
    std::string dispatch(const std::string& verb, const std::string& args);
    std::string handle_place(const std::string& args);
    std::string handle_follow(const std::string& args);
    std::string handle_remove(const std::string& args);
    std::string handle_legend(const std::string& args);
    std::string handle_info(const std::string& args);
    std::string handle_export(const std::string& args);
    std::string handle_get(const std::string& args);
    std::string handle_set(const std::string& args);

    Simulation& sim_;
    Logger& logger_;
    std::unordered_map<std::string, std::string> config_;
    std::deque<EventRecord> recent_;
    EventBus::Subscription events_;   // feeds recent_; declared after it
};

} // namespace dts
