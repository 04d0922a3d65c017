#include "trace/vehicle.h"
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <utility>

namespace dts {

Vehicle::Vehicle(std::string id, CategoryId category)
    : id_(std::move(id)), category_(category) {}

void Vehicle::add_timestep(const Timestep& ts) {
    timesteps_[ts.tick] = ts;
}

const Timestep* Vehicle::get_timestep(int64_t tick) const {
    auto it = timesteps_.find(tick);
    if (it == timesteps_.end())
        return nullptr;
    return &it->second;
}

bool Vehicle::is_present(int64_t tick) const {
    return timesteps_.count(tick) != 0;
}

std::optional<Coordinate> Vehicle::coordinate_at(int64_t tick) const {
    const Timestep* ts = get_timestep(tick);
    if (!ts)
        return std::nullopt;
    return ts->coordinate();
}

std::vector<std::optional<Timestep>> Vehicle::samples(int64_t end_exclusive) const {
    std::vector<std::optional<Timestep>> out;
    if (end_exclusive <= 0)
        return out;
    out.resize(static_cast<std::size_t>(end_exclusive));
    for (const auto& kv : timesteps_) {
        if (kv.first >= 0 && kv.first < end_exclusive)
            out[static_cast<std::size_t>(kv.first)] = kv.second;
    }
    return out;
}

std::string format_number(double value) {
    // 17 significant digits always read back exactly; prefer fewer when they do
    std::string text;
    for (int digits = 15; digits <= 17; ++digits) {
        std::ostringstream ss;
        ss << std::setprecision(digits) << value;
        text = ss.str();
        if (std::strtod(text.c_str(), nullptr) == value)
            break;
    }
    return text;
}

std::string format_timestep(const Timestep& ts) {
    std::ostringstream ss;
    ss << "tick=" << ts.tick
       << " x=" << format_number(ts.x)
       << " y=" << format_number(ts.y)
       << " angle=" << format_number(ts.angle)
       << " speed=" << format_number(ts.speed)
       << " pos=" << format_number(ts.pos)
       << " lane=" << ts.lane
       << " slope=" << format_number(ts.slope);
    return ss.str();
}

} // namespace dts
