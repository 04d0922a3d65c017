#pragma once
#include "synth/geodesy.h"
#include "trace/category_table.h"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dts {

// One kinematic sample of an agent. x is longitude and y is latitude in
// geographic traces; pos, lane and slope pass through from the source.
struct Timestep {
    int64_t     tick  = 0;
    double      x     = 0.0;
    double      y     = 0.0;
    double      angle = 0.0;
    double      speed = 0.0;
    double      pos   = 0.0;
    std::string lane  = "0";
    double      slope = 0.0;

    Coordinate coordinate() const { return Coordinate{y, x}; }
};

// Sparse per-tick series of one agent, keyed by tick.
class Vehicle {
public:
    Vehicle(std::string id, CategoryId category);

    const std::string& id() const { return id_; }
    CategoryId category() const { return category_; }

    // Insert or replace the sample at ts.tick.
    void add_timestep(const Timestep& ts);

    const Timestep* get_timestep(int64_t tick) const;
    bool is_present(int64_t tick) const;

    std::optional<Coordinate> coordinate_at(int64_t tick) const;

    std::size_t sample_count() const { return timesteps_.size(); }
    const std::map<int64_t, Timestep>& timesteps() const { return timesteps_; }

    // Samples for ticks [0, end_exclusive), absent ticks as nullopt.
    std::vector<std::optional<Timestep>> samples(int64_t end_exclusive) const;

private:
    std::string id_;
    CategoryId category_;
    std::map<int64_t, Timestep> timesteps_;
};

// Render a sample as "tick=.. x=.. y=.. angle=.. speed=.. pos=.. lane=.. slope=..".
std::string format_timestep(const Timestep& ts);

// Fewest significant digits (15 to 17) that read back as exactly `value`.
std::string format_number(double value);

} // namespace dts
