#pragma once
#include <string>
#include <fstream>
#include <cstdint>

namespace dts {

// Per-tick position table consumed by an external renderer.
// Columns: tick,category,label,vehicle,x,y
class FrameTableWriter {
public:
    FrameTableWriter() = default;
    ~FrameTableWriter();

    // Open file for writing and emit the header row
    bool open(const std::string& path);

    // Append one row. An absent agent is written as x = 0, y = 0.
    bool record(int64_t tick, const std::string& category, const std::string& label,
                const std::string& vehicle_id, double x, double y);

    void close();

    uint64_t row_count() const { return row_count_; }

    bool is_open() const { return file_.is_open(); }

private:
    std::ofstream file_;
    uint64_t row_count_ = 0;
};

} // namespace dts
