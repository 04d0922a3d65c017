#include "trace/frame_table_writer.h"
#include "trace/vehicle.h"

namespace dts {

FrameTableWriter::~FrameTableWriter() {
    close();
}

bool FrameTableWriter::open(const std::string& path) {
    close();
    file_.open(path, std::ios::trunc);
    if (!file_.is_open())
        return false;
    row_count_ = 0;
    file_ << "tick,category,label,vehicle,x,y\n";
    return file_.good();
}

bool FrameTableWriter::record(int64_t tick, const std::string& category, const std::string& label,
                              const std::string& vehicle_id, double x, double y) {
    if (!file_.is_open())
        return false;

    file_ << tick << ',' << category << ',' << label << ',' << vehicle_id << ','
          << format_number(x) << ',' << format_number(y) << '\n';

    if (!file_.good())
        return false;

    ++row_count_;
    return true;
}

void FrameTableWriter::close() {
    if (file_.is_open()) {
        file_.close();
    }
}

} // namespace dts
