#include "trace/frame_table_writer.h"
#include "simulation/simulation.h"
#include "common/logger.h"
#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

using namespace dts;

namespace {

std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line))
        lines.push_back(line);
    return lines;
}

} // anonymous namespace

class FrameTableWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_file_ = "/tmp/test_frame_table_" + std::to_string(rand()) + ".csv";
    }

    void TearDown() override {
        std::remove(test_file_.c_str());
    }

    std::string test_file_;
};

TEST_F(FrameTableWriterTest, HeaderWrittenOnOpen) {
    FrameTableWriter writer;
    ASSERT_TRUE(writer.open(test_file_));
    EXPECT_TRUE(writer.is_open());
    writer.close();
    EXPECT_FALSE(writer.is_open());

    auto lines = read_lines(test_file_);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "tick,category,label,vehicle,x,y");
}

TEST_F(FrameTableWriterTest, RowsCounted) {
    FrameTableWriter writer;
    ASSERT_TRUE(writer.open(test_file_));
    EXPECT_EQ(writer.row_count(), 0u);

    EXPECT_TRUE(writer.record(1, "UAV", "UAV", "drone1", -43.2, -22.9));
    EXPECT_TRUE(writer.record(1, "bus", "Bus", "bus7", 0.0, 0.0));
    EXPECT_EQ(writer.row_count(), 2u);
    writer.close();

    auto lines = read_lines(test_file_);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[1], "1,UAV,UAV,drone1,-43.2,-22.9");
    EXPECT_EQ(lines[2], "1,bus,Bus,bus7,0,0");
}

TEST_F(FrameTableWriterTest, RecordWithoutOpenFails) {
    FrameTableWriter writer;
    EXPECT_FALSE(writer.record(0, "UAV", "UAV", "drone1", 0.0, 0.0));
    EXPECT_EQ(writer.row_count(), 0u);
}

TEST_F(FrameTableWriterTest, OpenBadPathFails) {
    FrameTableWriter writer;
    EXPECT_FALSE(writer.open("/nonexistent/dir/frames.csv"));
    EXPECT_FALSE(writer.is_open());
}

TEST_F(FrameTableWriterTest, ReopenResetsCount) {
    FrameTableWriter writer;
    ASSERT_TRUE(writer.open(test_file_));
    writer.record(0, "UAV", "UAV", "drone1", 1.0, 1.0);
    ASSERT_TRUE(writer.open(test_file_));
    EXPECT_EQ(writer.row_count(), 0u);
    writer.close();
    EXPECT_EQ(read_lines(test_file_).size(), 1u);
}

// --- Simulation::export_frames ---

class FrameExportTest : public FrameTableWriterTest {
protected:
    std::ostringstream log_;

    void SetUp() override {
        FrameTableWriterTest::SetUp();
        Logger::instance().set_output(log_);
    }

    void TearDown() override {
        Logger::instance().set_output(std::cout);
        FrameTableWriterTest::TearDown();
    }
};

TEST_F(FrameExportTest, OneRowPerAgentPerTick) {
    auto sim = Simulation::from_file(std::string(DTS_TEST_DATA_DIR) + "/sample_fcd.xml");
    sim->create_drone_static({-22.8990, -43.1990});

    // 3 agents over ticks [0, 6)
    EXPECT_EQ(sim->export_frames(test_file_), 18u);

    auto lines = read_lines(test_file_);
    ASSERT_EQ(lines.size(), 19u);
    // tick 0: nobody present, absent agents written at the origin
    EXPECT_EQ(lines[1], "0,UAV,UAV,drone1,0,0");
    EXPECT_EQ(lines[2], "0,passenger,passenger,0,0,0");
    EXPECT_EQ(lines[3], "0,bus,bus,bus7,0,0");
    EXPECT_EQ(lines[4], "1,UAV,UAV,drone1,-43.199,-22.899");
}

TEST_F(FrameExportTest, OnlyUavFiltersCategories) {
    auto sim = Simulation::from_file(std::string(DTS_TEST_DATA_DIR) + "/sample_fcd.xml");
    sim->create_drone_static({-22.8990, -43.1990});
    sim->change_legend("bus", "Bus");

    EXPECT_EQ(sim->export_frames(test_file_, true), 6u);
    for (const auto& line : read_lines(test_file_)) {
        if (line.rfind("tick", 0) == 0) continue;
        EXPECT_NE(line.find(",UAV,UAV,drone1,"), std::string::npos) << line;
    }
    EXPECT_NE(log_.str().find("EVT_FRAMES_EXPORTED"), std::string::npos);
}

TEST_F(FrameExportTest, UnwritablePathThrows) {
    auto sim = Simulation::from_file(std::string(DTS_TEST_DATA_DIR) + "/sample_fcd.xml");
    EXPECT_THROW(sim->export_frames("/nonexistent/dir/frames.csv"), std::runtime_error);
}
