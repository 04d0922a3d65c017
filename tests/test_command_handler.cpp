#include "control/command_handler.h"
#include "common/logger.h"
#include <gtest/gtest.h>
#include <cstdio>
#include <iostream>
#include <memory>
#include <sstream>

using namespace dts;

class CommandHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_stream_ = std::make_unique<std::ostringstream>();
        Logger::instance().set_output(*log_stream_);
        Logger::instance().set_level(Severity::INFO);
        sim_ = Simulation::from_file(std::string(DTS_TEST_DATA_DIR) + "/sample_fcd.xml");
        handler_ = std::make_unique<CommandHandler>(*sim_, Logger::instance());
    }

    void TearDown() override {
        handler_.reset();
        sim_.reset();
        Logger::instance().set_output(std::cout);
        Logger::instance().set_level(Severity::INFO);
    }

    std::unique_ptr<std::ostringstream> log_stream_;
    std::unique_ptr<Simulation> sim_;
    std::unique_ptr<CommandHandler> handler_;
};

TEST_F(CommandHandlerTest, PlaceCreatesDrone) {
    EXPECT_EQ(handler_->handle("PLACE circular -22.8995 -43.1995"), "OK drone1");
    EXPECT_EQ(handler_->handle("place Static -22.8995 -43.1995"), "OK drone2");
    EXPECT_TRUE(sim_->has_vehicle("drone2"));
}

TEST_F(CommandHandlerTest, PlaceRejectsBadInput) {
    EXPECT_EQ(handler_->handle("PLACE hexagon 1 2"), "ERR UNKNOWN_PATTERN");
    EXPECT_EQ(handler_->handle("PLACE circular 1"), "ERR INVALID_ARGS");
    EXPECT_EQ(handler_->handle("PLACE circular north 2"), "ERR INVALID_ARGS");
    EXPECT_EQ(sim_->drone_counter(), 0u);
}

TEST_F(CommandHandlerTest, FollowVehicle) {
    EXPECT_EQ(handler_->handle("FOLLOW bus7"), "OK drone1");
    EXPECT_EQ(handler_->handle("FOLLOW 0 5 8"), "OK drone2");
    EXPECT_EQ(handler_->handle("FOLLOW 0 far"), "ERR INVALID_ARGS");
}

TEST_F(CommandHandlerTest, CoreErrorsMapToKind) {
    EXPECT_EQ(handler_->handle("FOLLOW ghost"), "ERR NOT_FOUND");
    EXPECT_EQ(handler_->handle("FOLLOW 0 -1"), "ERR INVALID_PARAMETER");
    EXPECT_EQ(handler_->handle("REMOVE ghost"), "ERR NOT_FOUND");
    EXPECT_EQ(handler_->handle("LEGEND tram Tram"), "ERR UNKNOWN_CATEGORY");
    EXPECT_EQ(handler_->handle("INFO ghost"), "ERR NOT_FOUND");
}

TEST_F(CommandHandlerTest, RemoveVehicle) {
    EXPECT_EQ(handler_->handle("REMOVE bus7"), "OK REMOVED bus7");
    EXPECT_FALSE(sim_->has_vehicle("bus7"));
    EXPECT_EQ(handler_->handle("REMOVE"), "ERR INVALID_ARGS");
}

TEST_F(CommandHandlerTest, LegendKeepsSpacesInLabel) {
    EXPECT_EQ(handler_->handle("LEGEND bus City Bus"), "OK LEGEND bus=City Bus");
    std::string legends = handler_->handle("GET LEGENDS");
    EXPECT_NE(legends.find("bus=City Bus"), std::string::npos);
    EXPECT_NE(legends.find("UAV=UAV"), std::string::npos);
    EXPECT_EQ(handler_->handle("LEGEND bus"), "ERR INVALID_ARGS");
    EXPECT_EQ(handler_->handle("LEGEND bus   "), "ERR INVALID_ARGS");
}

TEST_F(CommandHandlerTest, InfoListsSamples) {
    std::string response = handler_->handle("INFO bus7");
    EXPECT_EQ(response.rfind("INFO bus7\n", 0), 0u);
    EXPECT_NE(response.find("id=bus7 tick=5"), std::string::npos);
    EXPECT_NE(response.back(), '\n');
}

TEST_F(CommandHandlerTest, GetVehicles) {
    handler_->handle("PLACE static -22.8995 -43.1995");
    std::string response = handler_->handle("GET vehicles");
    EXPECT_EQ(response.rfind("VEHICLES 3", 0), 0u);
    EXPECT_NE(response.find("\n0 passenger samples=4"), std::string::npos);
    EXPECT_NE(response.find("\ndrone1 UAV samples=5"), std::string::npos);
}

TEST_F(CommandHandlerTest, GetTicks) {
    EXPECT_EQ(handler_->handle("GET ticks"), "TICKS last=5 max_exclusive=6");
}

TEST_F(CommandHandlerTest, ExportTrace) {
    std::string path = "/tmp/dts_test_command_export.xml";
    EXPECT_EQ(handler_->handle("EXPORT " + path), "OK EXPORTED " + path);
    EXPECT_EQ(handler_->handle("EXPORT " + path + " 0"), "OK EXPORTED " + path);
    EXPECT_EQ(handler_->handle("EXPORT " + path + " maybe"), "ERR INVALID_ARGS");
    EXPECT_EQ(handler_->handle("EXPORT /nonexistent/dir/out.xml"), "ERR IO_FAILURE");
    std::remove(path.c_str());
}

TEST_F(CommandHandlerTest, SetLogLevel) {
    std::string response = handler_->handle("SET LOG_LEVEL=WARN");
    EXPECT_EQ(response, "OK LOG_LEVEL=WARN");
    EXPECT_EQ(Logger::instance().get_level(), Severity::WARN);
    EXPECT_EQ(handler_->get_config("LOG_LEVEL"), "WARN");
}

TEST_F(CommandHandlerTest, SetLogLevelCaseInsensitive) {
    EXPECT_EQ(handler_->handle("SET log_level=debug"), "OK LOG_LEVEL=DEBUG");
    EXPECT_EQ(Logger::instance().get_level(), Severity::DEBUG);
}

TEST_F(CommandHandlerTest, SetErrors) {
    EXPECT_EQ(handler_->handle("SET LOG_LEVEL=LOUD"), "ERR INVALID_LOG_LEVEL");
    EXPECT_EQ(handler_->handle("SET SPEED=3"), "ERR UNKNOWN_KEY");
    EXPECT_EQ(handler_->handle("SET LOG_LEVEL"), "ERR INVALID_SET_SYNTAX");
}

TEST_F(CommandHandlerTest, UnknownCommand) {
    EXPECT_EQ(handler_->handle("LAUNCH all"), "ERR UNKNOWN_COMMAND");
    EXPECT_EQ(handler_->handle("GET weather"), "ERR UNKNOWN_COMMAND");
}

TEST_F(CommandHandlerTest, EmptyCommand) {
    EXPECT_EQ(handler_->handle(""), "ERR EMPTY_COMMAND");
}

TEST_F(CommandHandlerTest, FailuresAreLogged) {
    handler_->handle("REMOVE ghost");
    EXPECT_NE(log_stream_->str().find("[WARN ]"), std::string::npos);
    EXPECT_NE(log_stream_->str().find("ghost"), std::string::npos);
}

TEST_F(CommandHandlerTest, EventsListsWhatHappenedSinceAttach) {
    EXPECT_EQ(handler_->handle("GET EVENTS"), "EVENTS 0");
    handler_->handle("PLACE static -22.8995 -43.1995");
    handler_->handle("REMOVE bus7");

    std::string events = handler_->handle("get events");
    EXPECT_EQ(events.rfind("EVENTS 2\n", 0), 0u);
    std::size_t created = events.find("EVT_DRONE_CREATED id=drone1");
    std::size_t removed = events.find("EVT_VEHICLE_REMOVED id=bus7");
    ASSERT_NE(created, std::string::npos);
    ASSERT_NE(removed, std::string::npos);
    EXPECT_LT(created, removed);
}

TEST_F(CommandHandlerTest, EventsKeepsOnlyNewest) {
    for (std::size_t i = 0; i < CommandHandler::EVENT_HISTORY + 3; ++i)
        handler_->handle("LEGEND bus label" + std::to_string(i));

    std::string events = handler_->handle("GET EVENTS");
    EXPECT_EQ(events.rfind("EVENTS " + std::to_string(CommandHandler::EVENT_HISTORY) + "\n", 0), 0u);
    EXPECT_EQ(events.find("label=label2\n"), std::string::npos);
    EXPECT_NE(events.find("label=label3\n"), std::string::npos);
    EXPECT_NE(events.find("label=label" + std::to_string(CommandHandler::EVENT_HISTORY + 2)),
              std::string::npos);
}

TEST_F(CommandHandlerTest, DetachesFromBusWhenDestroyed) {
    EXPECT_EQ(sim_->event_bus().subscriber_count(), 1u);
    handler_.reset();
    EXPECT_EQ(sim_->event_bus().subscriber_count(), 0u);
    EXPECT_NO_THROW(sim_->create_drone_static({-22.8995, -43.1995}));
}
