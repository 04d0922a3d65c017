#include <gtest/gtest.h>
#include "synth/following.h"
#include "common/errors.h"
#include <cmath>

using namespace dts;

namespace {

// Vehicle driving north one degree-step per tick, absent at the given ticks.
std::vector<std::optional<Coordinate>> northbound(std::size_t ticks, double step_m,
                                                  std::vector<std::size_t> absent = {}) {
    std::vector<std::optional<Coordinate>> ref(ticks);
    for (std::size_t i = 0; i < ticks; ++i)
        ref[i] = Coordinate{-22.9 + meters_to_degrees(step_m) * static_cast<double>(i), -43.2};
    for (auto a : absent)
        ref[a].reset();
    return ref;
}

} // anonymous namespace

TEST(Following, OutputMatchesReferenceLength) {
    auto ref = northbound(10, 5.0);
    auto out = generate_following(ref, FollowingParams{});
    EXPECT_EQ(out.size(), ref.size());
}

TEST(Following, StartsOnVehicleAtRest) {
    auto ref = northbound(5, 5.0);
    auto out = generate_following(ref, FollowingParams{});
    ASSERT_TRUE(out[0].has_value());
    EXPECT_EQ(out[0]->position, *ref[0]);
    EXPECT_DOUBLE_EQ(out[0]->speed_mps, 0.0);
}

TEST(Following, LeadingAbsenceIsBackFilled) {
    auto ref = northbound(8, 5.0, {0, 1, 2});
    auto out = generate_following(ref, FollowingParams{});
    for (std::size_t i = 0; i <= 3; ++i) {
        ASSERT_TRUE(out[i].has_value()) << "tick " << i;
        EXPECT_EQ(out[i]->position, *ref[3]);
        EXPECT_DOUBLE_EQ(out[i]->speed_mps, 0.0);
    }
}

TEST(Following, LaterAbsenceStaysAbsent) {
    auto ref = northbound(10, 5.0, {4, 5});
    auto out = generate_following(ref, FollowingParams{});
    EXPECT_FALSE(out[4].has_value());
    EXPECT_FALSE(out[5].has_value());
    EXPECT_TRUE(out[3].has_value());
    EXPECT_TRUE(out[6].has_value());
}

TEST(Following, TrailsBehindAMovingVehicle) {
    FollowingParams p;
    p.offset_distance_m = 20.0;
    p.max_speed = 50.0;
    auto ref = northbound(60, 5.0);
    auto out = generate_following(ref, p);

    // After settling, the drone sits south of the northbound vehicle
    ASSERT_TRUE(out[59].has_value());
    EXPECT_LT(out[59]->position.lat, ref[59]->lat);
    EXPECT_NEAR(out[59]->position.lon, ref[59]->lon, 1e-9);
}

TEST(Following, DisplacementClampedToMaxSpeed) {
    FollowingParams p;
    p.offset_distance_m = 0.0;
    p.max_speed = 3.0;
    p.smoothing = 1.0;
    auto ref = northbound(10, 50.0);
    auto out = generate_following(ref, p);
    for (std::size_t i = 1; i < out.size(); ++i) {
        double d = distance_m(out[i - 1]->position, out[i]->position);
        EXPECT_LE(d, 3.0 + 1e-6) << "tick " << i;
        EXPECT_NEAR(out[i]->speed_mps, 3.0, 0.01);
    }
}

TEST(Following, SpeedDividesByTickGap) {
    FollowingParams p;
    p.offset_distance_m = 0.0;
    p.max_speed = 100.0;
    p.smoothing = 1.0;
    auto ref = northbound(6, 10.0, {2, 3});
    auto out = generate_following(ref, p);

    // tick 1 -> tick 4 covers 30 m in three ticks
    ASSERT_TRUE(out[4].has_value());
    EXPECT_NEAR(distance_m(out[1]->position, out[4]->position), 30.0, 0.05);
    EXPECT_NEAR(out[4]->speed_mps, 10.0, 0.01);
}

TEST(Following, SpeedRoundedToCentimeters) {
    auto ref = northbound(12, 7.3);
    auto out = generate_following(ref, FollowingParams{});
    for (const auto& s : out) {
        ASSERT_TRUE(s.has_value());
        EXPECT_NEAR(s->speed_mps * 100.0, std::round(s->speed_mps * 100.0), 1e-6);
    }
}

TEST(Following, StationaryVehicleKeepsLastHeading) {
    std::vector<std::optional<Coordinate>> ref(6, Coordinate{-22.9, -43.2});
    auto out = generate_following(ref, FollowingParams{});
    for (const auto& s : out) {
        ASSERT_TRUE(s.has_value());
        EXPECT_TRUE(std::isfinite(s->position.lat));
        EXPECT_TRUE(std::isfinite(s->position.lon));
    }
}

TEST(Following, AllAbsentProducesNothing) {
    std::vector<std::optional<Coordinate>> ref(5);
    auto out = generate_following(ref, FollowingParams{});
    for (const auto& s : out)
        EXPECT_FALSE(s.has_value());
}

TEST(Following, RejectsInvalidParameters) {
    auto ref = northbound(3, 1.0);
    FollowingParams p;
    p.offset_distance_m = -1.0;
    EXPECT_THROW(generate_following(ref, p), SimError);
    p = FollowingParams{};
    p.max_speed = 0.0;
    EXPECT_THROW(generate_following(ref, p), SimError);
    p = FollowingParams{};
    p.smoothing = 1.5;
    EXPECT_THROW(generate_following(ref, p), SimError);
}
