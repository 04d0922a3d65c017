#include <gtest/gtest.h>
#include "synth/pattern_builders.h"
#include "common/errors.h"
#include <cmath>

using namespace dts;

namespace {

const Coordinate CENTER{-22.9, -43.2};

double degree_distance(const Coordinate& a, const Coordinate& b) {
    return std::hypot(a.lat - b.lat, a.lon - b.lon);
}

// Sum of a segment list in degree space, as the stepper walks it.
Coordinate walk(const Coordinate& start, const std::vector<Segment>& segs) {
    Coordinate p = start;
    for (const auto& s : segs) {
        const double d = meters_to_degrees(s.distance_m);
        p.lat += d * std::cos(deg_to_rad(s.bearing_deg));
        p.lon += d * std::sin(deg_to_rad(s.bearing_deg));
    }
    return p;
}

} // anonymous namespace

TEST(CircularBuilder, StartsOnCircleAtStartAngle) {
    CircularParams p;
    p.center = CENTER;
    p.radius_m = 40.0;
    p.start_angle_deg = 90.0;
    PatternPlan plan = build_circular(p);
    EXPECT_NEAR(plan.start.lat, CENTER.lat, 1e-12);
    EXPECT_NEAR(plan.start.lon - CENTER.lon, meters_to_degrees(40.0), 1e-12);
}

TEST(CircularBuilder, OneSegmentPerStepOfARevolution) {
    CircularParams p;
    p.center = CENTER;
    p.radius_m = 40.0;
    p.max_speed = 10.0;
    PatternPlan plan = build_circular(p);
    // floor(2 * pi / (10 / 40)) = 25
    ASSERT_EQ(plan.segments.size(), 25u);
    for (const auto& s : plan.segments)
        EXPECT_DOUBLE_EQ(s.distance_m, 10.0);
    EXPECT_NEAR(plan.segments[1].bearing_deg - plan.segments[0].bearing_deg, 360.0 / 25.0, 1e-9);
}

TEST(CircularBuilder, SamplesStayWithinOneStepOfRadius) {
    CircularParams p;
    p.center = CENTER;
    p.radius_m = 60.0;
    p.max_speed = 8.0;
    p.start_angle_deg = 30.0;
    PatternPlan plan = build_circular(p);
    auto samples = generate_pattern(plan.start, plan.segments, 200, plan.max_speed);

    const double radius = meters_to_degrees(p.radius_m);
    const double step = meters_to_degrees(p.max_speed);
    for (std::size_t i = 0; i < samples.size(); ++i) {
        EXPECT_NEAR(degree_distance(samples[i].position, CENTER), radius, step)
            << "sample " << i;
    }
}

TEST(CircularBuilder, RejectsDegenerateRadius) {
    CircularParams p;
    p.center = CENTER;
    p.radius_m = 0.0;
    EXPECT_THROW(build_circular(p), SimError);

    p.radius_m = 1.0;
    p.max_speed = 10.0;   // more than a full turn per tick
    EXPECT_THROW(build_circular(p), SimError);
}

TEST(AngularBuilder, LatticeOfMirroredPairs) {
    AngularParams p;
    p.start_point = CENTER;
    p.max_length_m = 40.0;
    p.start_angle_deg = 10.0;
    p.max_turns = 2;
    p.angle_alpha_deg = 30.0;
    PatternPlan plan = build_angular(p);

    ASSERT_EQ(plan.segments.size(), 8u);
    EXPECT_EQ(plan.start, CENTER);
    EXPECT_DOUBLE_EQ(plan.segments[0].bearing_deg, 40.0);
    EXPECT_DOUBLE_EQ(plan.segments[1].bearing_deg, 140.0);
    EXPECT_DOUBLE_EQ(plan.segments[2].bearing_deg, 40.0);
    EXPECT_DOUBLE_EQ(plan.segments[4].bearing_deg, -20.0);
    EXPECT_DOUBLE_EQ(plan.segments[5].bearing_deg, 220.0);
    for (const auto& s : plan.segments)
        EXPECT_DOUBLE_EQ(s.distance_m, 40.0);
}

TEST(AngularBuilder, RejectsZeroTurns) {
    AngularParams p;
    p.start_point = CENTER;
    p.max_turns = 0;
    EXPECT_THROW(build_angular(p), SimError);
}

TEST(TractorBuilder, HorizontalSweepAndReturn) {
    TractorParams p;
    p.start_point = CENTER;
    p.width_between_tracks_m = 70.0;
    p.max_length_m = 100.0;
    p.max_turns = 2;
    p.orientation = TractorOrientation::HORIZONTAL;
    PatternPlan plan = build_tractor(p);

    // hop, (leg, hop) x2, return hop, (leg, hop) x2
    ASSERT_EQ(plan.segments.size(), 10u);
    EXPECT_DOUBLE_EQ(plan.segments[0].bearing_deg, 0.0);
    EXPECT_DOUBLE_EQ(plan.segments[0].distance_m, 70.0);
    EXPECT_DOUBLE_EQ(plan.segments[1].bearing_deg, 90.0);
    EXPECT_DOUBLE_EQ(plan.segments[1].distance_m, 100.0);
    EXPECT_DOUBLE_EQ(plan.segments[3].bearing_deg, 270.0);
    EXPECT_DOUBLE_EQ(plan.segments[5].bearing_deg, 180.0);
    EXPECT_DOUBLE_EQ(plan.segments[6].bearing_deg, 270.0);
    EXPECT_DOUBLE_EQ(plan.segments[8].bearing_deg, 90.0);
    EXPECT_DOUBLE_EQ(plan.segments[9].bearing_deg, 180.0);
}

TEST(TractorBuilder, VerticalRotatesBaseBearing) {
    TractorParams p;
    p.start_point = CENTER;
    p.max_turns = 1;
    p.orientation = TractorOrientation::VERTICAL;
    PatternPlan plan = build_tractor(p);
    ASSERT_EQ(plan.segments.size(), 6u);
    EXPECT_DOUBLE_EQ(plan.segments[0].bearing_deg, 90.0);
    EXPECT_DOUBLE_EQ(plan.segments[1].bearing_deg, 0.0);
    EXPECT_DOUBLE_EQ(plan.segments[3].bearing_deg, 270.0);
}

TEST(TractorBuilder, ParseOrientation) {
    TractorOrientation o = TractorOrientation::HORIZONTAL;
    EXPECT_TRUE(parse_orientation("Vertical", o));
    EXPECT_EQ(o, TractorOrientation::VERTICAL);
    EXPECT_FALSE(parse_orientation("diagonal", o));
    EXPECT_EQ(o, TractorOrientation::VERTICAL);
}

TEST(SquareBuilder, ConsecutiveLegsTurnByNinetyDegrees) {
    for (double angle : {0.0, 45.0, 90.0, 200.0}) {
        SquareParams p;
        p.center_point = CENTER;
        p.side_length_m = 50.0;
        p.angle_deg = angle;
        PatternPlan plan = build_square(p);
        ASSERT_EQ(plan.segments.size(), 4u);
        for (std::size_t i = 0; i < 4; ++i) {
            const double a = plan.segments[i].bearing_deg;
            const double b = plan.segments[(i + 1) % 4].bearing_deg;
            EXPECT_NEAR(normalize_degrees(a - b), 90.0, 1e-9) << "angle " << angle;
            EXPECT_GE(a, 0.0);
            EXPECT_LT(a, 360.0);
        }
    }
}

TEST(SquareBuilder, FourthLegClosesOnStart) {
    SquareParams p;
    p.center_point = CENTER;
    p.side_length_m = 50.0;
    p.angle_deg = 90.0;
    PatternPlan plan = build_square(p);
    Coordinate end = walk(plan.start, plan.segments);
    EXPECT_NEAR(end.lat, plan.start.lat, 1e-12);
    EXPECT_NEAR(end.lon, plan.start.lon, 1e-12);
}

TEST(SquareBuilder, AxisAlignedSquareIsCentered) {
    for (double angle : {0.0, 90.0, 180.0, 270.0}) {
        SquareParams p;
        p.center_point = CENTER;
        p.side_length_m = 50.0;
        p.angle_deg = angle;
        PatternPlan plan = build_square(p);

        // Corners of the full square, averaged
        Coordinate corner = plan.start;
        double lat_sum = 0.0;
        double lon_sum = 0.0;
        for (const auto& s : plan.segments) {
            lat_sum += corner.lat;
            lon_sum += corner.lon;
            corner = walk(corner, {s});
        }
        EXPECT_NEAR(lat_sum / 4.0, CENTER.lat, 1e-9) << "angle " << angle;
        EXPECT_NEAR(lon_sum / 4.0, CENTER.lon, 1e-9) << "angle " << angle;
    }
}

TEST(GenericBuilder, PassesSegmentsThroughAndValidates) {
    GenericParams p;
    p.start_point = CENTER;
    p.segments = {{10.0, 0.0}, {20.0, 120.0}};
    p.max_speed = 5.0;
    PatternPlan plan = build_generic(p);
    EXPECT_EQ(plan.segments.size(), 2u);
    EXPECT_DOUBLE_EQ(plan.max_speed, 5.0);

    p.segments.clear();
    EXPECT_THROW(build_generic(p), SimError);
}
