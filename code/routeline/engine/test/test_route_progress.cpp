#include "core/RoutePointsBuilder.hpp"
#include "core/RouteProgress.hpp"
#include "support/route_fixtures.hpp"
#include <gtest/gtest.h>

using fixtures::eq;

namespace {

ProgressSnapshot at(std::size_t leg, std::size_t step, double traveled,
                    const Route &route, Coordinate location = {}) {
  ProgressSnapshot s;
  s.leg_index = leg;
  s.step_index = step;
  s.distance_traveled = traveled;
  s.step_distance = route.legs[leg].steps[step].distance;
  s.location = location;
  return s;
}

RouteLineState state_for(const Route &route) {
  RoutePointsBuilder b;
  RouteLineState st;
  st.route_points = b.build(route);
  st.granular_distances = b.granular_distances(st.route_points->flat);
  return st;
}

} // namespace

TEST(UpcomingPointLocatorTest, CountsVerticesStrictlyAhead) {
  const std::vector<Coordinate> shape{eq(0), eq(1), eq(2)};
  const double len = RouteLineUtils::line_length_m(shape);
  EXPECT_EQ(UpcomingPointLocator::remaining_points_in_step(shape, 0.0, len), 1u);
  EXPECT_EQ(UpcomingPointLocator::remaining_points_in_step(shape, 150.0, len),
            0u);
  EXPECT_EQ(UpcomingPointLocator::remaining_points_in_step(shape, len, len), 0u);
  EXPECT_EQ(UpcomingPointLocator::remaining_points_in_step({eq(0)}, 0.0, 10.0),
            0u);
}

TEST(UpcomingPointLocatorTest, IndexSitsAtOrAheadOfTheUser) {
  const Route r = fixtures::two_step_route();
  const RoutePoints rp = RoutePointsBuilder().build(r);
  // flat: p0 p1 p2 | p2 p3 p4
  EXPECT_EQ(UpcomingPointLocator::locate(rp, at(0, 0, 0.0, r)), 1u);
  EXPECT_EQ(UpcomingPointLocator::locate(rp, at(0, 0, 50.0, r)), 1u);
  EXPECT_EQ(UpcomingPointLocator::locate(rp, at(0, 0, 150.0, r)), 2u);
  EXPECT_EQ(UpcomingPointLocator::locate(rp, at(0, 1, 0.0, r)), 4u);
  EXPECT_EQ(UpcomingPointLocator::locate(rp, at(0, 1, 150.0, r)), 5u);
}

TEST(UpcomingPointLocatorTest, LaterLegsAreCounted) {
  const Route r = fixtures::two_leg_route();
  const RoutePoints rp = RoutePointsBuilder().build(r);
  EXPECT_EQ(UpcomingPointLocator::locate(rp, at(0, 0, 0.0, r)), 1u);
  EXPECT_EQ(UpcomingPointLocator::locate(rp, at(1, 0, 0.0, r)), 4u);
}

TEST(UpcomingPointLocatorTest, IdenticalSnapshotsGiveIdenticalIndices) {
  const Route r = fixtures::two_step_route();
  const RoutePoints rp = RoutePointsBuilder().build(r);
  const auto s = at(0, 1, 42.0, r);
  EXPECT_EQ(UpcomingPointLocator::locate(rp, s),
            UpcomingPointLocator::locate(rp, s));
}

TEST(UpcomingPointLocatorTest, MonotoneInDistanceTraveled) {
  const Route r = fixtures::two_step_route();
  const RoutePoints rp = RoutePointsBuilder().build(r);
  for (std::size_t step = 0; step < 2; ++step) {
    std::size_t last = 0;
    for (double d = 0.0; d <= r.legs[0].steps[step].distance; d += 5.0) {
      const auto idx = UpcomingPointLocator::locate(rp, at(0, step, d, r));
      ASSERT_TRUE(idx.has_value());
      EXPECT_GE(*idx, last) << "step " << step << " at " << d << " m";
      EXPECT_LT(*idx, rp.flat.size());
      last = *idx;
    }
  }
}

TEST(UpcomingPointLocatorTest, OutOfRangeIndicesAreIgnored) {
  const Route r = fixtures::two_step_route();
  RouteLineState st = state_for(r);
  ASSERT_TRUE(UpcomingPointLocator::update(st, at(0, 0, 0.0, r)));
  ASSERT_EQ(st.remaining_distances_index, 1u);

  ProgressSnapshot bad = at(0, 0, 0.0, r);
  bad.step_index = 7;
  EXPECT_FALSE(UpcomingPointLocator::locate(*st.route_points, bad));
  EXPECT_FALSE(UpcomingPointLocator::update(st, bad));
  bad.step_index = 0;
  bad.leg_index = 3;
  EXPECT_FALSE(UpcomingPointLocator::update(st, bad));
  EXPECT_EQ(st.remaining_distances_index, 1u);
}

TEST(UpcomingPointLocatorTest, EmptyRouteHasNoIndex) {
  RouteLineState st;
  st.route_points = RoutePoints{};
  ProgressSnapshot s;
  EXPECT_FALSE(UpcomingPointLocator::update(st, s));

  st.route_points.reset();
  st.remaining_distances_index = 3;
  EXPECT_FALSE(UpcomingPointLocator::update(st, s));
  EXPECT_FALSE(st.remaining_distances_index.has_value());
}

TEST(TraveledFractionTrackerTest, FractionFromUpcomingPointAndPosition) {
  const Route r = fixtures::two_step_route();
  RouteLineState st = state_for(r);
  TraveledFractionTracker tracker;

  st.remaining_distances_index = 1;
  ASSERT_TRUE(tracker.update(st, eq(1)));
  EXPECT_NEAR(st.fraction_traveled, 0.25, 1e-9);
  EXPECT_DOUBLE_EQ(st.pre_fraction_traveled, 0.0);

  // halfway between p0 and p1, still heading for p1
  ASSERT_TRUE(tracker.update(st, {0.0, 0.0005}));
  EXPECT_NEAR(st.pre_fraction_traveled, 0.25, 1e-9);
  EXPECT_NEAR(st.fraction_traveled, 0.125, 1e-9);
}

TEST(TraveledFractionTrackerTest, ReachesOneAtTheEnd) {
  RouteLineState st = state_for(fixtures::two_step_route());
  st.remaining_distances_index = 5;
  ASSERT_TRUE(TraveledFractionTracker().update(st, eq(4)));
  EXPECT_DOUBLE_EQ(st.fraction_traveled, 1.0);
}

TEST(TraveledFractionTrackerTest, NoisyPositionIsDropped) {
  RouteLineState st = state_for(fixtures::two_step_route());
  st.remaining_distances_index = 1;
  st.fraction_traveled = 0.3;
  st.pre_fraction_traveled = 0.2;

  // far behind the start: more remaining than the whole route
  EXPECT_FALSE(TraveledFractionTracker().update(st, {0.0, -0.01}));
  EXPECT_DOUBLE_EQ(st.fraction_traveled, 0.3);
  EXPECT_DOUBLE_EQ(st.pre_fraction_traveled, 0.2);
}

TEST(TraveledFractionTrackerTest, NoOpWithoutTableIndexOrLength) {
  TraveledFractionTracker tracker;
  RouteLineState st = state_for(fixtures::two_step_route());
  EXPECT_FALSE(tracker.update(st, eq(1))); // no index yet

  st.remaining_distances_index = 99;
  EXPECT_FALSE(tracker.update(st, eq(1)));

  RouteLineState single;
  single.granular_distances = RoutePointsBuilder().granular_distances({eq(0)});
  single.remaining_distances_index = 0;
  EXPECT_FALSE(tracker.update(single, eq(0)));
  EXPECT_DOUBLE_EQ(single.fraction_traveled, 0.0);
}
