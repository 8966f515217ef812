#include "RouteProgress.hpp"
#include "core/RouteLineUtils.hpp"
#include <iostream>

std::size_t UpcomingPointLocator::remaining_points_in_step(
    const std::vector<Coordinate> &shape, double distance_traveled,
    double step_distance) {
  const auto sliced =
      RouteLineUtils::slice_along(shape, distance_traveled, step_distance);
  // drop both cut points, keep what lies strictly between them
  return sliced.size() >= 2 ? sliced.size() - 2 : 0;
}

std::optional<std::size_t>
UpcomingPointLocator::locate(const RoutePoints &points,
                             const ProgressSnapshot &snapshot) {
  if (points.flat.empty())
    return std::nullopt;

  const auto &legs = points.nested;
  if (snapshot.leg_index >= legs.size() ||
      snapshot.step_index >= legs[snapshot.leg_index].size()) {
    std::cerr << "[progress] leg " << snapshot.leg_index << " step "
              << snapshot.step_index << " is not part of the displayed route ("
              << legs.size() << " legs); update ignored\n";
    return std::nullopt;
  }

  // 1) what is left of the current step
  const auto &steps = legs[snapshot.leg_index];
  std::size_t remaining =
      remaining_points_in_step(steps[snapshot.step_index],
                               snapshot.distance_traveled, snapshot.step_distance);

  // 2) later steps of the current leg
  for (std::size_t s = snapshot.step_index + 1; s < steps.size(); ++s)
    remaining += steps[s].size();

  // 3) later legs
  for (std::size_t l = snapshot.leg_index + 1; l < legs.size(); ++l)
    for (const auto &step : legs[l])
      remaining += step.size();

  const std::size_t all_points = points.flat.size();
  // only reachable when every point sits in later steps
  if (remaining >= all_points)
    return std::size_t{0};
  return all_points - remaining - 1;
}

bool UpcomingPointLocator::update(RouteLineState &state,
                                  const ProgressSnapshot &snapshot) {
  if (!state.route_points) {
    state.remaining_distances_index.reset();
    return false;
  }
  auto index = locate(*state.route_points, snapshot);
  if (!index)
    return false;
  state.remaining_distances_index = index;
  return true;
}

bool TraveledFractionTracker::update(RouteLineState &state,
                                     const Coordinate &location) const {
  if (!state.granular_distances || !state.remaining_distances_index)
    return false;
  const auto &granular = *state.granular_distances;
  const std::size_t index = *state.remaining_distances_index;
  if (index >= granular.distances.size() || !(granular.distance > 0.0))
    return false;

  // extend the upcoming point's remaining distance to the exact position
  const auto &upcoming = granular.distances[index];
  const double remaining =
      upcoming.distance_remaining +
      RouteLineUtils::distance(upcoming.point, location, legacy_clamp_);

  if (granular.distance >= remaining) {
    const double offset = 1.0 - remaining / granular.distance;
    if (offset >= 0) {
      state.pre_fraction_traveled = state.fraction_traveled;
      state.fraction_traveled = offset;
      return true;
    }
  }
  return false;
}
