#pragma once
#include "core/TaskScheduler.hpp"
#include "models/CoreTypes.hpp"
#include <optional>

// Everything the vanishing route line keeps between progress updates for the
// displayed route. Owned by RouteLineController; the pipeline stages take it
// by reference.
struct RouteLineState {
  std::optional<RoutePoints> route_points;
  std::optional<RouteLineGranularDistances> granular_distances;
  std::optional<std::size_t> remaining_distances_index;

  double fraction_traveled = 0.0;
  double pre_fraction_traveled = 0.0;

  TaskHandle animation; // at most one outstanding

  // Cancels the animation and forgets the route.
  void reset() {
    animation.cancel();
    animation = TaskHandle{};
    route_points.reset();
    granular_distances.reset();
    remaining_distances_index.reset();
    fraction_traveled = 0.0;
    pre_fraction_traveled = 0.0;
  }
};
