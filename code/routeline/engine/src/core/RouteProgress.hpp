#pragma once
#include "core/RouteLineState.hpp"
#include <optional>

// Finds which entry of the remaining-distance table sits at or just ahead of
// the user for a progress snapshot.
class UpcomingPointLocator {
public:
  // Shape vertices of a step lying strictly between `distance_traveled` and
  // the step's end. The terminal vertex is not counted: the flat list repeats
  // it as the next step's first point.
  static std::size_t remaining_points_in_step(const std::vector<Coordinate> &shape,
                                              double distance_traveled,
                                              double step_distance);

  // std::nullopt when there are no points, or when the snapshot's leg/step
  // indices do not exist in `points` (the snapshot belongs to another route).
  static std::optional<std::size_t> locate(const RoutePoints &points,
                                           const ProgressSnapshot &snapshot);

  // Stores the located index in `state`. Returns false, leaving `state`
  // untouched, when the snapshot cannot be located.
  static bool update(RouteLineState &state, const ProgressSnapshot &snapshot);
};

// Turns the located table entry and the live position into the traveled
// fraction of the route.
class TraveledFractionTracker {
public:
  explicit TraveledFractionTracker(bool legacy_clamp = false)
      : legacy_clamp_(legacy_clamp) {}

  // Returns true when the fractions were updated. Positions implying more
  // remaining distance than the whole route are GPS noise and are dropped.
  bool update(RouteLineState &state, const Coordinate &location) const;

private:
  bool legacy_clamp_;
};
