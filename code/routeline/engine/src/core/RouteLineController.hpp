#pragma once
#include "core/CongestionBuilder.hpp"
#include "core/RouteLineAnimator.hpp"
#include "core/RoutePointsBuilder.hpp"
#include "core/RouteProgress.hpp"
#include <mutex>

// Owns the vanishing route line of the displayed route and runs the pipeline
// for each progress update. All public calls are serialised.
class RouteLineController {
public:
  RouteLineController(const RouteLineParams &params, TaskScheduler &scheduler,
                      LayerSink &sink);
  ~RouteLineController();

  RouteLineController(const RouteLineController &) = delete;
  RouteLineController &operator=(const RouteLineController &) = delete;

  struct RouteSummary {
    RouteLayerIds layers;
    std::size_t legs = 0;
    std::size_t steps = 0;
    std::size_t points = 0;
    double planar_distance = 0.0;
    std::size_t congestion_segments = 0;
  };

  struct ProgressResult {
    bool located = false; // false: snapshot ignored
    std::optional<std::size_t> index;
    double fraction_traveled = 0.0;
    double pre_fraction_traveled = 0.0;
    RouteLineAnimator::Outcome outcome = RouteLineAnimator::Outcome::Unchanged;
  };

  struct StateView {
    bool has_route = false;
    RouteLayerIds layers;
    std::size_t points = 0;
    double planar_distance = 0.0;
    std::optional<std::size_t> index;
    double fraction_traveled = 0.0;
    double pre_fraction_traveled = 0.0;
    bool animating = false;
  };

  // Replaces the displayed route: cancels the running animation, rebuilds the
  // point lists and distance table, adds both layers to the sink and paints
  // them untraveled.
  RouteSummary set_route(const Route &route);

  // A negative snapshot.step_distance is replaced by the route's own distance
  // for that step. Throws std::logic_error when no route is set.
  ProgressResult on_progress(ProgressSnapshot snapshot);

  // Tears the route down: cancels the animation, removes both layers.
  void clear();

  bool has_route() const;
  StateView state() const;

  // Gradient the given layer would get at `fraction`, without touching the
  // sink. Throws std::logic_error when no route is set.
  GradientStops gradient(double fraction, bool casing) const;

private:
  void clear_locked();

  mutable std::mutex mutex_;
  LayerSink &sink_;
  RoutePointsBuilder points_builder_;
  CongestionBuilder congestion_builder_;
  TraveledFractionTracker tracker_;
  GradientBuilder gradients_;
  RouteLineAnimator animator_;

  bool has_route_ = false;
  RouteLineState state_;
  RouteLayerIds ids_;
  CongestionList congestion_;
  std::vector<std::vector<double>> step_distances_; // per leg, per step
};
