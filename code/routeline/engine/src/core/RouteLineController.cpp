// RouteLineController wires flattening, indexing, locating, fraction tracking
// and animation together for one displayed route.

#include "RouteLineController.hpp"
#include "core/RouteLineUtils.hpp"
#include <iostream>
#include <stdexcept>

RouteLineController::RouteLineController(const RouteLineParams &params,
                                         TaskScheduler &scheduler,
                                         LayerSink &sink)
    : sink_(sink), points_builder_(params.legacy_y_clamp),
      congestion_builder_(params.legacy_y_clamp),
      tracker_(params.legacy_y_clamp),
      gradients_(params.colors, params.gradient_precision),
      animator_(scheduler, sink, gradients_,
                std::chrono::milliseconds(params.animation_interval_ms),
                std::chrono::milliseconds(params.animation_duration_ms)) {}

RouteLineController::~RouteLineController() {
  std::lock_guard<std::mutex> lock(mutex_);
  state_.animation.cancel();
}

RouteLineController::RouteSummary
RouteLineController::set_route(const Route &route) {
  // build outside the lock; the route is not shared yet
  RoutePoints points = points_builder_.build(route);
  auto granular = points_builder_.granular_distances(points.flat);
  auto congestion = std::make_shared<const std::vector<CongestionSegment>>(
      congestion_builder_.build(route));
  RouteLayerIds ids = RouteLineUtils::layer_ids(points.flat);

  std::vector<std::vector<double>> step_distances;
  RouteSummary summary;
  for (const auto &leg : route.legs) {
    std::vector<double> d;
    for (const auto &step : leg.steps)
      d.push_back(step.distance);
    summary.steps += d.size();
    step_distances.push_back(std::move(d));
  }
  summary.layers = ids;
  summary.legs = route.legs.size();
  summary.points = points.flat.size();
  summary.planar_distance = granular ? granular->distance : 0.0;
  summary.congestion_segments = congestion->size();

  std::lock_guard<std::mutex> lock(mutex_);
  clear_locked();

  state_.route_points = std::move(points);
  state_.granular_distances = std::move(granular);
  ids_ = ids;
  congestion_ = congestion;
  step_distances_ = std::move(step_distances);
  has_route_ = true;

  sink_.add_layer(ids_.main);
  sink_.add_layer(ids_.casing);
  RouteLineAnimator::push_gradients(sink_, gradients_, ids_, congestion_.get(),
                                    0.0);

  std::cout << "[route] displayed " << ids_.main << " legs=" << summary.legs
            << " steps=" << summary.steps << " points=" << summary.points
            << " congestion_segments=" << summary.congestion_segments
            << std::endl;
  return summary;
}

RouteLineController::ProgressResult
RouteLineController::on_progress(ProgressSnapshot snapshot) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!has_route_)
    throw std::logic_error("no route is displayed");

  if (snapshot.step_distance < 0.0) {
    snapshot.step_distance = 0.0;
    if (snapshot.leg_index < step_distances_.size() &&
        snapshot.step_index < step_distances_[snapshot.leg_index].size())
      snapshot.step_distance =
          step_distances_[snapshot.leg_index][snapshot.step_index];
  }

  ProgressResult result;
  result.located = UpcomingPointLocator::update(state_, snapshot);
  if (result.located) {
    tracker_.update(state_, snapshot.location);
    result.outcome = animator_.update_route(state_, ids_, congestion_);
  }
  result.index = state_.remaining_distances_index;
  result.fraction_traveled = state_.fraction_traveled;
  result.pre_fraction_traveled = state_.pre_fraction_traveled;
  return result;
}

void RouteLineController::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  clear_locked();
}

void RouteLineController::clear_locked() {
  state_.reset();
  if (has_route_) {
    sink_.remove_layer(ids_.main);
    sink_.remove_layer(ids_.casing);
    std::cout << "[route] cleared " << ids_.main << std::endl;
  }
  has_route_ = false;
  ids_ = RouteLayerIds{};
  congestion_.reset();
  step_distances_.clear();
}

bool RouteLineController::has_route() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return has_route_;
}

RouteLineController::StateView RouteLineController::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  StateView v;
  v.has_route = has_route_;
  v.layers = ids_;
  v.points = state_.route_points ? state_.route_points->flat.size() : 0;
  v.planar_distance =
      state_.granular_distances ? state_.granular_distances->distance : 0.0;
  v.index = state_.remaining_distances_index;
  v.fraction_traveled = state_.fraction_traveled;
  v.pre_fraction_traveled = state_.pre_fraction_traveled;
  v.animating = state_.animation.active();
  return v;
}

GradientStops RouteLineController::gradient(double fraction,
                                            bool casing) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!has_route_)
    throw std::logic_error("no route is displayed");
  if (casing)
    return gradients_.casing(fraction);
  return gradients_.build(fraction, congestion_.get(),
                          gradients_.colors().route_base);
}
