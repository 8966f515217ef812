#pragma once
#include "core/GradientBuilder.hpp"
#include "core/LayerSink.hpp"
#include "core/RouteLineState.hpp"
#include <chrono>
#include <memory>

using CongestionList = std::shared_ptr<const std::vector<CongestionSegment>>;

// Moves the painted line from the previous to the current traveled fraction
// over a short window instead of jumping.
class RouteLineAnimator {
public:
  enum class Outcome : uint8_t {
    Completed, // route fully traveled, layers removed
    Unchanged, // nothing moved, nothing scheduled
    Scheduled  // an animation is running
  };

  RouteLineAnimator(TaskScheduler &scheduler, LayerSink &sink,
                    const GradientBuilder &gradients,
                    std::chrono::milliseconds interval,
                    std::chrono::milliseconds duration)
      : scheduler_(scheduler), sink_(sink), gradients_(gradients),
        interval_(interval), duration_(duration) {}

  // Always cancels the outstanding animation of `state` first. When that
  // animation was still running and nothing moved, paints the current
  // fraction once instead of scheduling.
  Outcome update_route(RouteLineState &state, const RouteLayerIds &ids,
                       const CongestionList &congestion);

  // pre + (current - pre) * min(elapsed, duration) / duration
  static double interpolate(double pre, double current,
                            std::chrono::milliseconds elapsed,
                            std::chrono::milliseconds duration);

  // Pushes main line and casing gradients for `fraction`. Skipped unless the
  // sink holds both layers.
  static void push_gradients(LayerSink &sink, const GradientBuilder &gradients,
                             const RouteLayerIds &ids,
                             const std::vector<CongestionSegment> *congestion,
                             double fraction);

private:
  TaskScheduler &scheduler_;
  LayerSink &sink_;
  GradientBuilder gradients_;
  std::chrono::milliseconds interval_;
  std::chrono::milliseconds duration_;
};
