#include "RouteLineAnimator.hpp"
#include <algorithm>
#include <iostream>

double RouteLineAnimator::interpolate(double pre, double current,
                                      std::chrono::milliseconds elapsed,
                                      std::chrono::milliseconds duration) {
  if (duration.count() <= 0 || elapsed >= duration)
    return current;
  const auto clamped = std::max(std::chrono::milliseconds(0),
                                std::min(elapsed, duration));
  const double t = static_cast<double>(clamped.count()) /
                   static_cast<double>(duration.count());
  return pre + (current - pre) * t;
}

void RouteLineAnimator::push_gradients(
    LayerSink &sink, const GradientBuilder &gradients, const RouteLayerIds &ids,
    const std::vector<CongestionSegment> *congestion, double fraction) {
  if (!sink.has_layer(ids.main) || !sink.has_layer(ids.casing))
    return;
  sink.set_line_gradient(
      ids.main,
      gradients.build(fraction, congestion, gradients.colors().route_base));
  sink.set_line_gradient(ids.casing, gradients.casing(fraction));
}

RouteLineAnimator::Outcome
RouteLineAnimator::update_route(RouteLineState &state, const RouteLayerIds &ids,
                                const CongestionList &congestion) {
  const bool interrupted = state.animation.active();
  state.animation.cancel();
  state.animation = TaskHandle{};

  if (state.fraction_traveled >= 1.0) {
    sink_.remove_layer(ids.main);
    sink_.remove_layer(ids.casing);
    state.fraction_traveled = 0.0;
    state.pre_fraction_traveled = 0.0;
    std::cout << "[route] fully traveled, removed " << ids.main << " and "
              << ids.casing << std::endl;
    return Outcome::Completed;
  }

  if (state.fraction_traveled == state.pre_fraction_traveled) {
    // a cut-short animation leaves the line behind; settle it on current
    if (interrupted)
      push_gradients(sink_, gradients_, ids, congestion.get(),
                     state.fraction_traveled);
    return Outcome::Unchanged;
  }

  const double pre = state.pre_fraction_traveled;
  const double current = state.fraction_traveled;
  const auto duration = duration_;
  LayerSink &sink = sink_;
  GradientBuilder gradients = gradients_;

  // the tick owns copies of everything but the sink, which outlives it
  state.animation = scheduler_.schedule_repeating(
      interval_, [&sink, gradients, ids, congestion, pre, current,
                  duration](std::chrono::milliseconds elapsed) {
        const double f = interpolate(pre, current, elapsed, duration);
        push_gradients(sink, gradients, ids, congestion.get(), f);
        return elapsed < duration;
      });
  return Outcome::Scheduled;
}
