#pragma once
#include "models/params.hpp"
#include <nlohmann/json.hpp>
#include <vector>

// Builds the colour stops painting the route line for a traveled fraction.
class GradientBuilder {
public:
  explicit GradientBuilder(const RouteLineColors &colors, int precision = 16)
      : colors_(colors), precision_(precision) {}

  // Stops for `fraction_traveled`. Everything before the fraction gets the
  // traversed colour. After it, either congestion colours (when `congestion`
  // holds segments with a positive total length) or `untraveled`.
  GradientStops build(double fraction_traveled,
                      const std::vector<CongestionSegment> *congestion,
                      const Color &untraveled) const;

  // Main route line: congestion colours, base colour when there are none.
  GradientStops main_line(double fraction_traveled,
                          const std::vector<CongestionSegment> &congestion) const {
    return build(fraction_traveled, &congestion, colors_.route_base);
  }
  GradientStops casing(double fraction_traveled) const {
    return build(fraction_traveled, nullptr, colors_.casing);
  }

  const Color &congestion_color(CongestionLevel level) const;
  const RouteLineColors &colors() const { return colors_; }

  // ["step", ["line-progress"], c0, k1, c1, ...] as understood by the sink
  static nlohmann::json to_expression(const GradientStops &stops);

private:
  GradientStops congestion_stops(double fraction_traveled,
                                 const std::vector<CongestionSegment> &congestion,
                                 double total) const;
  GradientStops finalize(const GradientStops &raw) const;

  RouteLineColors colors_;
  int precision_;
};
