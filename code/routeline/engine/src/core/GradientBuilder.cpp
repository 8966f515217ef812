#include "GradientBuilder.hpp"
#include <cmath>
#include <limits>

// Neighbouring representable positions keep adjacent colour bands from
// blending into each other in the renderer.
static inline double next_up(double v) {
  return std::nextafter(v, std::numeric_limits<double>::infinity());
}
static inline double next_down(double v) {
  return std::nextafter(v, -std::numeric_limits<double>::infinity());
}

const Color &GradientBuilder::congestion_color(CongestionLevel level) const {
  switch (level) {
  case CongestionLevel::Low:
    return colors_.traffic_low;
  case CongestionLevel::Moderate:
    return colors_.traffic_moderate;
  case CongestionLevel::Heavy:
    return colors_.traffic_heavy;
  case CongestionLevel::Severe:
    return colors_.traffic_severe;
  default:
    return colors_.traffic_unknown;
  }
}

GradientStops
GradientBuilder::build(double fraction_traveled,
                       const std::vector<CongestionSegment> *congestion,
                       const Color &untraveled) const {
  double total = 0.0;
  if (congestion)
    for (const auto &seg : *congestion)
      total += seg.distance;

  if (congestion && !congestion->empty() && total > 0.0)
    return finalize(congestion_stops(fraction_traveled, *congestion, total));

  GradientStops raw;
  raw[0.0] = colors_.traversed;
  raw[next_down(fraction_traveled)] = colors_.traversed;
  raw[fraction_traveled] = untraveled;
  return finalize(raw);
}

GradientStops GradientBuilder::congestion_stops(
    double fraction_traveled, const std::vector<CongestionSegment> &congestion,
    double total) const {
  GradientStops stops;
  const std::size_t last = congestion.size() - 1;
  double traveled = 0.0;

  for (std::size_t i = 0; i < congestion.size(); ++i) {
    const Color &color = congestion_color(congestion[i].level);
    const double start = traveled / total;
    traveled += congestion[i].distance;
    const double end = traveled / total;

    if (i == 0)
      stops[0.0] = color;
    else
      stops[next_up(start)] = color;

    if (i == last) {
      stops[1.0] = color;
    } else {
      stops[next_down(end)] = color;
      stops[next_up(end)] = congestion_color(congestion[i + 1].level);
    }
  }

  // paint the traveled part over whatever congestion it covers
  GradientStops ahead(stops.lower_bound(fraction_traveled), stops.end());
  if (ahead.empty()) {
    ahead[0.0] = colors_.traversed;
    return ahead;
  }
  const Color nearest = ahead.begin()->second;
  ahead[0.0] = colors_.traversed;
  ahead[next_down(fraction_traveled)] = colors_.traversed;
  ahead[fraction_traveled] = nearest;
  return ahead;
}

GradientStops GradientBuilder::finalize(const GradientStops &raw) const {
  const double scale = std::pow(10.0, precision_);
  GradientStops out;
  // ascending order, so on a collision the later stop wins
  for (const auto &kv : raw) {
    if (kv.first < 0.0)
      continue;
    double pos = std::round(kv.first * scale) / scale;
    if (pos > 1.0)
      pos = 1.0;
    out[pos] = kv.second;
  }
  return out;
}

nlohmann::json GradientBuilder::to_expression(const GradientStops &stops) {
  nlohmann::json expr = nlohmann::json::array();
  expr.push_back("step");
  expr.push_back(nlohmann::json::array({"line-progress"}));
  if (stops.empty()) {
    expr.push_back(Color::from_hex("#00000000").to_string());
    return expr;
  }
  expr.push_back(stops.begin()->second.to_string());
  for (const auto &kv : stops) {
    expr.push_back(kv.first);
    expr.push_back(kv.second.to_string());
  }
  return expr;
}
