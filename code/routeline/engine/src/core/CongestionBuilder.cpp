#include "CongestionBuilder.hpp"
#include "core/RouteLineUtils.hpp"

std::vector<Coordinate> CongestionBuilder::leg_polyline(const Leg &leg) {
  std::vector<Coordinate> out;
  for (const auto &step : leg.steps) {
    if (!step.has_shape)
      continue;
    const auto &pts = step.shape.coordinates;
    auto first = pts.begin();
    if (first != pts.end() && !out.empty() && *first == out.back())
      ++first;
    out.insert(out.end(), first, pts.end());
  }
  return out;
}

std::vector<CongestionSegment>
CongestionBuilder::build(const Route &route) const {
  std::vector<CongestionSegment> segments;

  bool annotated = false;
  for (const auto &leg : route.legs)
    annotated = annotated || !leg.congestion.empty();
  if (!annotated)
    return segments;

  for (const auto &leg : route.legs) {
    const auto line = leg_polyline(leg);
    if (line.size() < 2)
      continue;

    CongestionSegment current;
    for (std::size_t e = 0; e + 1 < line.size(); ++e) {
      const CongestionLevel level = e < leg.congestion.size()
                                        ? leg.congestion[e]
                                        : CongestionLevel::Unknown;
      if (!current.coordinates.empty() && level != current.level) {
        segments.push_back(std::move(current));
        current = CongestionSegment{};
      }
      if (current.coordinates.empty()) {
        current.level = level;
        current.coordinates.push_back(line[e]);
      }
      current.coordinates.push_back(line[e + 1]);
      current.distance +=
          RouteLineUtils::distance(line[e], line[e + 1], legacy_clamp_);
    }
    if (!current.coordinates.empty())
      segments.push_back(std::move(current));
  }
  return segments;
}
