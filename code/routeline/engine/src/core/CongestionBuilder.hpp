#pragma once
#include "models/DirectionsResponse.hpp"
#include <vector>

// Turns per-edge congestion annotations into contiguous congestion segments.
class CongestionBuilder {
public:
  explicit CongestionBuilder(bool legacy_clamp = false)
      : legacy_clamp_(legacy_clamp) {}

  // Leg polyline: step shapes concatenated, dropping a step's first point
  // when it repeats the previous step's last point.
  static std::vector<Coordinate> leg_polyline(const Leg &leg);

  // Empty when no leg of the route carries congestion annotations. Edges
  // without an annotation entry are tagged Unknown. Segments never span legs.
  std::vector<CongestionSegment> build(const Route &route) const;

private:
  bool legacy_clamp_;
};
