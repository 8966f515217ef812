#pragma once
#include "models/DirectionsResponse.hpp"
#include <optional>

class RoutePointsBuilder {
public:
  explicit RoutePointsBuilder(bool legacy_clamp = false)
      : legacy_clamp_(legacy_clamp) {}

  // Legs -> steps -> coordinates. Steps without a shape stay as empty lists.
  RoutePoints build(const Route &route) const;

  // Remaining planar distance for every point of `coordinates`, computed back
  // to front. std::nullopt for an empty input.
  std::optional<RouteLineGranularDistances>
  granular_distances(const std::vector<Coordinate> &coordinates) const;

private:
  bool legacy_clamp_;
};
