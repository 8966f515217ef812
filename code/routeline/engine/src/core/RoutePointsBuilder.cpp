// Flattens a route into the point lists the vanishing route line works on and
// builds the remaining-distance table over them. Both are computed once per
// route; progress updates only index into them.

#include "RoutePointsBuilder.hpp"
#include "core/RouteLineUtils.hpp"

RoutePoints RoutePointsBuilder::build(const Route &route) const {
  RoutePoints rp;
  rp.nested.reserve(route.legs.size());
  for (const auto &leg : route.legs) {
    std::vector<std::vector<Coordinate>> steps;
    steps.reserve(leg.steps.size());
    for (const auto &step : leg.steps) {
      if (step.has_shape)
        steps.push_back(step.shape.coordinates);
      else
        steps.emplace_back();
    }
    rp.nested.push_back(std::move(steps));
  }

  // shared endpoints of adjacent steps are kept on purpose: the upcoming
  // point index counts them the same way
  for (const auto &leg : rp.nested)
    for (const auto &step : leg)
      rp.flat.insert(rp.flat.end(), step.begin(), step.end());
  return rp;
}

std::optional<RouteLineGranularDistances> RoutePointsBuilder::granular_distances(
    const std::vector<Coordinate> &coordinates) const {
  if (coordinates.empty())
    return std::nullopt;

  const std::size_t n = coordinates.size();
  RouteLineGranularDistances out;
  out.distances.resize(n);

  double distance = 0.0;
  for (std::size_t i = n - 1; i > 0; --i) {
    distance += RouteLineUtils::distance(coordinates[i], coordinates[i - 1],
                                         legacy_clamp_);
    out.distances[i - 1] = {coordinates[i - 1], distance};
  }
  out.distances[n - 1] = {coordinates[n - 1], 0.0};
  out.distance = distance;
  return out;
}
