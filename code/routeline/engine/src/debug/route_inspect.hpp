#pragma once
#include "core/CongestionBuilder.hpp"
#include "core/RouteLineUtils.hpp"
#include "core/RoutePointsBuilder.hpp"
#include "models/DirectionsResponse.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

// Summary of a parsed directions response, for checking what the engine will
// make of it before it is displayed.
inline nlohmann::json summarize(const DirectionsResponse &r,
                                std::size_t sample_n = 3) {
  using nlohmann::json;
  json out;
  out["code"] = r.code;
  out["route_count"] = r.routes.size();

  json routes = json::array();
  RoutePointsBuilder points_builder;
  CongestionBuilder congestion_builder;
  for (const auto &route : r.routes) {
    const RoutePoints pts = points_builder.build(route);

    std::size_t steps = 0, shapeless = 0, annotated = 0;
    json legs = json::array();
    for (const auto &leg : route.legs) {
      steps += leg.steps.size();
      annotated += leg.congestion.empty() ? 0 : 1;
      for (const auto &s : leg.steps)
        shapeless += (s.has_shape && !s.shape.coordinates.empty()) ? 0 : 1;
      legs.push_back({{"index", leg.index},
                      {"summary", leg.summary},
                      {"steps", leg.steps.size()},
                      {"distance", leg.distance},
                      {"congestion_entries", leg.congestion.size()}});
    }

    json samples = json::array();
    const auto N = std::min(sample_n, pts.flat.size());
    for (std::size_t i = 0; i < N; ++i)
      samples.push_back({{"lat", pts.flat[i].lat}, {"lon", pts.flat[i].lon}});

    json rj = {{"distance", route.distance},
               {"duration", route.duration},
               {"weight_name", route.weight_name},
               {"legs", legs},
               {"steps", steps},
               {"steps_without_shape", shapeless},
               {"annotated_legs", annotated},
               {"flat_points", pts.flat.size()},
               {"congestion_segments",
                congestion_builder.build(route).size()},
               {"sample_coords", samples}};
    if (!pts.flat.empty()) {
      const auto bb = RouteLineUtils::compute_bbox(pts.flat);
      rj["bbox"] = {bb.min_lon, bb.min_lat, bb.max_lon, bb.max_lat};
      const auto ids = RouteLineUtils::layer_ids(pts.flat);
      rj["layers"] = {{"main", ids.main}, {"casing", ids.casing}};
    }
    routes.push_back(rj);
  }
  out["routes"] = routes;
  return out;
}
