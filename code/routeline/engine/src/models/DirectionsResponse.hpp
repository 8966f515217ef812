#pragma once

#include "models/CoreTypes.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using Json = nlohmann::json;

// Structures modelling the subset of a Directions/OSRM route response the
// route line needs.

// ---------- Geometry ----------
struct Geometry {
  std::string type; // e.g., "LineString"
  std::vector<Coordinate> coordinates;
};

// ---------- Steps -------------
struct Step {
  double distance = 0.0; // meters
  double duration = 0.0;
  std::string name;
  std::string maneuver_type;
  bool has_shape = false; // false when the response carried no geometry
  Geometry shape;
};

// ---------- Legs --------------
struct Leg {
  int index = 0;
  double distance = 0.0;
  double duration = 0.0;
  std::string summary;
  std::vector<Step> steps;
  // One entry per edge of the leg polyline, empty when not annotated.
  std::vector<CongestionLevel> congestion;
};

// ---------- Route -------------
struct Route {
  double distance = 0.0;
  double duration = 0.0;
  std::string weight_name;
  std::vector<Leg> legs;
};

struct DirectionsResponse {
  std::string code;
  std::vector<Route> routes;

  // Throws std::out_of_range when no route sits at `index`.
  const Route &route(std::size_t index = 0) const {
    if (index >= routes.size())
      throw std::out_of_range("route index " + std::to_string(index) +
                              " out of range (" +
                              std::to_string(routes.size()) + " routes)");
    return routes[index];
  }
};

// Define from_json() overloads for structs to work with json::get() function

// --- Geometry ----
inline void from_json(const Json &j, Geometry &g) {
  g.type = j.value("type", "");
  g.coordinates.clear();
  if (j.contains("coordinates") && j["coordinates"].is_array()) {
    for (const auto &pt : j["coordinates"]) {
      // GeoJSON order is [lon, lat]
      if (pt.is_array() && pt.size() >= 2)
        g.coordinates.push_back({pt[1].get<double>(), pt[0].get<double>()});
    }
  }
}

// --- Step ----
inline void from_json(const Json &j, Step &s) {
  s.distance = j.value("distance", 0.0);
  s.duration = j.value("duration", 0.0);
  s.name = j.value("name", "");
  s.maneuver_type.clear();
  if (j.contains("maneuver") && j["maneuver"].is_object())
    s.maneuver_type = j["maneuver"].value("type", "");
  // encoded polylines are not decoded; such a step simply has no shape
  s.has_shape = j.contains("geometry") && j["geometry"].is_object();
  s.shape = s.has_shape ? j["geometry"].get<Geometry>() : Geometry{};
}

// --- Legs ----
inline void from_json(const Json &j, Leg &l) {
  l.distance = j.value("distance", 0.0);
  l.duration = j.value("duration", 0.0);
  l.summary = j.value("summary", "");
  l.steps.clear();
  if (j.contains("steps") && j["steps"].is_array()) {
    for (const auto &S : j["steps"])
      l.steps.push_back(S.get<Step>());
  }
  l.congestion.clear();
  if (j.contains("annotation") && j["annotation"].is_object()) {
    const auto &ann = j["annotation"];
    if (ann.contains("congestion") && ann["congestion"].is_array()) {
      for (const auto &c : ann["congestion"])
        l.congestion.push_back(c.is_string()
                                   ? CongestionLevelFromString(c.get<std::string>())
                                   : CongestionLevel::Unknown);
    }
  }
}

// --- Route ----
inline void from_json(const Json &j, Route &r) {
  r.distance = j.value("distance", 0.0);
  r.duration = j.value("duration", 0.0);
  r.weight_name = j.value("weight_name", "");
  r.legs.clear();
  if (j.contains("legs") && j["legs"].is_array()) {
    for (const auto &L : j["legs"]) {
      Leg leg = L.get<Leg>();
      leg.index = static_cast<int>(r.legs.size());
      r.legs.push_back(std::move(leg));
    }
  }
}

// --- DirectionsResponse ----
inline void from_json(const Json &j, DirectionsResponse &r) {
  r.code = j.value("code", "Error");
  const auto &arr = j.value("routes", Json::array());
  if (arr.empty())
    throw std::runtime_error("No routes in directions response");
  r.routes.clear();
  for (const auto &R : arr)
    r.routes.push_back(R.get<Route>());
}
