#pragma once
#include "models/CoreTypes.hpp"
#include <string>
#include <vector>

class RouteLineUtils {
public:
  // ---- EPSG:3857-like projection onto the unit square ----
  static double projectX(double lon);
  // Out-of-range values clamp to 0 below and to 1.0 above (1.1 with
  // legacy_clamp, matching previously rendered output).
  static double projectY(double lat, bool legacy_clamp = false);
  // Planar distance between projected points. Only meaningful relative to
  // other distances computed the same way.
  static double distance(const Coordinate &a, const Coordinate &b,
                         bool legacy_clamp = false);

  // haversine formulas, metres
  static double haversine(const Coordinate &p1, const Coordinate &p2);
  static double line_length_m(const std::vector<Coordinate> &line);
  static double planar_length(const std::vector<Coordinate> &line,
                              bool legacy_clamp = false);

  // Part of `line` between start_m and stop_m metres from its first point:
  // the cut point at start_m, every vertex strictly inside, the cut point at
  // stop_m. Bounds are clamped to the line. Empty when the line has fewer
  // than two points or nothing lies between the bounds.
  static std::vector<Coordinate> slice_along(const std::vector<Coordinate> &line,
                                             double start_m, double stop_m);

  // ---- route identity ----
  // Canonical text of the geometry: "v1|EPSG:4326|lat,lon;lat,lon;..."
  static std::string fingerprint_material(const std::vector<Coordinate> &pts);
  // SHA-256 of the fingerprint material, lowercase hex
  static std::string route_uid_hex(const std::vector<Coordinate> &pts);
  static RouteLayerIds layer_ids(const std::vector<Coordinate> &pts);

  struct BBox {
    double min_lat, min_lon, max_lat, max_lon;
  };
  static BBox compute_bbox(const std::vector<Coordinate> &pts);
};
