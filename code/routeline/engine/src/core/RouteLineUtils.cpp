#include "core/RouteLineUtils.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <iomanip>
#include <openssl/sha.h>
#include <sstream>

double RouteLineUtils::projectX(double lon) { return lon / 360.0 + 0.5; }

double RouteLineUtils::projectY(double lat, bool legacy_clamp) {
  const double sin_value = std::sin(lat * M_PI / 180.0);
  const double y =
      0.5 - 0.25 * std::log((1 + sin_value) / (1 - sin_value)) / M_PI;
  if (y < 0)
    return 0.0;
  if (y > 1)
    return legacy_clamp ? 1.1 : 1.0;
  return y;
}

double RouteLineUtils::distance(const Coordinate &a, const Coordinate &b,
                                bool legacy_clamp) {
  const double dx = projectX(a.lon) - projectX(b.lon);
  const double dy =
      projectY(a.lat, legacy_clamp) - projectY(b.lat, legacy_clamp);
  return std::sqrt(dx * dx + dy * dy);
}

double RouteLineUtils::haversine(const Coordinate &p1, const Coordinate &p2) {
  double phi1 = p1.lat * (M_PI / 180);
  double phi2 = p2.lat * (M_PI / 180);
  double delta_phi = (p2.lat - p1.lat) * (M_PI / 180);
  double delta_gamma = (p2.lon - p1.lon) * (M_PI / 180);
  double h = pow(sin(delta_phi / 2), 2) +
             cos(phi1) * cos(phi2) * pow(sin(delta_gamma / 2), 2);
  return 2 * 6371000 * asin(sqrt(h));
}

double RouteLineUtils::line_length_m(const std::vector<Coordinate> &line) {
  double len = 0.0;
  for (std::size_t i = 1; i < line.size(); ++i)
    len += haversine(line[i - 1], line[i]);
  return len;
}

double RouteLineUtils::planar_length(const std::vector<Coordinate> &line,
                                     bool legacy_clamp) {
  double len = 0.0;
  for (std::size_t i = 1; i < line.size(); ++i)
    len += distance(line[i - 1], line[i], legacy_clamp);
  return len;
}

// Linear interpolation on an edge; edges are short enough that the error
// against a great-circle position does not matter here.
static inline Coordinate point_on_edge(const Coordinate &a, const Coordinate &b,
                                       double along_m, double edge_m) {
  if (edge_m <= 0.0)
    return a;
  const double t = std::max(0.0, std::min(1.0, along_m / edge_m));
  return {a.lat + (b.lat - a.lat) * t, a.lon + (b.lon - a.lon) * t};
}

std::vector<Coordinate>
RouteLineUtils::slice_along(const std::vector<Coordinate> &line,
                            double start_m, double stop_m) {
  std::vector<Coordinate> out;
  if (line.size() < 2)
    return out;

  const double total = line_length_m(line);
  const double start = std::max(0.0, std::min(total, start_m));
  const double stop = std::max(start, std::min(total, stop_m));
  if (!(stop > start))
    return out;

  double traveled = 0.0;
  bool started = false;
  for (std::size_t i = 0; i + 1 < line.size(); ++i) {
    const double edge = haversine(line[i], line[i + 1]);
    const double edge_end = traveled + edge;

    if (!started && start <= edge_end) {
      out.push_back(point_on_edge(line[i], line[i + 1], start - traveled, edge));
      started = true;
    }
    if (started) {
      if (stop <= edge_end) {
        out.push_back(point_on_edge(line[i], line[i + 1], stop - traveled, edge));
        return out;
      }
      // vertex i+1 is strictly inside (start, stop)
      if (edge_end > start)
        out.push_back(line[i + 1]);
    }
    traveled = edge_end;
  }
  return out;
}

static std::string to_hex(const uint8_t *p, size_t n) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (size_t i = 0; i < n; ++i)
    oss << std::setw(2) << (int)p[i];
  return oss.str();
}

std::string
RouteLineUtils::fingerprint_material(const std::vector<Coordinate> &pts) {
  std::ostringstream csv;
  csv.setf(std::ios::fixed);
  csv << std::setprecision(6);
  for (size_t i = 0; i < pts.size(); ++i) {
    if (i)
      csv << ';';
    csv << pts[i].lat << ',' << pts[i].lon;
  }
  return "v1|EPSG:4326|" + csv.str();
}

std::string RouteLineUtils::route_uid_hex(const std::vector<Coordinate> &pts) {
  const std::string material = fingerprint_material(pts);
  std::array<uint8_t, SHA256_DIGEST_LENGTH> uid{};
  SHA256(reinterpret_cast<const unsigned char *>(material.data()),
         material.size(), uid.data());
  return to_hex(uid.data(), uid.size());
}

RouteLayerIds RouteLineUtils::layer_ids(const std::vector<Coordinate> &pts) {
  const std::string uid = route_uid_hex(pts).substr(0, 16);
  return {uid + ".mainRoute", uid + ".mainRouteCasing"};
}

RouteLineUtils::BBox
RouteLineUtils::compute_bbox(const std::vector<Coordinate> &pts) {
  RouteLineUtils::BBox b{+90, +180, -90, -180};
  for (auto &c : pts) {
    b.min_lat = std::min(b.min_lat, c.lat);
    b.max_lat = std::max(b.max_lat, c.lat);
    b.min_lon = std::min(b.min_lon, c.lon);
    b.max_lon = std::max(b.max_lon, c.lon);
  }
  return b;
}
