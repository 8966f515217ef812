#pragma once

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

// Basic spatial coordinate, degrees.
struct Coordinate {
  double lat = 0.0;
  double lon = 0.0;
};

inline bool operator==(const Coordinate &a, const Coordinate &b) {
  return a.lat == b.lat && a.lon == b.lon;
}
inline bool operator!=(const Coordinate &a, const Coordinate &b) {
  return !(a == b);
}

// RGBA colour as understood by the rendering sink.
struct Color {
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;
  double a = 1.0;

  // Accepts "#RRGGBB" or "#RRGGBBAA". Throws std::invalid_argument otherwise.
  static Color from_hex(const std::string &hex) {
    const bool alpha = hex.size() == 9;
    if ((hex.size() != 7 && !alpha) || hex[0] != '#')
      throw std::invalid_argument("bad colour '" + hex + "'");
    for (std::size_t i = 1; i < hex.size(); ++i)
      if (!std::isxdigit(static_cast<unsigned char>(hex[i])))
        throw std::invalid_argument("bad colour '" + hex + "'");
    auto byte_at = [&hex](std::size_t pos) {
      return static_cast<uint8_t>(std::stoi(hex.substr(pos, 2), nullptr, 16));
    };
    Color c;
    c.r = byte_at(1);
    c.g = byte_at(3);
    c.b = byte_at(5);
    c.a = alpha ? byte_at(7) / 255.0 : 1.0;
    return c;
  }

  // "rgba(r, g, b, a)"
  std::string to_string() const {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "rgba(%u, %u, %u, %.3g)", unsigned(r),
                  unsigned(g), unsigned(b), a);
    return buf;
  }
};

inline bool operator==(const Color &x, const Color &y) {
  return x.r == y.r && x.g == y.g && x.b == y.b && x.a == y.a;
}
inline bool operator!=(const Color &x, const Color &y) { return !(x == y); }

// Traffic severity attached to a stretch of route geometry.
enum class CongestionLevel : uint8_t { Unknown = 0, Low, Moderate, Heavy, Severe };

inline const char *CongestionLevelToString(CongestionLevel level) {
  switch (level) {
  case CongestionLevel::Low:
    return "low";
  case CongestionLevel::Moderate:
    return "moderate";
  case CongestionLevel::Heavy:
    return "heavy";
  case CongestionLevel::Severe:
    return "severe";
  default:
    return "unknown";
  }
}

inline CongestionLevel CongestionLevelFromString(const std::string &s) {
  if (s == "low")
    return CongestionLevel::Low;
  if (s == "moderate")
    return CongestionLevel::Moderate;
  if (s == "heavy")
    return CongestionLevel::Heavy;
  if (s == "severe")
    return CongestionLevel::Severe;
  return CongestionLevel::Unknown;
}

// Route geometry as legs -> steps -> coordinates, plus one flat sequence of
// every coordinate in traversal order. Step boundaries repeat: the last point
// of a step is also the first point of the next one.
struct RoutePoints {
  std::vector<std::vector<std::vector<Coordinate>>> nested;
  std::vector<Coordinate> flat;
};

struct RouteLineDistancesIndex {
  Coordinate point;
  double distance_remaining = 0.0; // planar distance to the route's end
};

// Remaining-distance table, index-aligned with RoutePoints::flat.
struct RouteLineGranularDistances {
  double distance = 0.0; // total planar length of the route
  std::vector<RouteLineDistancesIndex> distances;
};

// Progress reported by the navigation engine for one location fix.
struct ProgressSnapshot {
  std::size_t leg_index = 0;
  std::size_t step_index = 0;
  double distance_traveled = 0.0; // meters into the current step
  double step_distance = 0.0;     // total meters of the current step
  Coordinate location;            // live (snapped) user position
};

// Contiguous stretch of route geometry sharing one congestion level.
struct CongestionSegment {
  CongestionLevel level = CongestionLevel::Unknown;
  std::vector<Coordinate> coordinates;
  double distance = 0.0; // planar length
};

// Position along the line in [0,1] -> colour. Keys are unique; inserting an
// existing key overwrites it.
using GradientStops = std::map<double, Color>;

// Layer identifiers of the displayed route in the rendering sink.
struct RouteLayerIds {
  std::string main;
  std::string casing;
};
