#pragma once

#include "models/CoreTypes.hpp"
#include <nlohmann/json.hpp>
#include <string>

// Colours used when painting the route line.
struct RouteLineColors {
  Color traversed = Color::from_hex("#00000000");
  Color route_base = Color::from_hex("#56A8FB");
  Color casing = Color::from_hex("#2F7AC6");
  Color traffic_unknown = Color::from_hex("#56A8FB");
  Color traffic_low = Color::from_hex("#56A8FB");
  Color traffic_moderate = Color::from_hex("#FF9500");
  Color traffic_heavy = Color::from_hex("#FF4D4D");
  Color traffic_severe = Color::from_hex("#8F2447");
};

// Settings controlling projection, animation and gradient output. Loaded from
// the "route_line" block of config/settings.json.
struct RouteLineParams {
  RouteLineColors colors;
  int animation_interval_ms = 50;
  int animation_duration_ms = 1000;
  int gradient_precision = 16; // decimal places kept on stop positions
  bool legacy_y_clamp = false; // clamp projected y > 1 to 1.1 instead of 1.0

  static RouteLineParams from_json(const nlohmann::json &j) {
    RouteLineParams p;
    if (j.contains("colors")) {
      const auto &c = j.at("colors");
      auto read = [&c](const char *key, Color &out) {
        if (c.contains(key))
          out = Color::from_hex(c.at(key).get<std::string>());
      };
      read("traversed", p.colors.traversed);
      read("route_base", p.colors.route_base);
      read("casing", p.colors.casing);
      read("traffic_unknown", p.colors.traffic_unknown);
      read("traffic_low", p.colors.traffic_low);
      read("traffic_moderate", p.colors.traffic_moderate);
      read("traffic_heavy", p.colors.traffic_heavy);
      read("traffic_severe", p.colors.traffic_severe);
    }
    if (j.contains("animation")) {
      const auto &a = j.at("animation");
      p.animation_interval_ms = a.value("interval_ms", p.animation_interval_ms);
      p.animation_duration_ms = a.value("duration_ms", p.animation_duration_ms);
    }
    if (j.contains("gradient"))
      p.gradient_precision =
          j.at("gradient").value("precision", p.gradient_precision);
    if (j.contains("projection"))
      p.legacy_y_clamp =
          j.at("projection").value("legacy_y_clamp", p.legacy_y_clamp);

    if (p.animation_interval_ms <= 0 || p.animation_duration_ms <= 0)
      throw std::invalid_argument(
          "route_line.animation interval and duration must be positive");
    if (p.gradient_precision < 1 || p.gradient_precision > 17)
      throw std::invalid_argument(
          "route_line.gradient.precision must be within [1, 17]");
    return p;
  }
};
