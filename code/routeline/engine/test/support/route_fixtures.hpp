#pragma once
#include "core/RouteLineUtils.hpp"
#include "models/DirectionsResponse.hpp"
#include <string>
#include <vector>

namespace fixtures {

// Points along the equator, 0.001 degrees (~111 m) apart. Planar distances
// between neighbours are all equal there.
inline Coordinate eq(int i) { return {0.0, 0.001 * i}; }

inline Step make_step(const std::vector<Coordinate> &shape) {
  Step s;
  s.has_shape = true;
  s.shape.type = "LineString";
  s.shape.coordinates = shape;
  s.distance = RouteLineUtils::line_length_m(shape);
  return s;
}

inline Step shapeless_step(double distance = 0.0) {
  Step s;
  s.distance = distance;
  return s;
}

// One leg, two steps: [p0 p1 p2] [p2 p3 p4]. Flat list has six points.
inline Route two_step_route() {
  Leg leg;
  leg.steps.push_back(make_step({eq(0), eq(1), eq(2)}));
  leg.steps.push_back(make_step({eq(2), eq(3), eq(4)}));
  Route r;
  r.legs.push_back(leg);
  return r;
}

// Same geometry split over two legs of one step each.
inline Route two_leg_route() {
  Leg a, b;
  a.steps.push_back(make_step({eq(0), eq(1), eq(2)}));
  b.index = 1;
  b.steps.push_back(make_step({eq(2), eq(3), eq(4)}));
  Route r;
  r.legs = {a, b};
  return r;
}

// Two routes; the first has the geometry of two_step_route() and a congestion
// annotation of low, low, heavy, heavy over its four edges.
inline const std::string &directions_json() {
  static const std::string body = R"({
  "code": "Ok",
  "routes": [
    {
      "distance": 444.8,
      "duration": 60.0,
      "weight_name": "auto",
      "legs": [
        {
          "distance": 444.8,
          "duration": 60.0,
          "summary": "Equator Road",
          "annotation": { "congestion": ["low", "low", "heavy", "heavy"] },
          "steps": [
            {
              "distance": 222.39,
              "duration": 30.0,
              "name": "Equator Road",
              "maneuver": { "type": "depart" },
              "geometry": {
                "type": "LineString",
                "coordinates": [[0.0, 0.0], [0.001, 0.0], [0.002, 0.0]]
              }
            },
            {
              "distance": 222.39,
              "duration": 30.0,
              "name": "Equator Road",
              "maneuver": { "type": "arrive" },
              "geometry": {
                "type": "LineString",
                "coordinates": [[0.002, 0.0], [0.003, 0.0], [0.004, 0.0]]
              }
            }
          ]
        }
      ]
    },
    {
      "distance": 111.2,
      "duration": 20.0,
      "legs": [
        {
          "steps": [
            {
              "distance": 111.2,
              "maneuver": { "type": "depart" },
              "geometry": {
                "type": "LineString",
                "coordinates": [[10.0, 50.0], [10.001, 50.0]]
              }
            }
          ]
        }
      ]
    }
  ]
})";
  return body;
}

} // namespace fixtures
