#include "http_handler.hpp"
#include "core/GradientBuilder.hpp"
#include "debug/json_debug.hpp"
#include "debug/route_inspect.hpp"
#include "models/DirectionsResponse.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

static void send_json(httplib::Response &res, int status, const json &body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

static void send_error(httplib::Response &res, int status,
                       const std::string &msg) {
  send_json(res, status, {{"ok", false}, {"error", msg}});
}

static json layer_ids_json(const RouteLayerIds &ids) {
  return {{"main", ids.main}, {"casing", ids.casing}};
}

static const char *outcome_name(RouteLineAnimator::Outcome o) {
  switch (o) {
  case RouteLineAnimator::Outcome::Completed:
    return "completed";
  case RouteLineAnimator::Outcome::Scheduled:
    return "scheduled";
  case RouteLineAnimator::Outcome::Unchanged:
    break;
  }
  return "unchanged";
}

// Reads a non-negative index field; throws std::invalid_argument otherwise.
static std::size_t read_index(const json &j, const char *key) {
  if (!j.contains(key) || !j.at(key).is_number_integer())
    throw std::invalid_argument(std::string("'") + key +
                                "' must be an integer");
  const auto v = j.at(key).get<long long>();
  if (v < 0)
    throw std::invalid_argument(std::string("'") + key +
                                "' must not be negative");
  return static_cast<std::size_t>(v);
}

static ProgressSnapshot parse_snapshot(const json &j) {
  if (!j.is_object())
    throw std::invalid_argument("progress body must be a JSON object");
  ProgressSnapshot s;
  s.leg_index = read_index(j, "leg_index");
  s.step_index = read_index(j, "step_index");
  if (!j.contains("distance_traveled") || !j["distance_traveled"].is_number())
    throw std::invalid_argument("'distance_traveled' must be a number");
  s.distance_traveled = j["distance_traveled"].get<double>();
  // negative: let the controller take it from the route
  s.step_distance = -1.0;
  if (j.contains("step_distance") && !j["step_distance"].is_null()) {
    if (!j["step_distance"].is_number())
      throw std::invalid_argument("'step_distance' must be a number");
    s.step_distance = j["step_distance"].get<double>();
  }
  const auto &loc = j.value("location", json());
  if (!loc.is_array() || loc.size() < 2 || !loc[0].is_number() ||
      !loc[1].is_number())
    throw std::invalid_argument("'location' must be [lon, lat]");
  s.location = {loc[1].get<double>(), loc[0].get<double>()};
  return s;
}

// ===== routes =====

void HttpHandler::callPostHandler(const std::string &action,
                                  const httplib::Request &req,
                                  httplib::Response &res) {
  if (action == "route") {
    handleRoute(req, res);
  } else if (action == "progress") {
    handleProgress(req, res);
  } else if (action == "reset") {
    handleReset(req, res);
  } else if (action == "debug") {
    handleDebug(req, res);
  } else {
    res.status = 404;
    res.set_content("Unknown action: " + action, "text/plain");
  }
}

void HttpHandler::callGetHandler(const std::string &action,
                                 const httplib::Request &req,
                                 httplib::Response &res) {
  if (action == "layers") {
    handleLayers(req, res);
  } else if (action == "gradient") {
    handleGradient(req, res);
  } else if (action == "state") {
    handleState(req, res);
  }
  // default
  else {
    res.status = 404;
    res.set_content("Unknown action: " + action, "text/plain");
  }
}

// ===== POST: /route =====

void HttpHandler::handleRoute(const httplib::Request &req,
                              httplib::Response &res) {
  json body;
  try {
    body = json::parse(req.body);
  } catch (const json::parse_error &e) {
    send_json(res, 400, parse_error_json(req.body, e));
    return;
  }

  std::size_t route_index = 0;
  if (req.has_param("route_index")) {
    const std::string v = req.get_param_value("route_index");
    char *end = nullptr;
    const long long idx = std::strtoll(v.c_str(), &end, 10);
    if (v.empty() || *end != '\0' || idx < 0) {
      send_error(res, 400, "route_index must be a non-negative integer");
      return;
    }
    route_index = static_cast<std::size_t>(idx);
  }

  DirectionsResponse directions;
  try {
    directions = body.get<DirectionsResponse>();
  } catch (const std::exception &e) {
    std::cerr << "[route] rejected directions response: " << e.what() << "\n";
    send_error(res, 400, e.what());
    return;
  }

  const Route *route = nullptr;
  try {
    route = &directions.route(route_index);
  } catch (const std::out_of_range &e) {
    send_error(res, 400, e.what());
    return;
  }

  const auto summary = controller_.set_route(*route);
  json out = {{"ok", true},
              {"route_index", route_index},
              {"layers", layer_ids_json(summary.layers)},
              {"legs", summary.legs},
              {"steps", summary.steps},
              {"points", summary.points},
              {"planar_distance", summary.planar_distance},
              {"congestion_segments", summary.congestion_segments}};
  send_json(res, 200, out);
}

// ===== POST: /progress =====

void HttpHandler::handleProgress(const httplib::Request &req,
                                 httplib::Response &res) {
  json body;
  try {
    body = json::parse(req.body);
  } catch (const json::parse_error &e) {
    send_json(res, 400, parse_error_json(req.body, e));
    return;
  }

  ProgressSnapshot snapshot;
  try {
    snapshot = parse_snapshot(body);
  } catch (const std::exception &e) {
    send_error(res, 400, e.what());
    return;
  }

  if (!controller_.has_route()) {
    send_error(res, 409, "no route is displayed");
    return;
  }

  RouteLineController::ProgressResult r;
  try {
    r = controller_.on_progress(snapshot);
  } catch (const std::logic_error &e) {
    // route torn down between the check and the update
    send_error(res, 409, e.what());
    return;
  }

  json out = {{"ok", true},
              {"located", r.located},
              {"index", r.index ? json(*r.index) : json()},
              {"fraction_traveled", r.fraction_traveled},
              {"pre_fraction_traveled", r.pre_fraction_traveled},
              {"animation", outcome_name(r.outcome)},
              {"animating",
               r.outcome == RouteLineAnimator::Outcome::Scheduled},
              {"completed",
               r.outcome == RouteLineAnimator::Outcome::Completed}};
  send_json(res, 200, out);
}

// ===== POST: /reset =====

void HttpHandler::handleReset(const httplib::Request &, httplib::Response &res) {
  const bool had_route = controller_.has_route();
  controller_.clear();
  send_json(res, 200, {{"ok", true}, {"cleared", had_route}});
}

// ===== debug =====

void HttpHandler::handleDebug(const httplib::Request &req,
                              httplib::Response &res) {
  const bool validate =
      req.has_param("validate") && (req.get_param_value("validate") == "true");

  if (validate) {
    try {
      auto _ = json::parse(req.body);
      json ok = {{"ok", true}, {"message", "JSON parsed successfully"}};
      res.set_content(ok.dump(), "application/json");
    } catch (const json::parse_error &e) {
      send_json(res, 400, parse_error_json(req.body, e));
    }
    return;
  }

  const std::string inspect =
      req.has_param("inspect") ? req.get_param_value("inspect") : "";
  if (inspect.empty()) {
    res.set_content(R"({"ok":true,"message":"debug alive"})",
                    "application/json");
    return;
  }

  json body;
  try {
    body = json::parse(req.body);
  } catch (const json::parse_error &e) {
    res.status = 400;
    res.set_content(parse_error_json(req.body, e).dump(2), "application/json");
    return;
  }

  if (inspect == "directions") {
    try {
      DirectionsResponse resp = body.get<DirectionsResponse>();
      auto info = summarize(resp);
      res.set_content(info.dump(2), "application/json");
    } catch (const std::exception &e) {
      json err = {{"ok", false}, {"kind", "type_error"}, {"what", e.what()}};
      res.status = 400;
      res.set_content(err.dump(2), "application/json");
    }
    return;
  }

  send_error(res, 400, "unknown inspect target: " + inspect);
}

// ===== GET: /layers =====

void HttpHandler::handleLayers(const httplib::Request &,
                               httplib::Response &res) {
  json out = {{"ok", true},
              {"count", sink_.layer_count()},
              {"layers", sink_.snapshot()}};
  send_json(res, 200, out);
}

// ===== GET: /gradient =====

void HttpHandler::handleGradient(const httplib::Request &req,
                                 httplib::Response &res) {
  double fraction = 0.0;
  if (req.has_param("fraction")) {
    const std::string v = req.get_param_value("fraction");
    char *end = nullptr;
    fraction = std::strtod(v.c_str(), &end);
    if (v.empty() || *end != '\0' || !(fraction >= 0.0 && fraction <= 1.0)) {
      send_error(res, 400, "fraction must be a number within [0, 1]");
      return;
    }
  }
  const std::string layer =
      req.has_param("layer") ? req.get_param_value("layer") : "main";
  if (layer != "main" && layer != "casing") {
    send_error(res, 400, "layer must be 'main' or 'casing'");
    return;
  }

  GradientStops stops;
  try {
    stops = controller_.gradient(fraction, layer == "casing");
  } catch (const std::logic_error &e) {
    send_error(res, 409, e.what());
    return;
  }

  json arr = json::array();
  for (const auto &kv : stops)
    arr.push_back({{"position", kv.first}, {"color", kv.second.to_string()}});
  json out = {{"ok", true},
              {"layer", layer},
              {"fraction", fraction},
              {"stops", arr},
              {"expression", GradientBuilder::to_expression(stops)}};
  send_json(res, 200, out);
}

// ===== GET: /state =====

void HttpHandler::handleState(const httplib::Request &,
                              httplib::Response &res) {
  const auto s = controller_.state();
  json out = {{"ok", true},
              {"has_route", s.has_route},
              {"points", s.points},
              {"planar_distance", s.planar_distance},
              {"index", s.index ? json(*s.index) : json()},
              {"fraction_traveled", s.fraction_traveled},
              {"pre_fraction_traveled", s.pre_fraction_traveled},
              {"animating", s.animating}};
  if (s.has_route)
    out["layers"] = layer_ids_json(s.layers);
  send_json(res, 200, out);
}
