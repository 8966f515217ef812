#pragma once

#include "core/RouteLineController.hpp" // RouteLineController
#include "httplib.h"
#include "infra/InMemoryLayerSink.hpp" // InMemoryLayerSink
#include <nlohmann/json.hpp>

// Thin wrapper around httplib callbacks.  The main server forwards requests to
// these member functions based on the action string parsed from the URL.
class HttpHandler {
public:
  HttpHandler(RouteLineController &controller, InMemoryLayerSink &sink)
      : controller_(controller), sink_(sink) {}

  void callPostHandler(const std::string &action, const httplib::Request &req,
                       httplib::Response &res);
  void callGetHandler(const std::string &action, const httplib::Request &req,
                      httplib::Response &res);

private:
  RouteLineController &controller_;
  InMemoryLayerSink &sink_;

  // Individual request handlers
  void handleRoute(const httplib::Request &req, httplib::Response &res);
  void handleProgress(const httplib::Request &req, httplib::Response &res);
  void handleReset(const httplib::Request &req, httplib::Response &res);
  void handleDebug(const httplib::Request &req, httplib::Response &res);
  void handleLayers(const httplib::Request &req, httplib::Response &res);
  void handleGradient(const httplib::Request &req, httplib::Response &res);
  void handleState(const httplib::Request &req, httplib::Response &res);
};
