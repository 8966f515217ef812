// Entry point for the route line engine HTTP server.  It wires up the
// httplib server, loads configuration and exposes the REST endpoints handled by
// `HttpHandler`.

#include "core/RouteLineController.hpp"
#include "http/http_handler.hpp"
#include "infra/InMemoryLayerSink.hpp"
#include "infra/ThreadTimerScheduler.hpp"
#include "models/params.hpp"
#include <nlohmann/json.hpp>

#include <execinfo.h>
#include <fstream>
#include <iostream>
#include <signal.h>
#include <unistd.h>

using json = nlohmann::json;

static void bt_handler(int sig) {
  void *bt[64];
  int n = backtrace(bt, 64);
  dprintf(2, "\n=== FATAL SIG %d ===\n", sig);
  backtrace_symbols_fd(bt, n, 2);
  _exit(128 + sig);
}
static void install_bt_handlers() {
  signal(SIGSEGV, bt_handler);
  signal(SIGABRT, bt_handler);
  signal(SIGFPE, bt_handler);
  signal(SIGILL, bt_handler);
  signal(SIGBUS, bt_handler);
}

// path as configured -> action name ("/route" -> "route")
static std::string action_of(const std::string &path) {
  return (!path.empty() && path[0] == '/') ? path.substr(1) : path;
}

int main(int argc, char **argv) {
  install_bt_handlers();

  // ---------------------- Load configuration ------------------------------
  const std::string cfg_path = argc > 1 ? argv[1] : "config/settings.json";
  std::ifstream cfg(cfg_path);
  if (!cfg) {
    std::cerr << "[ERROR] Cannot open " << cfg_path << "\n";
    return 1;
  }
  json settings;
  RouteLineParams params;
  try {
    cfg >> settings;
    params = RouteLineParams::from_json(
        settings.value("route_line", json::object()));
  } catch (const std::exception &e) {
    std::cerr << "[ERROR] Bad configuration in " << cfg_path << ": "
              << e.what() << "\n";
    return 1;
  }
  const json server_cfg = settings.value("server", json::object());
  int port = server_cfg.value("port", 5005);
  std::cout << "[DEBUG] Starting server on port " << port << std::endl;
  std::cout << "[DEBUG] animation " << params.animation_interval_ms << "ms/"
            << params.animation_duration_ms << "ms, gradient precision "
            << params.gradient_precision
            << (params.legacy_y_clamp ? ", legacy y clamp" : "") << std::endl;

  // ---------------------- Engine ------------------------------------------
  // declaration order matters: the scheduler must join before the sink goes
  InMemoryLayerSink sink;
  ThreadTimerScheduler scheduler;
  RouteLineController controller(params, scheduler, sink);
  HttpHandler handler(controller, sink);

  // ---------------------- HTTP server setup -------------------------------
  httplib::Server server;
  server.set_payload_max_length(1024ull * 1024ull * 64ull); // 64MB
  server.set_read_timeout(60, 0);
  server.set_write_timeout(60, 0);

  // Simple echo endpoint useful during development
  server.Post("/_echo", [](const auto &req, auto &res) {
    std::string reply = "Received POST to " + req.path +
                        ", content-length=" + std::to_string(req.body.size());
    res.set_content(reply, "text/plain");
  });

  // ---------------------- Register POST endpoints -------------------------
  for (const auto &ep : server_cfg.value("post_endpoints", json::array())) {
    std::string path = ep.get<std::string>();
    std::string action = action_of(path);
    server.Post(path, [action, &handler](const auto &req, auto &res) {
      try {
        handler.callPostHandler(action, req, res);
      } catch (const std::exception &e) {
        std::cerr << "[POST λ] EXCEPTION: " << e.what() << "\n";
        res.status = 500;
        res.set_content(std::string("exception: ") + e.what(), "text/plain");
      }
    });
  }

  // ---------------------- Register GET endpoints --------------------------
  for (const auto &ep : server_cfg.value("get_endpoints", json::array())) {
    std::string path = ep.get<std::string>();
    std::string action = action_of(path);
    server.Get(path, [action, &handler](const auto &req, auto &res) {
      try {
        handler.callGetHandler(action, req, res);
      } catch (const std::exception &e) {
        std::cerr << "[GET λ] EXCEPTION: " << e.what() << "\n";
        res.status = 500;
        res.set_content(std::string("exception: ") + e.what(), "text/plain");
      }
    });
  }

  // ---------------------- Start server ------------------------------------
  if (!server.listen("0.0.0.0", port)) {
    std::cerr << "[ERROR] Cannot listen on port " << port << "\n";
    return 1;
  }
  return 0;
}
