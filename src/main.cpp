// Entry point for the pothole engine HTTP server. It loads configuration,
// connects the report store and exposes the REST endpoints handled by
// `HttpHandler`.
//
//   pothole_engine [config/settings.json] [--memory]

#include "http/http_handler.hpp"
#include "infra/HttpRoutingProvider.hpp"
#include "infra/MemoryPotholeDB.hpp"
#include "infra/MySQLPotholeDB.hpp"
#include "infra/NominatimGeocoder.hpp"
#include "models/Settings.hpp"
#include <nlohmann/json.hpp>

#include <execinfo.h>
#include <fstream>
#include <iostream>
#include <memory>
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

int main(int argc, char **argv) {
  install_bt_handlers();

  std::string config_path = "config/settings.json";
  bool in_memory = false;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--memory")
      in_memory = true;
    else
      config_path = arg;
  }

  // ---------------------- Load configuration ------------------------------
  std::ifstream cfg(config_path);
  if (!cfg) {
    std::cerr << "[ERROR] Cannot open " << config_path << "\n";
    return 1;
  }
  AppSettings settings;
  try {
    json raw;
    cfg >> raw;
    settings = AppSettings::from_json(raw);
    settings.params.validate();
  } catch (const std::exception &e) {
    std::cerr << "[ERROR] Bad configuration in " << config_path << ": "
              << e.what() << "\n";
    return 1;
  }
  settings.applyEnvironment();
  std::cout << "[DEBUG] Starting server on port " << settings.server.port
            << std::endl;
  if (settings.routing.ors_api_key.empty())
    std::cout << "[DEBUG] ORS_API_KEY not set, alternative routes fall back "
                 "to OSRM\n";

  // ---------------------- Report store ------------------------------------
  std::unique_ptr<PotholeDB> db;
  if (in_memory) {
    std::cout << "[DEBUG] using in-memory report store\n";
    db = std::make_unique<MemoryPotholeDB>();
  } else {
    try {
      db = std::make_unique<MySQLPotholeDB>(
          settings.database.uri, settings.database.user,
          settings.database.password, settings.database.schema);
    } catch (const std::exception &e) {
      std::cerr << "[main] " << e.what() << "\n";
      return 1;
    }
  }

  NominatimGeocoder geocoder(settings.geocoder);
  HttpRoutingProvider router(settings.routing);
  HttpHandler handler(*db, geocoder, router, settings.params);

  // ---------------------- HTTP server setup -------------------------------
  httplib::Server server;
  server.set_payload_max_length(1024ull * 1024ull * 16ull); // 16MB
  server.set_read_timeout(60, 0);
  server.set_write_timeout(60, 0);

  // ---------------------- Register POST endpoints -------------------------
  for (const auto &path : settings.server.post_endpoints) {
    std::string action =
        (!path.empty() && path[0] == '/') ? path.substr(1) : path;
    server.Post(path, [action, &handler](const auto &req, auto &res) {
      try {
        handler.callPostHandler(action, req, res);
      } catch (const std::exception &e) {
        std::cerr << "[POST " << action << "] EXCEPTION: " << e.what() << "\n";
        res.status = 500;
        res.set_content(json{{"error", e.what()}}.dump(), "application/json");
      }
    });
  }

  // ---------------------- Register GET endpoints --------------------------
  for (const auto &path : settings.server.get_endpoints) {
    std::string action =
        (!path.empty() && path[0] == '/') ? path.substr(1) : path;
    server.Get(path, [action, &handler](const auto &req, auto &res) {
      try {
        handler.callGetHandler(action, req, res);
      } catch (const std::exception &e) {
        std::cerr << "[GET " << action << "] EXCEPTION: " << e.what() << "\n";
        res.status = 500;
        res.set_content(json{{"error", e.what()}}.dump(), "application/json");
      }
    });
  }

  // ---------------------- Start server ------------------------------------
  if (!server.listen("0.0.0.0", settings.server.port)) {
    std::cerr << "[main] could not listen on port " << settings.server.port
              << "\n";
    return 1;
  }
  return 0;
}
