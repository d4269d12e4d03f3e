#pragma once

#include "models/params.hpp"
#include <cstdlib>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct ServerSettings {
  int port = 5005;
  std::vector<std::string> post_endpoints;
  std::vector<std::string> get_endpoints;
};

struct DatabaseSettings {
  std::string uri = "tcp://127.0.0.1:3306";
  std::string user = "pothole_user";
  std::string password;
  std::string schema = "potholes";
};

struct GeocoderSettings {
  std::string base_url = "https://nominatim.openstreetmap.org";
  std::string user_agent = "Pothole-Detection-System";
  int timeout_s = 10;
  int reverse_timeout_s = 5;
};

struct RoutingSettings {
  std::string osrm_url = "http://router.project-osrm.org";
  std::string ors_url = "https://api.openrouteservice.org";
  std::string ors_api_key; // empty disables avoidance-biased routing
  int timeout_s = 15;
  double avoid_radius_m = 150.0;
};

// Everything read from config/settings.json.
struct AppSettings {
  ServerSettings server;
  DatabaseSettings database;
  GeocoderSettings geocoder;
  RoutingSettings routing;
  EngineParams params;

  static AppSettings from_json(const nlohmann::json &j) {
    AppSettings s;
    const auto server = j.value("server", nlohmann::json::object());
    s.server.port = server.value("port", s.server.port);
    s.server.post_endpoints =
        server.value("post_endpoints", std::vector<std::string>{});
    s.server.get_endpoints =
        server.value("get_endpoints", std::vector<std::string>{});

    const auto db = j.value("database", nlohmann::json::object());
    s.database.uri = db.value("uri", s.database.uri);
    s.database.user = db.value("user", s.database.user);
    s.database.password = db.value("password", s.database.password);
    s.database.schema = db.value("schema", s.database.schema);

    const auto geo = j.value("geocoder", nlohmann::json::object());
    s.geocoder.base_url = geo.value("base_url", s.geocoder.base_url);
    s.geocoder.user_agent = geo.value("user_agent", s.geocoder.user_agent);
    s.geocoder.timeout_s = geo.value("timeout_s", s.geocoder.timeout_s);
    s.geocoder.reverse_timeout_s =
        geo.value("reverse_timeout_s", s.geocoder.reverse_timeout_s);

    const auto routing = j.value("routing", nlohmann::json::object());
    s.routing.osrm_url = routing.value("osrm_url", s.routing.osrm_url);
    s.routing.ors_url = routing.value("ors_url", s.routing.ors_url);
    s.routing.ors_api_key = routing.value("ors_api_key", "");
    s.routing.timeout_s = routing.value("timeout_s", s.routing.timeout_s);

    s.params = EngineParams::from_json(
        j.value("params", nlohmann::json::object()));
    s.routing.avoid_radius_m = s.params.avoid_radius_m;
    return s;
  }

  // Environment wins over the file for credentials and endpoints that
  // differ per deployment.
  void applyEnvironment() {
    auto env = [](const char *name) -> const char * {
      const char *v = std::getenv(name);
      return (v && *v) ? v : nullptr;
    };
    if (const char *key = env("ORS_API_KEY"))
      routing.ors_api_key = key;
    const char *host = env("DB_HOST");
    const char *port = env("DB_PORT");
    if (host || port) {
      std::string h = "127.0.0.1", p = "3306";
      std::string rest = database.uri;
      if (auto pos = rest.find("://"); pos != std::string::npos)
        rest = rest.substr(pos + 3);
      if (auto c = rest.find(':'); c != std::string::npos) {
        h = rest.substr(0, c);
        p = rest.substr(c + 1);
      } else if (!rest.empty()) {
        h = rest;
      }
      database.uri =
          "tcp://" + std::string(host ? host : h) + ":" + (port ? port : p);
    }
    if (const char *user = env("DB_USER"))
      database.user = user;
    if (const char *pass = env("DB_PASS"))
      database.password = pass;
    if (const char *name = env("DB_NAME"))
      database.schema = name;
  }
};
