#pragma once

#include "models/CoreTypes.hpp"
#include "models/RouteModel.hpp"
#include <stdexcept>
#include <string>
#include <vector>

// Structures modelling the subset of the routing providers' JSON we use.
// OSRM: GET /route/v1/driving/...?overview=full&geometries=geojson
// OpenRouteService: POST /v2/directions/driving-car/geojson

// ---------- Geometry ----------
struct Geometry {
  std::string type; // e.g., "LineString"
  std::vector<Coord> coordinates;
};

// ---------- OSRM route ----------
struct OsrmRoute {
  double distance = 0.0; // metres
  double duration = 0.0; // seconds
  double weight = 0.0;
  std::string weight_name;
  Geometry geometry;
};

struct OsrmResponse {
  std::string code;
  std::vector<OsrmRoute> routes;
};

// ---------- OpenRouteService GeoJSON ----------
struct OrsFeature {
  double distance = 0.0;
  double duration = 0.0;
  Geometry geometry;
};

struct OrsResponse {
  std::vector<OrsFeature> features;
};

// --- Geometry ----
inline void from_json(const Json &j, Geometry &g) {
  g.type = j.value("type", "");
  g.coordinates.clear();
  if (j.contains("coordinates") && j["coordinates"].is_array()) {
    for (const auto &pt : j["coordinates"]) {
      // each vertex is [lon, lat] (a third element may carry elevation)
      if (pt.is_array() && pt.size() >= 2 && pt[0].is_number() &&
          pt[1].is_number())
        g.coordinates.push_back({pt[0].get<double>(), pt[1].get<double>()});
    }
  }
}

// --- OSRM ----
inline void from_json(const Json &j, OsrmRoute &r) {
  r.distance = j.value("distance", 0.0);
  r.duration = j.value("duration", 0.0);
  r.weight = j.value("weight", 0.0);
  r.weight_name = j.value("weight_name", "");
  if (j.contains("geometry") && j["geometry"].is_object())
    r.geometry = j["geometry"].get<Geometry>();
}

inline void from_json(const Json &j, OsrmResponse &r) {
  r.code = j.value("code", "Error");
  r.routes.clear();
  if (j.contains("routes") && j["routes"].is_array()) {
    for (const auto &R : j["routes"])
      r.routes.push_back(R.get<OsrmRoute>());
  }
}

// --- ORS ----
inline void from_json(const Json &j, OrsFeature &f) {
  if (j.contains("properties") && j["properties"].is_object()) {
    const auto &summary =
        j["properties"].value("summary", Json::object());
    f.distance = summary.value("distance", 0.0);
    f.duration = summary.value("duration", 0.0);
  }
  if (j.contains("geometry") && j["geometry"].is_object())
    f.geometry = j["geometry"].get<Geometry>();
}

inline void from_json(const Json &j, OrsResponse &r) {
  r.features.clear();
  if (j.contains("features") && j["features"].is_array()) {
    for (const auto &F : j["features"])
      r.features.push_back(F.get<OrsFeature>());
  }
}

// First route of an OSRM response. Throws when the response carries none.
inline RouteSummary toRouteSummary(const OsrmResponse &r) {
  if (r.code != "Ok")
    throw std::runtime_error("OSRM returned code " + r.code);
  if (r.routes.empty())
    throw std::runtime_error("No routes in OSRM response");
  const auto &route = r.routes.front();
  if (route.geometry.coordinates.empty())
    throw std::runtime_error("OSRM route has no geometry");
  return {route.distance, route.duration, route.geometry.coordinates};
}

// First feature of an ORS response. Throws when the response carries none.
inline RouteSummary toRouteSummary(const OrsResponse &r) {
  if (r.features.empty())
    throw std::runtime_error("No features in ORS response");
  const auto &f = r.features.front();
  if (f.geometry.coordinates.empty())
    throw std::runtime_error("ORS route has no geometry");
  return {f.distance, f.duration, f.geometry.coordinates};
}
