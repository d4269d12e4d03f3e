#pragma once

#include "models/CoreTypes.hpp"
#include "models/SegmentModel.hpp"
#include <optional>
#include <string>
#include <vector>

// Provider-neutral route as returned by a RoutingProvider.
struct RouteSummary {
  double distance_m = 0.0;
  double duration_s = 0.0;
  std::vector<Coord> coordinates; // [lon, lat]
};

// Route as reported to callers.
struct PlannedRoute {
  double distance_km = 0.0;
  double duration_minutes = 0.0;
  std::vector<Coord> coordinates; // [lon, lat]

  static PlannedRoute from(const RouteSummary &r) {
    return {r.distance_m / 1000.0, r.duration_s / 60.0, r.coordinates};
  }
};

struct Recommendation {
  std::string message;
  std::string severity; // safe | recommended | consider | caution
  std::vector<std::string> affected_roads;
  int total_potholes = 0;
  Severity worst_severity = Severity::None;
  std::optional<double> detour_distance_km; // unset without an alternative
  std::optional<double> detour_time_min;

  bool isClear() const { return severity == "safe"; }
};

struct RouteResult {
  std::optional<Coordinate> start;
  std::optional<Coordinate> end;
  std::optional<PlannedRoute> original_route;
  std::vector<BadSegment> bad_segments_detected;
  std::optional<PlannedRoute> alternative_route;
  std::optional<Recommendation> recommendation;
  std::string error;          // empty on success
  std::string error_endpoint; // "start" or "end" for resolution failures

  bool ok() const { return error.empty(); }
};

inline void to_json(Json &j, const PlannedRoute &r) {
  j = Json{{"distance_km", r.distance_km},
           {"duration_minutes", r.duration_minutes},
           {"coordinates", r.coordinates}};
}

inline void to_json(Json &j, const Recommendation &r) {
  j = Json{{"message", r.message}, {"severity", r.severity}};
  if (r.isClear())
    return;
  j["affected_roads"] = r.affected_roads;
  j["total_potholes"] = r.total_potholes;
  j["worst_severity"] = r.worst_severity;
  j["detour_distance_km"] =
      r.detour_distance_km ? Json(*r.detour_distance_km) : Json(nullptr);
  j["detour_time_min"] =
      r.detour_time_min ? Json(*r.detour_time_min) : Json(nullptr);
}

inline void to_json(Json &j, const RouteResult &r) {
  auto coords = [](const std::optional<Coordinate> &c) {
    return c ? Json::array({c->lat, c->lon}) : Json(nullptr);
  };
  j = Json::object();
  if (!r.ok()) {
    j["error"] = r.error;
    if (!r.error_endpoint.empty())
      j["endpoint"] = r.error_endpoint;
  }
  j["start_coords"] = coords(r.start);
  j["end_coords"] = coords(r.end);
  j["original_route"] =
      r.original_route ? Json(*r.original_route) : Json(nullptr);
  j["bad_segments_detected"] = r.bad_segments_detected;
  j["alternative_route"] =
      r.alternative_route ? Json(*r.alternative_route) : Json(nullptr);
  j["recommendation"] =
      r.recommendation ? Json(*r.recommendation) : Json(nullptr);
}
