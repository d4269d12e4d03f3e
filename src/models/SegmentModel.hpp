#pragma once

#include "models/CoreTypes.hpp"
#include <limits>
#include <string>
#include <vector>

// A run of consecutive same-road potholes. Recomputed from scratch on every
// detection pass and persisted with replace-all semantics.
struct BadSegment {
  std::string segment_id; // <road>_<centerLat>_<centerLon>
  std::string road_name;
  Coordinate start{0.0, 0.0}; // first member in sorted order
  Coordinate end{0.0, 0.0};   // last member in sorted order
  Coordinate center{0.0, 0.0};
  int pothole_count = 0;
  Severity max_severity = Severity::Low;
  std::string area;
  std::vector<std::string> pothole_ids;
  std::string created_at;

  bool hasCenter() const {
    return IsValidCoordinate(center.lat, center.lon);
  }
};

inline void to_json(Json &j, const BadSegment &s) {
  j = Json{{"segment_id", s.segment_id},
           {"road_name", s.road_name},
           {"start_lat", s.start.lat},
           {"start_lon", s.start.lon},
           {"end_lat", s.end.lat},
           {"end_lon", s.end.lon},
           {"center_lat", s.center.lat},
           {"center_lon", s.center.lon},
           {"pothole_count", s.pothole_count},
           {"max_severity", s.max_severity},
           {"area", s.area},
           {"pothole_ids", s.pothole_ids},
           {"created_at", s.created_at}};
}

inline void from_json(const Json &j, BadSegment &s) {
  auto num = [&j](const char *key) {
    return j.contains(key) && j[key].is_number()
               ? j[key].get<double>()
               : std::numeric_limits<double>::quiet_NaN();
  };
  s.segment_id = j.value("segment_id", "");
  s.road_name = j.value("road_name", kUnknownRoad);
  s.start = {num("start_lat"), num("start_lon")};
  s.end = {num("end_lat"), num("end_lon")};
  s.center = {num("center_lat"), num("center_lon")};
  s.pothole_count = j.value("pothole_count", 0);
  s.max_severity = j.value("max_severity", Severity::Low);
  s.area = j.value("area", kUnknownArea);
  s.pothole_ids.clear();
  if (j.contains("pothole_ids") && j["pothole_ids"].is_array()) {
    for (const auto &id : j["pothole_ids"])
      if (id.is_string())
        s.pothole_ids.push_back(id.get<std::string>());
  }
  s.created_at = j.value("created_at", "");
}
