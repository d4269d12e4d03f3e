#pragma once

#include "models/CoreTypes.hpp"
#include <optional>
#include <string>
#include <vector>

// A single pothole observation as stored in the report collection.
struct Report {
  std::string id; // assigned by the store
  std::optional<double> latitude;
  std::optional<double> longitude;
  int detections = 0;
  Severity severity = Severity::None;
  std::string status;
  std::string road = kUnknownRoad;
  std::string area = kUnknownArea;
  std::string full_address;
  std::string notes;
  std::string image_path;
  std::string source = "web";
  std::string timestamp; // ISO-8601

  bool hasCoordinate() const {
    return latitude && longitude && IsValidCoordinate(*latitude, *longitude);
  }
  Coordinate coordinate() const { return {*latitude, *longitude}; }
  bool isPothole() const { return severity != Severity::None; }

  // Only these reports take part in clustering and series detection.
  bool qualifies() const { return isPothole() && hasCoordinate(); }
};

// Reports arrive from several writers (web form, chat channel, manual adds)
// so coordinates may be numbers, numeric strings or null.
inline std::optional<double> parse_coordinate_field(const Json &j,
                                                    const char *key) {
  if (!j.contains(key))
    return std::nullopt;
  const Json &v = j[key];
  if (v.is_number())
    return v.get<double>();
  if (v.is_string()) {
    const auto s = v.get<std::string>();
    if (s.empty())
      return std::nullopt;
    try {
      size_t used = 0;
      double d = std::stod(s, &used);
      if (used == s.size())
        return d;
    } catch (const std::exception &) {
    }
  }
  return std::nullopt;
}

inline std::string text_or(const Json &j, const char *key,
                           const std::string &fallback) {
  if (!j.contains(key) || !j[key].is_string())
    return fallback;
  auto s = j[key].get<std::string>();
  return s.empty() ? fallback : s;
}

inline void from_json(const Json &j, Report &r) {
  r.id = text_or(j, "id", "");
  r.latitude = parse_coordinate_field(j, "latitude");
  r.longitude = parse_coordinate_field(j, "longitude");
  r.detections = j.contains("detections") && j["detections"].is_number()
                     ? j["detections"].get<int>()
                     : 0;
  // An explicit severity wins; otherwise derive it from the detection count.
  std::optional<Severity> sev;
  if (j.contains("severity") && j["severity"].is_string())
    sev = SeverityFromString(j["severity"].get<std::string>());
  r.severity = sev.value_or(SeverityFromDetections(r.detections));
  r.status = text_or(j, "status", "");
  r.road = text_or(j, "road", kUnknownRoad);
  r.area = text_or(j, "area", kUnknownArea);
  r.full_address = text_or(j, "full_address", "");
  r.notes = text_or(j, "notes", "");
  r.image_path = text_or(j, "image_path", "");
  r.source = text_or(j, "source", "web");
  r.timestamp = text_or(j, "timestamp", "");
}

inline void to_json(Json &j, const Report &r) {
  j = Json{{"id", r.id},
           {"latitude", r.latitude ? Json(*r.latitude) : Json(nullptr)},
           {"longitude", r.longitude ? Json(*r.longitude) : Json(nullptr)},
           {"detections", r.detections},
           {"severity", r.severity},
           {"status", r.status},
           {"road", r.road},
           {"area", r.area},
           {"full_address", r.full_address},
           {"notes", r.notes},
           {"image_path", r.image_path},
           {"source", r.source},
           {"timestamp", r.timestamp}};
}
