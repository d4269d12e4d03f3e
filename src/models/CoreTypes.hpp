#pragma once

#include <array>
#include <cmath>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

using Json = nlohmann::json;

// Sentinels written by reverse geocoding when a field is unavailable.
inline constexpr const char *kUnknownRoad = "Unknown Road";
inline constexpr const char *kUnknownArea = "Unknown Area";
inline constexpr const char *kAddressNotFound = "Address not found";

// Basic spatial coordinate in degrees.
struct Coordinate {
  double lat;
  double lon;
};

using Coord = std::array<double, 2>; // [lon, lat], provider polyline order

// Ordered severity scale. None marks a report where nothing was detected.
enum class Severity : uint8_t { None = 0, Low, Medium, High };

inline const char *SeverityToString(Severity s) {
  switch (s) {
  case Severity::Low:
    return "Low";
  case Severity::Medium:
    return "Medium";
  case Severity::High:
    return "High";
  default:
    return "None";
  }
}

inline std::optional<Severity> SeverityFromString(const std::string &s) {
  if (s == "None")
    return Severity::None;
  if (s == "Low")
    return Severity::Low;
  if (s == "Medium")
    return Severity::Medium;
  if (s == "High")
    return Severity::High;
  return std::nullopt;
}

// 0 -> None, 1 -> Low, 2 -> Medium, 3+ -> High
inline Severity SeverityFromDetections(int detections) {
  if (detections <= 0)
    return Severity::None;
  if (detections == 1)
    return Severity::Low;
  if (detections == 2)
    return Severity::Medium;
  return Severity::High;
}

inline Severity MaxSeverity(Severity a, Severity b) { return a < b ? b : a; }

inline bool IsValidCoordinate(double lat, double lon) {
  return std::isfinite(lat) && std::isfinite(lon) && lat >= -90.0 &&
         lat <= 90.0 && lon >= -180.0 && lon <= 180.0;
}

inline void to_json(Json &j, Severity s) { j = SeverityToString(s); }
inline void from_json(const Json &j, Severity &s) {
  s = j.is_string() ? SeverityFromString(j.get<std::string>())
                          .value_or(Severity::None)
                    : Severity::None;
}
