#pragma once

#include "models/Report.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Workflow state an operator attaches to a cluster. Stored separately from
// reports, keyed by the cluster id.
enum class ClusterStatus : uint8_t { Open = 0, InProgress, Fixed };

inline const char *ClusterStatusToString(ClusterStatus s) {
  switch (s) {
  case ClusterStatus::InProgress:
    return "In Progress";
  case ClusterStatus::Fixed:
    return "Fixed";
  default:
    return "Open";
  }
}

inline std::optional<ClusterStatus>
ClusterStatusFromString(const std::string &s) {
  if (s == "Open")
    return ClusterStatus::Open;
  if (s == "In Progress")
    return ClusterStatus::InProgress;
  if (s == "Fixed")
    return ClusterStatus::Fixed;
  return std::nullopt;
}

struct BoundingBox {
  double min_lat, min_lon, max_lat, max_lon;
};

// Anchor-relative group of reports; recomputed on demand, never stored.
struct Cluster {
  std::string id; // <anchorLat>_<anchorLon>, 5 decimal places
  Coordinate anchor{0.0, 0.0};
  std::vector<Report> reports;
  Severity max_severity = Severity::None;
};

// Dashboard presentation of a cluster.
struct ClusterView {
  Cluster cluster;
  std::string friendly_name;
  BoundingBox bounds{0.0, 0.0, 0.0, 0.0};
  ClusterStatus status = ClusterStatus::Open;
};

inline void to_json(Json &j, const ClusterView &v) {
  Json ids = Json::array();
  for (const auto &r : v.cluster.reports)
    ids.push_back(r.id);
  j = Json{{"id", v.cluster.id},
           {"center_lat", v.cluster.anchor.lat},
           {"center_lon", v.cluster.anchor.lon},
           {"max_severity", v.cluster.max_severity},
           {"report_count", v.cluster.reports.size()},
           {"report_ids", ids},
           {"friendly_name", v.friendly_name},
           {"bounds",
            {{v.bounds.min_lat, v.bounds.min_lon},
             {v.bounds.max_lat, v.bounds.max_lon}}},
           {"status", ClusterStatusToString(v.status)}};
}
