#pragma once

#include "core/GeoUtils.hpp"
#include "models/Cluster.hpp"
#include "models/Report.hpp"
#include <string>
#include <vector>

// Greedy single-pass clustering of pothole reports.
//
// The first unassigned qualifying report anchors a cluster; every later
// unassigned qualifying report within radius_m of that anchor joins it. The
// grouping is a star around the anchor, not a chain: two members may be up to
// 2 * radius_m apart, and a report just outside the radius never joins even
// if it sits next to another member. Membership therefore depends on input
// order.
class ClusterEngine {
public:
  explicit ClusterEngine(double radius_m = 100.0);

  std::vector<Cluster> computeClusters(const std::vector<Report> &reports) const;

  // Dashboard enrichment: friendly name, bounds and the stored status.
  static ClusterView describe(const Cluster &cluster,
                              ClusterStatus status = ClusterStatus::Open);

  static std::string clusterId(const Coordinate &anchor);
  static std::string friendlyName(const Cluster &cluster);
  static BoundingBox bounds(const Cluster &cluster);

private:
  double radius_m_;
};
