// ClusterEngine groups reports around anchor points for the dashboard.

#include "core/ClusterEngine.hpp"

#include <stdexcept>
#include <utility>

ClusterEngine::ClusterEngine(double radius_m) : radius_m_(radius_m) {
  if (!(radius_m_ >= 0.0))
    throw std::invalid_argument("cluster radius must be non-negative");
}

std::string ClusterEngine::clusterId(const Coordinate &anchor) {
  return GeoUtils::format_rounded(anchor.lat) + "_" +
         GeoUtils::format_rounded(anchor.lon);
}

std::vector<Cluster>
ClusterEngine::computeClusters(const std::vector<Report> &reports) const {
  std::vector<Cluster> clusters;
  std::vector<bool> assigned(reports.size(), false);

  for (size_t i = 0; i < reports.size(); ++i) {
    const Report &anchor = reports[i];
    if (assigned[i] || !anchor.qualifies())
      continue;

    Cluster cluster;
    cluster.anchor = anchor.coordinate();
    cluster.id = clusterId(cluster.anchor);
    cluster.reports.push_back(anchor);
    cluster.max_severity = anchor.severity;
    assigned[i] = true;

    for (size_t j = i + 1; j < reports.size(); ++j) {
      const Report &other = reports[j];
      if (assigned[j] || !other.qualifies())
        continue;
      // distance to the anchor only, never to other members
      double d = GeoUtils::haversine(cluster.anchor, other.coordinate());
      if (d <= radius_m_) {
        cluster.reports.push_back(other);
        cluster.max_severity = MaxSeverity(cluster.max_severity, other.severity);
        assigned[j] = true;
      }
    }
    clusters.push_back(std::move(cluster));
  }
  return clusters;
}

// Most frequent value other than `unknown`; ties go to the value seen first.
static std::string dominant(const std::vector<std::string> &values,
                            const std::string &unknown) {
  std::vector<std::pair<std::string, int>> counts;
  for (const auto &v : values) {
    if (v.empty() || v == unknown)
      continue;
    bool found = false;
    for (auto &c : counts) {
      if (c.first == v) {
        ++c.second;
        found = true;
        break;
      }
    }
    if (!found)
      counts.emplace_back(v, 1);
  }
  if (counts.empty())
    return unknown;
  const std::pair<std::string, int> *best = &counts.front();
  for (const auto &c : counts)
    if (c.second > best->second)
      best = &c;
  return best->first;
}

std::string ClusterEngine::friendlyName(const Cluster &cluster) {
  std::vector<std::string> areas, roads;
  for (const auto &r : cluster.reports) {
    areas.push_back(r.area);
    roads.push_back(r.road);
  }
  const std::string area = dominant(areas, kUnknownArea);
  const std::string road = dominant(roads, kUnknownRoad);
  if (area == kUnknownArea && road == kUnknownRoad)
    return "Cluster #" + cluster.id.substr(0, cluster.id.find('_'));
  return area + " - " + road;
}

BoundingBox ClusterEngine::bounds(const Cluster &cluster) {
  std::vector<Coordinate> pts;
  for (const auto &r : cluster.reports)
    if (r.hasCoordinate())
      pts.push_back(r.coordinate());
  if (pts.empty())
    return {cluster.anchor.lat, cluster.anchor.lon, cluster.anchor.lat,
            cluster.anchor.lon};
  auto b = GeoUtils::compute_bbox(pts);
  return {b.min_lat, b.min_lon, b.max_lat, b.max_lon};
}

ClusterView ClusterEngine::describe(const Cluster &cluster,
                                    ClusterStatus status) {
  ClusterView view;
  view.cluster = cluster;
  view.friendly_name = friendlyName(cluster);
  view.bounds = bounds(cluster);
  view.status = status;
  return view;
}
