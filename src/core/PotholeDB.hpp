#pragma once
#include "models/Cluster.hpp"
#include "models/Report.hpp"
#include "models/SegmentModel.hpp"
#include <string>
#include <vector>

// Storage for reports, detected bad segments and cluster workflow status.
// Implementations throw std::runtime_error on backend failures.
class PotholeDB {
public:
  virtual ~PotholeDB() = default;

  // ---- reports ----
  // Full snapshot; all filtering happens in memory.
  virtual std::vector<Report> readReports() = 0;
  // Stores a new report and returns the id assigned to it.
  virtual std::string insertReport(const Report &report) = 0;

  // ---- bad segments ----
  // Clear-then-insert: the previous set is discarded entirely.
  virtual void replaceSegments(const std::vector<BadSegment> &segments) = 0;
  virtual std::vector<BadSegment> readSegments() = 0;

  // ---- cluster status ----
  // Open when nothing was stored for the id.
  virtual ClusterStatus clusterStatus(const std::string &cluster_id) = 0;
  virtual void setClusterStatus(const std::string &cluster_id,
                                ClusterStatus status,
                                const std::string &updated_at) = 0;
};
