#pragma once
#include "core/PotholeDB.hpp"
#include <map>
#include <mutex>
#include <string>
#include <vector>

// Process-local store used by tests and by --memory runs without MySQL.
class MemoryPotholeDB final : public PotholeDB {
public:
  std::vector<Report> readReports() override {
    std::lock_guard<std::mutex> lock(mu_);
    return reports_;
  }

  std::string insertReport(const Report &report) override {
    std::lock_guard<std::mutex> lock(mu_);
    Report stored = report;
    stored.id = std::to_string(++next_id_);
    reports_.push_back(stored);
    return stored.id;
  }

  void replaceSegments(const std::vector<BadSegment> &segments) override {
    std::lock_guard<std::mutex> lock(mu_);
    segments_ = segments;
  }

  std::vector<BadSegment> readSegments() override {
    std::lock_guard<std::mutex> lock(mu_);
    return segments_;
  }

  ClusterStatus clusterStatus(const std::string &cluster_id) override {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = status_.find(cluster_id);
    return it == status_.end() ? ClusterStatus::Open : it->second.first;
  }

  void setClusterStatus(const std::string &cluster_id, ClusterStatus status,
                        const std::string &updated_at) override {
    std::lock_guard<std::mutex> lock(mu_);
    status_[cluster_id] = {status, updated_at};
  }

private:
  std::mutex mu_;
  long long next_id_ = 0;
  std::vector<Report> reports_;
  std::vector<BadSegment> segments_;
  std::map<std::string, std::pair<ClusterStatus, std::string>> status_;
};
