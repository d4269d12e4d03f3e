#pragma once

#include <nlohmann/json.hpp>

#include <cmath>
#include <stdexcept>
#include <string>

// Tunable thresholds shared by clustering, series detection and route
// avoidance.
struct EngineParams {
  double cluster_radius_m = 100.0;
  double series_threshold_m = 200.0;
  int min_potholes = 3;
  double intersection_threshold_m = 50.0;
  double avoid_radius_m = 150.0;

  static EngineParams from_json(const nlohmann::json &j) {
    EngineParams p;
    if (j.contains("cluster_radius_m"))
      p.cluster_radius_m = j.at("cluster_radius_m").get<double>();
    if (j.contains("series_threshold_m"))
      p.series_threshold_m = j.at("series_threshold_m").get<double>();
    if (j.contains("min_potholes"))
      p.min_potholes = j.at("min_potholes").get<int>();
    if (j.contains("intersection_threshold_m"))
      p.intersection_threshold_m =
          j.at("intersection_threshold_m").get<double>();
    if (j.contains("avoid_radius_m"))
      p.avoid_radius_m = j.at("avoid_radius_m").get<double>();
    return p;
  }

  // Throws std::invalid_argument naming the first unusable value.
  void validate() const {
    auto check_distance = [](const char *name, double v) {
      if (!std::isfinite(v) || v < 0)
        throw std::invalid_argument(std::string(name) +
                                    " must be a non-negative distance");
    };
    check_distance("cluster_radius_m", cluster_radius_m);
    check_distance("series_threshold_m", series_threshold_m);
    check_distance("intersection_threshold_m", intersection_threshold_m);
    check_distance("avoid_radius_m", avoid_radius_m);
    if (min_potholes < 1)
      throw std::invalid_argument("min_potholes must be at least 1");
  }
};
