#pragma once

#include "models/CoreTypes.hpp"
#include "models/Report.hpp"
#include "models/SegmentModel.hpp"
#include <string>
#include <vector>

// Finds "bad segments": runs of at least min_potholes reports on the same road
// where each report lies within threshold_m of the previous one.
//
// Reports of a road are ordered by (latitude, longitude). This stands in for
// the order along the road and is wrong for roads that bend back on
// themselves; road-graph ordering would need real topology.
class SeriesDetector {
public:
  explicit SeriesDetector(double threshold_m = 200.0, int min_potholes = 3);

  // created_at is stamped on every segment so that a pass over an unchanged
  // report set yields identical output.
  std::vector<BadSegment> detectSeries(const std::vector<Report> &reports,
                                       const std::string &created_at) const;

  static BadSegment createSegment(const std::vector<const Report *> &run,
                                  const std::string &road_name,
                                  const std::string &created_at);
  static std::string segmentId(const std::string &road_name,
                               const Coordinate &center);

private:
  double threshold_m_;
  int min_potholes_;
};

// Aggregate counts reported next to the segment list.
struct SeriesStatistics {
  int total_reports = 0;
  int pothole_detections = 0;
  int no_pothole_detections = 0;
  int high = 0;
  int medium = 0;
  int low = 0;
  int bad_road_segments = 0;
  int roads_with_series = 0;
  int potholes_in_series = 0;
  int isolated_potholes = 0;
};

SeriesStatistics computeStatistics(const std::vector<Report> &reports,
                                   const std::vector<BadSegment> &segments);

void to_json(Json &j, const SeriesStatistics &s);
