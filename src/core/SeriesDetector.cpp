// SeriesDetector turns same-road pothole reports into bad segments.

#include "core/SeriesDetector.hpp"
#include "core/GeoUtils.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <stdexcept>
#include <utility>

SeriesDetector::SeriesDetector(double threshold_m, int min_potholes)
    : threshold_m_(threshold_m), min_potholes_(min_potholes) {
  if (!(threshold_m_ >= 0.0))
    throw std::invalid_argument("series threshold must be non-negative");
  if (min_potholes_ < 1)
    throw std::invalid_argument("min_potholes must be at least 1");
}

std::string SeriesDetector::segmentId(const std::string &road_name,
                                      const Coordinate &center) {
  std::string road = road_name;
  std::replace(road.begin(), road.end(), ' ', '_');
  return road + "_" + GeoUtils::format_rounded(center.lat) + "_" +
         GeoUtils::format_rounded(center.lon);
}

BadSegment SeriesDetector::createSegment(const std::vector<const Report *> &run,
                                         const std::string &road_name,
                                         const std::string &created_at) {
  if (run.empty())
    throw std::invalid_argument("cannot build a segment from an empty run");

  BadSegment seg;
  seg.road_name = road_name;
  seg.start = run.front()->coordinate();
  seg.end = run.back()->coordinate();

  double sum_lat = 0.0, sum_lon = 0.0;
  Severity worst = Severity::None;
  for (const Report *r : run) {
    sum_lat += *r->latitude;
    sum_lon += *r->longitude;
    worst = MaxSeverity(worst, r->severity);
    seg.pothole_ids.push_back(r->id);
  }
  const double n = static_cast<double>(run.size());
  seg.center = {sum_lat / n, sum_lon / n};
  seg.pothole_count = static_cast<int>(run.size());
  seg.max_severity = worst;
  seg.area = run.front()->area;
  seg.created_at = created_at;
  seg.segment_id = segmentId(road_name, seg.center);
  return seg;
}

std::vector<BadSegment>
SeriesDetector::detectSeries(const std::vector<Report> &reports,
                             const std::string &created_at) const {
  // Group by road, keeping the order in which roads are first seen.
  std::vector<std::pair<std::string, std::vector<const Report *>>> roads;
  for (const auto &r : reports) {
    if (!r.qualifies())
      continue;
    auto it = std::find_if(roads.begin(), roads.end(),
                           [&r](const auto &g) { return g.first == r.road; });
    if (it == roads.end()) {
      roads.push_back({r.road, {}});
      it = std::prev(roads.end());
    }
    it->second.push_back(&r);
  }

  std::vector<BadSegment> segments;
  for (auto &[road_name, members] : roads) {
    if (static_cast<int>(members.size()) < min_potholes_)
      continue;

    std::stable_sort(members.begin(), members.end(),
                     [](const Report *a, const Report *b) {
                       if (*a->latitude != *b->latitude)
                         return *a->latitude < *b->latitude;
                       return *a->longitude < *b->longitude;
                     });

    std::vector<const Report *> run{members.front()};
    for (size_t i = 1; i < members.size(); ++i) {
      const Report *prev = run.back();
      const Report *cur = members[i];
      // chained: compare with the previous member of the run
      double d = GeoUtils::haversine(prev->coordinate(), cur->coordinate());
      if (d <= threshold_m_) {
        run.push_back(cur);
      } else {
        if (static_cast<int>(run.size()) >= min_potholes_)
          segments.push_back(createSegment(run, road_name, created_at));
        run = {cur};
      }
    }
    if (static_cast<int>(run.size()) >= min_potholes_)
      segments.push_back(createSegment(run, road_name, created_at));
  }
  return segments;
}

SeriesStatistics computeStatistics(const std::vector<Report> &reports,
                                   const std::vector<BadSegment> &segments) {
  SeriesStatistics s;
  s.total_reports = static_cast<int>(reports.size());
  for (const auto &r : reports) {
    switch (r.severity) {
    case Severity::High:
      ++s.high;
      break;
    case Severity::Medium:
      ++s.medium;
      break;
    case Severity::Low:
      ++s.low;
      break;
    default:
      ++s.no_pothole_detections;
      break;
    }
  }
  s.pothole_detections = s.total_reports - s.no_pothole_detections;

  std::set<std::string> roads;
  for (const auto &seg : segments) {
    roads.insert(seg.road_name);
    s.potholes_in_series += seg.pothole_count;
  }
  s.bad_road_segments = static_cast<int>(segments.size());
  s.roads_with_series = static_cast<int>(roads.size());
  s.isolated_potholes = s.pothole_detections - s.potholes_in_series;
  return s;
}

void to_json(Json &j, const SeriesStatistics &s) {
  j = Json{{"total_reports", s.total_reports},
           {"pothole_detections", s.pothole_detections},
           {"no_pothole_detections", s.no_pothole_detections},
           {"severity_breakdown",
            {{"High", s.high},
             {"Medium", s.medium},
             {"Low", s.low},
             {"None", s.no_pothole_detections}}},
           {"bad_road_segments", s.bad_road_segments},
           {"roads_with_series", s.roads_with_series},
           {"potholes_in_series", s.potholes_in_series},
           {"isolated_potholes", s.isolated_potholes}};
}
