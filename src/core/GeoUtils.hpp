#pragma once

#include "models/CoreTypes.hpp"
#include <string>
#include <vector>

// Geometry helpers shared by clustering, series detection and routing.
// Every distance in the engine goes through GeoUtils::haversine so that
// cluster, segment and intersection thresholds agree with each other.
class GeoUtils {
public:
  static constexpr double kEarthRadiusM = 6371000.0;
  static constexpr double kMetresPerDegLat = 111320.0;

  // haversine formulas, degrees in, metres out
  static double haversine(double lat1, double lon1, double lat2, double lon2);
  static double haversine(const Coordinate &p1, const Coordinate &p2);
  // polyline vertex in provider order [lon, lat]
  static double haversine(const Coord &lonlat, const Coordinate &p);

  struct BBox {
    double min_lat, min_lon, max_lat, max_lon;
  };
  static BBox compute_bbox(const std::vector<Coordinate> &pts);
  // Square zone of roughly pad_m around a single point.
  static BBox inflate_point(const Coordinate &c, double pad_m);

  // Value rounded to `places` decimals, printed without trailing zeros
  // ("12.9716", "13.0"). Used to build stable cluster and segment ids.
  static std::string format_rounded(double v, int places = 5);
};
