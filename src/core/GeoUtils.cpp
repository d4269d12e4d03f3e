#include "core/GeoUtils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace {
constexpr double kPi = 3.14159265358979323846;
inline double deg2rad(double d) { return d * (kPi / 180.0); }
} // namespace

double GeoUtils::haversine(double lat1, double lon1, double lat2,
                           double lon2) {
  double phi1 = deg2rad(lat1);
  double phi2 = deg2rad(lat2);
  double delta_phi = deg2rad(lat2 - lat1);
  double delta_lambda = deg2rad(lon2 - lon1);
  double h = std::pow(std::sin(delta_phi / 2), 2) +
             std::cos(phi1) * std::cos(phi2) *
                 std::pow(std::sin(delta_lambda / 2), 2);
  return 2 * kEarthRadiusM * std::asin(std::sqrt(h));
}

double GeoUtils::haversine(const Coordinate &p1, const Coordinate &p2) {
  return haversine(p1.lat, p1.lon, p2.lat, p2.lon);
}

double GeoUtils::haversine(const Coord &lonlat, const Coordinate &p) {
  return haversine(lonlat[1], lonlat[0], p.lat, p.lon);
}

GeoUtils::BBox GeoUtils::compute_bbox(const std::vector<Coordinate> &pts) {
  BBox b{+90, +180, -90, -180};
  for (const auto &c : pts) {
    b.min_lat = std::min(b.min_lat, c.lat);
    b.max_lat = std::max(b.max_lat, c.lat);
    b.min_lon = std::min(b.min_lon, c.lon);
    b.max_lon = std::max(b.max_lon, c.lon);
  }
  return b;
}

GeoUtils::BBox GeoUtils::inflate_point(const Coordinate &c, double pad_m) {
  const double dlat = pad_m / kMetresPerDegLat;
  // clamp the cosine so zones near the poles stay finite
  const double coslat = std::max(std::cos(deg2rad(c.lat)), 1e-6);
  const double dlon = pad_m / (kMetresPerDegLat * coslat);
  return {c.lat - dlat, c.lon - dlon, c.lat + dlat, c.lon + dlon};
}

std::string GeoUtils::format_rounded(double v, int places) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", places, v);
  std::string s(buf);
  if (s.find('.') == std::string::npos)
    return s;
  while (!s.empty() && s.back() == '0')
    s.pop_back();
  if (!s.empty() && s.back() == '.')
    s.push_back('0');
  if (s == "-0.0")
    s = "0.0";
  return s;
}
