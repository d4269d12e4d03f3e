// RouteAvoidancePlanner: primary route, bad-segment check, alternative route
// and recommendation.

#include "core/RoutePlanner.hpp"
#include "core/GeoUtils.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace {
constexpr double kRecommendedDetourKm = 2.0;
constexpr double kConsiderDetourKm = 5.0;

std::string fixed(double v, int precision) {
  std::ostringstream os;
  os.setf(std::ios::fixed);
  os << std::setprecision(precision) << v;
  return os.str();
}
} // namespace

Coordinate RouteAvoidancePlanner::resolveEndpoint(const LocationInput &input,
                                                  const std::string &which) {
  if (const auto *c = std::get_if<Coordinate>(&input))
    return *c;

  const std::string &address = std::get<std::string>(input);
  std::optional<Coordinate> hit;
  try {
    hit = geocoder_.geocode(address);
  } catch (const std::exception &e) {
    std::cerr << "[RoutePlanner] geocoder failed for " << which << ": "
              << e.what() << "\n";
  }
  if (!hit)
    throw LocationResolutionError(which, address);
  return *hit;
}

std::optional<RouteSummary>
RouteAvoidancePlanner::fetchRoute(const Coordinate &start,
                                  const Coordinate &end,
                                  const std::vector<Coordinate> &avoid_points) {
  try {
    auto route = router_.route(start, end, avoid_points);
    if (route && route->coordinates.empty()) {
      std::cerr << "[RoutePlanner] provider returned a route without "
                   "geometry\n";
      return std::nullopt;
    }
    return route;
  } catch (const std::exception &e) {
    std::cerr << "[RoutePlanner] routing provider error: " << e.what()
              << "\n";
    return std::nullopt;
  }
}

std::vector<BadSegment>
RouteAvoidancePlanner::checkIntersection(const std::vector<Coord> &polyline,
                                         const std::vector<BadSegment> &segments,
                                         double threshold_m) {
  std::vector<BadSegment> hits;
  for (const auto &seg : segments) {
    if (!seg.hasCenter())
      continue;
    for (const auto &vertex : polyline) {
      if (GeoUtils::haversine(vertex, seg.center) <= threshold_m) {
        hits.push_back(seg);
        break; // one vertex is enough for this segment
      }
    }
  }
  return hits;
}

Recommendation RouteAvoidancePlanner::clearRecommendation() {
  Recommendation r;
  r.message = "Route is clear! No pothole series detected along this route.";
  r.severity = "safe";
  return r;
}

Recommendation RouteAvoidancePlanner::buildRecommendation(
    const std::vector<BadSegment> &intersected,
    std::optional<double> detour_km, std::optional<double> detour_min) {
  Recommendation rec;
  Severity worst = Severity::Low;
  for (const auto &seg : intersected) {
    rec.total_potholes += seg.pothole_count;
    worst = MaxSeverity(worst, seg.max_severity);
    bool seen = false;
    for (const auto &road : rec.affected_roads)
      seen = seen || road == seg.road_name;
    if (!seen)
      rec.affected_roads.push_back(seg.road_name);
  }
  rec.worst_severity = worst;
  rec.detour_distance_km = detour_km;
  rec.detour_time_min = detour_min;

  const auto &roads = rec.affected_roads;
  std::string roads_text;
  if (roads.size() == 1)
    roads_text = roads[0] + " has";
  else if (roads.size() == 2)
    roads_text = roads[0] + " and " + roads[1] + " have";
  else
    roads_text = std::to_string(roads.size()) + " roads have";

  std::ostringstream msg;
  msg << "Warning: " << roads_text << " a series of " << rec.total_potholes
      << " potholes (" << SeverityToString(worst) << " severity).";

  if (!detour_km) {
    msg << " No alternative route is available. Proceed with caution.";
    rec.severity = "caution";
  } else if (*detour_km > 0) {
    msg << " Alternative route adds " << fixed(*detour_km, 1) << " km and ~"
        << fixed(detour_min.value_or(0.0), 0)
        << " minutes but avoids damaged sections.";
    if (*detour_km < kRecommendedDetourKm && worst == Severity::High) {
      msg << " Recommended: Take the alternative route for smoother travel.";
      rec.severity = "recommended";
    } else if (*detour_km < kConsiderDetourKm) {
      msg << " Consider the alternative route to avoid road damage.";
      rec.severity = "consider";
    } else {
      msg << " Significant detour required. Proceed with caution on "
             "original route.";
      rec.severity = "caution";
    }
  } else {
    // Without a real detour the provider did not route around anything.
    msg << " Alternative route could not avoid all bad segments.";
    rec.severity = "caution";
  }
  rec.message = msg.str();
  return rec;
}

RouteResult
RouteAvoidancePlanner::planWithAvoidance(const Coordinate &start,
                                         const Coordinate &end,
                                         const std::vector<BadSegment> &segments) {
  RouteResult result;
  auto primary = fetchRoute(start, end);
  if (!primary) {
    result.error = "Could not calculate route";
    return result;
  }

  result.start = start;
  result.end = end;
  result.original_route = PlannedRoute::from(*primary);
  result.bad_segments_detected = checkIntersection(
      primary->coordinates, segments, intersection_threshold_m_);

  if (result.bad_segments_detected.empty()) {
    result.recommendation = clearRecommendation();
    return result;
  }

  std::vector<Coordinate> avoid;
  avoid.reserve(result.bad_segments_detected.size());
  for (const auto &seg : result.bad_segments_detected)
    avoid.push_back(seg.center);

  std::cout << "[RoutePlanner] route crosses "
            << result.bad_segments_detected.size()
            << " bad segment(s); requesting alternative\n";

  auto alternative = fetchRoute(start, end, avoid);
  if (!alternative) {
    result.recommendation =
        buildRecommendation(result.bad_segments_detected, std::nullopt,
                            std::nullopt);
    return result;
  }

  result.alternative_route = PlannedRoute::from(*alternative);
  const double detour_km = result.alternative_route->distance_km -
                           result.original_route->distance_km;
  const double detour_min = result.alternative_route->duration_minutes -
                            result.original_route->duration_minutes;
  result.recommendation =
      buildRecommendation(result.bad_segments_detected, detour_km, detour_min);
  return result;
}

RouteResult
RouteAvoidancePlanner::planRoute(const LocationInput &start,
                                 const LocationInput &end,
                                 const std::vector<BadSegment> &segments) {
  Coordinate s{}, e{};
  try {
    s = resolveEndpoint(start, "start");
    e = resolveEndpoint(end, "end");
  } catch (const LocationResolutionError &err) {
    std::cerr << "[RoutePlanner] " << err.what() << "\n";
    RouteResult result;
    result.error = err.what();
    result.error_endpoint = err.endpoint();
    return result;
  }
  return planWithAvoidance(s, e, segments);
}

std::string formatRouteSummary(const RouteResult &result) {
  if (!result.ok())
    return "Error: " + result.error;

  const std::string rule(60, '=');
  std::ostringstream out;
  out << rule << "\nROUTE PLANNING RESULT\n" << rule << "\n";

  if (result.original_route) {
    out << "\nOriginal Route:\n"
        << "   Distance: " << fixed(result.original_route->distance_km, 2)
        << " km\n"
        << "   Duration: "
        << fixed(result.original_route->duration_minutes, 0)
        << " minutes\n";
  }

  if (!result.bad_segments_detected.empty()) {
    out << "\nPothole Series Detected: "
        << result.bad_segments_detected.size() << " segments\n";
    for (const auto &seg : result.bad_segments_detected)
      out << "   * " << seg.road_name << ": " << seg.pothole_count
          << " potholes (" << SeverityToString(seg.max_severity)
          << " severity)\n";
  }

  if (result.alternative_route) {
    out << "\nAlternative Route:\n"
        << "   Distance: " << fixed(result.alternative_route->distance_km, 2)
        << " km\n"
        << "   Duration: "
        << fixed(result.alternative_route->duration_minutes, 0)
        << " minutes\n";
  }

  if (result.recommendation)
    out << "\n" << result.recommendation->message << "\n";

  out << "\n" << rule;
  return out.str();
}
