#pragma once

#include "core/Geocoder.hpp"
#include "core/RoutingProvider.hpp"
#include "models/RouteModel.hpp"
#include "models/SegmentModel.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

// An endpoint as supplied by a caller: free text or a coordinate pair.
using LocationInput = std::variant<std::string, Coordinate>;

// Raised when a free-text endpoint has no geocoding match.
class LocationResolutionError : public std::runtime_error {
public:
  LocationResolutionError(const std::string &endpoint,
                          const std::string &input)
      : std::runtime_error("Could not geocode " + endpoint +
                           " address: " + input),
        endpoint_(endpoint) {}

  const std::string &endpoint() const noexcept { return endpoint_; }

private:
  std::string endpoint_;
};

// Plans a route, checks it against known bad segments and, when it crosses
// any, asks for an alternative that avoids them and scores the detour.
//
// planRoute and planWithAvoidance always return a RouteResult; every failure
// of the geocoder or routing provider is converted into the result.
class RouteAvoidancePlanner {
public:
  RouteAvoidancePlanner(Geocoder &geocoder, RoutingProvider &router,
                        double intersection_threshold_m = 50.0)
      : geocoder_(geocoder), router_(router),
        intersection_threshold_m_(intersection_threshold_m) {}

  // Throws LocationResolutionError naming `which` ("start"/"end").
  Coordinate resolveEndpoint(const LocationInput &input,
                             const std::string &which);

  // Empty when the provider fails in any way.
  std::optional<RouteSummary>
  fetchRoute(const Coordinate &start, const Coordinate &end,
             const std::vector<Coordinate> &avoid_points = {});

  // Segments whose centre lies within threshold_m of any polyline vertex, in
  // input order.
  static std::vector<BadSegment>
  checkIntersection(const std::vector<Coord> &polyline,
                    const std::vector<BadSegment> &segments,
                    double threshold_m = 50.0);

  RouteResult planWithAvoidance(const Coordinate &start,
                                const Coordinate &end,
                                const std::vector<BadSegment> &segments);

  RouteResult planRoute(const LocationInput &start, const LocationInput &end,
                        const std::vector<BadSegment> &segments);

  // detour values are alternative minus original; unset when no alternative
  // route could be obtained.
  static Recommendation
  buildRecommendation(const std::vector<BadSegment> &intersected,
                      std::optional<double> detour_km,
                      std::optional<double> detour_min);
  static Recommendation clearRecommendation();

private:
  Geocoder &geocoder_;
  RoutingProvider &router_;
  double intersection_threshold_m_;
};

// Plain-text rendering of a RouteResult for logs and chat replies.
std::string formatRouteSummary(const RouteResult &result);
