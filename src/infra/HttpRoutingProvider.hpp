#pragma once
#include "core/RoutingProvider.hpp"
#include "models/Settings.hpp"

// Routing over HTTP. Unbiased routes come from OSRM (no key needed). Routes
// that must avoid points go to OpenRouteService with avoid_polygons, which
// needs an API key; without one, or when ORS fails, the request falls back to
// an unbiased OSRM route.
class HttpRoutingProvider final : public RoutingProvider {
public:
  explicit HttpRoutingProvider(RoutingSettings settings)
      : settings_(std::move(settings)) {}

  std::optional<RouteSummary>
  route(const Coordinate &start, const Coordinate &end,
        const std::vector<Coordinate> &avoid_points) override;

  bool avoidanceEnabled() const { return !settings_.ors_api_key.empty(); }

  // GeoJSON MultiPolygon with one square zone of radius_m per point.
  static Json buildAvoidPolygons(const std::vector<Coordinate> &points,
                                 double radius_m);
  static Json buildOrsRequest(const Coordinate &start, const Coordinate &end,
                              const std::vector<Coordinate> &avoid_points,
                              double radius_m);
  static std::string osrmPath(const Coordinate &start, const Coordinate &end);

private:
  std::optional<RouteSummary> routeOsrm(const Coordinate &start,
                                        const Coordinate &end);
  std::optional<RouteSummary>
  routeOrs(const Coordinate &start, const Coordinate &end,
           const std::vector<Coordinate> &avoid_points);

  RoutingSettings settings_;
};
