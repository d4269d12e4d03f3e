// HttpRoutingProvider: OSRM for plain routes, OpenRouteService for routes
// that avoid bad segments.

#include "HttpRoutingProvider.hpp"
#include "core/GeoUtils.hpp"
#include "models/OsrmResponse.hpp"

#include <httplib.h>
#include <iomanip>
#include <iostream>
#include <sstream>

Json HttpRoutingProvider::buildAvoidPolygons(
    const std::vector<Coordinate> &points, double radius_m) {
  Json polygons = Json::array();
  for (const auto &p : points) {
    const auto b = GeoUtils::inflate_point(p, radius_m);
    // closed ring, [lon, lat]
    polygons.push_back(Json::array({Json::array({
        Json::array({b.min_lon, b.min_lat}),
        Json::array({b.max_lon, b.min_lat}),
        Json::array({b.max_lon, b.max_lat}),
        Json::array({b.min_lon, b.max_lat}),
        Json::array({b.min_lon, b.min_lat}),
    })}));
  }
  return Json{{"type", "MultiPolygon"}, {"coordinates", polygons}};
}

Json HttpRoutingProvider::buildOrsRequest(
    const Coordinate &start, const Coordinate &end,
    const std::vector<Coordinate> &avoid_points, double radius_m) {
  Json body;
  body["coordinates"] = Json::array({Json::array({start.lon, start.lat}),
                                     Json::array({end.lon, end.lat})});
  if (!avoid_points.empty())
    body["options"] = {
        {"avoid_polygons", buildAvoidPolygons(avoid_points, radius_m)}};
  return body;
}

std::string HttpRoutingProvider::osrmPath(const Coordinate &start,
                                          const Coordinate &end) {
  std::ostringstream os;
  os.setf(std::ios::fixed);
  os << std::setprecision(7) << "/route/v1/driving/" << start.lon << ','
     << start.lat << ';' << end.lon << ',' << end.lat;
  return os.str();
}

std::optional<RouteSummary>
HttpRoutingProvider::routeOsrm(const Coordinate &start, const Coordinate &end) {
  try {
    httplib::Client cli(settings_.osrm_url);
    cli.set_connection_timeout(settings_.timeout_s, 0);
    cli.set_read_timeout(settings_.timeout_s, 0);
    httplib::Params params{{"overview", "full"},
                           {"geometries", "geojson"},
                           {"steps", "false"}};

    auto res = cli.Get(osrmPath(start, end), params, httplib::Headers{});
    if (!res) {
      std::cerr << "[Routing] OSRM request failed: "
                << httplib::to_string(res.error()) << "\n";
      return std::nullopt;
    }
    if (res->status != 200) {
      std::cerr << "[Routing] OSRM API error: " << res->status << "\n";
      return std::nullopt;
    }
    OsrmResponse osrm = Json::parse(res->body).get<OsrmResponse>();
    return toRouteSummary(osrm);
  } catch (const std::exception &e) {
    std::cerr << "[Routing] OSRM routing error: " << e.what() << "\n";
    return std::nullopt;
  }
}

std::optional<RouteSummary>
HttpRoutingProvider::routeOrs(const Coordinate &start, const Coordinate &end,
                              const std::vector<Coordinate> &avoid_points) {
  try {
    httplib::Client cli(settings_.ors_url);
    cli.set_connection_timeout(settings_.timeout_s, 0);
    cli.set_read_timeout(settings_.timeout_s, 0);
    httplib::Headers headers{{"Authorization", settings_.ors_api_key},
                             {"Accept", "application/geo+json"}};
    const Json body = buildOrsRequest(start, end, avoid_points,
                                      settings_.avoid_radius_m);

    auto res = cli.Post("/v2/directions/driving-car/geojson", headers,
                        body.dump(), "application/json");
    if (!res) {
      std::cerr << "[Routing] ORS request failed: "
                << httplib::to_string(res.error()) << "\n";
      return std::nullopt;
    }
    if (res->status != 200) {
      std::cerr << "[Routing] ORS API error: " << res->status << "\n";
      return std::nullopt;
    }
    OrsResponse ors = Json::parse(res->body).get<OrsResponse>();
    return toRouteSummary(ors);
  } catch (const std::exception &e) {
    std::cerr << "[Routing] ORS routing error: " << e.what() << "\n";
    return std::nullopt;
  }
}

std::optional<RouteSummary>
HttpRoutingProvider::route(const Coordinate &start, const Coordinate &end,
                           const std::vector<Coordinate> &avoid_points) {
  if (avoid_points.empty())
    return routeOsrm(start, end);

  if (avoidanceEnabled()) {
    if (auto r = routeOrs(start, end, avoid_points))
      return r;
    std::cerr << "[Routing] avoidance route unavailable, falling back to "
                 "OSRM\n";
  } else {
    std::cout << "[Routing] no ORS_API_KEY; alternative is an unbiased "
                 "route\n";
  }
  return routeOsrm(start, end);
}
