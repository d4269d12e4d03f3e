// NominatimGeocoder: /search for addresses, /reverse for report enrichment.

#include "NominatimGeocoder.hpp"

#include <httplib.h>
#include <iomanip>
#include <iostream>
#include <sstream>

static std::string coord_param(double v) {
  std::ostringstream os;
  os.setf(std::ios::fixed);
  os << std::setprecision(7) << v;
  return os.str();
}

static double number_field(const Json &v) {
  // Nominatim returns lat/lon as strings
  if (v.is_number())
    return v.get<double>();
  return std::stod(v.get<std::string>());
}

std::optional<Coordinate> NominatimGeocoder::parseSearch(const Json &body) {
  if (!body.is_array() || body.empty())
    return std::nullopt;
  const auto &hit = body.front();
  if (!hit.contains("lat") || !hit.contains("lon"))
    return std::nullopt;
  Coordinate c{number_field(hit["lat"]), number_field(hit["lon"])};
  if (!IsValidCoordinate(c.lat, c.lon))
    return std::nullopt;
  return c;
}

AddressInfo NominatimGeocoder::parseReverse(const Json &body) {
  AddressInfo info;
  if (!body.is_object())
    return info;
  const auto address = body.value("address", Json::object());
  auto field = [&address](const char *key) -> std::string {
    return address.contains(key) && address[key].is_string()
               ? address[key].get<std::string>()
               : std::string();
  };
  if (auto road = field("road"); !road.empty())
    info.road = road;
  for (const char *key : {"suburb", "neighbourhood", "city"}) {
    if (auto area = field(key); !area.empty()) {
      info.area = area;
      break;
    }
  }
  if (body.contains("display_name") && body["display_name"].is_string())
    info.full_address = body["display_name"].get<std::string>();
  return info;
}

std::optional<Coordinate>
NominatimGeocoder::geocode(const std::string &address) {
  try {
    httplib::Client cli(settings_.base_url);
    cli.set_connection_timeout(settings_.timeout_s, 0);
    cli.set_read_timeout(settings_.timeout_s, 0);
    httplib::Params params{{"q", address}, {"format", "json"}, {"limit", "1"}};
    httplib::Headers headers{{"User-Agent", settings_.user_agent + "-Routing"}};

    auto res = cli.Get("/search", params, headers);
    if (!res) {
      std::cerr << "[Geocoder] search failed: " << httplib::to_string(res.error())
                << "\n";
      return std::nullopt;
    }
    if (res->status != 200) {
      std::cerr << "[Geocoder] search HTTP " << res->status << "\n";
      return std::nullopt;
    }
    return parseSearch(Json::parse(res->body));
  } catch (const std::exception &e) {
    std::cerr << "[Geocoder] geocoding error: " << e.what() << "\n";
    return std::nullopt;
  }
}

AddressInfo NominatimGeocoder::reverse(const Coordinate &c) {
  try {
    httplib::Client cli(settings_.base_url);
    cli.set_connection_timeout(settings_.reverse_timeout_s, 0);
    cli.set_read_timeout(settings_.reverse_timeout_s, 0);
    httplib::Params params{{"lat", coord_param(c.lat)},
                           {"lon", coord_param(c.lon)},
                           {"format", "json"}};
    httplib::Headers headers{{"User-Agent", settings_.user_agent}};

    auto res = cli.Get("/reverse", params, headers);
    if (!res) {
      std::cerr << "[Geocoder] reverse failed: "
                << httplib::to_string(res.error()) << "\n";
      return {};
    }
    if (res->status != 200) {
      std::cerr << "[Geocoder] reverse HTTP " << res->status << "\n";
      return {};
    }
    return parseReverse(Json::parse(res->body));
  } catch (const std::exception &e) {
    std::cerr << "[Geocoder] reverse geocoding error: " << e.what() << "\n";
    return {};
  }
}
