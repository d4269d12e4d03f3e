#pragma once
#include "core/Geocoder.hpp"
#include "models/Settings.hpp"

// Geocoder backed by an OpenStreetMap Nominatim instance.
class NominatimGeocoder final : public Geocoder {
public:
  explicit NominatimGeocoder(GeocoderSettings settings)
      : settings_(std::move(settings)) {}

  std::optional<Coordinate> geocode(const std::string &address) override;
  AddressInfo reverse(const Coordinate &c) override;

  // Response parsing, separated from transport.
  static std::optional<Coordinate> parseSearch(const Json &body);
  static AddressInfo parseReverse(const Json &body);

private:
  GeocoderSettings settings_;
};
