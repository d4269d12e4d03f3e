#pragma once
#include "models/CoreTypes.hpp"
#include <optional>
#include <string>

// Address fields attached to a report at creation time.
struct AddressInfo {
  std::string road = kUnknownRoad;
  std::string area = kUnknownArea;
  std::string full_address = kAddressNotFound;
};

// Forward and reverse geocoding. Implementations report "not found" (and
// transport failures) through the return value instead of throwing.
class Geocoder {
public:
  virtual ~Geocoder() = default;

  // Free-text address -> coordinate of the best match.
  virtual std::optional<Coordinate> geocode(const std::string &address) = 0;

  // Coordinate -> road/area names; unknown sentinels when unavailable.
  virtual AddressInfo reverse(const Coordinate &c) = 0;
};
