#pragma once
#include "models/CoreTypes.hpp"
#include "models/RouteModel.hpp"
#include <optional>
#include <vector>

// Turn-by-turn routing backend. An empty result means "no route"; a provider
// may still throw on programming errors, which the planner also converts.
class RoutingProvider {
public:
  virtual ~RoutingProvider() = default;

  // Driving route from start to end. When avoid_points is non-empty the
  // provider should steer clear of a small zone around each point, or fall
  // back to an unbiased route when it cannot.
  virtual std::optional<RouteSummary>
  route(const Coordinate &start, const Coordinate &end,
        const std::vector<Coordinate> &avoid_points) = 0;
};
