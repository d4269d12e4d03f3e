#include "core/RoutePlanner.hpp"
#include "core/SeriesDetector.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

namespace {
const double kLon = 77.5946;

BadSegment segment_at(double lat, double lon, const std::string &road,
                      int count, Severity worst) {
  BadSegment s;
  s.road_name = road;
  s.center = {lat, lon};
  s.start = s.end = s.center;
  s.pothole_count = count;
  s.max_severity = worst;
  s.segment_id = SeriesDetector::segmentId(road, s.center);
  return s;
}

class RoutePlannerTest : public ::testing::Test {
protected:
  FakeGeocoder geocoder;
  FakeRouter router;
  RouteAvoidancePlanner planner{geocoder, router};

  Coordinate start{12.9600, kLon};
  Coordinate end{12.9900, kLon};
  // segment sits directly on the straight primary route
  std::vector<BadSegment> segments{
      segment_at(12.9730, kLon, "Main St", 3, Severity::High)};
};
} // namespace

TEST(CheckIntersection, VertexWithinThresholdHits) {
  auto seg = segment_at(12.9730, kLon, "Main St", 3, Severity::High);
  std::vector<Coord> near{{kLon, 12.9730 + lat_offset(40)}};
  std::vector<Coord> far{{kLon, 12.9730 + lat_offset(60)}};
  EXPECT_EQ(RouteAvoidancePlanner::checkIntersection(near, {seg}).size(), 1u);
  EXPECT_TRUE(RouteAvoidancePlanner::checkIntersection(far, {seg}).empty());
}

TEST(CheckIntersection, EachSegmentReportedOnceInInputOrder) {
  auto a = segment_at(12.9730, kLon, "Main St", 3, Severity::Low);
  auto b = segment_at(12.9650, kLon, "Side Rd", 4, Severity::Medium);
  auto route = straight_route(12.9600, 12.9900, kLon, 3000, 300);
  auto hits = RouteAvoidancePlanner::checkIntersection(route.coordinates, {a, b});
  ASSERT_EQ(hits.size(), 2u);
  EXPECT_EQ(hits[0].road_name, "Main St");
  EXPECT_EQ(hits[1].road_name, "Side Rd");
}

TEST(CheckIntersection, SegmentsWithoutCenterAreSkipped) {
  auto seg = Json{{"road_name", "Main St"}, {"pothole_count", 3}}.get<BadSegment>();
  auto route = straight_route(12.9600, 12.9900, kLon, 3000, 300);
  EXPECT_TRUE(
      RouteAvoidancePlanner::checkIntersection(route.coordinates, {seg}).empty());
}

TEST(BuildRecommendation, ShortDetourAroundHighSeverityIsRecommended) {
  auto rec = RouteAvoidancePlanner::buildRecommendation(
      {segment_at(12.97, kLon, "Main St", 3, Severity::High)}, 1.0, 3.0);
  EXPECT_EQ(rec.severity, "recommended");
  EXPECT_EQ(rec.message,
            "Warning: Main St has a series of 3 potholes (High severity). "
            "Alternative route adds 1.0 km and ~3 minutes but avoids damaged "
            "sections. Recommended: Take the alternative route for smoother "
            "travel.");
  EXPECT_EQ(rec.total_potholes, 3);
  EXPECT_EQ(rec.worst_severity, Severity::High);
}

TEST(BuildRecommendation, ShortDetourAroundMediumIsConsider) {
  auto rec = RouteAvoidancePlanner::buildRecommendation(
      {segment_at(12.97, kLon, "Main St", 3, Severity::Medium)}, 1.0, 3.0);
  EXPECT_EQ(rec.severity, "consider");
}

TEST(BuildRecommendation, DetourTiers) {
  auto high = segment_at(12.97, kLon, "Main St", 3, Severity::High);
  EXPECT_EQ(RouteAvoidancePlanner::buildRecommendation({high}, 4.9, 9.0).severity,
            "consider");
  auto far = RouteAvoidancePlanner::buildRecommendation({high}, 6.0, 12.0);
  EXPECT_EQ(far.severity, "caution");
  EXPECT_NE(far.message.find("Significant detour required"), std::string::npos);
}

TEST(BuildRecommendation, NonPositiveDetourMeansNothingWasAvoided) {
  auto rec = RouteAvoidancePlanner::buildRecommendation(
      {segment_at(12.97, kLon, "Main St", 3, Severity::High)}, 0.0, 0.0);
  EXPECT_EQ(rec.severity, "caution");
  EXPECT_NE(rec.message.find("could not avoid all bad segments"),
            std::string::npos);
}

TEST(BuildRecommendation, NoAlternative) {
  auto rec = RouteAvoidancePlanner::buildRecommendation(
      {segment_at(12.97, kLon, "Main St", 3, Severity::Low)}, std::nullopt,
      std::nullopt);
  EXPECT_EQ(rec.severity, "caution");
  EXPECT_FALSE(rec.detour_distance_km.has_value());
  EXPECT_NE(rec.message.find("No alternative route is available"),
            std::string::npos);
}

TEST(BuildRecommendation, NamesAffectedRoads) {
  auto a = segment_at(12.97, kLon, "Main St", 3, Severity::Low);
  auto a2 = segment_at(12.98, kLon, "Main St", 4, Severity::Medium);
  auto b = segment_at(12.99, kLon, "Side Rd", 3, Severity::Low);
  auto c = segment_at(13.00, kLon, "Ring Rd", 5, Severity::Low);

  auto two = RouteAvoidancePlanner::buildRecommendation({a, a2, b}, 3.0, 5.0);
  EXPECT_EQ(two.affected_roads, (std::vector<std::string>{"Main St", "Side Rd"}));
  EXPECT_EQ(two.total_potholes, 10);
  EXPECT_EQ(two.message.rfind("Warning: Main St and Side Rd have a series of 10 "
                              "potholes (Medium severity).",
                              0),
            0u);

  auto three = RouteAvoidancePlanner::buildRecommendation({a, b, c}, 3.0, 5.0);
  EXPECT_EQ(three.message.rfind("Warning: 3 roads have a series of 11", 0), 0u);
}

TEST_F(RoutePlannerTest, ClearRouteIsSafe) {
  router.answers.push_back(straight_route(12.9600, 12.9900, 77.6100, 3500, 420));
  auto result = planner.planRoute(start, end, segments);
  ASSERT_TRUE(result.ok());
  ASSERT_TRUE(result.recommendation);
  EXPECT_EQ(result.recommendation->severity, "safe");
  EXPECT_EQ(result.recommendation->message,
            "Route is clear! No pothole series detected along this route.");
  EXPECT_TRUE(result.bad_segments_detected.empty());
  EXPECT_FALSE(result.alternative_route);
  EXPECT_DOUBLE_EQ(result.original_route->distance_km, 3.5);
  EXPECT_DOUBLE_EQ(result.original_route->duration_minutes, 7.0);
  EXPECT_EQ(router.calls.size(), 1u);
  EXPECT_EQ(geocoder.geocode_calls, 0);
}

TEST_F(RoutePlannerTest, CrossingRequestsAlternativeAvoidingCenters) {
  router.answers.push_back(straight_route(12.9600, 12.9900, kLon, 3000, 360));
  router.answers.push_back(straight_route(12.9600, 12.9900, 77.6100, 4000, 540));
  auto result = planner.planRoute(start, end, segments);

  ASSERT_TRUE(result.ok());
  ASSERT_EQ(result.bad_segments_detected.size(), 1u);
  ASSERT_EQ(router.calls.size(), 2u);
  EXPECT_TRUE(router.calls[0].avoid.empty());
  ASSERT_EQ(router.calls[1].avoid.size(), 1u);
  EXPECT_DOUBLE_EQ(router.calls[1].avoid[0].lat, 12.9730);

  ASSERT_TRUE(result.alternative_route);
  const auto &rec = *result.recommendation;
  EXPECT_EQ(rec.severity, "recommended");
  EXPECT_NEAR(*rec.detour_distance_km, 1.0, 1e-9);
  EXPECT_NEAR(*rec.detour_time_min, 3.0, 1e-9);
}

TEST_F(RoutePlannerTest, AlternativeFailureStillReturnsOriginal) {
  router.answers.push_back(straight_route(12.9600, 12.9900, kLon, 3000, 360));
  router.answers.push_back(std::nullopt);
  auto result = planner.planRoute(start, end, segments);
  ASSERT_TRUE(result.ok());
  EXPECT_TRUE(result.original_route);
  EXPECT_FALSE(result.alternative_route);
  EXPECT_EQ(result.recommendation->severity, "caution");

  Json j = result;
  EXPECT_TRUE(j["alternative_route"].is_null());
  EXPECT_TRUE(j["recommendation"]["detour_distance_km"].is_null());
}

TEST_F(RoutePlannerTest, PrimaryFailureIsAnError) {
  auto result = planner.planRoute(start, end, segments);
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.error, "Could not calculate route");
  EXPECT_TRUE(result.error_endpoint.empty());
}

TEST_F(RoutePlannerTest, ProviderExceptionsAreConverted) {
  router.throw_on_call = true;
  auto result = planner.planRoute(start, end, segments);
  EXPECT_EQ(result.error, "Could not calculate route");
}

TEST_F(RoutePlannerTest, UnknownStartAddressNamesTheEndpoint) {
  geocoder.places["MG Road"] = end;
  auto result = planner.planRoute(std::string("Nowhere"),
                                  std::string("MG Road"), segments);
  EXPECT_EQ(result.error, "Could not geocode start address: Nowhere");
  EXPECT_EQ(result.error_endpoint, "start");
  EXPECT_TRUE(router.calls.empty());
}

TEST_F(RoutePlannerTest, UnknownEndAddressNamesTheEndpoint) {
  geocoder.places["Cubbon Park"] = start;
  auto result = planner.planRoute(std::string("Cubbon Park"),
                                  std::string("Atlantis"), segments);
  EXPECT_EQ(result.error_endpoint, "end");
}

TEST_F(RoutePlannerTest, AddressesAreGeocoded) {
  geocoder.places["Cubbon Park"] = start;
  geocoder.places["MG Road"] = end;
  router.answers.push_back(straight_route(12.9600, 12.9900, 77.6100, 3500, 420));
  auto result = planner.planRoute(std::string("Cubbon Park"),
                                  std::string("MG Road"), segments);
  ASSERT_TRUE(result.ok());
  EXPECT_DOUBLE_EQ(result.start->lat, start.lat);
  EXPECT_DOUBLE_EQ(router.calls[0].end.lat, end.lat);
}

TEST_F(RoutePlannerTest, SummaryText) {
  router.answers.push_back(straight_route(12.9600, 12.9900, kLon, 3000, 360));
  router.answers.push_back(std::nullopt);
  auto text = formatRouteSummary(planner.planRoute(start, end, segments));
  EXPECT_NE(text.find("Distance: 3.00 km"), std::string::npos);
  EXPECT_NE(text.find("Main St: 3 potholes (High severity)"), std::string::npos);

  RouteResult failed;
  failed.error = "Could not calculate route";
  EXPECT_EQ(formatRouteSummary(failed), "Error: Could not calculate route");
}
