#include "fakes.hpp"
#include "http/http_handler.hpp"
#include "infra/MemoryPotholeDB.hpp"

#include <gtest/gtest.h>

namespace {
const double kLon = 77.5946;

class HttpHandlerTest : public ::testing::Test {
protected:
  MemoryPotholeDB db;
  FakeGeocoder geocoder;
  FakeRouter router;
  HttpHandler handler{db, geocoder, router, EngineParams{}};

  void SetUp() override {
    geocoder.address.road = "Main St";
    geocoder.address.area = "Indiranagar";
    geocoder.address.full_address = "Main St, Indiranagar, Bengaluru";
  }

  httplib::Response post(const std::string &action, const Json &body) {
    return post_raw(action, body.dump());
  }

  httplib::Response post_raw(const std::string &action,
                             const std::string &body) {
    httplib::Request req;
    req.body = body;
    req.headers.emplace("Content-Type", "application/json");
    httplib::Response res;
    handler.callPostHandler(action, req, res);
    return res;
  }

  httplib::Response get(const std::string &action,
                        const httplib::Params &params = {}) {
    httplib::Request req;
    req.params = params;
    httplib::Response res;
    handler.callGetHandler(action, req, res);
    return res;
  }

  void seedSeries() {
    for (double lat : {12.9716, 12.9730, 12.9745})
      db.insertReport(make_report("", lat, kLon, Severity::High));
  }
};
} // namespace

TEST_F(HttpHandlerTest, UnknownActionIs404) {
  EXPECT_EQ(post("api/nope", Json::object()).status, 404);
  EXPECT_EQ(get("api/nope").status, 404);
}

TEST_F(HttpHandlerTest, MalformedJsonIsDescribed) {
  auto res = post_raw("api/route/plan", "{\"start\": [12.9, }");
  EXPECT_EQ(res.status, 400);
  auto body = Json::parse(res.body);
  EXPECT_EQ(body["error"], "invalid json");
  EXPECT_EQ(body["line"], 1);
}

TEST_F(HttpHandlerTest, ReportUploadIsReverseGeocoded) {
  auto res = post("api/reports", {{"detections", 2},
                                  {"latitude", 12.9716},
                                  {"longitude", kLon},
                                  {"source", "telegram"}});
  EXPECT_EQ(res.status, 200);
  auto stored = db.readReports();
  ASSERT_EQ(stored.size(), 1u);
  EXPECT_EQ(stored[0].severity, Severity::Medium);
  EXPECT_EQ(stored[0].road, "Main St");
  EXPECT_EQ(stored[0].source, "telegram");
  EXPECT_EQ(stored[0].status, "Pothole Detected");
}

TEST_F(HttpHandlerTest, ReportUploadWithoutLocationKeepsSentinels) {
  auto res = post("api/reports", {{"detections", 0}});
  EXPECT_EQ(res.status, 200);
  auto stored = db.readReports();
  ASSERT_EQ(stored.size(), 1u);
  EXPECT_FALSE(stored[0].hasCoordinate());
  EXPECT_EQ(stored[0].road, kUnknownRoad);
  EXPECT_EQ(stored[0].severity, Severity::None);
}

TEST_F(HttpHandlerTest, ReportUploadRejectsOversizedDetections) {
  auto res = post("api/reports", {{"detections", 4294967297LL}});
  EXPECT_EQ(res.status, 400);
  EXPECT_EQ(Json::parse(res.body)["error"], "detections count required");

  res = post("api/reports", {{"detections", 18446744073709551615ULL}});
  EXPECT_EQ(res.status, 400);
  EXPECT_TRUE(db.readReports().empty());
}

TEST_F(HttpHandlerTest, AdminAddRequiresFields) {
  auto res = post("api/admin/add-pothole", {{"latitude", 12.97}});
  EXPECT_EQ(res.status, 400);
  EXPECT_EQ(Json::parse(res.body)["success"], false);
  EXPECT_TRUE(db.readReports().empty());
}

TEST_F(HttpHandlerTest, AdminAddRejectsUnknownSeverity) {
  auto res = post("api/admin/add-pothole", {{"latitude", 12.97},
                                            {"longitude", kLon},
                                            {"severity", "Severe"}});
  EXPECT_EQ(res.status, 400);
}

TEST_F(HttpHandlerTest, AdminAddStoresAndRefreshesSegments) {
  db.insertReport(make_report("", 12.9716, kLon, Severity::Low, "Old Airport Rd"));
  db.insertReport(make_report("", 12.9730, kLon, Severity::Low, "Old Airport Rd"));

  auto res = post("api/admin/add-pothole", {{"latitude", "12.9745"},
                                            {"longitude", kLon},
                                            {"severity", "High"},
                                            {"road", "  Old Airport Rd "},
                                            {"notes", "deep"}});
  EXPECT_EQ(res.status, 200);
  auto body = Json::parse(res.body);
  EXPECT_EQ(body["success"], true);
  EXPECT_EQ(body["message"], "Pothole added successfully!");

  auto stored = db.readReports();
  ASSERT_EQ(stored.size(), 3u);
  EXPECT_EQ(stored[2].source, "admin_manual");
  EXPECT_EQ(stored[2].detections, 3);
  EXPECT_EQ(stored[2].road, "Old Airport Rd");
  EXPECT_EQ(stored[2].area, "Indiranagar");

  auto segments = db.readSegments();
  ASSERT_EQ(segments.size(), 1u);
  EXPECT_EQ(segments[0].road_name, "Old Airport Rd");
  EXPECT_EQ(segments[0].max_severity, Severity::High);
}

TEST_F(HttpHandlerTest, BadSegmentsCarryStatistics) {
  seedSeries();
  auto res = get("api/bad-segments");
  auto body = Json::parse(res.body);
  EXPECT_EQ(body["total_segments"], 1);
  EXPECT_EQ(body["bad_segments"][0]["pothole_count"], 3);
  EXPECT_EQ(body["statistics"]["potholes_in_series"], 3);
  EXPECT_EQ(db.readSegments().size(), 1u);
}

TEST_F(HttpHandlerTest, RepeatedDetectionStoresIdenticalSegments) {
  seedSeries();
  auto first_res = Json::parse(get("api/bad-segments").body);
  const Json first = db.readSegments();
  ASSERT_EQ(first.size(), 1u);

  // Force the stored stamp into the past so a fresh stamp would show up.
  auto stored = db.readSegments();
  stored[0].created_at = "2024-01-01T00:00:00.000";
  db.replaceSegments(stored);

  get("api/bad-segments");
  post("api/bad-segments/refresh", Json::object());
  auto again = db.readSegments();
  ASSERT_EQ(again.size(), 1u);
  EXPECT_EQ(again[0].created_at, "2024-01-01T00:00:00.000");

  auto second_res = Json::parse(get("api/bad-segments").body);
  EXPECT_EQ(Json(db.readSegments()), Json(again));
  EXPECT_EQ(second_res["bad_segments"][0]["segment_id"],
            first_res["bad_segments"][0]["segment_id"]);
  EXPECT_EQ(second_res["bad_segments"][0]["created_at"],
            "2024-01-01T00:00:00.000");
}

TEST_F(HttpHandlerTest, RefreshReportsCount) {
  seedSeries();
  auto body = Json::parse(post("api/bad-segments/refresh", Json::object()).body);
  EXPECT_EQ(body["segments_count"], 1);
  EXPECT_EQ(body["message"], "Refreshed 1 bad road segments");
}

TEST_F(HttpHandlerTest, LocationsListOnlyQualifyingReports) {
  seedSeries();
  db.insertReport(make_report("", 12.99, kLon, Severity::None));
  auto body = Json::parse(get("api/potholes/locations").body);
  EXPECT_EQ(body["total"], 3);
  EXPECT_EQ(body["potholes"][0]["severity"], "High");
}

TEST_F(HttpHandlerTest, ClusterStatusRoundTrip) {
  seedSeries();
  auto clusters = Json::parse(get("api/clusters").body);
  ASSERT_FALSE(clusters["clusters"].empty());
  const auto id = clusters["clusters"][0]["id"].get<std::string>();
  EXPECT_EQ(clusters["clusters"][0]["status"], "Open");
  EXPECT_EQ(clusters["summary"]["high"], 3);

  auto bad = post("api/cluster/update",
                  {{"cluster_id", id}, {"status", "Closed"}});
  EXPECT_EQ(bad.status, 400);
  EXPECT_EQ(Json::parse(bad.body)["error"], "Invalid status");

  auto ok = post("api/cluster/update",
                 {{"cluster_id", id}, {"status", "In Progress"}});
  EXPECT_EQ(ok.status, 200);
  EXPECT_EQ(db.clusterStatus(id), ClusterStatus::InProgress);

  clusters = Json::parse(get("api/clusters").body);
  EXPECT_EQ(clusters["clusters"][0]["status"], "In Progress");
}

TEST_F(HttpHandlerTest, ClusterUpdateAcceptsFormParams) {
  httplib::Request req;
  req.params = {{"cluster_id", "12.9716_77.5946"}, {"status", "Fixed"}};
  httplib::Response res;
  handler.callPostHandler("api/cluster/update", req, res);
  EXPECT_EQ(res.status, 200);
  EXPECT_EQ(db.clusterStatus("12.9716_77.5946"), ClusterStatus::Fixed);
}

TEST_F(HttpHandlerTest, RoutePlanNeedsBothEnds) {
  auto res = post("api/route/plan", {{"start", "Cubbon Park"}});
  EXPECT_EQ(res.status, 400);
  EXPECT_EQ(Json::parse(res.body)["error"],
            "Start and end locations required");
}

TEST_F(HttpHandlerTest, RoutePlanGeocodeFailureIs400) {
  auto res = post("api/route/plan", {{"start", "Nowhere"},
                                     {"end", Json::array({12.99, kLon})}});
  EXPECT_EQ(res.status, 400);
  EXPECT_EQ(Json::parse(res.body)["error"],
            "Could not geocode start address: Nowhere");
}

TEST_F(HttpHandlerTest, RoutePlanDetectsSegmentsWhenNoneStored) {
  seedSeries();
  router.answers.push_back(straight_route(12.9600, 12.9900, kLon, 3000, 360));
  router.answers.push_back(straight_route(12.9600, 12.9900, 77.6100, 3800, 480));

  auto res = post("api/route/plan", {{"start", Json::array({12.96, kLon})},
                                     {"end", Json::array({12.99, kLon})}});
  EXPECT_EQ(res.status, 200);
  auto body = Json::parse(res.body);
  EXPECT_EQ(body["bad_segments_detected"].size(), 1u);
  EXPECT_EQ(body["recommendation"]["severity"], "recommended");
  EXPECT_FALSE(body["alternative_route"].is_null());
  EXPECT_EQ(db.readSegments().size(), 1u);
}

TEST_F(HttpHandlerTest, ExportFormats) {
  seedSeries();
  auto csv = get("api/export/potholes", {{"format", "CSV"}});
  EXPECT_EQ(csv.body.rfind("timestamp,latitude,longitude", 0), 0u);
  EXPECT_NE(csv.get_header_value("Content-Disposition").find(".csv"),
            std::string::npos);

  auto osm = get("api/export/potholes", {{"format", "osm"}});
  EXPECT_NE(osm.body.find("<osm version=\"0.6\""), std::string::npos);

  auto json = Json::parse(get("api/export/potholes").body);
  EXPECT_EQ(json["total_reports"], 3);

  EXPECT_EQ(get("api/export/potholes", {{"format", "kml"}}).status, 400);
}
