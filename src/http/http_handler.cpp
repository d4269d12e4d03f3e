#include "http_handler.hpp"
#include "core/Clock.hpp"
#include "core/ClusterEngine.hpp"
#include "core/RoutePlanner.hpp"
#include "core/SeriesDetector.hpp"
#include "debug/json_debug.hpp"
#include "io/ReportExport.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>

using json = nlohmann::json;

static void send_json(httplib::Response &res, const json &body,
                      int status = 200) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

// Parses the request body; on failure answers 400 and returns false.
static bool parse_body(const httplib::Request &req, httplib::Response &res,
                       json &out) {
  if (req.body.empty()) {
    out = json::object();
    return true;
  }
  try {
    out = json::parse(req.body);
    return true;
  } catch (const json::parse_error &e) {
    send_json(res, describe_parse_error(req.body, e), 400);
    return false;
  }
}

// Value of a field from the JSON body, falling back to form/query params.
static std::string field_text(const httplib::Request &req, const json &body,
                              const char *key) {
  if (body.is_object() && body.contains(key) && body[key].is_string())
    return body[key].get<std::string>();
  if (req.has_param(key))
    return req.get_param_value(key);
  return "";
}

// "Some address" or [lat, lon]
static std::optional<LocationInput> parse_location(const json &v) {
  if (v.is_string()) {
    auto text = v.get<std::string>();
    if (text.empty())
      return std::nullopt;
    return LocationInput{text};
  }
  if (v.is_array() && v.size() == 2 && v[0].is_number() && v[1].is_number()) {
    Coordinate c{v[0].get<double>(), v[1].get<double>()};
    if (!IsValidCoordinate(c.lat, c.lon))
      return std::nullopt;
    return LocationInput{c};
  }
  return std::nullopt;
}

// ===== routes =====

void HttpHandler::callPostHandler(std::string action,
                                  const httplib::Request &req,
                                  httplib::Response &res) {
  if (action == "api/reports") {
    handleReportUpload(req, res);
  } else if (action == "api/admin/add-pothole") {
    handleAdminAddPothole(req, res);
  } else if (action == "api/cluster/update") {
    handleClusterUpdate(req, res);
  } else if (action == "api/bad-segments/refresh") {
    handleSegmentsRefresh(req, res);
  } else if (action == "api/route/plan") {
    handleRoutePlan(req, res);
  } else {
    res.status = 404;
    res.set_content("Unknown action: " + action, "text/plain");
  }
}

void HttpHandler::callGetHandler(std::string action,
                                 const httplib::Request &req,
                                 httplib::Response &res) {
  if (action == "api/bad-segments") {
    handleBadSegments(req, res);
  } else if (action == "api/potholes/locations") {
    handleLocations(req, res);
  } else if (action == "api/clusters") {
    handleClusters(req, res);
  } else if (action == "api/export/potholes") {
    handleExport(req, res);
  }
  // default
  else {
    res.status = 404;
    res.set_content("Unknown action: " + action, "text/plain");
  }
}

std::vector<BadSegment>
HttpHandler::refreshSegments(const std::vector<Report> &reports) {
  SeriesDetector detector(params_.series_threshold_m, params_.min_potholes);
  auto segments = detector.detectSeries(reports, iso_timestamp_now());

  // A segment that survives the pass keeps the stamp it was first stored
  // with, so re-running detection on unchanged reports stores the same rows.
  const auto stored = db_.readSegments();
  for (auto &seg : segments) {
    auto it = std::find_if(stored.begin(), stored.end(),
                           [&seg](const BadSegment &old) {
                             return old.segment_id == seg.segment_id;
                           });
    if (it != stored.end() && !it->created_at.empty())
      seg.created_at = it->created_at;
  }
  db_.replaceSegments(segments);
  std::cout << "[DEBUG] stored " << segments.size()
            << " bad road segment(s) from " << reports.size() << " reports\n";
  return segments;
}

// ===== POST: /api/reports =====

void HttpHandler::handleReportUpload(const httplib::Request &req,
                                     httplib::Response &res) {
  json body;
  if (!parse_body(req, res, body))
    return;
  if (!body.is_object() || !body.contains("detections") ||
      !body["detections"].is_number_integer()) {
    send_json(res, {{"ok", false}, {"error", "detections count required"}},
              400);
    return;
  }

  const json &count = body["detections"];
  const bool too_large =
      count.is_number_unsigned()
          ? count.get<std::uint64_t>() >
                static_cast<std::uint64_t>(std::numeric_limits<int>::max())
          : count.get<std::int64_t>() > std::numeric_limits<int>::max();
  if (too_large) {
    send_json(res, {{"ok", false}, {"error", "detections count required"}},
              400);
    return;
  }

  Report r;
  r.detections = static_cast<int>(
      std::max<std::int64_t>(0, count.get<std::int64_t>()));
  r.severity = SeverityFromDetections(r.detections);
  r.status = r.isPothole() ? "Pothole Detected" : "No Pothole Detected";
  r.source = field_text(req, body, "source");
  if (r.source.empty())
    r.source = "web";
  r.image_path = field_text(req, body, "image_path");
  r.timestamp = iso_timestamp_now();
  r.road.clear();
  r.area.clear();

  auto lat = parse_coordinate_field(body, "latitude");
  auto lon = parse_coordinate_field(body, "longitude");
  if (lat && lon && IsValidCoordinate(*lat, *lon)) {
    r.latitude = lat;
    r.longitude = lon;
    AddressInfo address = geocoder_.reverse(r.coordinate());
    r.road = address.road;
    r.area = address.area;
    r.full_address = address.full_address;
  } else if (lat || lon) {
    std::cerr << "[" << r.source << "] dropping unusable coordinates\n";
  }
  if (r.road.empty())
    r.road = kUnknownRoad;
  if (r.area.empty())
    r.area = kUnknownArea;

  r.id = db_.insertReport(r);
  std::cout << "[" << r.source << "] report " << r.id << " saved ("
            << SeverityToString(r.severity) << ")\n";
  send_json(res, {{"ok", true}, {"report", r}});
}

// ===== POST: /api/admin/add-pothole =====

void HttpHandler::handleAdminAddPothole(const httplib::Request &req,
                                        httplib::Response &res) {
  json body;
  if (!parse_body(req, res, body))
    return;
  auto lat = parse_coordinate_field(body, "latitude");
  auto lon = parse_coordinate_field(body, "longitude");
  const std::string severity_text = field_text(req, body, "severity");
  if (!lat || !lon || severity_text.empty()) {
    send_json(res,
              {{"success", false}, {"error", "Missing required fields"}}, 400);
    return;
  }
  auto severity = SeverityFromString(severity_text);
  if (!severity || *severity == Severity::None ||
      !IsValidCoordinate(*lat, *lon)) {
    send_json(res, {{"success", false}, {"error", "Invalid pothole data"}},
              400);
    return;
  }

  try {
    Report r;
    r.latitude = lat;
    r.longitude = lon;
    r.severity = *severity;
    r.detections = static_cast<int>(*severity); // Low=1, Medium=2, High=3
    r.status = "Pothole Detected";
    r.notes = field_text(req, body, "notes");
    r.source = "admin_manual";
    r.timestamp = iso_timestamp_now();

    AddressInfo address = geocoder_.reverse(r.coordinate());
    r.road = address.road;
    r.area = address.area;
    r.full_address = address.full_address;
    std::string road = field_text(req, body, "road");
    road.erase(0, road.find_first_not_of(" \t"));
    road.erase(road.find_last_not_of(" \t") + 1);
    if (!road.empty())
      r.road = road;

    r.id = db_.insertReport(r);
    refreshSegments(db_.readReports());
    send_json(res,
              {{"success", true}, {"message", "Pothole added successfully!"}});
  } catch (const std::exception &e) {
    std::cerr << "[admin] Error adding pothole: " << e.what() << "\n";
    send_json(res, {{"success", false}, {"error", e.what()}}, 500);
  }
}

// ===== POST: /api/cluster/update =====

void HttpHandler::handleClusterUpdate(const httplib::Request &req,
                                      httplib::Response &res) {
  json body = json::object();
  // form posts from the dashboard carry no JSON body
  if (!req.body.empty() && req.get_header_value("Content-Type").find(
                               "application/json") != std::string::npos) {
    if (!parse_body(req, res, body))
      return;
  }
  const std::string cluster_id = field_text(req, body, "cluster_id");
  const std::string status_text = field_text(req, body, "status");
  auto status = ClusterStatusFromString(status_text);
  if (!status) {
    send_json(res, {{"ok", false}, {"error", "Invalid status"}}, 400);
    return;
  }
  if (cluster_id.empty()) {
    send_json(res, {{"ok", false}, {"error", "cluster_id required"}}, 400);
    return;
  }
  db_.setClusterStatus(cluster_id, *status, iso_timestamp_now());
  send_json(res, {{"ok", true},
                  {"cluster_id", cluster_id},
                  {"status", ClusterStatusToString(*status)}});
}

// ===== POST: /api/bad-segments/refresh =====

void HttpHandler::handleSegmentsRefresh(const httplib::Request &req,
                                        httplib::Response &res) {
  auto segments = refreshSegments(db_.readReports());
  send_json(res, {{"message", "Refreshed " + std::to_string(segments.size()) +
                                  " bad road segments"},
                  {"segments_count", segments.size()}});
}

// ===== POST: /api/route/plan =====

void HttpHandler::handleRoutePlan(const httplib::Request &req,
                                  httplib::Response &res) {
  json body;
  if (!parse_body(req, res, body))
    return;
  std::optional<LocationInput> start, end;
  if (body.is_object()) {
    if (body.contains("start"))
      start = parse_location(body["start"]);
    if (body.contains("end"))
      end = parse_location(body["end"]);
  }
  if (!start || !end) {
    send_json(res, {{"error", "Start and end locations required"}}, 400);
    return;
  }

  auto segments = db_.readSegments();
  if (segments.empty())
    segments = refreshSegments(db_.readReports());

  RouteAvoidancePlanner planner(geocoder_, router_,
                                params_.intersection_threshold_m);
  RouteResult result = planner.planRoute(*start, *end, segments);
  send_json(res, result, result.error_endpoint.empty() ? 200 : 400);
}

// ===== GET: /api/bad-segments =====

void HttpHandler::handleBadSegments(const httplib::Request &req,
                                    httplib::Response &res) {
  const auto reports = db_.readReports();
  auto segments = refreshSegments(reports);
  send_json(res, {{"bad_segments", segments},
                  {"statistics", computeStatistics(reports, segments)},
                  {"total_segments", segments.size()}});
}

// ===== GET: /api/potholes/locations =====

void HttpHandler::handleLocations(const httplib::Request &req,
                                  httplib::Response &res) {
  json potholes = json::array();
  for (const auto &r : db_.readReports()) {
    if (!r.qualifies())
      continue;
    potholes.push_back({{"id", r.id},
                        {"lat", *r.latitude},
                        {"lon", *r.longitude},
                        {"severity", r.severity},
                        {"road", r.road},
                        {"area", r.area},
                        {"detections", r.detections},
                        {"timestamp", r.timestamp}});
  }
  const auto total = potholes.size();
  send_json(res, {{"potholes", std::move(potholes)}, {"total", total}});
}

// ===== GET: /api/clusters =====

void HttpHandler::handleClusters(const httplib::Request &req,
                                 httplib::Response &res) {
  auto reports = db_.readReports();
  // newest first, the order the dashboard lists them in
  std::stable_sort(reports.begin(), reports.end(),
                   [](const Report &a, const Report &b) {
                     return a.timestamp > b.timestamp;
                   });

  json summary = {{"total", reports.size()},
                  {"high", 0},
                  {"medium", 0},
                  {"low", 0},
                  {"none", 0}};
  for (const auto &r : reports) {
    const char *key = r.severity == Severity::High     ? "high"
                      : r.severity == Severity::Medium ? "medium"
                      : r.severity == Severity::Low    ? "low"
                                                       : "none";
    summary[key] = summary[key].get<int>() + 1;
  }

  ClusterEngine engine(params_.cluster_radius_m);
  json clusters = json::array();
  for (const auto &c : engine.computeClusters(reports))
    clusters.push_back(ClusterEngine::describe(c, db_.clusterStatus(c.id)));

  std::cout << "[DEBUG] clusters: " << clusters.size() << " from "
            << reports.size() << " reports\n";
  send_json(res, {{"clusters", clusters}, {"summary", summary}});
}

// ===== GET: /api/export/potholes =====

void HttpHandler::handleExport(const httplib::Request &req,
                               httplib::Response &res) {
  std::string format =
      req.has_param("format") ? req.get_param_value("format") : "json";
  std::transform(format.begin(), format.end(), format.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  const auto reports = db_.readReports();
  const std::string stamp = iso_timestamp_now();
  std::string file_stamp = stamp.substr(0, 19);
  std::replace(file_stamp.begin(), file_stamp.end(), ':', '-');

  if (format == "json") {
    send_json(res, ReportExport::to_json_document(reports, stamp));
  } else if (format == "csv") {
    res.set_header("Content-Disposition", "attachment; filename=\"potholes_" +
                                              file_stamp + ".csv\"");
    res.set_content(ReportExport::to_csv(reports), "text/csv");
  } else if (format == "osm") {
    res.set_header("Content-Disposition", "attachment; filename=\"potholes_" +
                                              file_stamp + ".osm\"");
    res.set_content(ReportExport::to_osm_xml(reports, stamp),
                    "application/xml");
  } else {
    send_json(res, {{"error", "Invalid format. Use json, csv, or osm"}}, 400);
  }
}
