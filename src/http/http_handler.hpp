#pragma once

#include "core/Geocoder.hpp"
#include "core/PotholeDB.hpp"
#include "core/RoutingProvider.hpp"
#include "models/params.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Thin wrapper around httplib callbacks.  The main server forwards requests to
// these member functions based on the action string parsed from the URL
// (path without the leading slash, e.g. "api/route/plan").
class HttpHandler {
public:
  HttpHandler(PotholeDB &db, Geocoder &geocoder, RoutingProvider &router,
              EngineParams params)
      : db_(db), geocoder_(geocoder), router_(router), params_(params) {}

  void callPostHandler(std::string action, const httplib::Request &req,
                       httplib::Response &res);
  void callGetHandler(std::string action, const httplib::Request &req,
                      httplib::Response &res);

private:
  PotholeDB &db_;
  Geocoder &geocoder_;
  RoutingProvider &router_;
  EngineParams params_;

  // Detects series over `reports` and replaces the stored segments.
  std::vector<BadSegment> refreshSegments(const std::vector<Report> &reports);

  // Individual request handlers
  void handleReportUpload(const httplib::Request &req, httplib::Response &res);
  void handleAdminAddPothole(const httplib::Request &req,
                             httplib::Response &res);
  void handleClusterUpdate(const httplib::Request &req, httplib::Response &res);
  void handleSegmentsRefresh(const httplib::Request &req,
                             httplib::Response &res);
  void handleRoutePlan(const httplib::Request &req, httplib::Response &res);
  void handleBadSegments(const httplib::Request &req, httplib::Response &res);
  void handleLocations(const httplib::Request &req, httplib::Response &res);
  void handleClusters(const httplib::Request &req, httplib::Response &res);
  void handleExport(const httplib::Request &req, httplib::Response &res);
};
