#pragma once

#include "models/Report.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Serialisers behind /api/export/potholes.
class ReportExport {
public:
  // {export_date, total_reports, reports}
  static nlohmann::json to_json_document(const std::vector<Report> &reports,
                                         const std::string &export_date);

  // One row per report with coordinates.
  static std::string to_csv(const std::vector<Report> &reports);

  // OSM 0.6 XML, one node per pothole with coordinates; node ids count down
  // from -1 as OSM expects for new objects.
  static std::string to_osm_xml(const std::vector<Report> &reports,
                                const std::string &fallback_timestamp);

  static std::string csv_escape(const std::string &field);
  static std::string xml_escape(const std::string &text);
};
