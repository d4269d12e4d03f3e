#include "io/ReportExport.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

nlohmann::json
ReportExport::to_json_document(const std::vector<Report> &reports,
                               const std::string &export_date) {
  return nlohmann::json{{"export_date", export_date},
                        {"total_reports", reports.size()},
                        {"reports", reports}};
}

std::string ReportExport::csv_escape(const std::string &field) {
  const bool quote = field.find_first_of(",\"\r\n") != std::string::npos;
  if (!quote)
    return field;
  std::string out = "\"";
  for (char c : field) {
    if (c == '"')
      out += "\"\"";
    else
      out += c;
  }
  out += '"';
  return out;
}

std::string ReportExport::xml_escape(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    case '\'':
      out += "&apos;";
      break;
    default:
      out += c;
    }
  }
  return out;
}

static std::string coord_text(double v) {
  std::ostringstream os;
  os << std::setprecision(10) << v;
  return os.str();
}

std::string ReportExport::to_csv(const std::vector<Report> &reports) {
  std::ostringstream out;
  out << "timestamp,latitude,longitude,severity,detections,road,area,"
         "full_address,source\r\n";
  for (const auto &r : reports) {
    if (!r.latitude || !r.longitude)
      continue;
    out << csv_escape(r.timestamp) << ',' << coord_text(*r.latitude) << ','
        << coord_text(*r.longitude) << ',' << SeverityToString(r.severity)
        << ',' << r.detections << ',' << csv_escape(r.road) << ','
        << csv_escape(r.area) << ',' << csv_escape(r.full_address) << ','
        << csv_escape(r.source) << "\r\n";
  }
  return out.str();
}

std::string ReportExport::to_osm_xml(const std::vector<Report> &reports,
                                     const std::string &fallback_timestamp) {
  std::ostringstream out;
  out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
      << "<osm version=\"0.6\" generator=\"Pothole Detection System\">\n";

  long node_id = -1;
  for (const auto &r : reports) {
    if (!r.qualifies())
      continue;
    std::string severity = SeverityToString(r.severity);
    std::transform(severity.begin(), severity.end(), severity.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    const std::string ts =
        r.timestamp.empty() ? fallback_timestamp : r.timestamp;

    out << "  <node id=\"" << node_id << "\" lat=\""
        << coord_text(*r.latitude) << "\" lon=\"" << coord_text(*r.longitude)
        << "\" version=\"1\">\n"
        << "    <tag k=\"highway\" v=\"road_damage\"/>\n"
        << "    <tag k=\"pothole\" v=\"yes\"/>\n"
        << "    <tag k=\"severity\" v=\"" << severity << "\"/>\n"
        << "    <tag k=\"detections\" v=\"" << r.detections << "\"/>\n"
        << "    <tag k=\"timestamp\" v=\"" << xml_escape(ts) << "\"/>\n"
        << "    <tag k=\"road\" v=\"" << xml_escape(r.road) << "\"/>\n"
        << "  </node>\n";
    --node_id;
  }
  out << "</osm>";
  return out.str();
}
