#include "fakes.hpp"
#include "io/ReportExport.hpp"

#include <gtest/gtest.h>

TEST(ReportExport, CsvHeaderAndRows) {
  Report with_comma = make_report("1", 12.9716, 77.5946, Severity::High,
                                  "Main St", "Indiranagar");
  with_comma.full_address = "12, Main St, Bengaluru";
  Report no_coords = make_report("2", 0, 0, Severity::Low);
  no_coords.latitude.reset();

  auto csv = ReportExport::to_csv({with_comma, no_coords});
  EXPECT_EQ(csv,
            "timestamp,latitude,longitude,severity,detections,road,area,"
            "full_address,source\r\n"
            "2024-05-01T09:00:00.000,12.9716,77.5946,High,3,Main St,"
            "Indiranagar,\"12, Main St, Bengaluru\",web\r\n");
}

TEST(ReportExport, CsvEscapesQuotes) {
  EXPECT_EQ(ReportExport::csv_escape("say \"hi\""), "\"say \"\"hi\"\"\"");
  EXPECT_EQ(ReportExport::csv_escape("plain"), "plain");
}

TEST(ReportExport, OsmNodesCountDownAndSkipNonPotholes) {
  std::vector<Report> reports{
      make_report("1", 12.9716, 77.5946, Severity::Medium, "A & B Road"),
      make_report("2", 12.9800, 77.6000, Severity::None),
      make_report("3", 12.9900, 77.6100, Severity::Low),
  };
  auto xml = ReportExport::to_osm_xml(reports, "2024-06-01T00:00:00");
  EXPECT_NE(xml.find("<osm version=\"0.6\""), std::string::npos);
  EXPECT_NE(xml.find("<node id=\"-1\" lat=\"12.9716\" lon=\"77.5946\""),
            std::string::npos);
  EXPECT_NE(xml.find("<node id=\"-2\" lat=\"12.99\""), std::string::npos);
  EXPECT_EQ(xml.find("id=\"-3\""), std::string::npos);
  EXPECT_NE(xml.find("v=\"medium\""), std::string::npos);
  EXPECT_NE(xml.find("v=\"A &amp; B Road\""), std::string::npos);
}

TEST(ReportExport, JsonDocumentCountsReports) {
  auto doc = ReportExport::to_json_document(
      {make_report("1", 12.97, 77.59, Severity::Low)}, "2024-06-01T00:00:00");
  EXPECT_EQ(doc["total_reports"], 1);
  EXPECT_EQ(doc["export_date"], "2024-06-01T00:00:00");
  EXPECT_EQ(doc["reports"][0]["severity"], "Low");
}
