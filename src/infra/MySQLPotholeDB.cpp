// MySQLPotholeDB stores reports, bad segments and cluster status in MySQL.
// Table layout: sql/schema.sql

#include "MySQLPotholeDB.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void bind_text(MYSQL_BIND &b, const std::string &s, unsigned long &len) {
  len = s.size();
  b.buffer_type = MYSQL_TYPE_STRING;
  b.buffer = (void *)s.data();
  b.buffer_length = len;
  b.length = &len;
}

void bind_double(MYSQL_BIND &b, const double &v) {
  b.buffer_type = MYSQL_TYPE_DOUBLE;
  b.buffer = (void *)&v;
}

// Absent coordinates are stored as SQL NULL.
void bind_optional_double(MYSQL_BIND &b, const std::optional<double> &v) {
  if (v)
    bind_double(b, *v);
  else
    b.buffer_type = MYSQL_TYPE_NULL;
}

void bind_int(MYSQL_BIND &b, const int &v) {
  b.buffer_type = MYSQL_TYPE_LONG;
  b.buffer = (void *)&v;
}

std::optional<double> to_optional_double(const char *field) {
  if (!field || !*field)
    return std::nullopt;
  return std::stod(field);
}

double to_double(const char *field) {
  return field ? std::stod(field) : 0.0;
}

std::string to_text(const char *field, const std::string &fallback = "") {
  return (field && *field) ? std::string(field) : fallback;
}

} // namespace

// Establish connection using URI and credentials
MySQLPotholeDB::MySQLPotholeDB(const std::string &uri,
                               const std::string &user,
                               const std::string &pass,
                               const std::string &schema) {
  conn_ = mysql_init(nullptr);
  if (!conn_)
    throw std::runtime_error("mysql_init failed");
  // Parse URI "tcp://host:port"
  std::string host = uri, port = "3306";
  if (auto pos = uri.find("://"); pos != std::string::npos) {
    host = uri.substr(pos + 3);
  }
  if (auto p = host.find(':'); p != std::string::npos) {
    port = host.substr(p + 1);
    host = host.substr(0, p);
  }
  if (!mysql_real_connect(conn_, host.c_str(), user.c_str(), pass.c_str(),
                          schema.c_str(), std::stoi(port), nullptr, 0)) {
    std::string err = mysql_error(conn_);
    mysql_close(conn_);
    throw std::runtime_error("connect failed: " + err);
  }
  if (mysql_set_character_set(conn_, "utf8mb4"))
    std::cerr << "[MySQLPotholeDB] cannot set utf8mb4: " << mysql_error(conn_)
              << "\n";
}

MySQLPotholeDB::~MySQLPotholeDB() { mysql_close(conn_); }

void MySQLPotholeDB::query(const char *sql) {
  if (mysql_query(conn_, sql))
    throw std::runtime_error(mysql_error(conn_));
}

void MySQLPotholeDB::begin() { query("START TRANSACTION"); }
void MySQLPotholeDB::commit() { query("COMMIT"); }
void MySQLPotholeDB::rollback() { query("ROLLBACK"); }

MySQLPotholeDB::StmtPtr MySQLPotholeDB::prepare(const char *sql) {
  StmtPtr stmt(mysql_stmt_init(conn_));
  if (!stmt)
    throw std::runtime_error("mysql_stmt_init failed");
  if (mysql_stmt_prepare(stmt.get(), sql, strlen(sql)))
    throw std::runtime_error(mysql_stmt_error(stmt.get()));
  return stmt;
}

// ---- reports ----

std::vector<Report> MySQLPotholeDB::readReports() {
  std::lock_guard<std::mutex> lock(mu_);
  query(R"SQL(
      SELECT id, latitude, longitude, detections, severity, status, road,
             area, full_address, notes, image_path, source, reported_at
      FROM pothole_reports ORDER BY id
    )SQL");

  MYSQL_RES *res = mysql_store_result(conn_);
  if (!res)
    throw std::runtime_error(std::string("store result failed: ") +
                             mysql_error(conn_));

  std::vector<Report> out;
  MYSQL_ROW row;
  while ((row = mysql_fetch_row(res))) {
    Report r;
    r.id = to_text(row[0]);
    r.latitude = to_optional_double(row[1]);
    r.longitude = to_optional_double(row[2]);
    r.detections = row[3] ? std::atoi(row[3]) : 0;
    r.severity = SeverityFromString(to_text(row[4]))
                     .value_or(SeverityFromDetections(r.detections));
    r.status = to_text(row[5]);
    r.road = to_text(row[6], kUnknownRoad);
    r.area = to_text(row[7], kUnknownArea);
    r.full_address = to_text(row[8]);
    r.notes = to_text(row[9]);
    r.image_path = to_text(row[10]);
    r.source = to_text(row[11], "web");
    r.timestamp = to_text(row[12]);
    out.push_back(std::move(r));
  }
  mysql_free_result(res);
  return out;
}

std::string MySQLPotholeDB::insertReport(const Report &r) {
  static const char *SQL = R"SQL(
      INSERT INTO pothole_reports
        (latitude, longitude, detections, severity, status, road, area,
         full_address, notes, image_path, source, reported_at)
      VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )SQL";

  std::lock_guard<std::mutex> lock(mu_);
  StmtPtr stmt = prepare(SQL);

  const std::string severity = SeverityToString(r.severity);
  unsigned long len[12] = {0};
  MYSQL_BIND b[12];
  memset(b, 0, sizeof(b));
  bind_optional_double(b[0], r.latitude);
  bind_optional_double(b[1], r.longitude);
  bind_int(b[2], r.detections);
  bind_text(b[3], severity, len[3]);
  bind_text(b[4], r.status, len[4]);
  bind_text(b[5], r.road, len[5]);
  bind_text(b[6], r.area, len[6]);
  bind_text(b[7], r.full_address, len[7]);
  bind_text(b[8], r.notes, len[8]);
  bind_text(b[9], r.image_path, len[9]);
  bind_text(b[10], r.source, len[10]);
  bind_text(b[11], r.timestamp, len[11]);

  if (mysql_stmt_bind_param(stmt.get(), b))
    throw std::runtime_error(mysql_stmt_error(stmt.get()));
  if (mysql_stmt_execute(stmt.get()))
    throw std::runtime_error(mysql_stmt_error(stmt.get()));

  return std::to_string(mysql_stmt_insert_id(stmt.get()));
}

// ---- bad segments ----

void MySQLPotholeDB::replaceSegments(const std::vector<BadSegment> &segments) {
  static const char *SQL = R"SQL(
      REPLACE INTO bad_road_segments
        (segment_id, road_name, start_lat, start_lon, end_lat, end_lon,
         center_lat, center_lon, pothole_count, max_severity, area,
         pothole_ids, created_at)
      VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )SQL";

  std::lock_guard<std::mutex> lock(mu_);
  begin();
  try {
    query("DELETE FROM bad_road_segments");
    StmtPtr stmt = prepare(SQL);
    for (const auto &s : segments) {
      const std::string severity = SeverityToString(s.max_severity);
      const std::string ids = nlohmann::json(s.pothole_ids).dump();
      unsigned long len[13] = {0};
      MYSQL_BIND b[13];
      memset(b, 0, sizeof(b));
      bind_text(b[0], s.segment_id, len[0]);
      bind_text(b[1], s.road_name, len[1]);
      bind_double(b[2], s.start.lat);
      bind_double(b[3], s.start.lon);
      bind_double(b[4], s.end.lat);
      bind_double(b[5], s.end.lon);
      bind_double(b[6], s.center.lat);
      bind_double(b[7], s.center.lon);
      bind_int(b[8], s.pothole_count);
      bind_text(b[9], severity, len[9]);
      bind_text(b[10], s.area, len[10]);
      bind_text(b[11], ids, len[11]);
      bind_text(b[12], s.created_at, len[12]);

      if (mysql_stmt_bind_param(stmt.get(), b))
        throw std::runtime_error(mysql_stmt_error(stmt.get()));
      if (mysql_stmt_execute(stmt.get()))
        throw std::runtime_error(mysql_stmt_error(stmt.get()));
    }
    commit();
  } catch (const std::exception &e) {
    std::cerr << "[MySQLPotholeDB] replaceSegments failed: " << e.what()
              << "\n";
    try {
      rollback();
    } catch (const std::exception &re) {
      std::cerr << "[MySQLPotholeDB] rollback failed: " << re.what() << "\n";
    }
    throw;
  }
}

std::vector<BadSegment> MySQLPotholeDB::readSegments() {
  std::lock_guard<std::mutex> lock(mu_);
  query(R"SQL(
      SELECT segment_id, road_name, start_lat, start_lon, end_lat, end_lon,
             center_lat, center_lon, pothole_count, max_severity, area,
             pothole_ids, created_at
      FROM bad_road_segments ORDER BY segment_id
    )SQL");

  MYSQL_RES *res = mysql_store_result(conn_);
  if (!res)
    throw std::runtime_error(std::string("store result failed: ") +
                             mysql_error(conn_));

  std::vector<BadSegment> out;
  MYSQL_ROW row;
  while ((row = mysql_fetch_row(res))) {
    BadSegment s;
    s.segment_id = to_text(row[0]);
    s.road_name = to_text(row[1], kUnknownRoad);
    s.start = {to_double(row[2]), to_double(row[3])};
    s.end = {to_double(row[4]), to_double(row[5])};
    s.center = {to_double(row[6]), to_double(row[7])};
    s.pothole_count = row[8] ? std::atoi(row[8]) : 0;
    s.max_severity =
        SeverityFromString(to_text(row[9])).value_or(Severity::Low);
    s.area = to_text(row[10], kUnknownArea);
    auto ids = nlohmann::json::parse(to_text(row[11], "[]"), nullptr,
                                     /*allow_exceptions=*/false);
    if (ids.is_array())
      for (const auto &id : ids)
        if (id.is_string())
          s.pothole_ids.push_back(id.get<std::string>());
    s.created_at = to_text(row[12]);
    out.push_back(std::move(s));
  }
  mysql_free_result(res);
  return out;
}

// ---- cluster status ----

ClusterStatus MySQLPotholeDB::clusterStatus(const std::string &cluster_id) {
  std::lock_guard<std::mutex> lock(mu_);
  std::string escaped(cluster_id.size() * 2 + 1, '\0');
  unsigned long n = mysql_real_escape_string(
      conn_, escaped.data(), cluster_id.c_str(), cluster_id.size());
  escaped.resize(n);

  const std::string sql =
      "SELECT status FROM cluster_status WHERE cluster_id = '" + escaped + "'";
  query(sql.c_str());
  MYSQL_RES *res = mysql_store_result(conn_);
  if (!res)
    throw std::runtime_error(std::string("store result failed: ") +
                             mysql_error(conn_));

  ClusterStatus status = ClusterStatus::Open;
  if (MYSQL_ROW row = mysql_fetch_row(res))
    status = ClusterStatusFromString(to_text(row[0]))
                 .value_or(ClusterStatus::Open);
  mysql_free_result(res);
  return status;
}

void MySQLPotholeDB::setClusterStatus(const std::string &cluster_id,
                                      ClusterStatus status,
                                      const std::string &updated_at) {
  static const char *SQL = R"SQL(
      INSERT INTO cluster_status (cluster_id, status, updated_at)
      VALUES (?, ?, ?)
      ON DUPLICATE KEY UPDATE
        status = VALUES(status),
        updated_at = VALUES(updated_at)
    )SQL";

  std::lock_guard<std::mutex> lock(mu_);
  StmtPtr stmt = prepare(SQL);

  const std::string status_text = ClusterStatusToString(status);
  unsigned long len[3] = {0};
  MYSQL_BIND b[3];
  memset(b, 0, sizeof(b));
  bind_text(b[0], cluster_id, len[0]);
  bind_text(b[1], status_text, len[1]);
  bind_text(b[2], updated_at, len[2]);

  if (mysql_stmt_bind_param(stmt.get(), b))
    throw std::runtime_error(mysql_stmt_error(stmt.get()));
  if (mysql_stmt_execute(stmt.get()))
    throw std::runtime_error(mysql_stmt_error(stmt.get()));
}
