#pragma once
#include "core/PotholeDB.hpp"
#include <memory>
#include <mutex>
#include <mysql/mysql.h>

class MySQLPotholeDB final : public PotholeDB {
public:
  MySQLPotholeDB(const std::string &uri, const std::string &user,
                 const std::string &pass, const std::string &schema);
  ~MySQLPotholeDB();
  MySQLPotholeDB(const MySQLPotholeDB &) = delete;
  MySQLPotholeDB &operator=(const MySQLPotholeDB &) = delete;

  std::vector<Report> readReports() override;
  std::string insertReport(const Report &report) override;
  void replaceSegments(const std::vector<BadSegment> &segments) override;
  std::vector<BadSegment> readSegments() override;
  ClusterStatus clusterStatus(const std::string &cluster_id) override;
  void setClusterStatus(const std::string &cluster_id, ClusterStatus status,
                        const std::string &updated_at) override;

private:
  struct StmtCloser {
    void operator()(MYSQL_STMT *s) const { mysql_stmt_close(s); }
  };
  using StmtPtr = std::unique_ptr<MYSQL_STMT, StmtCloser>;

  void begin();
  void commit();
  void rollback();
  void query(const char *sql);
  StmtPtr prepare(const char *sql);

  // One connection shared by all handler threads.
  std::mutex mu_;
  MYSQL *conn_ = nullptr;
};
