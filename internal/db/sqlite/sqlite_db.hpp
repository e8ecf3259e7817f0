#pragma once

#include <sqlite3.h>

#include <chrono>
#include <string>

namespace analysis::db::sqlite {

/*
  One connection to a channel database file.

  Several worker processes may open the same file; writers queue behind
  BEGIN IMMEDIATE for up to `busy_timeout`. Lock contention that outlives
  the timeout surfaces as util::TransientInfraError, every other failure as
  std::runtime_error.
*/
class SqliteDB {
public:
  explicit SqliteDB(std::string path, bool wal_mode = true, std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(5000));
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const { return db_; }
  const std::string& Path() const { return path_; }

  // Runs one or more statements without result rows (pragmas, DDL, BEGIN/COMMIT).
  void Exec(const std::string& sql);

  // Throws for rc != SQLITE_OK, naming the statement and this connection.
  void Check(int rc, const char* what) const;

private:
  void Open();
  void Configure(bool wal_mode, std::chrono::milliseconds busy_timeout);

  std::string path_;
  sqlite3*    db_ = nullptr;
};

bool IsBusy(int rc);

}
