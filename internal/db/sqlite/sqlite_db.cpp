#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace analysis::db::sqlite {

namespace {

[[noreturn]] void Raise(int rc, const std::string& message) {
  if (IsBusy(rc)) {
    throw util::TransientInfraError(message);
  }
  throw std::runtime_error(message);
}

} // namespace

bool IsBusy(int rc) {
  const int primary = rc & 0xff;
  return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

SqliteDB::SqliteDB(std::string path, bool wal_mode, std::chrono::milliseconds busy_timeout) : path_(std::move(path)) {
  Open();
  try {
    Configure(wal_mode, busy_timeout);
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

void SqliteDB::Open() {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  const int rc    = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);
  if (rc == SQLITE_OK) {
    sqlite3_extended_result_codes(db_, 1);
    return;
  }

  // sqlite3_open_v2 hands back a handle even on failure, except when out of memory
  const std::string reason = db_ != nullptr ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
  sqlite3_close(db_);
  db_ = nullptr;
  Raise(rc, "sqlite open " + path_ + ": " + reason);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc == SQLITE_OK) {
    return;
  }
  std::string reason = err != nullptr ? err : sqlite3_errstr(rc);
  sqlite3_free(err);
  Raise(rc, "sqlite " + path_ + ": " + reason + " (" + sql + ")");
}

void SqliteDB::Check(int rc, const char* what) const {
  if (rc != SQLITE_OK) {
    Raise(rc, "sqlite " + path_ + ": " + what + ": " + sqlite3_errmsg(db_));
  }
}

void SqliteDB::Configure(bool wal_mode, std::chrono::milliseconds busy_timeout) {
  Check(sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout.count())), "busy_timeout");

  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }
  Exec("PRAGMA synchronous=NORMAL;");
  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace analysis::db::sqlite
