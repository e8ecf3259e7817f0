#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace analysis::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  if (sqlite3_get_autocommit(db_->Handle()) == 0) {
    throw util::InvalidState("sqlite: " + db_->Path() + " already has an open transaction on this connection");
  }
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (state_ == State::kOpen) {
    RollbackQuietly();
  }
}

void SqliteTransaction::Commit() {
  if (state_ != State::kOpen) {
    throw util::InvalidState("sqlite: commit on a finished transaction");
  }
  try {
    db_->Exec("COMMIT;");
  } catch (const std::exception&) {
    RollbackQuietly();
    throw;
  }
  state_ = State::kCommitted;
}

void SqliteTransaction::Rollback() {
  if (state_ != State::kOpen) {
    return;
  }
  state_ = State::kRolledBack;
  db_->Exec("ROLLBACK;");
}

void SqliteTransaction::RollbackQuietly() {
  state_ = State::kRolledBack;
  if (sqlite3_get_autocommit(db_->Handle()) != 0) {
    return;
  }
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    ANALYSIS_LOG_WARN("sqlite rollback failed", {observability::StringField("database", db_->Path()), observability::StringField("error", e.what())});
  }
}

} // namespace analysis::db::sqlite
