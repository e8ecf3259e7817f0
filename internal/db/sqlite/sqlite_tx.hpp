#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace analysis::db::sqlite {

/*
  BEGIN IMMEDIATE transaction on one channel connection.

  The write lock is taken up front, so a claim (read ready rows, write the
  lease) is atomic across every process sharing the database file. A
  connection carries one transaction at a time; callers serialize on the
  channel mutex.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const { return db_->Handle(); }

  // A failed COMMIT is rolled back before the error propagates.
  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return state_ == State::kCommitted; }

private:
  enum class State { kOpen, kCommitted, kRolledBack };

  void RollbackQuietly();

  std::shared_ptr<SqliteDB> db_;
  State                     state_ = State::kOpen;
};

}
