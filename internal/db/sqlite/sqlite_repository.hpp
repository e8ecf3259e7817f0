#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace analysis::db::sqlite {

// Creates broker_tasks / backend_results when missing.
void BootstrapSchema(SqliteDB& db);

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertTask(Transaction&, model::TaskRecord&) override;
  std::optional<model::TaskRecord> GetTask(Transaction&, const std::string& channel, const std::string& task_id) override;
  std::vector<model::TaskRecord> ListTasks(Transaction&, const std::string& channel) override;
  Result UpdateTask(Transaction&, const model::TaskRecord&) override;
  Result DeleteTask(Transaction&, const std::string& channel, const std::string& task_id) override;

  Result InsertResult(Transaction&, const model::ResultRow&) override;
  Result UpdateResult(Transaction&, const model::ResultRow&) override;
  std::optional<model::ResultRow> GetResult(Transaction&, const std::string& channel, const std::string& task_id) override;
  uint64_t CountResults(Transaction&, const std::string& channel) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
