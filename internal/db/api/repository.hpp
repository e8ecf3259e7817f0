#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/result_row.hpp"
#include "internal/db/model/task_record.hpp"

namespace analysis::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Sequence assignment on InsertTask is atomic

  The DB is the source of truth for:
    queued / in-flight envelopes (broker channel)
    result records (backend channel)
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Broker tasks
  // ---------------------------------------------------------------------

  // Assigns record.seq. AlreadyExists when (channel, task_id) is present.
  virtual Result InsertTask(Transaction&, model::TaskRecord& record) = 0;

  virtual std::optional<model::TaskRecord> GetTask(Transaction&, const std::string& channel, const std::string& task_id) = 0;

  // All tasks of a channel ordered by seq.
  virtual std::vector<model::TaskRecord> ListTasks(Transaction&, const std::string& channel) = 0;

  virtual Result UpdateTask(Transaction&, const model::TaskRecord& record) = 0;

  virtual Result DeleteTask(Transaction&, const std::string& channel, const std::string& task_id) = 0;

  // ---------------------------------------------------------------------
  // Backend results
  // ---------------------------------------------------------------------

  virtual Result InsertResult(Transaction&, const model::ResultRow& row) = 0;

  virtual Result UpdateResult(Transaction&, const model::ResultRow& row) = 0;

  virtual std::optional<model::ResultRow> GetResult(Transaction&, const std::string& channel, const std::string& task_id) = 0;

  virtual uint64_t CountResults(Transaction&, const std::string& channel) = 0;
};

} // namespace analysis::db
