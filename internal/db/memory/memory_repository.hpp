#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace analysis::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    // channel -> task_id -> record
    std::unordered_map<std::string, std::unordered_map<std::string, model::TaskRecord>> tasks;
    std::unordered_map<std::string, std::unordered_map<std::string, model::ResultRow>>  results;
    uint64_t next_seq = 1;
  };

  // Held by a MemoryTransaction from Begin() until Commit()/Rollback().
  std::mutex writer_;
  State      committed_;
};

}
