#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace analysis::db::memory {

/*
  Exclusive transaction over a MemoryRepository.

  Begin takes the repository's writer lock and works on a private copy of
  the committed state; Commit swaps the copy in. Concurrent transactions
  queue on the lock, the in-process counterpart of BEGIN IMMEDIATE. A
  thread must not open a second transaction on the same repository while
  one is live.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  void Finish();

  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> lock_;
  MemoryRepository::State      working_;
  bool                         committed_ = false;
};

} // namespace analysis::db::memory
