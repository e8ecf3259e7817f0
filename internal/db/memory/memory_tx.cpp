#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace analysis::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo.writer_), working_(repo.committed_) {
}

MemoryTransaction::~MemoryTransaction() {
  Finish();
}

void MemoryTransaction::Commit() {
  if (!lock_.owns_lock()) {
    throw util::InvalidState("memory transaction already finished");
  }
  repo_.committed_ = std::move(working_);
  committed_       = true;
  Finish();
}

void MemoryTransaction::Rollback() {
  Finish();
}

void MemoryTransaction::Finish() {
  if (lock_.owns_lock()) {
    lock_.unlock();
  }
}

} // namespace analysis::db::memory
