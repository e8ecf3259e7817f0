#pragma once

#include <exception>
#include <memory>
#include <string>

namespace analysis::db {

/*
  One unit of channel work: an enqueue, a claim, an ack/nack or a result
  write. A claim reads the ready set and writes the lease in the same
  transaction, so two workers can never both take an envelope.

  - writes are invisible to other transactions until Commit()
  - Rollback() discards them
  - the destructor rolls back an uncommitted transaction

  SQLite: BEGIN IMMEDIATE (writers queue behind the busy timeout)
  Memory: exclusive writer lock over a working copy, swapped in on Commit()
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

/*
  Begins a transaction on `repository`, runs fn(tx) and commits unless fn
  already committed. An exception from fn leaves the transaction to roll
  back; Begin/Commit failures are rethrown as E("<op>: ...").
*/
template <typename E, typename Repo, typename Fn>
auto Transact(Repo& repository, const std::string& op, Fn&& fn) {
  std::unique_ptr<Transaction> tx;
  try {
    tx = repository.Begin();
  } catch (const std::exception& e) {
    throw E(op + ": " + e.what());
  }

  auto result = fn(*tx);

  try {
    if (!tx->IsCommitted()) {
      tx->Commit();
    }
  } catch (const std::exception& e) {
    throw E(op + ": commit failed: " + e.what());
  }
  return result;
}

} // namespace analysis::db
