#pragma once

namespace reaper::db {

enum class TxPhase { kOpen, kCommitted, kRolledBack };

/*
  Unit of work against the replica catalog.

  A claim (select + mark BEING_DELETED), a lease refresh and a catalog
  delete each run inside exactly one transaction. Writes stay private
  until Commit(); a transaction destroyed without Commit() is rolled
  back. Commit() may throw util::TransactionConflict when another
  worker changed the same rows first (memory catalog only).
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  [[nodiscard]] virtual bool IsCommitted() const = 0;
};

} // namespace reaper::db
