#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace reaper::db::memory {

/*
  Optimistic transaction over a private copy of the catalog.

  Reads and writes go to the copy. Commit() publishes it only if no
  other transaction published since the copy was taken; otherwise it
  throws util::TransactionConflict and the caller retries with a fresh
  snapshot. A transaction that never wrote always commits.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override = default;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return phase_ == TxPhase::kCommitted;
  }

  MemoryRepository::State& Mutable() {
    wrote_ = true;
    return snapshot_;
  }
  const MemoryRepository::State& View() const {
    return snapshot_;
  }

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State snapshot_;
  uint64_t                base_version_ = 0;
  TxPhase                 phase_        = TxPhase::kOpen;
  bool                    wrote_        = false;
};

} // namespace reaper::db::memory
