#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace reaper::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  snapshot_     = repo_.committed_;
  base_version_ = repo_.committed_version_;
}

void MemoryTransaction::Commit() {
  if (!wrote_) {
    phase_ = TxPhase::kCommitted;
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != base_version_) {
    phase_ = TxPhase::kRolledBack;
    throw util::TransactionConflict("replica catalog changed by a concurrent transaction");
  }
  repo_.committed_ = std::move(snapshot_);
  ++repo_.committed_version_;
  phase_ = TxPhase::kCommitted;
}

// Dropping the snapshot is all a rollback needs.
void MemoryTransaction::Rollback() {
  phase_ = TxPhase::kRolledBack;
}

} // namespace reaper::db::memory
