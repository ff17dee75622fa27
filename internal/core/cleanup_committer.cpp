#include "cleanup_committer.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace reaper::core {

using observability::IntField;
using observability::StringField;

// ---------------------------------------------------------------------
// Deferred
// ---------------------------------------------------------------------

std::size_t DeferredCleanupCommitter::Commit(const std::vector<model::ReplicaRef>& successes) {
  progress_.pending.insert(progress_.pending.end(), successes.begin(), successes.end());
  return 0;
}

std::vector<model::ReplicaRef> DeferredCleanupCommitter::Finish() {
  return progress_.pending;
}

// ---------------------------------------------------------------------
// Incremental
// ---------------------------------------------------------------------

IncrementalCleanupCommitter::IncrementalCleanupCommitter(std::shared_ptr<lease::LeaseStore> store, std::size_t db_batch_size)
    : store_(std::move(store)),
      db_batch_size_(db_batch_size) {
  if (!store_) {
    throw std::invalid_argument("IncrementalCleanupCommitter requires a lease store");
  }
  if (db_batch_size_ == 0) {
    throw std::invalid_argument("db_batch_size must be greater than 0");
  }
}

std::size_t IncrementalCleanupCommitter::Commit(const std::vector<model::ReplicaRef>& successes) {
  progress_.pending.insert(progress_.pending.end(), successes.begin(), successes.end());

  std::size_t removed = 0;
  while (progress_.pending.size() >= db_batch_size_) {
    removed += Flush(db_batch_size_);
    progress_.commit_sizes.push_back(db_batch_size_);
  }
  return removed;
}

std::vector<model::ReplicaRef> IncrementalCleanupCommitter::Finish() {
  if (!progress_.pending.empty()) {
    final_flush_size_ = progress_.pending.size();
    Flush(final_flush_size_);
  }
  return {};
}

std::size_t IncrementalCleanupCommitter::Flush(std::size_t count) {
  const auto last = progress_.pending.begin() + static_cast<std::ptrdiff_t>(count);
  std::vector<model::ReplicaRef> rows(progress_.pending.begin(), last);

  auto result = store_->DeleteCatalogRows(rows);
  if (!result.ok) {
    REAPER_LOG_ERROR("catalog delete failed",
                     {IntField("rows", static_cast<int64_t>(count)), IntField("committed", static_cast<int64_t>(progress_.committed)),
                      StringField("error", result.error)});
    throw util::CommitFailed("catalog delete failed: " + result.error, progress_.committed, progress_.pending);
  }

  // rows no longer BEING_DELETED: the lease lapsed and someone else moved them
  if (!result.lease_lost.empty()) {
    REAPER_LOG_ERROR("lease lost before commit",
                     {IntField("expected", static_cast<int64_t>(count)), IntField("removed", static_cast<int64_t>(result.rows_removed))});
    progress_.lease_lost.insert(progress_.lease_lost.end(), result.lease_lost.begin(), result.lease_lost.end());
  }

  progress_.pending.erase(progress_.pending.begin(), last);
  progress_.committed += result.rows_removed;
  return result.rows_removed;
}

std::unique_ptr<CleanupCommitter> MakeCleanupCommitter(const config::ReaperOptions& options,
                                                       std::shared_ptr<lease::LeaseStore> store) {
  if (options.enable_immediate_cleanup) {
    return std::make_unique<IncrementalCleanupCommitter>(std::move(store), options.db_batch_size);
  }
  return std::make_unique<DeferredCleanupCommitter>();
}

} // namespace reaper::core
