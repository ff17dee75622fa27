#pragma once

#include <atomic>
#include <memory>

#include "internal/config/reaper_options.hpp"
#include "internal/lease/lease_store.hpp"
#include "internal/model/batch.hpp"
#include "internal/model/deletion_outcome.hpp"
#include "internal/storage/physical_deleter.hpp"
#include "internal/util/time.hpp"

namespace reaper::core {

/*
  Deletes one claimed batch.

  Replicas are processed in batch order, deletion_chunk_size at a time.
  After every sub-chunk:
    1. its successes go to the cleanup committer
    2. the lease refresher sees the time since the last lease stamp and
       the replicas not processed yet

  A failed physical deletion is recorded and skipped; the replica keeps
  its lease until it expires and is claimed again. Only a catalog
  commit failure (util::CommitFailed) escapes Process().

  When `stop` is set the worker finishes the current sub-chunk, commits
  what succeeded and leaves the rest of the batch to lease expiry.
*/
class DeletionWorker {
 public:
  DeletionWorker(std::shared_ptr<storage::PhysicalDeleter> deleter, std::shared_ptr<lease::LeaseStore> store,
                 std::shared_ptr<const util::ClockSource> clock);

  model::BatchReport Process(const model::Batch& batch, const config::ReaperOptions& options,
                             const std::atomic<bool>* stop = nullptr);

 private:
  model::DeletionOutcome DeleteOne(const model::Replica& replica);

  std::shared_ptr<storage::PhysicalDeleter> deleter_;
  std::shared_ptr<lease::LeaseStore>        store_;
  std::shared_ptr<const util::ClockSource>  clock_;
};

} // namespace reaper::core
