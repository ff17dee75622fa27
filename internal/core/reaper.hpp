#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>

#include "internal/config/reaper_options.hpp"
#include "internal/core/deletion_worker.hpp"
#include "internal/core/replica_selector.hpp"
#include "internal/lease/lease_store.hpp"
#include "internal/storage/physical_deleter.hpp"
#include "internal/util/time.hpp"

namespace reaper::core {

struct RunStats {
  std::size_t batches          = 0;
  std::size_t claimed          = 0;
  std::size_t deleted          = 0;
  std::size_t failed           = 0;
  std::size_t committed        = 0;
  std::size_t refresh_failures = 0;
  // failed catalog delete calls, retries included
  std::size_t commit_failures  = 0;
  // physically deleted but still in the catalog after the retry
  std::size_t uncommitted      = 0;
  // physically deleted after the lease lapsed; the catalog row was kept
  std::size_t lease_lost       = 0;
  // claimed but left to lease expiry by a stop request
  std::size_t unprocessed      = 0;

  RunStats& operator+=(const RunStats& other);
};

/*
  Outer reaper loop for one worker.

  For each RSE: claim a batch, delete it, then remove whatever the
  committer handed back from the catalog. A commit failure is retried
  once; rows that still cannot be removed stay BEING_DELETED and come
  back through lease expiry.
*/
class Reaper {
 public:
  Reaper(std::shared_ptr<lease::LeaseStore> store, std::shared_ptr<storage::PhysicalDeleter> deleter,
         std::shared_ptr<const util::ClockSource> clock);

  // One batch per configured RSE. Once `stop` is set no further RSE is
  // started and the running batch ends after its current sub-chunk.
  RunStats RunOnce(const config::ReaperOptions& options, const std::atomic<bool>* stop = nullptr);

  RunStats ReapRse(const std::string& rse_id, const config::ReaperOptions& options, const std::atomic<bool>* stop = nullptr);

 private:
  std::size_t CommitWithRetry(const std::string& rse_id, const std::vector<model::ReplicaRef>& refs, int max_attempts,
                              RunStats& stats);

  std::shared_ptr<lease::LeaseStore> store_;
  ReplicaSelector                    selector_;
  DeletionWorker                     worker_;
};

} // namespace reaper::core
