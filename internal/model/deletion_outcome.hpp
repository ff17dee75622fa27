#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "internal/model/replica.hpp"
#include "internal/model/state_machine.hpp"

namespace reaper::model {

struct DeletionOutcome {
  ReplicaRef        ref;
  bool              succeeded = false;
  BatchReplicaState state     = BatchReplicaState::kClaimed;
  std::string       error;
};

/*
  Worker-local record of what the committer has done.

  committed + lease_lost + pending always equals the successes handed
  to it so far. lease_lost rows were physically deleted but the catalog
  row had already left BEING_DELETED, so the delete did not remove it.
*/
struct CleanupProgress {
  std::size_t              committed = 0;
  std::vector<std::size_t> commit_sizes;
  std::vector<ReplicaRef>  pending;
  std::vector<ReplicaRef>  lease_lost;
};

/*
  Result of processing one batch.

  remainder holds the successes the caller still has to remove from the
  catalog (deferred mode); it is empty in immediate mode.
*/
struct BatchReport {
  std::string                  rse_id;
  std::vector<DeletionOutcome> outcomes;

  std::size_t processed = 0;
  std::size_t succeeded = 0;
  std::size_t failed    = 0;

  // immediate mode: sizes of the full db_batch_size flushes, then the final flush
  std::vector<std::size_t> commit_sizes;
  std::size_t              final_flush_size      = 0;
  std::size_t              committed_immediately = 0;
  std::size_t              lease_lost            = 0;

  std::vector<ReplicaRef> remainder;

  std::size_t refreshes         = 0;
  std::size_t failed_refreshes  = 0;

  // replicas left leased because a stop was requested mid-batch
  std::size_t unprocessed = 0;
};

} // namespace reaper::model
