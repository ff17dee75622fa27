#pragma once

#include <cstdint>
#include <string_view>

namespace reaper::model {

/*
  Lifecycle of one replica inside a single worker's batch.

    CLAIMED -> DELETE_SUCCEEDED -> COMMITTED
                                -> LEASE_EXPIRED   (invariant violation)
            -> DELETE_FAILED    -> LEASE_EXPIRED   (re-selectable)
*/
enum class BatchReplicaState : std::uint8_t {
  kClaimed         = 0,
  kDeleteSucceeded = 1,
  kDeleteFailed    = 2,
  kCommitted       = 3,
  kLeaseExpired    = 4,
};

constexpr bool IsTerminal(BatchReplicaState state) {
  return state == BatchReplicaState::kCommitted || state == BatchReplicaState::kLeaseExpired;
}

constexpr bool CanTransition(BatchReplicaState from, BatchReplicaState to) {
  switch (from) {
    case BatchReplicaState::kClaimed:
      return to == BatchReplicaState::kDeleteSucceeded || to == BatchReplicaState::kDeleteFailed;
    case BatchReplicaState::kDeleteSucceeded:
      return to == BatchReplicaState::kCommitted || to == BatchReplicaState::kLeaseExpired;
    case BatchReplicaState::kDeleteFailed:
      return to == BatchReplicaState::kLeaseExpired;
    case BatchReplicaState::kCommitted:
    case BatchReplicaState::kLeaseExpired:
    default:
      return false;
  }
}

// A succeeded deletion whose lease lapsed before the catalog row was removed.
constexpr bool IsInvariantViolation(BatchReplicaState from, BatchReplicaState to) {
  return from == BatchReplicaState::kDeleteSucceeded && to == BatchReplicaState::kLeaseExpired;
}

constexpr std::string_view ToString(BatchReplicaState state) {
  switch (state) {
    case BatchReplicaState::kClaimed:
      return "claimed";
    case BatchReplicaState::kDeleteSucceeded:
      return "delete_succeeded";
    case BatchReplicaState::kDeleteFailed:
      return "delete_failed";
    case BatchReplicaState::kCommitted:
      return "committed";
    case BatchReplicaState::kLeaseExpired:
    default:
      return "lease_expired";
  }
}

} // namespace reaper::model
