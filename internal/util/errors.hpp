#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "internal/model/deletion_outcome.hpp"
#include "internal/model/replica.hpp"

namespace reaper::util {

/*
  Central error types.

  Per-replica deletion failures and refresh failures never surface as
  exceptions; only the classes below cross component boundaries.
*/

// Optimistic write conflict detected at commit; the whole transaction was discarded.
class TransactionConflict : public std::runtime_error {
 public:
  explicit TransactionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DatabaseError : public std::runtime_error {
 public:
  explicit DatabaseError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  A catalog delete failed.

  Physically deleted replicas listed in uncommitted() are still referenced
  by the catalog. The caller is expected to retry them; if it cannot, the
  rows stay BEING_DELETED and are re-claimed after the lease expires.
  report() carries what the aborted batch did up to the failure; it is
  empty when the committer is used outside a deletion worker.
*/
class CommitFailed : public std::runtime_error {
 public:
  CommitFailed(const std::string& msg, std::size_t committed, std::vector<model::ReplicaRef> uncommitted,
               model::BatchReport report = {})
      : std::runtime_error(msg),
        committed_(committed),
        uncommitted_(std::move(uncommitted)),
        report_(std::move(report)) {
  }

  std::size_t committed() const {
    return committed_;
  }

  const std::vector<model::ReplicaRef>& uncommitted() const {
    return uncommitted_;
  }

  const model::BatchReport& report() const {
    return report_;
  }

 private:
  std::size_t                    committed_;
  std::vector<model::ReplicaRef> uncommitted_;
  model::BatchReport             report_;
};

} // namespace reaper::util
