#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/batch.hpp"
#include "internal/model/replica.hpp"
#include "internal/util/time.hpp"

namespace reaper::lease {

struct CatalogDeleteResult {
  bool        ok           = false;
  std::size_t rows_removed = 0;
  // requested rows that were no longer BEING_DELETED (or already gone)
  std::vector<model::ReplicaRef> lease_lost;
  std::string                    error;
};

/*
  Shared lease/catalog capability.

  This is the only shared mutable resource between reaper workers. A
  lease is the pair (state=BEING_DELETED, updated_at); there is no lock
  object. Any backing store that can do a conditional row update can
  implement it.
*/
class LeaseStore {
 public:
  virtual ~LeaseStore() = default;

  /*
    Claim up to chunk_size replicas at rse_id that are AVAILABLE or whose
    BEING_DELETED lease is older than `delay`. Every returned replica is
    stamped with `now`. Two concurrent calls never return the same row.
  */
  virtual model::Batch ClaimBatch(const std::string& rse_id, std::size_t chunk_size, util::TimePoint now,
                                  std::chrono::seconds delay) = 0;

  // Re-stamp rows still BEING_DELETED; false if the store could not be updated.
  virtual bool Refresh(const std::string& rse_id, const std::vector<model::ReplicaRef>& refs, util::TimePoint now) = 0;

  // Remove rows still BEING_DELETED from the catalog; the others are
  // reported back in lease_lost and left untouched.
  virtual CatalogDeleteResult DeleteCatalogRows(const std::vector<model::ReplicaRef>& refs) = 0;

  // Diagnostic accessor; nullopt when the row no longer exists.
  virtual std::optional<util::TimePoint> GetUpdatedAt(const model::ReplicaRef& ref) = 0;
};

} // namespace reaper::lease
