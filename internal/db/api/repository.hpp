#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/replica_record.hpp"

namespace reaper::db {

/*
  Repository abstraction over the replica catalog.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - ClaimReplicas is atomic per row: two transactions that both commit
    never return the same row
  - RefreshReplicas and DeleteReplicas only touch rows still in
    BEING_DELETED; anything else is skipped, not an error

  The DB is the source of truth for:
    replica state
    lease timestamps (updated_at_ms)
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Replica rows
  // ---------------------------------------------------------------------

  virtual Result InsertReplica(Transaction&, const model::ReplicaRecord&) = 0;

  virtual std::optional<model::ReplicaRecord> GetReplica(Transaction&, const model::ReplicaKey&) = 0;

  virtual std::vector<model::ReplicaRecord> ListReplicas(Transaction&, const std::string& rse_id) = 0;

  virtual Result UpdateReplica(Transaction&, const model::ReplicaRecord&) = 0;

  // ---------------------------------------------------------------------
  // Lease operations
  // ---------------------------------------------------------------------

  /*
    Claim up to `limit` rows at `rse_id` that are AVAILABLE, or
    BEING_DELETED with updated_at_ms < lease_expired_before_ms.
    Claimed rows get state=BEING_DELETED, updated_at_ms=now_ms.
    Returned in (scope, name) order.
  */
  virtual std::vector<model::ReplicaRecord> ClaimReplicas(Transaction&, const std::string& rse_id, std::size_t limit,
                                                          uint64_t now_ms, uint64_t lease_expired_before_ms) = 0;

  // Re-stamp updated_at_ms on rows still BEING_DELETED; rows_affected = rows stamped.
  virtual Result RefreshReplicas(Transaction&, const std::string& rse_id, const std::vector<model::ReplicaKey>& keys,
                                 uint64_t now_ms) = 0;

  // Remove rows still BEING_DELETED; rows_affected = rows removed. Keys
  // whose row was gone or no longer leased are appended to `skipped`.
  virtual Result DeleteReplicas(Transaction&, const std::vector<model::ReplicaKey>& keys,
                                std::vector<model::ReplicaKey>& skipped) = 0;

  // ---------------------------------------------------------------------
  // Clock
  // ---------------------------------------------------------------------

  // The catalog server's current time in unix milliseconds. Throws
  // util::DatabaseError when it cannot be read.
  virtual uint64_t DatabaseTimeMs(Transaction&) = 0;
};

} // namespace reaper::db
