#pragma once

#include <cstdint>
#include <string>

#include "internal/model/replica.hpp"

namespace reaper::db::model {

/*
  Persistent replica row.

  IMPORTANT:
  - (scope, name, rse_id) is the primary key.
  - state + updated_at_ms together form the lease; there is no
    separate lock table.
*/

using ReplicaKey   = reaper::model::ReplicaRef;
using ReplicaState = reaper::model::ReplicaState;

struct ReplicaRecord {
  ReplicaKey key;

  ReplicaState state = ReplicaState::kUnspecified;

  uint64_t    bytes = 0;
  std::string path;

  // Last lease stamp (unix ms)
  uint64_t updated_at_ms = 0;
};

inline reaper::model::Replica ToReplica(const ReplicaRecord& r) {
  reaper::model::Replica replica;
  replica.ref           = r.key;
  replica.state         = r.state;
  replica.bytes         = r.bytes;
  replica.path          = r.path;
  replica.updated_at_ms = r.updated_at_ms;
  return replica;
}

} // namespace reaper::db::model
