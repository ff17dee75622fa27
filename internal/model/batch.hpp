#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "internal/model/replica.hpp"

namespace reaper::model {

/*
  One selector call's claim.

  Owned by exactly one worker; never modified after the claim.
  claimed_at is the lease stamp written to every row.
*/
struct Batch {
  std::string                           rse_id;
  std::vector<Replica>                  replicas;
  std::chrono::system_clock::time_point claimed_at{};

  bool empty() const {
    return replicas.empty();
  }

  std::size_t size() const {
    return replicas.size();
  }
};

} // namespace reaper::model
