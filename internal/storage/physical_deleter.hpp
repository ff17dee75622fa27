#pragma once

#include <memory>

#include "internal/model/replica.hpp"

namespace reaper::storage {

/*
  Storage-endpoint deletion capability.

  Called once per replica by the deletion worker. Returns true when the
  replica's bytes are gone from the endpoint, including when they were
  already missing; false (or an exception) marks the deletion failed and
  leaves the catalog row leased for a later retry.

  Implementations:
    DISK     -> std::filesystem removal below a root directory
*/
class PhysicalDeleter {
 public:
  virtual ~PhysicalDeleter() = default;

  virtual bool Delete(const model::Replica& replica) = 0;
};

using PhysicalDeleterPtr = std::shared_ptr<PhysicalDeleter>;

} // namespace reaper::storage
