#pragma once

#include <memory>
#include <string>

#include "internal/config/reaper_options.hpp"
#include "internal/lease/lease_store.hpp"
#include "internal/model/batch.hpp"
#include "internal/util/time.hpp"

namespace reaper::core {

/*
  Claims the next batch of deletable replicas at one RSE.

  Eligible: AVAILABLE, or BEING_DELETED with a lease older than
  delay_seconds, whoever set it. Claiming stamps the rows, so the
  returned batch is leased to the caller from batch.claimed_at.
*/
class ReplicaSelector {
 public:
  ReplicaSelector(std::shared_ptr<lease::LeaseStore> store, std::shared_ptr<const util::ClockSource> clock);

  // Throws std::invalid_argument if chunk_size == 0. An empty batch means no work.
  model::Batch Select(const std::string& rse_id, std::size_t chunk_size, std::chrono::seconds delay);

  model::Batch Select(const std::string& rse_id, const config::ReaperOptions& options) {
    return Select(rse_id, options.chunk_size, options.Delay());
  }

 private:
  std::shared_ptr<lease::LeaseStore>       store_;
  std::shared_ptr<const util::ClockSource> clock_;
};

} // namespace reaper::core
