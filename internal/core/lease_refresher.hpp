#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "internal/config/reaper_options.hpp"
#include "internal/lease/lease_store.hpp"
#include "internal/model/replica.hpp"
#include "internal/util/time.hpp"

namespace reaper::core {

/*
  Extends leases on replicas a worker has not reached yet.

  Locking is optimistic: only rows still BEING_DELETED are re-stamped, a
  row someone else moved out of that state is skipped. A failed refresh
  only raises the chance of another worker re-claiming; it never blocks
  the batch.
*/
class LeaseRefresher {
 public:
  LeaseRefresher(std::shared_ptr<lease::LeaseStore> store, std::shared_ptr<const util::ClockSource> clock);

  // elapsed > trigger_ratio/100 * delay_seconds
  static bool IsDue(std::chrono::milliseconds elapsed, uint32_t trigger_ratio, uint32_t delay_seconds);

  /*
    Refresh `outstanding` if the lease is old enough. Returns true only
    when a refresh was issued and the store accepted it.
  */
  bool MaybeRefresh(const std::string& rse_id, std::chrono::milliseconds elapsed,
                    const std::vector<model::ReplicaRef>& outstanding, uint32_t trigger_ratio, uint32_t delay_seconds);

  bool MaybeRefresh(const std::string& rse_id, std::chrono::milliseconds elapsed,
                    const std::vector<model::ReplicaRef>& outstanding, const config::ReaperOptions& options) {
    return MaybeRefresh(rse_id, elapsed, outstanding, options.refresh_trigger_ratio, options.delay_seconds);
  }

  std::size_t Attempts() const {
    return attempts_;
  }

  std::size_t Failures() const {
    return failures_;
  }

 private:
  std::shared_ptr<lease::LeaseStore>       store_;
  std::shared_ptr<const util::ClockSource> clock_;

  std::size_t attempts_ = 0;
  std::size_t failures_ = 0;
};

} // namespace reaper::core
