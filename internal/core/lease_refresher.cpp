#include "lease_refresher.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace reaper::core {

using observability::IntField;
using observability::StringField;

LeaseRefresher::LeaseRefresher(std::shared_ptr<lease::LeaseStore> store, std::shared_ptr<const util::ClockSource> clock)
    : store_(std::move(store)),
      clock_(std::move(clock)) {
  if (!store_ || !clock_) {
    throw std::invalid_argument("LeaseRefresher requires a lease store and a clock");
  }
}

bool LeaseRefresher::IsDue(std::chrono::milliseconds elapsed, uint32_t trigger_ratio, uint32_t delay_seconds) {
  const auto trigger = std::chrono::milliseconds(static_cast<int64_t>(delay_seconds) * 1000 * trigger_ratio / 100);
  return elapsed > trigger;
}

bool LeaseRefresher::MaybeRefresh(const std::string& rse_id, std::chrono::milliseconds elapsed,
                                  const std::vector<model::ReplicaRef>& outstanding, uint32_t trigger_ratio,
                                  uint32_t delay_seconds) {
  if (outstanding.empty() || !IsDue(elapsed, trigger_ratio, delay_seconds)) {
    return false;
  }

  REAPER_LOG_INFO("lease refresh triggered",
                  {StringField("rse_id", rse_id), IntField("elapsed_ms", elapsed.count()),
                   IntField("outstanding", static_cast<int64_t>(outstanding.size()))});

  ++attempts_;
  if (!store_->Refresh(rse_id, outstanding, clock_->Now())) {
    ++failures_;
    REAPER_LOG_WARN("lease refresh failed, continuing with aging leases",
                    {StringField("rse_id", rse_id), IntField("outstanding", static_cast<int64_t>(outstanding.size()))});
    return false;
  }
  return true;
}

} // namespace reaper::core
