#include "replica_selector.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace reaper::core {

using observability::IntField;
using observability::StringField;

ReplicaSelector::ReplicaSelector(std::shared_ptr<lease::LeaseStore> store, std::shared_ptr<const util::ClockSource> clock)
    : store_(std::move(store)),
      clock_(std::move(clock)) {
  if (!store_ || !clock_) {
    throw std::invalid_argument("ReplicaSelector requires a lease store and a clock");
  }
}

model::Batch ReplicaSelector::Select(const std::string& rse_id, std::size_t chunk_size, std::chrono::seconds delay) {
  if (chunk_size == 0) {
    throw std::invalid_argument("chunk_size must be greater than 0");
  }

  auto batch = store_->ClaimBatch(rse_id, chunk_size, clock_->Now(), delay);

  REAPER_LOG_DEBUG("replicas claimed",
                   {StringField("rse_id", rse_id), IntField("requested", static_cast<int64_t>(chunk_size)),
                    IntField("claimed", static_cast<int64_t>(batch.size()))});
  return batch;
}

} // namespace reaper::core
