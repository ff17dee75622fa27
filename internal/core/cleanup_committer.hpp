#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "internal/config/reaper_options.hpp"
#include "internal/lease/lease_store.hpp"
#include "internal/model/deletion_outcome.hpp"

namespace reaper::core {

/*
  Removes successfully deleted replicas from the catalog.

  The worker hands every sub-chunk's successes to Commit() as they
  happen and calls Finish() once at the end of the batch. A catalog
  delete that fails throws util::CommitFailed; nothing else throws.
*/
class CleanupCommitter {
 public:
  virtual ~CleanupCommitter() = default;

  // Returns the number of catalog rows removed by this call.
  virtual std::size_t Commit(const std::vector<model::ReplicaRef>& successes) = 0;

  // Returns the successes the caller still has to remove itself.
  virtual std::vector<model::ReplicaRef> Finish() = 0;

  virtual bool Immediate() const = 0;

  const model::CleanupProgress& Progress() const {
    return progress_;
  }

  std::size_t FinalFlushSize() const {
    return final_flush_size_;
  }

 protected:
  model::CleanupProgress progress_;
  std::size_t            final_flush_size_ = 0;
};

/*
  Traditional mode: no catalog mutation during the batch. Finish() hands
  the complete success list back to the caller.
*/
class DeferredCleanupCommitter final : public CleanupCommitter {
 public:
  std::size_t Commit(const std::vector<model::ReplicaRef>& successes) override;

  std::vector<model::ReplicaRef> Finish() override;

  bool Immediate() const override {
    return false;
  }
};

/*
  Immediate mode: every time db_batch_size successes are pending, exactly
  that many rows are deleted. Finish() deletes the smaller remainder.
  Keeps each catalog mutation bounded and spreads them over the batch.
*/
class IncrementalCleanupCommitter final : public CleanupCommitter {
 public:
  IncrementalCleanupCommitter(std::shared_ptr<lease::LeaseStore> store, std::size_t db_batch_size);

  std::size_t Commit(const std::vector<model::ReplicaRef>& successes) override;

  std::vector<model::ReplicaRef> Finish() override;

  bool Immediate() const override {
    return true;
  }

 private:
  std::size_t Flush(std::size_t count);

  std::shared_ptr<lease::LeaseStore> store_;
  std::size_t                        db_batch_size_;
};

std::unique_ptr<CleanupCommitter> MakeCleanupCommitter(const config::ReaperOptions& options,
                                                       std::shared_ptr<lease::LeaseStore> store);

} // namespace reaper::core
