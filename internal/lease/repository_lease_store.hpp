#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/lease/lease_store.hpp"

namespace reaper::lease {

/*
  LeaseStore over a transactional db::Repository.

  Every operation is one transaction. Optimistic backends (memory) may
  reject a commit with util::TransactionConflict; the operation is then
  replayed on a fresh snapshot up to kMaxAttempts times.
*/
class RepositoryLeaseStore final : public LeaseStore {
 public:
  static constexpr int kMaxAttempts = 8;

  explicit RepositoryLeaseStore(std::shared_ptr<db::Repository> repository);

  model::Batch ClaimBatch(const std::string& rse_id, std::size_t chunk_size, util::TimePoint now,
                          std::chrono::seconds delay) override;

  bool Refresh(const std::string& rse_id, const std::vector<model::ReplicaRef>& refs, util::TimePoint now) override;

  CatalogDeleteResult DeleteCatalogRows(const std::vector<model::ReplicaRef>& refs) override;

  std::optional<util::TimePoint> GetUpdatedAt(const model::ReplicaRef& ref) override;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace reaper::lease
