#pragma once

#include <map>
#include <mutex>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace reaper::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  // `clock` stands in for the database server clock; system clock if null.
  explicit MemoryRepository(std::shared_ptr<const util::ClockSource> clock = nullptr);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertReplica(Transaction&, const model::ReplicaRecord&) override;
  std::optional<model::ReplicaRecord> GetReplica(Transaction&, const model::ReplicaKey&) override;
  std::vector<model::ReplicaRecord> ListReplicas(Transaction&, const std::string& rse_id) override;
  Result UpdateReplica(Transaction&, const model::ReplicaRecord&) override;

  std::vector<model::ReplicaRecord> ClaimReplicas(Transaction&, const std::string& rse_id, std::size_t limit,
                                                  uint64_t now_ms, uint64_t lease_expired_before_ms) override;
  Result RefreshReplicas(Transaction&, const std::string& rse_id, const std::vector<model::ReplicaKey>& keys,
                         uint64_t now_ms) override;
  Result DeleteReplicas(Transaction&, const std::vector<model::ReplicaKey>& keys,
                        std::vector<model::ReplicaKey>& skipped) override;

  uint64_t DatabaseTimeMs(Transaction&) override;

private:
  friend class MemoryTransaction;

  struct State {
    // ordered by (rse_id, scope, name) so claims come back in a stable order
    std::map<model::ReplicaKey, model::ReplicaRecord> replicas;
  };

  static bool IsLeased(const State& s, const model::ReplicaKey& key);

  std::shared_ptr<const util::ClockSource> clock_;

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
