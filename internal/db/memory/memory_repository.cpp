#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace reaper::db::memory {

namespace {

bool IsClaimable(const model::ReplicaRecord& r, uint64_t lease_expired_before_ms) {
  if (r.state == model::ReplicaState::kAvailable) return true;
  return r.state == model::ReplicaState::kBeingDeleted && r.updated_at_ms < lease_expired_before_ms;
}

} // namespace

bool MemoryRepository::IsLeased(const State& s, const model::ReplicaKey& key) {
  auto it = s.replicas.find(key);
  return it != s.replicas.end() && it->second.state == model::ReplicaState::kBeingDeleted;
}

MemoryRepository::MemoryRepository(std::shared_ptr<const util::ClockSource> clock) : clock_(std::move(clock)) {
  if (!clock_) clock_ = std::make_shared<const util::SystemClockSource>();
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertReplica(Transaction& t, const model::ReplicaRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.replicas.contains(r.key)) return Result::Err(ErrorCode::AlreadyExists, r.key.ToString());
  s.replicas[r.key] = r;
  return Result::Ok(1);
}

std::optional<model::ReplicaRecord> MemoryRepository::GetReplica(Transaction& t, const model::ReplicaKey& key) {
  const auto& s  = TX(t).View();
  auto        it = s.replicas.find(key);
  if (it == s.replicas.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ReplicaRecord> MemoryRepository::ListReplicas(Transaction& t, const std::string& rse_id) {
  std::vector<model::ReplicaRecord> out;
  for (const auto& [key, record] : TX(t).View().replicas) {
    if (key.rse_id == rse_id) out.push_back(record);
  }
  return out;
}

Result MemoryRepository::UpdateReplica(Transaction& t, const model::ReplicaRecord& r) {
  if (!TX(t).View().replicas.contains(r.key)) return Result::Err(ErrorCode::NotFound, r.key.ToString());
  TX(t).Mutable().replicas[r.key] = r;
  return Result::Ok(1);
}

std::vector<model::ReplicaRecord> MemoryRepository::ClaimReplicas(Transaction& t, const std::string& rse_id,
                                                                  std::size_t limit, uint64_t now_ms,
                                                                  uint64_t lease_expired_before_ms) {
  std::vector<model::ReplicaRecord> claimed;
  if (limit == 0) return claimed;

  // select on the read view first so an empty claim leaves the snapshot clean
  for (const auto& [key, record] : TX(t).View().replicas) {
    if (claimed.size() >= limit) break;
    if (key.rse_id != rse_id || !IsClaimable(record, lease_expired_before_ms)) continue;
    claimed.push_back(record);
  }
  if (claimed.empty()) return claimed;

  auto& s = TX(t).Mutable();
  for (auto& record : claimed) {
    record.state         = model::ReplicaState::kBeingDeleted;
    record.updated_at_ms = now_ms;
    s.replicas[record.key] = record;
  }
  return claimed;
}

Result MemoryRepository::RefreshReplicas(Transaction& t, const std::string& rse_id,
                                         const std::vector<model::ReplicaKey>& keys, uint64_t now_ms) {
  std::vector<model::ReplicaKey> leased;
  for (const auto& key : keys) {
    if (key.rse_id != rse_id) continue;
    if (IsLeased(TX(t).View(), key)) leased.push_back(key);
  }
  if (leased.empty()) return Result::Ok(0);

  auto& s = TX(t).Mutable();
  for (const auto& key : leased) {
    s.replicas[key].updated_at_ms = now_ms;
  }
  return Result::Ok(leased.size());
}

Result MemoryRepository::DeleteReplicas(Transaction& t, const std::vector<model::ReplicaKey>& keys,
                                        std::vector<model::ReplicaKey>& skipped) {
  std::vector<model::ReplicaKey> leased;
  for (const auto& key : keys) {
    if (IsLeased(TX(t).View(), key)) {
      leased.push_back(key);
    } else {
      skipped.push_back(key);
    }
  }
  if (leased.empty()) return Result::Ok(0);

  auto&    s       = TX(t).Mutable();
  uint64_t removed = 0;
  for (const auto& key : leased) {
    removed += s.replicas.erase(key);
  }
  return Result::Ok(removed);
}

uint64_t MemoryRepository::DatabaseTimeMs(Transaction&) {
  return util::ToUnixMillis(clock_->Now());
}

} // namespace reaper::db::memory
