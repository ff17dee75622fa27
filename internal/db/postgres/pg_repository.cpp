#include "pg_repository.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace reaper::db::postgres {

namespace {

constexpr int kAvailable    = static_cast<int>(model::ReplicaState::kAvailable);
constexpr int kBeingDeleted = static_cast<int>(model::ReplicaState::kBeingDeleted);

model::ReplicaRecord ReadRow(const pqxx::row& row) {
  model::ReplicaRecord r;
  r.key.scope     = row[0].c_str();
  r.key.name      = row[1].c_str();
  r.key.rse_id    = row[2].c_str();
  r.state         = static_cast<model::ReplicaState>(row[3].as<int>());
  r.bytes         = row[4].as<uint64_t>();
  r.path          = row[5].is_null() ? "" : row[5].c_str();
  r.updated_at_ms = row[6].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgConnectionPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::InsertReplica(Transaction& t, const model::ReplicaRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_replica", r.key.scope, r.key.name, r.key.rse_id, static_cast<int>(r.state), r.bytes,
                               r.path, r.updated_at_ms);
    return Result::Ok(1);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ReplicaRecord> PgRepository::GetReplica(Transaction& t, const model::ReplicaKey& key) {
  auto res = TX(t).Work().exec_prepared("get_replica", key.scope, key.name, key.rse_id);
  if (res.empty()) return std::nullopt;
  return ReadRow(res[0]);
}

std::vector<model::ReplicaRecord> PgRepository::ListReplicas(Transaction& t, const std::string& rse_id) {
  auto res = TX(t).Work().exec_prepared("list_replicas", rse_id);

  std::vector<model::ReplicaRecord> records;
  records.reserve(res.size());
  for (const auto& row : res) {
    records.push_back(ReadRow(row));
  }
  return records;
}

Result PgRepository::UpdateReplica(Transaction& t, const model::ReplicaRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_replica", r.key.scope, r.key.name, r.key.rse_id, static_cast<int>(r.state),
                                          r.bytes, r.path, r.updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, r.key.ToString());
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ReplicaRecord> PgRepository::ClaimReplicas(Transaction& t, const std::string& rse_id, std::size_t limit,
                                                              uint64_t now_ms, uint64_t lease_expired_before_ms) {
  std::vector<model::ReplicaRecord> claimed;
  if (limit == 0) return claimed;

  auto res = TX(t).Work().exec_prepared("claim_replicas", rse_id, kAvailable, kBeingDeleted, lease_expired_before_ms,
                                        static_cast<uint64_t>(limit), now_ms);
  claimed.reserve(res.size());
  for (const auto& row : res) {
    claimed.push_back(ReadRow(row));
  }
  // RETURNING has no ORDER BY
  std::sort(claimed.begin(), claimed.end(),
            [](const model::ReplicaRecord& a, const model::ReplicaRecord& b) { return a.key < b.key; });
  return claimed;
}

Result PgRepository::RefreshReplicas(Transaction& t, const std::string& rse_id, const std::vector<model::ReplicaKey>& keys,
                                     uint64_t now_ms) {
  try {
    uint64_t touched = 0;
    for (const auto& key : keys) {
      if (key.rse_id != rse_id) continue;
      auto res = TX(t).Work().exec_prepared("refresh_replica", key.scope, key.name, key.rse_id, now_ms, kBeingDeleted);
      touched += res.affected_rows();
    }
    return Result::Ok(touched);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteReplicas(Transaction& t, const std::vector<model::ReplicaKey>& keys,
                                    std::vector<model::ReplicaKey>& skipped) {
  try {
    uint64_t removed = 0;
    for (const auto& key : keys) {
      auto res = TX(t).Work().exec_prepared("delete_replica", key.scope, key.name, key.rse_id, kBeingDeleted);
      if (res.affected_rows() == 0) skipped.push_back(key);
      removed += res.affected_rows();
    }
    return Result::Ok(removed);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

uint64_t PgRepository::DatabaseTimeMs(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("select_now_ms");
  if (res.empty()) throw util::DatabaseError("postgres returned no server time");
  return res[0][0].as<uint64_t>();
}

} // namespace reaper::db::postgres
