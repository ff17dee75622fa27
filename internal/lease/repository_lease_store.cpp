#include "repository_lease_store.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace reaper::lease {

namespace {

using observability::IntField;
using observability::StringField;

template <typename Fn>
auto WithConflictRetry(const char* operation, Fn&& fn) {
  for (int attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const util::TransactionConflict&) {
      if (attempt >= RepositoryLeaseStore::kMaxAttempts) throw;
      REAPER_LOG_DEBUG("lease store write conflict, retrying", {StringField("operation", operation), IntField("attempt", attempt)});
    }
  }
}

} // namespace

RepositoryLeaseStore::RepositoryLeaseStore(std::shared_ptr<db::Repository> repository)
    : repository_(std::move(repository)) {
}

model::Batch RepositoryLeaseStore::ClaimBatch(const std::string& rse_id, std::size_t chunk_size, util::TimePoint now,
                                              std::chrono::seconds delay) {
  const auto now_ms           = util::ToUnixMillis(now);
  const auto delay_ms         = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(delay).count());
  const auto expired_before   = now_ms > delay_ms ? now_ms - delay_ms : 0;

  auto records = WithConflictRetry("claim", [&] {
    auto tx      = repository_->Begin();
    auto claimed = repository_->ClaimReplicas(*tx, rse_id, chunk_size, now_ms, expired_before);
    tx->Commit();
    return claimed;
  });

  model::Batch batch;
  batch.rse_id     = rse_id;
  batch.claimed_at = now;
  batch.replicas.reserve(records.size());
  for (const auto& record : records) {
    batch.replicas.push_back(db::model::ToReplica(record));
  }
  return batch;
}

bool RepositoryLeaseStore::Refresh(const std::string& rse_id, const std::vector<model::ReplicaRef>& refs,
                                   util::TimePoint now) {
  try {
    auto result = WithConflictRetry("refresh", [&] {
      auto tx = repository_->Begin();
      auto r  = repository_->RefreshReplicas(*tx, rse_id, refs, util::ToUnixMillis(now));
      if (r) tx->Commit();
      return r;
    });

    if (!result) {
      REAPER_LOG_WARN("lease refresh rejected by catalog",
                      {StringField("rse_id", rse_id), StringField("code", db::ToString(result.code)), StringField("error", result.message)});
      return false;
    }

    REAPER_LOG_DEBUG("lease refresh applied", {StringField("rse_id", rse_id), IntField("requested", static_cast<int64_t>(refs.size())),
                                               IntField("restamped", static_cast<int64_t>(result.rows_affected))});
    return true;
  } catch (const std::exception& e) {
    REAPER_LOG_WARN("lease refresh failed", {StringField("rse_id", rse_id), StringField("error", e.what())});
    return false;
  }
}

CatalogDeleteResult RepositoryLeaseStore::DeleteCatalogRows(const std::vector<model::ReplicaRef>& refs) {
  CatalogDeleteResult out;
  if (refs.empty()) {
    out.ok = true;
    return out;
  }

  try {
    std::vector<model::ReplicaRef> skipped;
    auto                           result = WithConflictRetry("delete", [&] {
      skipped.clear();
      auto tx = repository_->Begin();
      auto r  = repository_->DeleteReplicas(*tx, refs, skipped);
      if (r) tx->Commit();
      return r;
    });

    out.ok           = static_cast<bool>(result);
    out.rows_removed = result.rows_affected;
    if (result) {
      out.lease_lost = std::move(skipped);
    } else {
      out.error = std::string(db::ToString(result.code)) + ": " + result.message;
    }
  } catch (const std::exception& e) {
    out.ok    = false;
    out.error = e.what();
  }
  return out;
}

std::optional<util::TimePoint> RepositoryLeaseStore::GetUpdatedAt(const model::ReplicaRef& ref) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetReplica(*tx, ref);
  tx->Commit();
  if (!record) return std::nullopt;
  return util::FromUnixMillis(record->updated_at_ms);
}

} // namespace reaper::lease
