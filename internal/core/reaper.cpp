#include "reaper.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace reaper::core {

using observability::IntField;
using observability::ReaperCounter;
using observability::StringField;

namespace {

void PublishCounters(const std::string& rse_id, const RunStats& stats) {
  auto& metrics = observability::Metrics::Instance();
  metrics.Add(ReaperCounter::kDeleted, rse_id, stats.deleted);
  metrics.Add(ReaperCounter::kFailed, rse_id, stats.failed);
  metrics.Add(ReaperCounter::kRefreshFailures, rse_id, stats.refresh_failures);
  metrics.Add(ReaperCounter::kCommitFailures, rse_id, stats.commit_failures);
  metrics.Add(ReaperCounter::kLeaseLost, rse_id, stats.lease_lost);
}

void TakeReport(const model::BatchReport& report, RunStats& stats) {
  stats.deleted          = report.succeeded;
  stats.failed           = report.failed;
  stats.committed        = report.committed_immediately;
  stats.refresh_failures = report.failed_refreshes;
  stats.lease_lost       = report.lease_lost;
  stats.unprocessed      = report.unprocessed;
}

} // namespace

RunStats& RunStats::operator+=(const RunStats& other) {
  batches += other.batches;
  claimed += other.claimed;
  deleted += other.deleted;
  failed += other.failed;
  committed += other.committed;
  refresh_failures += other.refresh_failures;
  commit_failures += other.commit_failures;
  uncommitted += other.uncommitted;
  lease_lost += other.lease_lost;
  unprocessed += other.unprocessed;
  return *this;
}

Reaper::Reaper(std::shared_ptr<lease::LeaseStore> store, std::shared_ptr<storage::PhysicalDeleter> deleter,
               std::shared_ptr<const util::ClockSource> clock)
    : store_(store),
      selector_(store, clock),
      worker_(std::move(deleter), store, clock) {
}

RunStats Reaper::RunOnce(const config::ReaperOptions& options, const std::atomic<bool>* stop) {
  RunStats total;
  for (const auto& rse_id : options.rse_ids) {
    if (stop != nullptr && stop->load()) break;
    total += ReapRse(rse_id, options, stop);
  }
  return total;
}

RunStats Reaper::ReapRse(const std::string& rse_id, const config::ReaperOptions& options, const std::atomic<bool>* stop) {
  RunStats stats;

  auto batch = selector_.Select(rse_id, options);
  if (batch.empty()) {
    REAPER_LOG_DEBUG("no replicas to delete", {StringField("rse_id", rse_id)});
    return stats;
  }
  stats.batches = 1;
  stats.claimed = batch.size();

  try {
    auto report = worker_.Process(batch, options, stop);
    TakeReport(report, stats);

    if (!report.remainder.empty()) {
      stats.committed += CommitWithRetry(rse_id, report.remainder, 2, stats);
    }
  } catch (const util::CommitFailed& e) {
    TakeReport(e.report(), stats);
    ++stats.commit_failures;
    stats.committed = e.committed();
    // the worker's attempt was the first; retry once
    stats.committed += CommitWithRetry(rse_id, e.uncommitted(), 1, stats);
  }

  PublishCounters(rse_id, stats);
  return stats;
}

std::size_t Reaper::CommitWithRetry(const std::string& rse_id, const std::vector<model::ReplicaRef>& refs, int max_attempts,
                                    RunStats& stats) {
  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    auto result = store_->DeleteCatalogRows(refs);
    if (result.ok) {
      if (!result.lease_lost.empty()) {
        REAPER_LOG_ERROR("lease lost before commit", {StringField("rse_id", rse_id), IntField("expected", static_cast<int64_t>(refs.size())),
                                                      IntField("removed", static_cast<int64_t>(result.rows_removed))});
        stats.lease_lost += result.lease_lost.size();
      }
      return result.rows_removed;
    }

    ++stats.commit_failures;
    REAPER_LOG_ERROR("catalog cleanup failed", {StringField("rse_id", rse_id), IntField("attempt", attempt),
                                                IntField("rows", static_cast<int64_t>(refs.size())), StringField("error", result.error)});
  }

  stats.uncommitted += refs.size();
  return 0;
}

} // namespace reaper::core
