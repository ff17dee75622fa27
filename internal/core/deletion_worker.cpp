#include "deletion_worker.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

#include "internal/core/cleanup_committer.hpp"
#include "internal/core/lease_refresher.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace reaper::core {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

void Advance(model::DeletionOutcome& outcome, model::BatchReplicaState to) {
  if (!model::CanTransition(outcome.state, to)) {
    throw std::logic_error("invalid replica transition " + std::string(model::ToString(outcome.state)) + " -> " +
                           std::string(model::ToString(to)) + " for " + outcome.ref.ToString());
  }
  outcome.state = to;
}

int64_t Count(std::size_t n) {
  return static_cast<int64_t>(n);
}

/*
  Moves every succeeded outcome to its final state once the committer is
  done: rows the catalog delete skipped lost their lease, the others are
  committed if the committer removed them. Deferred successes stay
  DELETE_SUCCEEDED for the caller to commit.
*/
void SettleOutcomes(model::BatchReport& report, const CleanupCommitter& committer) {
  const auto&                       progress = committer.Progress();
  const std::set<model::ReplicaRef> lost(progress.lease_lost.begin(), progress.lease_lost.end());
  const std::set<model::ReplicaRef> pending(progress.pending.begin(), progress.pending.end());

  for (auto& outcome : report.outcomes) {
    if (outcome.state != model::BatchReplicaState::kDeleteSucceeded) continue;

    if (lost.contains(outcome.ref)) {
      if (model::IsInvariantViolation(outcome.state, model::BatchReplicaState::kLeaseExpired)) {
        REAPER_LOG_ERROR("replica deleted after its lease expired, catalog row kept",
                         {StringField("rse_id", report.rse_id), StringField("replica", outcome.ref.ToString())});
      }
      Advance(outcome, model::BatchReplicaState::kLeaseExpired);
    } else if (committer.Immediate() && !pending.contains(outcome.ref)) {
      Advance(outcome, model::BatchReplicaState::kCommitted);
    }
  }

  report.commit_sizes          = progress.commit_sizes;
  report.final_flush_size      = committer.FinalFlushSize();
  report.committed_immediately = progress.committed;
  report.lease_lost            = progress.lease_lost.size();
}

} // namespace

DeletionWorker::DeletionWorker(std::shared_ptr<storage::PhysicalDeleter> deleter, std::shared_ptr<lease::LeaseStore> store,
                               std::shared_ptr<const util::ClockSource> clock)
    : deleter_(std::move(deleter)),
      store_(std::move(store)),
      clock_(std::move(clock)) {
  if (!deleter_ || !store_ || !clock_) {
    throw std::invalid_argument("DeletionWorker requires a deleter, a lease store and a clock");
  }
}

model::DeletionOutcome DeletionWorker::DeleteOne(const model::Replica& replica) {
  model::DeletionOutcome outcome;
  outcome.ref = replica.ref;

  try {
    outcome.succeeded = deleter_->Delete(replica);
    if (!outcome.succeeded) outcome.error = "endpoint reported failure";
  } catch (const std::exception& e) {
    outcome.succeeded = false;
    outcome.error     = e.what();
  }

  Advance(outcome, outcome.succeeded ? model::BatchReplicaState::kDeleteSucceeded : model::BatchReplicaState::kDeleteFailed);
  if (!outcome.succeeded) {
    REAPER_LOG_WARN("replica deletion failed, left leased for retry",
                    {StringField("replica", replica.ref.ToString()), StringField("error", outcome.error)});
  }
  return outcome;
}

model::BatchReport DeletionWorker::Process(const model::Batch& batch, const config::ReaperOptions& options,
                                           const std::atomic<bool>* stop) {
  options.Validate();

  model::BatchReport report;
  report.rse_id = batch.rse_id;
  report.outcomes.reserve(batch.size());

  REAPER_LOG_INFO("batch started",
                  {StringField("rse_id", batch.rse_id), StringField("mode", options.ModeName()), IntField("replicas", Count(batch.size())),
                   IntField("chunk_size", Count(options.chunk_size)), IntField("deletion_chunk_size", Count(options.DeletionChunkSize())),
                   IntField("db_batch_size", Count(options.db_batch_size)), IntField("delay_seconds", options.delay_seconds),
                   IntField("refresh_trigger_ratio", options.refresh_trigger_ratio),
                   IntField("refresh_trigger_ms", options.RefreshTriggerTime().count())});

  auto committer = MakeCleanupCommitter(options, store_);
  LeaseRefresher refresher(store_, clock_);

  const std::size_t unit        = options.DeletionChunkSize();
  util::TimePoint   lease_stamp = batch.claimed_at;

  try {
    for (std::size_t begin = 0; begin < batch.size(); begin += unit) {
      const std::size_t end = std::min(begin + unit, batch.size());

      std::vector<model::ReplicaRef> successes;
      for (std::size_t i = begin; i < end; ++i) {
        auto outcome = DeleteOne(batch.replicas[i]);
        if (outcome.succeeded) {
          successes.push_back(outcome.ref);
          ++report.succeeded;
        } else {
          ++report.failed;
        }
        report.outcomes.push_back(std::move(outcome));
        ++report.processed;
      }

      report.committed_immediately += committer->Commit(successes);

      std::vector<model::ReplicaRef> outstanding;
      outstanding.reserve(batch.size() - end);
      for (std::size_t i = end; i < batch.size(); ++i) {
        outstanding.push_back(batch.replicas[i].ref);
      }

      if (stop != nullptr && stop->load() && end < batch.size()) {
        report.unprocessed = batch.size() - end;
        REAPER_LOG_INFO("stop requested, leaving unprocessed replicas to lease expiry",
                        {StringField("rse_id", batch.rse_id), IntField("processed", Count(report.processed)),
                         IntField("unprocessed", Count(report.unprocessed))});
        break;
      }

      const auto now     = clock_->Now();
      const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - lease_stamp);
      if (refresher.MaybeRefresh(batch.rse_id, elapsed, outstanding, options)) {
        lease_stamp = now;
      }
    }

    report.remainder = committer->Finish();
  } catch (const util::CommitFailed& e) {
    report.unprocessed      = batch.size() - report.processed;
    report.refreshes        = refresher.Attempts() - refresher.Failures();
    report.failed_refreshes = refresher.Failures();
    SettleOutcomes(report, *committer);
    REAPER_LOG_ERROR("batch aborted on commit failure",
                     {StringField("rse_id", batch.rse_id), IntField("processed", Count(report.processed)),
                      IntField("committed", Count(e.committed())), IntField("uncommitted", Count(e.uncommitted().size())),
                      IntField("unprocessed", Count(report.unprocessed))});
    throw util::CommitFailed(e.what(), e.committed(), e.uncommitted(), std::move(report));
  }

  report.refreshes        = refresher.Attempts() - refresher.Failures();
  report.failed_refreshes = refresher.Failures();
  SettleOutcomes(report, *committer);

  REAPER_LOG_INFO("batch finished",
                  {StringField("rse_id", batch.rse_id), StringField("mode", options.ModeName()), IntField("processed", Count(report.processed)),
                   IntField("succeeded", Count(report.succeeded)), IntField("failed", Count(report.failed)),
                   IntField("immediate_cleanup", Count(report.committed_immediately)), IntField("lease_lost", Count(report.lease_lost)),
                   IntField("remainder", Count(report.remainder.size())), IntField("unprocessed", Count(report.unprocessed)),
                   IntField("refreshes", Count(report.refreshes)), BoolField("refresh_failures", report.failed_refreshes > 0)});
  return report;
}

} // namespace reaper::core
