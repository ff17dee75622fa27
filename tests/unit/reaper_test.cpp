#include "internal/core/reaper.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "test_support.hpp"

namespace {

using namespace std::chrono_literals;

using reaper::config::ReaperOptions;
using reaper::core::Reaper;
using reaper::core::ReplicaSelector;
using reaper::db::memory::MemoryRepository;
using reaper::lease::RepositoryLeaseStore;
using reaper::model::ReplicaState;
using reaper::testing::CountReplicas;
using reaper::testing::FakePhysicalDeleter;
using reaper::testing::ManualClock;
using reaper::testing::ReadReplica;
using reaper::testing::RecordingLeaseStore;
using reaper::testing::SeedReplicas;
using reaper::testing::SetReplicaState;

struct Fixture {
  std::shared_ptr<MemoryRepository>    repo    = std::make_shared<MemoryRepository>();
  std::shared_ptr<RecordingLeaseStore> store   = std::make_shared<RecordingLeaseStore>(std::make_shared<RepositoryLeaseStore>(repo));
  std::shared_ptr<ManualClock>         clock   = std::make_shared<ManualClock>();
  std::shared_ptr<FakePhysicalDeleter> deleter = std::make_shared<FakePhysicalDeleter>(clock);
  Reaper                               runner{store, deleter, clock};
};

ReaperOptions Options(bool immediate, std::vector<std::string> rse_ids = {"MOCK"}) {
  ReaperOptions options;
  options.enable_immediate_cleanup = immediate;
  options.rse_ids                  = std::move(rse_ids);
  options.chunk_size               = 100;
  options.deletion_chunk_size      = 15;
  options.db_batch_size            = 50;
  return options;
}

void TestDeferredPassEmptiesCatalog() {
  Fixture f;
  SeedReplicas(*f.repo, "MOCK", 30);

  auto stats = f.runner.RunOnce(Options(false));

  assert(stats.batches == 1);
  assert(stats.claimed == 30);
  assert(stats.deleted == 30);
  assert(stats.committed == 30);
  assert(stats.commit_failures == 0);
  assert(f.store->delete_calls.size() == 1);
  assert(CountReplicas(*f.repo, "MOCK") == 0);
}

void TestEveryConfiguredRseIsVisited() {
  Fixture f;
  SeedReplicas(*f.repo, "RSE-A", 5);
  SeedReplicas(*f.repo, "RSE-B", 7);
  SeedReplicas(*f.repo, "RSE-C", 3);

  auto stats = f.runner.RunOnce(Options(true, {"RSE-A", "RSE-B"}));

  assert(stats.batches == 2);
  assert(stats.committed == 12);
  assert(CountReplicas(*f.repo, "RSE-A") == 0);
  assert(CountReplicas(*f.repo, "RSE-B") == 0);
  assert(CountReplicas(*f.repo, "RSE-C") == 3);
}

void TestNothingToDoIsQuiet() {
  Fixture f;
  auto    stats = f.runner.RunOnce(Options(false));
  assert(stats.batches == 0);
  assert(stats.claimed == 0);
}

void TestDeferredCommitIsRetried() {
  Fixture f;
  SeedReplicas(*f.repo, "MOCK", 30);
  f.store->fail_next_deletes = 1;

  auto stats = f.runner.RunOnce(Options(false));

  assert(stats.commit_failures == 1);
  assert(stats.committed == 30);
  assert(stats.uncommitted == 0);
  assert(f.store->delete_calls.size() == 2);
  assert(CountReplicas(*f.repo, "MOCK") == 0);
}

void TestImmediateCommitFailureIsRetriedOnce() {
  Fixture f;
  SeedReplicas(*f.repo, "MOCK", 60);
  f.store->fail_next_deletes = 1;

  auto stats = f.runner.RunOnce(Options(true));

  assert(stats.commit_failures == 1);
  assert(stats.deleted == 60);
  assert(stats.committed == 60);
  assert(stats.uncommitted == 0);
  assert(CountReplicas(*f.repo, "MOCK") == 0);
}

void TestCommitFailureKeepsDeletionCounts() {
  Fixture f;
  auto    refs = SeedReplicas(*f.repo, "MOCK", 60);
  f.deleter->FailOn(refs[5]);
  f.store->fail_next_deletes = 1;

  auto stats = f.runner.RunOnce(Options(true));

  assert(stats.commit_failures == 1);
  assert(stats.deleted == 59);
  assert(stats.failed == 1);
  assert(stats.committed == 59);
  assert(CountReplicas(*f.repo, "MOCK") == 1);
  assert(ReadReplica(*f.repo, refs[5])->state == ReplicaState::kBeingDeleted);
}

void TestDeferredCommitCountsReassignedRowAsLeaseLost() {
  Fixture f;
  auto    refs = SeedReplicas(*f.repo, "MOCK", 10);
  f.deleter->OnDelete(refs[1], [&] { SetReplicaState(*f.repo, refs[1], ReplicaState::kAvailable); });

  auto stats = f.runner.RunOnce(Options(false));

  assert(stats.deleted == 10);
  assert(stats.committed == 9);
  assert(stats.lease_lost == 1);
  assert(stats.uncommitted == 0);
  assert(CountReplicas(*f.repo, "MOCK") == 1);
}

void TestStopSkipsRemainingRses() {
  Fixture f;
  auto    refs = SeedReplicas(*f.repo, "RSE-A", 5);
  SeedReplicas(*f.repo, "RSE-B", 5);

  std::atomic<bool> stop{false};
  f.deleter->OnDelete(refs[0], [&] { stop = true; });

  auto stats = f.runner.RunOnce(Options(true, {"RSE-A", "RSE-B"}), &stop);

  assert(stats.batches == 1);
  assert(stats.committed == 5);
  assert(CountReplicas(*f.repo, "RSE-A") == 0);
  assert(CountReplicas(*f.repo, "RSE-B") == 5);
}

// Physically deleted rows that never left the catalog come back after the
// lease expires; a second pass finds the files gone and commits them.
void TestUncommittedRowsSelfHealAfterDelay() {
  Fixture f;
  auto    refs               = SeedReplicas(*f.repo, "MOCK", 20);
  f.store->fail_next_deletes = 2;

  auto first = f.runner.RunOnce(Options(false));
  assert(first.commit_failures == 2);
  assert(first.committed == 0);
  assert(first.uncommitted == 20);
  assert(ReadReplica(*f.repo, refs[0])->state == ReplicaState::kBeingDeleted);

  assert(f.runner.RunOnce(Options(false)).claimed == 0);

  f.clock->Advance(600s + 1ms);
  auto second = f.runner.RunOnce(Options(false));
  assert(second.claimed == 20);
  assert(second.committed == 20);
  assert(CountReplicas(*f.repo, "MOCK") == 0);
}

void TestCrashedWorkerClaimsAreRecovered() {
  Fixture f;
  SeedReplicas(*f.repo, "MOCK", 12);

  ReplicaSelector crashed(f.store, f.clock);
  assert(crashed.Select("MOCK", 12, 600s).size() == 12);

  assert(f.runner.RunOnce(Options(true)).claimed == 0);

  f.clock->Advance(601s);
  auto stats = f.runner.RunOnce(Options(true));
  assert(stats.claimed == 12);
  assert(stats.committed == 12);
  assert(CountReplicas(*f.repo, "MOCK") == 0);
}

void TestFailedDeletionsAreRetriedNextPass() {
  Fixture f;
  auto    refs = SeedReplicas(*f.repo, "MOCK", 10);
  f.deleter->FailOn(refs[4]);

  auto first = f.runner.RunOnce(Options(true));
  assert(first.deleted == 9);
  assert(first.failed == 1);
  assert(CountReplicas(*f.repo, "MOCK") == 1);

  // the endpoint recovers, but the lease must lapse first
  auto healthy = std::make_shared<FakePhysicalDeleter>(f.clock);
  Reaper retry(f.store, healthy, f.clock);
  assert(retry.RunOnce(Options(true)).claimed == 0);

  f.clock->Advance(601s);
  auto second = retry.RunOnce(Options(true));
  assert(second.claimed == 1);
  assert(second.committed == 1);
  assert(CountReplicas(*f.repo, "MOCK") == 0);
}

} // namespace

int main() {
  TestDeferredPassEmptiesCatalog();
  TestEveryConfiguredRseIsVisited();
  TestNothingToDoIsQuiet();
  TestDeferredCommitIsRetried();
  TestImmediateCommitFailureIsRetriedOnce();
  TestCommitFailureKeepsDeletionCounts();
  TestDeferredCommitCountsReassignedRowAsLeaseLost();
  TestStopSkipsRemainingRses();
  TestUncommittedRowsSelfHealAfterDelay();
  TestCrashedWorkerClaimsAreRecovered();
  TestFailedDeletionsAreRetriedNextPass();

  std::cout << "replica_reaper_unit_reaper: pass\n";
  return 0;
}
