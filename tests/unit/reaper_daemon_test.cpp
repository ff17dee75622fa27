#include "internal/runtime/reaper_daemon.hpp"

#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

#include "test_support.hpp"

namespace {

using namespace std::chrono_literals;

using reaper::config::ReaperOptions;
using reaper::core::Reaper;
using reaper::db::memory::MemoryRepository;
using reaper::lease::RepositoryLeaseStore;
using reaper::runtime::ReaperDaemon;
using reaper::testing::CountReplicas;
using reaper::testing::FakePhysicalDeleter;
using reaper::testing::ManualClock;
using reaper::testing::ReadReplica;
using reaper::testing::SeedReplicas;

struct Fixture {
  std::shared_ptr<MemoryRepository>     repo    = std::make_shared<MemoryRepository>();
  std::shared_ptr<RepositoryLeaseStore> store   = std::make_shared<RepositoryLeaseStore>(repo);
  std::shared_ptr<ManualClock>          clock   = std::make_shared<ManualClock>();
  std::shared_ptr<FakePhysicalDeleter>  deleter = std::make_shared<FakePhysicalDeleter>();
  std::shared_ptr<Reaper>               reaper  = std::make_shared<Reaper>(store, deleter, clock);
};

ReaperOptions DaemonOptions() {
  ReaperOptions options;
  options.rse_ids            = {"RSE-A", "RSE-B"};
  options.chunk_size         = 10;
  options.threads            = 2;
  options.sleep_time_seconds = 1;
  return options;
}

void TestInvalidOptionsAreRejected() {
  Fixture f;
  auto    options = DaemonOptions();
  options.threads = 0;

  bool threw = false;
  try {
    ReaperDaemon daemon(f.reaper, options);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestSinglePassAccumulatesTotals() {
  Fixture f;
  SeedReplicas(*f.repo, "RSE-A", 15);
  SeedReplicas(*f.repo, "RSE-B", 4);

  ReaperDaemon daemon(f.reaper, DaemonOptions());
  auto         first = daemon.RunOnce();
  assert(first.batches == 2);
  assert(first.committed == 14);

  auto second = daemon.RunOnce();
  assert(second.committed == 5);

  auto totals = daemon.Totals();
  assert(totals.batches == 3);
  assert(totals.committed == 19);
  assert(CountReplicas(*f.repo, "RSE-A") == 0);
}

void TestWorkersDrainCatalogAndStop() {
  Fixture f;
  SeedReplicas(*f.repo, "RSE-A", 60);
  SeedReplicas(*f.repo, "RSE-B", 45);

  ReaperDaemon daemon(f.reaper, DaemonOptions());
  daemon.Start();
  daemon.Start();

  const auto deadline = std::chrono::steady_clock::now() + 20s;
  while (CountReplicas(*f.repo, "RSE-A") + CountReplicas(*f.repo, "RSE-B") > 0) {
    assert(std::chrono::steady_clock::now() < deadline);
    std::this_thread::sleep_for(10ms);
  }

  daemon.Stop();
  daemon.Stop();

  const auto totals = daemon.Totals();
  assert(totals.committed == 105);
  assert(totals.uncommitted == 0);
  assert(f.deleter->Calls().size() == 105);
}

// Stop arrives while the third replica of a 40-replica claim is being
// deleted: the running sub-chunk is finished and committed, the rest stays
// leased for another worker once the lease expires.
void TestStopMidBatchCommitsFinishedSubChunk() {
  Fixture f;
  auto    refs = SeedReplicas(*f.repo, "RSE-A", 40);

  std::promise<void> reached;
  std::promise<void> release;
  auto               released = release.get_future().share();
  f.deleter->OnDelete(refs[2], [&reached, released] {
    reached.set_value();
    released.wait();
  });

  auto options                     = DaemonOptions();
  options.rse_ids                  = {"RSE-A"};
  options.threads                  = 1;
  options.chunk_size               = 40;
  options.deletion_chunk_size      = 5;
  options.db_batch_size            = 5;
  options.enable_immediate_cleanup = true;

  ReaperDaemon daemon(f.reaper, options);
  daemon.Start();
  reached.get_future().wait();
  daemon.RequestStop();
  release.set_value();
  daemon.Stop();

  const auto totals = daemon.Totals();
  assert(totals.claimed == 40);
  assert(totals.committed == 5);
  assert(totals.unprocessed == 35);
  assert(f.deleter->Calls().size() == 5);
  assert(CountReplicas(*f.repo, "RSE-A") == 35);
  for (std::size_t i = 5; i < 40; ++i) {
    assert(ReadReplica(*f.repo, refs[i])->state == reaper::model::ReplicaState::kBeingDeleted);
  }
}

void TestStopWithoutStartIsSafe() {
  Fixture      f;
  ReaperDaemon daemon(f.reaper, DaemonOptions());
  daemon.Stop();
}

} // namespace

int main() {
  TestInvalidOptionsAreRejected();
  TestSinglePassAccumulatesTotals();
  TestWorkersDrainCatalogAndStop();
  TestStopMidBatchCommitsFinishedSubChunk();
  TestStopWithoutStartIsSafe();

  std::cout << "replica_reaper_unit_reaper_daemon: pass\n";
  return 0;
}
