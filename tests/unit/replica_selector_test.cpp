#include "internal/core/replica_selector.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using reaper::core::ReplicaSelector;
using reaper::db::memory::MemoryRepository;
using reaper::lease::RepositoryLeaseStore;
using reaper::model::ReplicaRef;
using reaper::model::ReplicaState;
using reaper::testing::ManualClock;
using reaper::testing::ReadReplica;
using reaper::testing::SeedReplicas;

struct Fixture {
  std::shared_ptr<MemoryRepository>     repo  = std::make_shared<MemoryRepository>();
  std::shared_ptr<RepositoryLeaseStore> store = std::make_shared<RepositoryLeaseStore>(repo);
  std::shared_ptr<ManualClock>          clock = std::make_shared<ManualClock>();
  ReplicaSelector                       selector{store, clock};
};

void TestBatchIsBoundedByChunkSize() {
  Fixture f;
  SeedReplicas(*f.repo, "MOCK", 25);

  auto batch = f.selector.Select("MOCK", 10, std::chrono::seconds(600));
  assert(batch.size() == 10);
  assert(batch.rse_id == "MOCK");
  assert(batch.claimed_at == f.clock->Now());

  for (const auto& replica : batch.replicas) {
    auto record = ReadReplica(*f.repo, replica.ref);
    assert(record->state == ReplicaState::kBeingDeleted);
    assert(record->updated_at_ms == reaper::util::ToUnixMillis(f.clock->Now()));
  }
}

void TestNoEligibleReplicasYieldsEmptyBatch() {
  Fixture f;
  SeedReplicas(*f.repo, "MOCK", 3, ReplicaState::kBad);

  auto batch = f.selector.Select("MOCK", 10, std::chrono::seconds(600));
  assert(batch.empty());
  assert(f.selector.Select("UNKNOWN", 10, std::chrono::seconds(600)).empty());
}

void TestZeroChunkSizeIsRejected() {
  Fixture f;
  bool    threw = false;
  try {
    (void)f.selector.Select("MOCK", 0, std::chrono::seconds(600));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestSuccessiveSelectsAreDisjoint() {
  Fixture f;
  SeedReplicas(*f.repo, "MOCK", 30);

  auto first  = f.selector.Select("MOCK", 20, std::chrono::seconds(600));
  auto second = f.selector.Select("MOCK", 20, std::chrono::seconds(600));
  assert(first.size() == 20);
  assert(second.size() == 10);

  std::set<ReplicaRef> refs;
  for (const auto& r : first.replicas) refs.insert(r.ref);
  for (const auto& r : second.replicas) assert(!refs.contains(r.ref));
}

void TestConcurrentSelectorsNeverDoubleClaim() {
  Fixture f;
  SeedReplicas(*f.repo, "MOCK", 200);

  std::mutex              mutex;
  std::vector<ReplicaRef> claimed;

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&] {
      ReplicaSelector selector(f.store, f.clock);
      for (;;) {
        reaper::model::Batch batch;
        try {
          batch = selector.Select("MOCK", 9, std::chrono::seconds(600));
        } catch (const reaper::util::TransactionConflict&) {
          continue;
        }
        if (batch.empty()) return;
        std::lock_guard lock(mutex);
        for (const auto& r : batch.replicas) claimed.push_back(r.ref);
      }
    });
  }
  for (auto& thread : threads) thread.join();

  std::set<ReplicaRef> unique(claimed.begin(), claimed.end());
  assert(claimed.size() == 200);
  assert(unique.size() == 200);
}

void TestExpiredLeaseIsReclaimed() {
  Fixture f;
  SeedReplicas(*f.repo, "MOCK", 5);

  // a worker claims and then disappears
  auto crashed = f.selector.Select("MOCK", 5, std::chrono::seconds(600));
  assert(crashed.size() == 5);

  f.clock->Advance(std::chrono::seconds(600));
  assert(f.selector.Select("MOCK", 5, std::chrono::seconds(600)).empty());

  f.clock->Advance(std::chrono::milliseconds(1));
  auto reclaimed = f.selector.Select("MOCK", 5, std::chrono::seconds(600));
  assert(reclaimed.size() == 5);
  assert(reclaimed.claimed_at == f.clock->Now());
}

} // namespace

int main() {
  TestBatchIsBoundedByChunkSize();
  TestNoEligibleReplicasYieldsEmptyBatch();
  TestZeroChunkSizeIsRejected();
  TestSuccessiveSelectsAreDisjoint();
  TestConcurrentSelectorsNeverDoubleClaim();
  TestExpiredLeaseIsReclaimed();

  std::cout << "replica_reaper_unit_replica_selector: pass\n";
  return 0;
}
