#include "internal/core/lease_refresher.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <vector>

#include "test_support.hpp"

namespace {

using namespace std::chrono_literals;

using reaper::core::LeaseRefresher;
using reaper::db::memory::MemoryRepository;
using reaper::lease::RepositoryLeaseStore;
using reaper::model::ReplicaState;
using reaper::testing::ManualClock;
using reaper::testing::ReadReplica;
using reaper::testing::RecordingLeaseStore;
using reaper::testing::SeedReplicas;
using reaper::testing::SetReplicaState;
using reaper::util::FromUnixMillis;

struct Fixture {
  std::shared_ptr<MemoryRepository>    repo  = std::make_shared<MemoryRepository>();
  std::shared_ptr<RecordingLeaseStore> store = std::make_shared<RecordingLeaseStore>(std::make_shared<RepositoryLeaseStore>(repo));
  std::shared_ptr<ManualClock>         clock = std::make_shared<ManualClock>();
  LeaseRefresher                       refresher{store, clock};
};

void TestTriggerBoundaryIsStrict() {
  assert(!LeaseRefresher::IsDue(480'000ms, 80, 600));
  assert(LeaseRefresher::IsDue(480'001ms, 80, 600));
  assert(!LeaseRefresher::IsDue(0ms, 100, 1));
  assert(LeaseRefresher::IsDue(1'001ms, 100, 1));
}

void TestNotDueDoesNothing() {
  Fixture f;
  auto    refs = SeedReplicas(*f.repo, "MOCK", 3, ReplicaState::kBeingDeleted, 1);

  assert(!f.refresher.MaybeRefresh("MOCK", 480'000ms, refs, 80, 600));
  assert(f.store->refresh_calls.empty());
  assert(f.refresher.Attempts() == 0);
}

void TestEmptyOutstandingDoesNothing() {
  Fixture f;
  assert(!f.refresher.MaybeRefresh("MOCK", 599'000ms, {}, 80, 600));
  assert(f.store->refresh_calls.empty());
}

void TestDueRefreshRestampsOnlyLeasedRows() {
  Fixture f;
  auto    leased = SeedReplicas(*f.repo, "MOCK", 3, ReplicaState::kBeingDeleted, 1);

  // a row another actor moved out of BEING_DELETED
  SetReplicaState(*f.repo, leased[2], ReplicaState::kAvailable);

  assert(f.refresher.MaybeRefresh("MOCK", 480'001ms, leased, 80, 600));
  assert(f.store->refresh_calls.size() == 1);
  assert(f.store->refresh_calls[0] == leased);

  const auto now = f.clock->Now();
  assert(f.store->GetUpdatedAt(leased[0]) == now);
  assert(f.store->GetUpdatedAt(leased[1]) == now);
  assert(f.store->GetUpdatedAt(leased[2]) == FromUnixMillis(1));
  assert(ReadReplica(*f.repo, leased[2])->state == ReplicaState::kAvailable);
}

void TestRefreshIsIdempotent() {
  Fixture f;
  auto    refs = SeedReplicas(*f.repo, "MOCK", 2, ReplicaState::kBeingDeleted, 1);

  assert(f.refresher.MaybeRefresh("MOCK", 500'000ms, refs, 80, 600));
  assert(f.refresher.MaybeRefresh("MOCK", 500'000ms, refs, 80, 600));

  assert(f.store->GetUpdatedAt(refs[0]) == f.clock->Now());
  assert(ReadReplica(*f.repo, refs[0])->state == ReplicaState::kBeingDeleted);
  assert(f.refresher.Attempts() == 2);
}

void TestStoreFailureIsReportedNotThrown() {
  Fixture f;
  auto    refs = SeedReplicas(*f.repo, "MOCK", 2, ReplicaState::kBeingDeleted, 1);
  f.store->fail_next_refreshes = 1;

  assert(!f.refresher.MaybeRefresh("MOCK", 500'000ms, refs, 80, 600));
  assert(f.refresher.Attempts() == 1);
  assert(f.refresher.Failures() == 1);
  assert(f.store->GetUpdatedAt(refs[0]) == FromUnixMillis(1));
}

void TestRefreshIgnoresOtherRse() {
  Fixture f;
  auto    refs = SeedReplicas(*f.repo, "OTHER", 1, ReplicaState::kBeingDeleted, 1);

  assert(f.refresher.MaybeRefresh("MOCK", 500'000ms, refs, 80, 600));
  assert(f.store->GetUpdatedAt(refs[0]) == FromUnixMillis(1));
}

void TestUnknownReplicaHasNoTimestamp() {
  Fixture f;
  assert(!f.store->GetUpdatedAt(reaper::testing::MakeRef("MOCK", 0)).has_value());
}

} // namespace

int main() {
  TestTriggerBoundaryIsStrict();
  TestNotDueDoesNothing();
  TestEmptyOutstandingDoesNothing();
  TestDueRefreshRestampsOnlyLeasedRows();
  TestRefreshIsIdempotent();
  TestStoreFailureIsReportedNotThrown();
  TestRefreshIgnoresOtherRse();
  TestUnknownReplicaHasNoTimestamp();

  std::cout << "replica_reaper_unit_lease_refresher: pass\n";
  return 0;
}
