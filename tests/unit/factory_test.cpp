#include "internal/factory.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "test_support.hpp"

namespace {

using namespace std::chrono_literals;

using reaper::db::memory::MemoryRepository;
using reaper::factory::CheckClockOffset;
using reaper::testing::ManualClock;

struct Clocks {
  std::shared_ptr<ManualClock>      local   = std::make_shared<ManualClock>();
  std::shared_ptr<ManualClock>      catalog = std::make_shared<ManualClock>();
  std::shared_ptr<MemoryRepository> repo    = std::make_shared<MemoryRepository>(catalog);
};

bool ThrowsRuntimeError(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestCatalogClockAheadWithinBound() {
  Clocks c;
  c.catalog->Advance(30s);
  assert(CheckClockOffset(*c.repo, *c.local, 3610s) == 30'000ms);
}

void TestCatalogClockBehindWithinBound() {
  Clocks c;
  c.local->Advance(45s);
  assert(CheckClockOffset(*c.repo, *c.local, 3610s) == -45'000ms);
}

void TestOffsetAtBoundIsAccepted() {
  Clocks c;
  c.catalog->Advance(3610s);
  assert(CheckClockOffset(*c.repo, *c.local, 3610s) == 3'610'000ms);
}

void TestOffsetBeyondBoundIsRejected() {
  Clocks c;
  c.local->Advance(2h);
  assert(ThrowsRuntimeError([&] { CheckClockOffset(*c.repo, *c.local, 3610s); }));

  Clocks ahead;
  ahead.catalog->Advance(3610s + 1ms);
  assert(ThrowsRuntimeError([&] { CheckClockOffset(*ahead.repo, *ahead.local, 3610s); }));
}

reaper::runtime::config::RuntimeConfig MemoryConfig() {
  reaper::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_memory();
  config.mutable_storage()->set_root_path((std::filesystem::temp_directory_path() / "replica_reaper_factory_tests").string());
  config.mutable_reaper()->add_rse_ids("MOCK");
  return config;
}

void TestBuildWiresMemoryCatalog() {
  auto app = reaper::factory::Build(MemoryConfig());
  assert(app.repository);
  assert(app.lease_store);
  assert(app.reaper);
  assert(app.daemon);
  assert(app.options.max_clock_offset_seconds == 3610);
}

void TestBuildRejectsMissingRses() {
  auto config = MemoryConfig();
  config.mutable_reaper()->clear_rse_ids();
  assert(ThrowsRuntimeError([&] { reaper::factory::Build(config); }));
}

} // namespace

int main() {
  TestCatalogClockAheadWithinBound();
  TestCatalogClockBehindWithinBound();
  TestOffsetAtBoundIsAccepted();
  TestOffsetBeyondBoundIsRejected();
  TestBuildWiresMemoryCatalog();
  TestBuildRejectsMissingRses();

  std::cout << "replica_reaper_unit_factory: pass\n";
  return 0;
}
