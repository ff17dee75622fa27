#include "internal/config/reaper_options.hpp"

#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>

#include "config/config.pb.h"

namespace {

using reaper::config::ReaperOptions;
using reaper::runtime::config::ReaperConfig;

bool ThrowsInvalidArgument(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

void TestDefaults() {
  const auto options = ReaperOptions::FromConfig(ReaperConfig{});

  assert(!options.enable_immediate_cleanup);
  assert(options.db_batch_size == 50);
  assert(options.refresh_trigger_ratio == 80);
  assert(options.delay_seconds == 600);
  assert(options.chunk_size == 100);
  assert(options.DeletionChunkSize() == 100);
  assert(options.threads == 1);
  assert(options.sleep_time_seconds == 60);
  assert(!options.once);
  assert(options.rse_ids.empty());
  assert(options.max_clock_offset_seconds == 3610);
  assert(std::string(options.ModeName()) == "deferred");
}

void TestRefreshTriggerTimeIsRatioOfDelay() {
  ReaperOptions options;
  assert(options.RefreshTriggerTime() == std::chrono::milliseconds(480'000));

  options.delay_seconds         = 10;
  options.refresh_trigger_ratio = 33;
  assert(options.RefreshTriggerTime() == std::chrono::milliseconds(3'300));

  options.refresh_trigger_ratio = 100;
  assert(options.RefreshTriggerTime() == std::chrono::seconds(10));
}

void TestOverrides() {
  ReaperConfig config;
  config.set_enable_immediate_cleanup(true);
  config.set_db_batch_size(10);
  config.set_chunk_size(40);
  config.set_deletion_chunk_size(8);
  config.add_rse_ids("MOCK");
  config.set_threads(3);
  config.set_max_clock_offset_seconds(0);

  const auto options = ReaperOptions::FromConfig(config);
  assert(options.enable_immediate_cleanup);
  assert(std::string(options.ModeName()) == "immediate");
  assert(options.db_batch_size == 10);
  assert(options.chunk_size == 40);
  assert(options.DeletionChunkSize() == 8);
  assert(options.rse_ids.size() == 1 && options.rse_ids[0] == "MOCK");
  assert(options.threads == 3);
  assert(options.max_clock_offset_seconds == 0);
}

void TestValidationRejectsBadValues() {
  {
    ReaperConfig config;
    config.set_chunk_size(0);
    assert(ThrowsInvalidArgument([&] { ReaperOptions::FromConfig(config); }));
  }
  {
    ReaperConfig config;
    config.set_db_batch_size(0);
    assert(ThrowsInvalidArgument([&] { ReaperOptions::FromConfig(config); }));
  }
  {
    ReaperConfig config;
    config.set_refresh_trigger_ratio(0);
    assert(ThrowsInvalidArgument([&] { ReaperOptions::FromConfig(config); }));
  }
  {
    ReaperConfig config;
    config.set_refresh_trigger_ratio(101);
    assert(ThrowsInvalidArgument([&] { ReaperOptions::FromConfig(config); }));
  }
  {
    ReaperConfig config;
    config.set_delay_seconds(0);
    assert(ThrowsInvalidArgument([&] { ReaperOptions::FromConfig(config); }));
  }
  {
    ReaperConfig config;
    config.set_threads(0);
    assert(ThrowsInvalidArgument([&] { ReaperOptions::FromConfig(config); }));
  }

  ReaperConfig boundary;
  boundary.set_refresh_trigger_ratio(100);
  assert(!ThrowsInvalidArgument([&] { ReaperOptions::FromConfig(boundary); }));
}

} // namespace

int main() {
  TestDefaults();
  TestRefreshTriggerTimeIsRatioOfDelay();
  TestOverrides();
  TestValidationRejectsBadValues();

  std::cout << "replica_reaper_unit_reaper_options: pass\n";
  return 0;
}
