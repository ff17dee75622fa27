#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace reaper::runtime::config {
class ReaperConfig;
}

namespace reaper::config {

/*
  Resolved reaper settings.

  Passed by value into every component call; nothing in the core reads
  process-wide configuration.
*/
struct ReaperOptions {
  static constexpr bool        kDefaultEnableImmediateCleanup = false;
  static constexpr std::size_t kDefaultDbBatchSize            = 50;
  static constexpr uint32_t    kDefaultRefreshTriggerRatio    = 80;
  static constexpr uint32_t    kDefaultDelaySeconds           = 600;
  static constexpr std::size_t kDefaultChunkSize              = 100;
  static constexpr uint32_t    kDefaultThreads                = 1;
  static constexpr uint32_t    kDefaultSleepTimeSeconds       = 60;
  static constexpr uint32_t    kDefaultMaxClockOffsetSeconds  = 3610;

  bool        enable_immediate_cleanup = kDefaultEnableImmediateCleanup;
  std::size_t db_batch_size            = kDefaultDbBatchSize;
  // percent of delay_seconds
  uint32_t    refresh_trigger_ratio    = kDefaultRefreshTriggerRatio;
  uint32_t    delay_seconds            = kDefaultDelaySeconds;
  std::size_t chunk_size               = kDefaultChunkSize;
  // 0 = reuse chunk_size
  std::size_t deletion_chunk_size      = 0;

  std::vector<std::string> rse_ids;
  uint32_t                 threads            = kDefaultThreads;
  uint32_t                 sleep_time_seconds = kDefaultSleepTimeSeconds;
  bool                     once               = false;

  // 0 disables the startup clock comparison
  uint32_t max_clock_offset_seconds = kDefaultMaxClockOffsetSeconds;

  static ReaperOptions FromConfig(const reaper::runtime::config::ReaperConfig& config);

  // Throws std::invalid_argument on the first violated constraint.
  void Validate() const;

  std::chrono::seconds Delay() const {
    return std::chrono::seconds(delay_seconds);
  }

  // refresh_trigger_ratio/100 * delay_seconds
  std::chrono::milliseconds RefreshTriggerTime() const;

  std::size_t DeletionChunkSize() const {
    return deletion_chunk_size == 0 ? chunk_size : deletion_chunk_size;
  }

  const char* ModeName() const {
    return enable_immediate_cleanup ? "immediate" : "deferred";
  }
};

} // namespace reaper::config
