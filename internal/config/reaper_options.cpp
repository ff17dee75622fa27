#include "reaper_options.hpp"

#include <stdexcept>

#include "config/config.pb.h"

namespace reaper::config {

ReaperOptions ReaperOptions::FromConfig(const reaper::runtime::config::ReaperConfig& config) {
  ReaperOptions options;

  if (config.has_enable_immediate_cleanup()) options.enable_immediate_cleanup = config.enable_immediate_cleanup();
  if (config.has_db_batch_size()) options.db_batch_size = config.db_batch_size();
  if (config.has_refresh_trigger_ratio()) options.refresh_trigger_ratio = config.refresh_trigger_ratio();
  if (config.has_delay_seconds()) options.delay_seconds = config.delay_seconds();
  if (config.has_chunk_size()) options.chunk_size = config.chunk_size();
  if (config.has_deletion_chunk_size()) options.deletion_chunk_size = config.deletion_chunk_size();

  options.rse_ids.assign(config.rse_ids().begin(), config.rse_ids().end());
  if (config.has_threads()) options.threads = config.threads();
  if (config.has_sleep_time_seconds()) options.sleep_time_seconds = config.sleep_time_seconds();
  if (config.has_once()) options.once = config.once();
  if (config.has_max_clock_offset_seconds()) options.max_clock_offset_seconds = config.max_clock_offset_seconds();

  options.Validate();
  return options;
}

void ReaperOptions::Validate() const {
  if (chunk_size == 0) {
    throw std::invalid_argument("reaper.chunk_size must be greater than 0");
  }
  if (db_batch_size == 0) {
    throw std::invalid_argument("reaper.db_batch_size must be greater than 0");
  }
  if (refresh_trigger_ratio == 0 || refresh_trigger_ratio > 100) {
    throw std::invalid_argument("reaper.refresh_trigger_ratio must be in (0, 100]");
  }
  if (delay_seconds == 0) {
    throw std::invalid_argument("reaper.delay_seconds must be greater than 0");
  }
  if (threads == 0) {
    throw std::invalid_argument("reaper.threads must be greater than 0");
  }
}

std::chrono::milliseconds ReaperOptions::RefreshTriggerTime() const {
  // integer milliseconds: 80% of 600s is exactly 480000ms
  return std::chrono::milliseconds(static_cast<int64_t>(delay_seconds) * 1000 * refresh_trigger_ratio / 100);
}

} // namespace reaper::config
