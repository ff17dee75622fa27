#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "internal/config/reaper_options.hpp"
#include "internal/core/reaper.hpp"

namespace reaper::runtime {

/*
  Background workers running the reaper loop.

  Each thread is an independent reaper worker: threads share nothing but
  the lease store, exactly like separate processes would. A pass that
  claims nothing sleeps sleep_time_seconds; a pass that found work runs
  again immediately.

  A stop request reaches a running batch between sub-chunks: what was
  deleted so far is committed, the rest of the claim is left to lease
  expiry.
*/
class ReaperDaemon {
 public:
  ReaperDaemon(std::shared_ptr<core::Reaper> reaper, ::reaper::config::ReaperOptions options);
  ~ReaperDaemon();

  ReaperDaemon(const ReaperDaemon&)            = delete;
  ReaperDaemon& operator=(const ReaperDaemon&) = delete;

  void Start();

  // Signals the workers without waiting for them.
  void RequestStop();

  // RequestStop() and join.
  void Stop();

  // Single synchronous pass on the calling thread (once mode).
  core::RunStats RunOnce();

  core::RunStats Totals() const;

 private:
  void Run(std::size_t worker_number);

  std::shared_ptr<core::Reaper> reaper_;
  ::reaper::config::ReaperOptions         options_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
  std::atomic<bool>        stop_requested_{false};

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  core::RunStats          totals_;
};

} // namespace reaper::runtime
