#include "reaper_daemon.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace reaper::runtime {

using observability::IntField;
using observability::StringField;

ReaperDaemon::ReaperDaemon(std::shared_ptr<core::Reaper> reaper, ::reaper::config::ReaperOptions options)
    : reaper_(std::move(reaper)),
      options_(std::move(options)) {
  if (!reaper_) {
    throw std::invalid_argument("ReaperDaemon requires a reaper");
  }
  options_.Validate();
}

ReaperDaemon::~ReaperDaemon() {
  Stop();
}

void ReaperDaemon::Start() {
  if (running_.exchange(true)) return;
  stop_requested_ = false;

  REAPER_LOG_INFO("reaper starting", {IntField("threads", options_.threads), IntField("rses", static_cast<int64_t>(options_.rse_ids.size())),
                                      StringField("mode", options_.ModeName())});
  for (std::size_t i = 0; i < options_.threads; ++i) {
    threads_.emplace_back(&ReaperDaemon::Run, this, i);
  }
}

void ReaperDaemon::RequestStop() {
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = true;
    running_        = false;
  }
  cv_.notify_all();
}

void ReaperDaemon::Stop() {
  RequestStop();

  if (threads_.empty()) return;
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
  REAPER_LOG_INFO("reaper stopped");
}

core::RunStats ReaperDaemon::RunOnce() {
  auto stats = reaper_->RunOnce(options_, &stop_requested_);
  {
    std::lock_guard lock(mutex_);
    totals_ += stats;
  }
  REAPER_LOG_INFO("reaper pass finished",
                  {IntField("batches", static_cast<int64_t>(stats.batches)), IntField("deleted", static_cast<int64_t>(stats.deleted)),
                   IntField("failed", static_cast<int64_t>(stats.failed)), IntField("committed", static_cast<int64_t>(stats.committed)),
                   IntField("uncommitted", static_cast<int64_t>(stats.uncommitted)), IntField("lease_lost", static_cast<int64_t>(stats.lease_lost)),
                   IntField("unprocessed", static_cast<int64_t>(stats.unprocessed))});
  return stats;
}

core::RunStats ReaperDaemon::Totals() const {
  std::lock_guard lock(mutex_);
  return totals_;
}

void ReaperDaemon::Run(std::size_t worker_number) {
  const auto sleep_time = std::chrono::seconds(options_.sleep_time_seconds);

  while (running_) {
    bool found_work = false;
    try {
      found_work = RunOnce().claimed > 0;
    } catch (const std::exception& e) {
      REAPER_LOG_ERROR("reaper pass failed", {IntField("worker", static_cast<int64_t>(worker_number)), StringField("error", e.what())});
    }

    if (found_work) continue;

    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, sleep_time, [this] { return !running_; });
  }
}

} // namespace reaper::runtime
