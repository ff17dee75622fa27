#pragma once

#include <chrono>
#include <memory>

#include "config/config.pb.h"

#include "internal/config/reaper_options.hpp"
#include "internal/core/reaper.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/lease/lease_store.hpp"
#include "internal/runtime/reaper_daemon.hpp"
#include "internal/storage/physical_deleter.hpp"
#include "internal/util/time.hpp"

namespace reaper::factory {

/*
  Application

  Owns all long-lived objects used by the daemon.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  config::ReaperOptions options;

  std::shared_ptr<db::Repository>           repository;
  std::shared_ptr<lease::LeaseStore>        lease_store;
  std::shared_ptr<storage::PhysicalDeleter> deleter;
  std::shared_ptr<core::Reaper>             reaper;
  std::unique_ptr<runtime::ReaperDaemon>    daemon;
};

/*
  BuildRepository

  Opens the configured catalog backend and applies its schema.
  This is the ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const reaper::runtime::config::DatabaseConfig& database);

/*
  CheckClockOffset

  Lease ages are computed from local time but compared against stamps
  written by every other worker, so all workers must agree with the
  catalog clock. Returns catalog time minus local time; throws
  std::runtime_error when its magnitude exceeds max_offset.
*/
std::chrono::milliseconds CheckClockOffset(db::Repository& repository, const util::ClockSource& local,
                                           std::chrono::seconds max_offset);

/*
  Build

  Composition root of the application.
*/
Application Build(const reaper::runtime::config::RuntimeConfig& config);

} // namespace reaper::factory
