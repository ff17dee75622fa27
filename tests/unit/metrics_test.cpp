#include "internal/observability/metrics.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <string_view>

#include "config/config.pb.h"

namespace {

using reaper::observability::CounterName;
using reaper::observability::Metrics;
using reaper::observability::ReaperCounter;

void TestCounterNamesAreDistinct() {
  assert(CounterName(ReaperCounter::kDeleted) == "reaper.replicas.deleted");
  assert(CounterName(ReaperCounter::kFailed) == "reaper.replicas.failed");
  assert(CounterName(ReaperCounter::kRefreshFailures) == "reaper.lease.refresh_failures");
  assert(CounterName(ReaperCounter::kCommitFailures) == "reaper.catalog.commit_failures");
  assert(CounterName(ReaperCounter::kLeaseLost) == "reaper.lease.lost");

  const std::set<std::string_view> names = {CounterName(ReaperCounter::kDeleted), CounterName(ReaperCounter::kFailed),
                                            CounterName(ReaperCounter::kRefreshFailures), CounterName(ReaperCounter::kCommitFailures),
                                            CounterName(ReaperCounter::kLeaseLost)};
  assert(names.size() == 5);
}

void TestDisabledMetricsStayOff() {
  reaper::runtime::config::RuntimeConfig config;
  config.mutable_metrics()->set_enabled(false);
  assert(!reaper::observability::InitializeMetrics(config));
  reaper::observability::ShutdownMetrics();
}

void TestAddWithoutExporterIsHarmless() {
  auto& metrics = Metrics::Instance();
  assert(&metrics == &Metrics::Instance());
  metrics.Add(ReaperCounter::kDeleted, "MOCK", 3);
  metrics.Add(ReaperCounter::kLeaseLost, "MOCK", 0);
  metrics.Add(ReaperCounter::kCommitFailures, "", 1);
}

} // namespace

int main() {
  TestCounterNamesAreDistinct();
  TestDisabledMetricsStayOff();
  TestAddWithoutExporterIsHarmless();

  std::cout << "replica_reaper_unit_metrics: pass\n";
  return 0;
}
