#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace reaper::runtime::config {
class RuntimeConfig;
}

namespace reaper::observability {

enum class ReaperCounter {
  kDeleted,
  kFailed,
  kRefreshFailures,
  kCommitFailures,
  kLeaseLost,
};

constexpr std::string_view CounterName(ReaperCounter counter) {
  switch (counter) {
    case ReaperCounter::kDeleted:
      return "reaper.replicas.deleted";
    case ReaperCounter::kFailed:
      return "reaper.replicas.failed";
    case ReaperCounter::kRefreshFailures:
      return "reaper.lease.refresh_failures";
    case ReaperCounter::kCommitFailures:
      return "reaper.catalog.commit_failures";
    case ReaperCounter::kLeaseLost:
      return "reaper.lease.lost";
  }
  return "reaper.unknown";
}

// Installs the OTLP/HTTP meter provider; false when metrics are disabled
// in config or the build has no OpenTelemetry.
bool InitializeMetrics(const reaper::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

class Metrics {
 public:
  static Metrics& Instance();

  void Add(ReaperCounter counter, std::string_view rse_id, std::uint64_t value);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const reaper::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() = default;

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::Add(ReaperCounter, std::string_view, std::uint64_t) {
}
#endif

} // namespace reaper::observability
