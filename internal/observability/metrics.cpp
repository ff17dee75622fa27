#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <array>
#include <chrono>
#include <cstdlib>
#include <string>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define REAPER_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"

namespace reaper::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

constexpr std::array kCounters = {ReaperCounter::kDeleted, ReaperCounter::kFailed, ReaperCounter::kRefreshFailures,
                                  ReaperCounter::kCommitFailures, ReaperCounter::kLeaseLost};

constexpr const char* kCounterHelp[] = {
    "Replicas physically deleted",
    "Replica deletions that failed and were left leased",
    "Lease refreshes the catalog did not apply",
    "Catalog delete calls that failed",
    "Replicas deleted after their lease had lapsed",
};

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const reaper::runtime::config::MetricsConfig& config) {
  if (!config.otlp_endpoint().empty()) return config.otlp_endpoint();
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) return endpoint;
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) return std::string(endpoint) + "/v1/metrics";
  return "http://localhost:4318/v1/metrics";
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const Instrument& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  using CounterPtr = decltype(std::declval<metrics_api::Meter&>().CreateUInt64Counter(opentelemetry::nostd::string_view{}));

  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;
  std::array<CounterPtr, kCounters.size()>             counters;
};

bool InitializeMetrics(const reaper::runtime::config::RuntimeConfig& config) {
  const auto& metrics = config.metrics();
  if (!metrics.enabled()) {
    ShutdownMetrics();
    return false;
  }

  otlp::OtlpHttpMetricExporterOptions exporter_options;
  exporter_options.url = ResolveEndpoint(metrics);
  auto exporter        = otlp::OtlpHttpMetricExporterFactory::Create(exporter_options);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis =
      std::chrono::milliseconds(metrics.export_interval_ms() > 0 ? metrics.export_interval_ms() : 10000);
#ifdef REAPER_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  resource::ResourceAttributes attrs = {{"service.name", "replica-reaper"}};
  auto                         res   = resource::Resource::Create(attrs);
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), res);
  AddMetricReaderCompat(g_provider, std::move(reader));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  REAPER_LOG_INFO("metrics export enabled", {StringField("endpoint", exporter_options.url)});
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter("replica-reaper", "0.1.0");
  for (std::size_t i = 0; i < kCounters.size(); ++i) {
    const auto name    = CounterName(kCounters[i]);
    impl_->counters[i] = impl_->meter->CreateUInt64Counter(opentelemetry::nostd::string_view(name.data(), name.size()),
                                                           kCounterHelp[i], "1");
  }
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::Add(ReaperCounter counter, std::string_view rse_id, std::uint64_t value) {
  if (value == 0 || !impl_) return;

  const auto& instrument = impl_->counters[static_cast<std::size_t>(counter)];
  if (!instrument) return;

  const std::initializer_list<AttributePair> attributes = {{"rse_id", opentelemetry::nostd::string_view(rse_id.data(), rse_id.size())}};
  AddWithAttributes(instrument, value, attributes);
}

} // namespace reaper::observability

#endif
