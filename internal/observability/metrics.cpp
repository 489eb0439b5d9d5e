#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define TRACELENS_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define TRACELENS_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace tracelens::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

constexpr std::uint32_t kDefaultCollectionIntervalMs = 1000;

struct MetricsOptions {
  bool analysis_metrics_enabled{true};
  bool latency_histograms_enabled{true};
  bool finding_metrics_enabled{true};
  bool cache_metrics_enabled{true};
};

MetricsOptions g_metrics_options;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveEndpoint(config);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

template <typename Provider>
void ConfigureResource(Provider& provider, const resource::Resource& res) {
  if constexpr (requires { provider.SetResource(res); }) {
    provider.SetResource(res);
  }
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
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> analysis_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      analysis_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> finding_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> cache_lookups;
};

bool InitializeMetrics(const tracelens::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == tracelens::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  if (!observability.service_name().empty()) {
    otlp_config.service_name = observability.service_name();
  }

  const auto&                                      metric_config = observability.metrics();
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis =
      std::chrono::milliseconds(metric_config.collection_interval_ms() > 0 ? metric_config.collection_interval_ms() : kDefaultCollectionIntervalMs);
  if (metric_config.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(metric_config.export_timeout_ms());
  }

#ifdef TRACELENS_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(otlp_config), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(BuildExporter(otlp_config), reader_options);
#endif

  resource::ResourceAttributes attrs    = {{"service.name", otlp_config.service_name}};
  auto                         resource = resource::Resource::Create(attrs);
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), resource);
  ConfigureResource(*g_provider, resource);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  g_metrics_options.analysis_metrics_enabled   = metric_config.analysis_metrics_enabled();
  g_metrics_options.latency_histograms_enabled = metric_config.latency_histograms_enabled();
  g_metrics_options.finding_metrics_enabled    = metric_config.finding_metrics_enabled();
  g_metrics_options.cache_metrics_enabled      = metric_config.cache_metrics_enabled();
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

// ------------------------------------------------------------
// Instruments
// ------------------------------------------------------------

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("tracelens", "0.1.0");

  impl_->analysis_count      = impl_->meter->CreateUInt64Counter("tracelens.analysis.count", "Completed analyses by operation and outcome", "1");
  impl_->analysis_latency_ms = impl_->meter->CreateDoubleHistogram("tracelens.analysis.latency_ms", "End-to-end analysis latency in milliseconds", "ms");
  impl_->finding_count       = impl_->meter->CreateUInt64Counter("tracelens.findings.count", "Findings emitted by kind", "1");
  impl_->cache_lookups       = impl_->meter->CreateUInt64Counter("tracelens.cache.lookups", "Cache lookups by cache and result", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordAnalysis(std::string_view operation, bool success) {
  if (!impl_ || !impl_->analysis_count || !g_metrics_options.analysis_metrics_enabled) {
    return;
  }

  const std::string                          label(operation);
  const std::initializer_list<AttributePair> attributes = {{"operation", label}, {"success", success}};
  AddWithAttributes(impl_->analysis_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveAnalysisLatencyMs(std::string_view operation, double latency_ms) {
  if (!impl_ || !impl_->analysis_latency_ms || !g_metrics_options.analysis_metrics_enabled || !g_metrics_options.latency_histograms_enabled) {
    return;
  }

  const std::string                          label(operation);
  const std::initializer_list<AttributePair> attributes = {{"operation", label}};
  RecordWithAttributes(impl_->analysis_latency_ms, latency_ms, attributes);
}

void Metrics::RecordFindings(std::string_view kind, std::uint64_t count) {
  if (!impl_ || !impl_->finding_count || !g_metrics_options.finding_metrics_enabled || count == 0) {
    return;
  }

  const std::string                          label(kind);
  const std::initializer_list<AttributePair> attributes = {{"kind", label}};
  AddWithAttributes(impl_->finding_count, count, attributes);
}

void Metrics::RecordCacheLookup(std::string_view cache, bool hit) {
  if (!impl_ || !impl_->cache_lookups || !g_metrics_options.cache_metrics_enabled) {
    return;
  }

  const std::string                          label(cache);
  const std::initializer_list<AttributePair> attributes = {{"cache", label}, {"hit", hit}};
  AddWithAttributes(impl_->cache_lookups, static_cast<std::uint64_t>(1), attributes);
}

} // namespace tracelens::observability

#endif
