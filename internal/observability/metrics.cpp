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
#include <mutex>
#include <unordered_map>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define RECALL_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define RECALL_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace recall::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

// Attribute values borrow; callers keep the viewed text alive until the instrument call returns.
opentelemetry::nostd::string_view Sv(std::string_view v) {
  return {v.data(), v.size()};
}
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

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

resource::Resource BuildResource(const OtlpConfig& config) {
  resource::ResourceAttributes attrs = {{"service.name", config.service_name}, {"service.version", "0.1.0"}};
  if (!config.storage_backend.empty()) attrs.SetAttribute("recall.storage", config.storage_backend);
  return resource::Resource::Create(attrs);
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

bool InstallMeterProvider(const OtlpConfig& config, std::chrono::milliseconds interval) {
  auto endpoint = ResolveEndpoint(config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = interval;
#ifdef RECALL_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  auto resource = BuildResource(config);
  g_provider    = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), resource);
  ConfigureResource(*g_provider, resource);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> decision_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      decision_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> job_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      job_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      retrieval_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   queue_depth_gauge;

  std::mutex                                    queue_depth_mutex;
  std::unordered_map<std::string, std::int64_t> queue_depth_values;
};

bool InitializeMetrics(const OtlpConfig& config) {
  return InstallMeterProvider(config, std::chrono::milliseconds(1000));
}

bool InitializeMetrics(const recall::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == recall::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  if (!observability.service_name().empty()) {
    otlp_config.service_name = observability.service_name();
  }
  otlp_config.storage_backend = config.database().has_postgres() ? "postgres" : config.database().has_memory() ? "memory" : "sqlite";

  const auto interval_ms = observability.metrics_export_interval_ms() > 0 ? observability.metrics_export_interval_ms() : 1000;
  return InstallMeterProvider(otlp_config, std::chrono::milliseconds(interval_ms));
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("recall", "0.1.0");

  impl_->decision_count       = impl_->meter->CreateUInt64Counter("recall.decision.count", "1", "Candidate facts applied, by operation and outcome");
  impl_->decision_latency_ms  = impl_->meter->CreateDoubleHistogram("recall.decision.latency_ms", "ms", "Per-candidate decision latency in milliseconds");
  impl_->job_count            = impl_->meter->CreateUInt64Counter("recall.job.count", "1", "Maintenance job executions");
  impl_->job_duration_ms      = impl_->meter->CreateDoubleHistogram("recall.job.duration_ms", "ms", "Maintenance job duration in milliseconds");
  impl_->retrieval_latency_ms = impl_->meter->CreateDoubleHistogram("recall.retrieval.latency_ms", "ms", "Context retrieval latency in milliseconds");
  impl_->queue_depth_gauge    = impl_->meter->CreateInt64ObservableGauge("recall.job.queue_depth", "Maintenance jobs by status", "1");
  impl_->queue_depth_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto*                       impl = static_cast<Impl*>(state);
        std::lock_guard<std::mutex> lock(impl->queue_depth_mutex);
        auto int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        for (const auto& [status, jobs] : impl->queue_depth_values) {
          const std::initializer_list<AttributePair> attributes = {{"status", status}};
          int_result->Observe(jobs, attributes);
        }
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordDecision(std::string_view operation, std::string_view outcome) {
  if (!impl_ || !impl_->decision_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"operation", Sv(operation)}, {"outcome", Sv(outcome)}};
  AddWithAttributes(impl_->decision_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveDecisionLatencyMs(std::string_view operation, double latency_ms) {
  if (!impl_ || !impl_->decision_latency_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"operation", Sv(operation)}};
  RecordWithAttributes(impl_->decision_latency_ms, latency_ms, attributes);
}

void Metrics::RecordJob(std::string_view job_type, bool success) {
  if (!impl_ || !impl_->job_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"job_type", Sv(job_type)}, {"success", success}};
  AddWithAttributes(impl_->job_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveJobDurationMs(std::string_view job_type, double duration_ms) {
  if (!impl_ || !impl_->job_duration_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"job_type", Sv(job_type)}};
  RecordWithAttributes(impl_->job_duration_ms, duration_ms, attributes);
}

void Metrics::ObserveRetrievalLatencyMs(std::string_view tier, double latency_ms) {
  if (!impl_ || !impl_->retrieval_latency_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"tier", Sv(tier)}};
  RecordWithAttributes(impl_->retrieval_latency_ms, latency_ms, attributes);
}

void Metrics::SetJobQueueDepth(std::string_view status, std::uint64_t jobs) {
  if (!impl_ || !impl_->queue_depth_gauge) {
    return;
  }

  std::lock_guard<std::mutex> lock(impl_->queue_depth_mutex);
  impl_->queue_depth_values[std::string(status)] = static_cast<std::int64_t>(jobs);
}

} // namespace recall::observability

#endif
