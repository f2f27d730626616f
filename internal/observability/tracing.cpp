#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/samplers/parent_factory.h>
#include <opentelemetry/sdk/trace/samplers/trace_id_ratio_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <cstdlib>
#include <mutex>
#include <utility>

#include "config/config.pb.h"

namespace recall::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {

constexpr const char* kTracerName    = "recall";
constexpr const char* kTracerVersion = "0.1.0";

std::mutex                                          g_tracer_mutex;
std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) return config.endpoint;
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT")) return endpoint;
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) return endpoint;
  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/traces" : "localhost:4317";
}

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveEndpoint(config);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

resource::Resource BuildResource(const OtlpConfig& config) {
  resource::ResourceAttributes attrs = {{"service.name", config.service_name}, {"service.version", kTracerVersion}};
  if (!config.storage_backend.empty()) attrs.SetAttribute("recall.storage", config.storage_backend);
  return resource::Resource::Create(attrs);
}

opentelemetry::nostd::shared_ptr<trace_api::Tracer> CurrentTracer() {
  std::scoped_lock lock(g_tracer_mutex);
  if (!g_tracer) {
    // Embedders may install their own provider without calling InitializeTracing.
    if (auto provider = trace_api::Provider::GetTracerProvider()) g_tracer = provider->GetTracer(kTracerName, kTracerVersion);
  }
  return g_tracer;
}

std::string StorageBackendName(const recall::runtime::config::DatabaseConfig& database) {
  if (database.has_postgres()) return "postgres";
  if (database.has_memory()) return "memory";
  return "sqlite";
}

} // namespace

bool InitializeTracing(const OtlpConfig& config) {
  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(config), sdktrace::BatchSpanProcessorOptions{});
  auto sampler   = sdktrace::ParentBasedSamplerFactory::Create(sdktrace::TraceIdRatioBasedSamplerFactory::Create(config.sample_ratio));
  auto provider  = sdktrace::TracerProviderFactory::Create(std::move(processor), BuildResource(config), std::move(sampler));

  std::scoped_lock lock(g_tracer_mutex);
  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer(kTracerName, kTracerVersion);
  return static_cast<bool>(g_tracer);
}

bool InitializeTracing(const recall::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint        = observability.otlp_endpoint();
  otlp_config.transport       = observability.transport() == recall::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf
                                                                                                    : OtlpTransport::kGrpc;
  otlp_config.sample_ratio    = observability.trace_sample_ratio();
  otlp_config.storage_backend = StorageBackendName(config.database());
  if (!observability.service_name().empty()) otlp_config.service_name = observability.service_name();
  return InitializeTracing(otlp_config);
}

void ShutdownTracing() {
  std::scoped_lock lock(g_tracer_mutex);
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
  }
  g_sdk_provider.reset();
  g_tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view name, std::string_view owner_id) : impl_(std::make_unique<Impl>()) {
  auto tracer = CurrentTracer();
  if (!tracer) return;

  impl_->span  = tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
  if (!owner_id.empty()) impl_->span->SetAttribute("recall.owner_id", std::string(owner_id));
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->span) impl_->span->End();
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->span) impl_->span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_ && impl_->span) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::SetAttribute(std::string_view key, double value) {
  if (impl_ && impl_->span) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_ && impl_->span) impl_->span->AddEvent(std::string(name));
}

void SpanScope::RecordException(std::string_view description) {
  if (!impl_ || !impl_->span) return;
  impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
}

void SpanScope::SetOutcome(std::string_view outcome) {
  if (impl_ && impl_->span) impl_->span->SetAttribute("recall.outcome", std::string(outcome));
}

} // namespace recall::observability

#endif
