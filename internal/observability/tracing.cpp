#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <cstdlib>
#include <utility>

#include "config/config.pb.h"

namespace artscan::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

namespace {

struct TracingState {
  std::shared_ptr<sdktrace::TracerProvider>           provider;
  opentelemetry::nostd::shared_ptr<trace_api::Tracer> tracer;
};

TracingState& State() {
  static TracingState state;
  return state;
}

OtlpConfig FromRuntimeConfig(const artscan::runtime::config::RuntimeConfig& config) {
  const auto& section = config.observability();

  OtlpConfig otlp;
  otlp.endpoint = section.otlp_endpoint();
  if (section.transport() == artscan::runtime::config::OTLP_TRANSPORT_HTTP) {
    otlp.transport = OtlpTransport::kHttpProtobuf;
  }
  if (otlp.endpoint.empty()) {
    // Traces-specific variable wins over the shared one.
    for (const char* var : {"OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
      if (const char* value = std::getenv(var); value != nullptr && *value != '\0') {
        otlp.endpoint = value;
        break;
      }
    }
  }
  if (otlp.endpoint.empty()) {
    otlp.endpoint = otlp.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/traces" : "localhost:4317";
  }
  return otlp;
}

std::unique_ptr<sdktrace::SpanExporter> MakeSpanExporter(const OtlpConfig& otlp) {
  if (otlp.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions http;
    http.url = otlp.endpoint;
    return otlp::OtlpHttpExporterFactory::Create(http);
  }
  otlp::OtlpGrpcExporterOptions grpc_options;
  grpc_options.endpoint            = otlp.endpoint;
  grpc_options.use_ssl_credentials = !otlp.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(grpc_options);
}

} // namespace

bool InitializeTracing(const artscan::runtime::config::RuntimeConfig& config) {
  if (!config.observability().tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  const auto otlp      = FromRuntimeConfig(config);
  auto       processor = sdktrace::BatchSpanProcessorFactory::Create(MakeSpanExporter(otlp), sdktrace::BatchSpanProcessorOptions{});
  auto       resource  = opentelemetry::sdk::resource::Resource::Create({{"service.name", otlp.service_name}});

  auto& state    = State();
  state.provider = std::shared_ptr<sdktrace::TracerProvider>(sdktrace::TracerProviderFactory::Create(std::move(processor), resource));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(state.provider));
  state.tracer = state.provider->GetTracer("artscan.pipeline", "0.1.0");
  return static_cast<bool>(state.tracer);
}

void ShutdownTracing() {
  auto& state = State();
  if (state.provider) {
    state.provider->ForceFlush();
    state.provider->Shutdown();
    state.provider.reset();
  }
  state.tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;

  trace_api::Span* Live() const {
    return span ? span.get() : nullptr;
  }
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  const auto& tracer = State().tracer;
  if (tracer) {
    impl_->span  = tracer->StartSpan(std::string(name));
    impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
  }
}

SpanScope::~SpanScope() {
  if (impl_ != nullptr) {
    if (auto* span = impl_->Live()) {
      span->End();
    }
  }
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (auto* span = impl_ ? impl_->Live() : nullptr) {
    span->SetAttribute(std::string(key), std::string(value));
  }
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (auto* span = impl_ ? impl_->Live() : nullptr) {
    span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::SetAttribute(std::string_view key, double value) {
  if (auto* span = impl_ ? impl_->Live() : nullptr) {
    span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::AddEvent(std::string_view name) {
  if (auto* span = impl_ ? impl_->Live() : nullptr) {
    span->AddEvent(std::string(name));
  }
}

void SpanScope::RecordException(std::string_view description) {
  auto* span = impl_ ? impl_->Live() : nullptr;
  if (span == nullptr) {
    return;
  }
  const std::string message(description);
  span->AddEvent("exception", {{"exception.message", message}});
  span->SetStatus(trace_api::StatusCode::kError, message);
}

} // namespace artscan::observability

#endif
