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
#define ARTSCAN_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define ARTSCAN_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace artscan::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {
using Attribute  = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
using Attributes = std::initializer_list<Attribute>;
using Counter    = opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>;
using Histogram  = opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>;

std::shared_ptr<sdkmetrics::MeterProvider> g_meter_provider;

OtlpConfig MetricsExportConfig(const artscan::runtime::config::ObservabilityConfig& section) {
  OtlpConfig otlp;
  if (section.transport() == artscan::runtime::config::OTLP_TRANSPORT_HTTP) {
    otlp.transport = OtlpTransport::kHttpProtobuf;
  }
  if (section.collection_interval_ms() > 0) {
    otlp.collection_interval_ms = section.collection_interval_ms();
  }

  otlp.endpoint = section.otlp_endpoint();
  for (const char* var : {"OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (!otlp.endpoint.empty()) {
      break;
    }
    if (const char* value = std::getenv(var); value != nullptr) {
      otlp.endpoint = value;
    }
  }
  if (otlp.endpoint.empty()) {
    otlp.endpoint = otlp.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
  }
  return otlp;
}

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeMetricExporter(const OtlpConfig& otlp) {
  if (otlp.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions http;
    http.url = otlp.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(http);
  }
  otlp::OtlpGrpcMetricExporterOptions grpc_options;
  grpc_options.endpoint            = otlp.endpoint;
  grpc_options.use_ssl_credentials = !otlp.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(grpc_options);
}

std::unique_ptr<sdkmetrics::MetricReader> MakeReader(const OtlpConfig& otlp) {
  sdkmetrics::PeriodicExportingMetricReaderOptions options;
  options.export_interval_millis = std::chrono::milliseconds(otlp.collection_interval_ms);
#ifdef ARTSCAN_OTEL_METRIC_READER_FACTORY
  return sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeMetricExporter(otlp), options);
#else
  return std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(MakeMetricExporter(otlp), options);
#endif
}

// SDK releases disagree on AddMetricReader ownership and on the context argument.
template <typename Provider>
void AttachReader(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument>
void Increment(const opentelemetry::nostd::shared_ptr<Instrument>& counter, Attributes attributes) {
  if (!counter) {
    return;
  }
  const std::uint64_t one = 1;
  if constexpr (requires { counter->Add(one, attributes, opentelemetry::context::Context{}); }) {
    counter->Add(one, attributes, opentelemetry::context::Context{});
  } else {
    counter->Add(one, attributes);
  }
}

template <typename Instrument>
void Observe(const opentelemetry::nostd::shared_ptr<Instrument>& histogram, double value, Attributes attributes) {
  if (!histogram) {
    return;
  }
  if constexpr (requires { histogram->Record(value, attributes, opentelemetry::context::Context{}); }) {
    histogram->Record(value, attributes, opentelemetry::context::Context{});
  } else {
    histogram->Record(value, attributes);
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  Counter   requests;
  Histogram request_latency_ms;
  Counter   scan_outcomes;
  Counter   catalog_resolutions;
  Counter   catalog_conflicts;
};

bool InitializeMetrics(const artscan::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto otlp     = MetricsExportConfig(config.observability());
  auto       resource = opentelemetry::sdk::resource::Resource::Create({{"service.name", otlp.service_name}});
  g_meter_provider    = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), resource);
  AttachReader(g_meter_provider, MakeReader(otlp));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_meter_provider));
  return true;
}

void ShutdownMetrics() {
  if (!g_meter_provider) {
    return;
  }
  g_meter_provider->ForceFlush();
  g_meter_provider->Shutdown();
  g_meter_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto& meter = impl_->meter;
  meter       = metrics_api::Provider::GetMeterProvider()->GetMeter("artscan.pipeline", "0.1.0");

  impl_->requests            = meter->CreateUInt64Counter("artscan.request.count", "Service requests by route and success", "1");
  impl_->request_latency_ms  = meter->CreateDoubleHistogram("artscan.request.latency_ms", "Request latency", "ms");
  impl_->scan_outcomes       = meter->CreateUInt64Counter("artscan.scan.outcomes", "Scans by reported status", "1");
  impl_->catalog_resolutions = meter->CreateUInt64Counter("artscan.catalog.resolutions", "Auto-catalog requests by outcome", "1");
  impl_->catalog_conflicts   = meter->CreateUInt64Counter("artscan.catalog.conflicts", "Store conflicts retried by the coordinator", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  Increment(impl_->requests, {{"route", std::string(route)}, {"success", success}});
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  Observe(impl_->request_latency_ms, latency_ms, {{"route", std::string(route)}});
}

void Metrics::RecordScanOutcome(std::string_view status) {
  Increment(impl_->scan_outcomes, {{"status", std::string(status)}});
}

void Metrics::RecordCatalogCreation(bool created) {
  Increment(impl_->catalog_resolutions, {{"created", created}});
}

void Metrics::RecordCatalogConflict() {
  Increment(impl_->catalog_conflicts, {});
}

} // namespace artscan::observability

#endif
