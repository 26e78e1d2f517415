#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define FLOWLOCK_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define FLOWLOCK_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "flowlock/config/v1/config.pb.h"

namespace flowlock::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const flowlock::config::v1::RuntimeConfig& config) {
  if (!config.telemetry().otlp_endpoint().empty()) {
    return config.telemetry().otlp_endpoint();
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }
  return "localhost:4317";
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

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> transition_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> retry_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> audit_failure_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      lock_wait_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      transaction_ms;
};

bool InitializeMetrics(const flowlock::config::v1::RuntimeConfig& config) {
  if (!config.telemetry().enabled()) {
    ShutdownMetrics();
    return false;
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint = ResolveEndpoint(config);
  auto exporter    = otlp::OtlpGrpcMetricExporterFactory::Create(options);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(1000);
#ifdef FLOWLOCK_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  resource::ResourceAttributes attrs = {{"service.name", config.telemetry().service_name()}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
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
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("flowlock", "0.1.0");

  impl_->transition_count    = impl_->meter->CreateUInt64Counter("flowlock.transition.count", "Workflow mutations by outcome", "1");
  impl_->retry_count         = impl_->meter->CreateUInt64Counter("flowlock.retry.count", "Retried attempts by error kind", "1");
  impl_->audit_failure_count = impl_->meter->CreateUInt64Counter("flowlock.audit.write_failures", "Audit rows that could not be written", "1");
  impl_->lock_wait_ms        = impl_->meter->CreateDoubleHistogram("flowlock.lock.wait_ms", "Time spent acquiring mutex and row locks", "ms");
  impl_->transaction_ms      = impl_->meter->CreateDoubleHistogram("flowlock.transaction.duration_ms", "Critical section duration", "ms");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordTransition(std::string_view entity_type, std::string_view outcome) {
  if (!impl_ || !impl_->transition_count) {
    return;
  }

  const std::string                          entity(entity_type);
  const std::string                          result(outcome);
  const std::initializer_list<AttributePair> attributes = {{"entity_type", entity}, {"outcome", result}};
  AddWithAttributes(impl_->transition_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordRetry(std::string_view operation, std::string_view error_kind) {
  if (!impl_ || !impl_->retry_count) {
    return;
  }

  const std::string                          op(operation);
  const std::string                          kind(error_kind);
  const std::initializer_list<AttributePair> attributes = {{"operation", op}, {"error_kind", kind}};
  AddWithAttributes(impl_->retry_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveLockWaitMs(std::string_view entity_type, double wait_ms) {
  if (!impl_ || !impl_->lock_wait_ms) {
    return;
  }

  const std::string                          entity(entity_type);
  const std::initializer_list<AttributePair> attributes = {{"entity_type", entity}};
  RecordWithAttributes(impl_->lock_wait_ms, wait_ms, attributes);
}

void Metrics::ObserveTransactionMs(std::string_view entity_type, double duration_ms) {
  if (!impl_ || !impl_->transaction_ms) {
    return;
  }

  const std::string                          entity(entity_type);
  const std::initializer_list<AttributePair> attributes = {{"entity_type", entity}};
  RecordWithAttributes(impl_->transaction_ms, duration_ms, attributes);
}

void Metrics::RecordAuditWriteFailure() {
  if (!impl_ || !impl_->audit_failure_count) {
    return;
  }
  AddWithAttributes(impl_->audit_failure_count, static_cast<std::uint64_t>(1), std::initializer_list<AttributePair>{});
}

} // namespace flowlock::observability

#endif
