#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>

#include <chrono>
#include <utility>

#include "internal/observability/otlp_common.hpp"

namespace negotiation::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
using negotiation::runtime::config::ObservabilityConfig;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

struct MetricsOptions {
  bool request_metrics_enabled{true};
  bool transition_metrics_enabled{true};
  bool dispatch_metrics_enabled{true};
};

MetricsOptions g_metrics_options;

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const ObservabilityConfig& config) {
  const auto endpoint = detail::ResolveEndpoint(config, "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "/v1/metrics");
  if (detail::UseHttp(config)) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

// attribute values reference the caller's strings for the duration of the call
opentelemetry::nostd::string_view Sv(std::string_view value) {
  return {value.data(), value.size()};
}

template <typename Attributes>
void AddOne(const opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>& counter, Attributes&& attributes) {
  counter->Add(static_cast<std::uint64_t>(1), std::forward<Attributes>(attributes), opentelemetry::context::Context{});
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> transition_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> dispatch_count;
};

bool InitializeMetrics(const negotiation::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto&                                      metric_config = observability.metrics();
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis =
      std::chrono::milliseconds(metric_config.collection_interval_ms() > 0 ? metric_config.collection_interval_ms() : 1000);
  if (metric_config.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(metric_config.export_timeout_ms());
  }
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(observability), reader_options);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), detail::BuildResource());
  g_provider->AddMetricReader(std::move(reader));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  g_metrics_options.request_metrics_enabled    = metric_config.request_metrics_enabled();
  g_metrics_options.transition_metrics_enabled = metric_config.transition_metrics_enabled();
  g_metrics_options.dispatch_metrics_enabled   = metric_config.dispatch_metrics_enabled();
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
  impl_->meter  = provider->GetMeter(detail::kServiceName, detail::kServiceVersion);

  impl_->request_count      = impl_->meter->CreateUInt64Counter("negotiation.request.count", "Service façade calls", "1");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("negotiation.request.latency_ms", "Service façade latency", "ms");
  impl_->transition_count   = impl_->meter->CreateUInt64Counter("negotiation.transition.count", "Persisted state transitions", "1");
  impl_->dispatch_count     = impl_->meter->CreateUInt64Counter("negotiation.dispatch.count", "Outbound protocol messages", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_->request_count || !g_metrics_options.request_metrics_enabled) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"route", Sv(route)}, {"success", success}};
  AddOne(impl_->request_count, attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_->request_latency_ms || !g_metrics_options.request_metrics_enabled) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"route", Sv(route)}};
  impl_->request_latency_ms->Record(latency_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::RecordTransition(std::string_view role, std::string_view state) {
  if (!impl_->transition_count || !g_metrics_options.transition_metrics_enabled) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"role", Sv(role)}, {"state", Sv(state)}};
  AddOne(impl_->transition_count, attributes);
}

void Metrics::RecordDispatch(std::string_view kind, std::string_view status) {
  if (!impl_->dispatch_count || !g_metrics_options.dispatch_metrics_enabled) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"kind", Sv(kind)}, {"status", Sv(status)}};
  AddOne(impl_->dispatch_count, attributes);
}

} // namespace negotiation::observability

#endif
