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
#include <opentelemetry/sdk/resource/resource.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace capacity::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

opentelemetry::nostd::string_view View(std::string_view s) {
  return {s.data(), s.size()};
}

resource::Resource BuildResource(const OtlpConfig& config) {
  resource::ResourceAttributes attrs = {{"service.name", config.service_name}};
  return resource::Resource::Create(attrs);
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> debited_weight;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> discrepancy_weight;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   locked_total_gauge;

  std::atomic<std::int64_t> locked_total{0};
};

bool InitializeMetrics(const capacity::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto otlp_config = ResolveOtlpConfig(config, "metrics");

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = otlp_config.endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = otlp_config.endpoint;
    options.use_ssl_credentials = !otlp_config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(1000);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  auto resource = BuildResource(otlp_config);
  g_provider    = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), resource);
  g_provider->AddMetricReader(std::move(reader));

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
  impl_->meter  = provider->GetMeter("capacity-manager", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("capacity.request.count", "Total number of service requests", "1");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("capacity.request.latency_ms", "End-to-end request latency in milliseconds", "ms");
  impl_->debited_weight     = impl_->meter->CreateUInt64Counter("capacity.usage.debited_weight", "Weight debited from subscriptions", "1");
  impl_->discrepancy_weight =
      impl_->meter->CreateUInt64Counter("capacity.accounting.shortfall_weight", "Dispatched weight the free balance could not cover", "1");
  impl_->locked_total_gauge = impl_->meter->CreateInt64ObservableGauge("capacity.lock.total", "Assets currently held by lock-backed subscriptions", "1");
  impl_->locked_total_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        int_result->Observe(impl->locked_total.load());
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  const std::initializer_list<AttributePair> attributes = {{"route", View(route)}, {"success", success}};
  impl_->request_count->Add(1, attributes, opentelemetry::context::Context{});
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  const std::initializer_list<AttributePair> attributes = {{"route", View(route)}};
  impl_->request_latency_ms->Record(latency_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::AddDebitedWeight(std::string_view mode, std::uint64_t weight) {
  const std::initializer_list<AttributePair> attributes = {{"mode", View(mode)}};
  impl_->debited_weight->Add(weight, attributes, opentelemetry::context::Context{});
}

void Metrics::RecordDiscrepancy(std::uint64_t shortfall) {
  impl_->discrepancy_weight->Add(shortfall);
}

void Metrics::SetLockedTotal(std::uint64_t amount) {
  impl_->locked_total.store(static_cast<std::int64_t>(amount));
}

void Metrics::AdjustLockedTotal(std::int64_t delta) {
  impl_->locked_total.fetch_add(delta);
}

} // namespace capacity::observability

#endif
