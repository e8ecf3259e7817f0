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

#include <chrono>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace analysis::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;
} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> task_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      stage_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> degraded_cache;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> rpc_requests;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      rpc_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> redeliveries;
};

bool InitializeMetrics(const analysis::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto settings = ResolveOtlpExport(config, OtlpSignal::kMetrics);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (settings.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = settings.endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = settings.endpoint;
    options.use_ssl_credentials = !settings.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(config.observability().metrics_export_interval_ms());
  // the export timeout must stay below the interval
  reader_options.export_timeout_millis = reader_options.export_interval_millis / 2;

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create({{"service.name", settings.service_name}}));
  g_provider->AddMetricReader(sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options));

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
  impl_->meter  = provider->GetMeter("analysis-engine", "0.1.0");

  impl_->task_outcomes    = impl_->meter->CreateUInt64Counter("analysis.task.outcomes", "Task attempts by terminal or retry status", "1");
  impl_->stage_latency_ms = impl_->meter->CreateDoubleHistogram("analysis.stage.latency_ms", "Stage execution time", "ms");
  impl_->degraded_cache   = impl_->meter->CreateUInt64Counter("analysis.cache.degraded", "Publishes whose cache write failed", "1");
  impl_->rpc_requests     = impl_->meter->CreateUInt64Counter("analysis.rpc.requests", "Producer RPCs by route and outcome", "1");
  impl_->rpc_latency_ms   = impl_->meter->CreateDoubleHistogram("analysis.rpc.latency_ms", "Producer RPC latency", "ms");
  impl_->redeliveries     = impl_->meter->CreateUInt64Counter("analysis.broker.redelivered", "Envelopes redelivered after a lease expired", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordTaskOutcome(std::string_view task_name, std::string_view status) {
  if (!impl_ || !impl_->task_outcomes) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"task", std::string(task_name)}, {"status", std::string(status)}};
  impl_->task_outcomes->Add(static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveStageLatencyMs(std::string_view task_name, double latency_ms) {
  if (!impl_ || !impl_->stage_latency_ms) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"task", std::string(task_name)}};
  impl_->stage_latency_ms->Record(latency_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::RecordDegradedCache(std::string_view bucket) {
  if (!impl_ || !impl_->degraded_cache) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"bucket", std::string(bucket)}};
  impl_->degraded_cache->Add(static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordRequest(std::string_view route, bool ok) {
  if (!impl_ || !impl_->rpc_requests) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"ok", ok}};
  impl_->rpc_requests->Add(static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->rpc_latency_ms) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
  impl_->rpc_latency_ms->Record(latency_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::RecordRedelivery(std::string_view task_name) {
  if (!impl_ || !impl_->redeliveries) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"task", std::string(task_name)}};
  impl_->redeliveries->Add(static_cast<std::uint64_t>(1), attributes);
}

} // namespace analysis::observability

#endif
