#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/context/propagation/global_propagator.h>
#include <opentelemetry/context/propagation/text_map_propagator.h>
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/context.h>
#include <opentelemetry/trace/propagation/http_trace_context.h>
#include <opentelemetry/trace/provider.h>

#include <cstdlib>
#include <utility>

#include "config/config.pb.h"

namespace analysis::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;
namespace context   = opentelemetry::context;

namespace {
constexpr const char* kTracerName    = "analysis-engine";
constexpr const char* kTracerVersion = "0.1.0";

std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

// TextMapCarrier over an envelope's trace_context map.
class EnvelopeCarrier final : public context::propagation::TextMapCarrier {
 public:
  explicit EnvelopeCarrier(TraceContext* headers) : headers_(headers) {
  }

  opentelemetry::nostd::string_view Get(opentelemetry::nostd::string_view key) const noexcept override {
    auto it = headers_->find(std::string(key));
    if (it == headers_->end()) {
      return "";
    }
    return opentelemetry::nostd::string_view(it->second.data(), it->second.size());
  }

  void Set(opentelemetry::nostd::string_view key, opentelemetry::nostd::string_view value) noexcept override {
    (*headers_)[std::string(key)] = std::string(value);
  }

 private:
  TraceContext* headers_;
};

opentelemetry::nostd::shared_ptr<trace_api::Tracer> ResolveTracer() {
  if (!g_tracer) {
    auto provider = trace_api::Provider::GetTracerProvider();
    if (provider) {
      g_tracer = provider->GetTracer(kTracerName, kTracerVersion);
    }
  }
  return g_tracer;
}

} // namespace

OtlpExport ResolveOtlpExport(const analysis::runtime::config::RuntimeConfig& config, OtlpSignal signal) {
  const auto& observability = config.observability();
  const bool  traces        = signal == OtlpSignal::kTraces;

  OtlpExport out;
  out.service_name = observability.service_name().empty() ? kTracerName : observability.service_name();
  out.http         = observability.transport() == analysis::runtime::config::OTLP_TRANSPORT_HTTP;

  if (!observability.otlp_endpoint().empty()) {
    out.endpoint = observability.otlp_endpoint();
  } else if (const char* v = std::getenv(traces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    out.endpoint = v;
  } else if (const char* v = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    out.endpoint = v;
  } else if (out.http) {
    out.endpoint = traces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
  } else {
    out.endpoint = "localhost:4317";
  }
  return out;
}

bool InitializeTracing(const analysis::runtime::config::RuntimeConfig& config) {
  if (!config.observability().tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  const auto settings = ResolveOtlpExport(config, OtlpSignal::kTraces);

  std::unique_ptr<sdktrace::SpanExporter> exporter;
  if (settings.http) {
    otlp::OtlpHttpExporterOptions options;
    options.url = settings.endpoint;
    exporter    = otlp::OtlpHttpExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcExporterOptions options;
    options.endpoint            = settings.endpoint;
    options.use_ssl_credentials = !settings.insecure;
    exporter                    = otlp::OtlpGrpcExporterFactory::Create(options);
  }

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), sdktrace::BatchSpanProcessorOptions{});
  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(
      sdktrace::TracerProviderFactory::Create(std::move(processor), resource::Resource::Create({{"service.name", settings.service_name}})));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer(kTracerName, kTracerVersion);

  // follow-up envelopes carry W3C traceparent headers
  context::propagation::GlobalTextMapPropagator::SetGlobalPropagator(
      opentelemetry::nostd::shared_ptr<context::propagation::TextMapPropagator>(new trace_api::propagation::HttpTraceContext()));
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
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

TraceContext CurrentTraceContext() {
  TraceContext    headers;
  EnvelopeCarrier carrier(&headers);
  context::propagation::GlobalTextMapPropagator::GetGlobalPropagator()->Inject(carrier, context::RuntimeContext::GetCurrent());
  return headers;
}

SpanScope::SpanScope(std::string_view name) : SpanScope(name, TraceContext{}) {
}

SpanScope::SpanScope(std::string_view name, const TraceContext& parent) : impl_(std::make_unique<Impl>()) {
  auto tracer = ResolveTracer();
  if (!tracer) {
    return;
  }

  trace_api::StartSpanOptions options;
  if (!parent.empty()) {
    TraceContext    headers = parent;
    EnvelopeCarrier carrier(&headers);
    auto extracted = context::propagation::GlobalTextMapPropagator::GetGlobalPropagator()->Extract(carrier, context::RuntimeContext::GetCurrent());
    auto remote    = trace_api::GetSpan(extracted)->GetContext();
    if (remote.IsValid()) {
      options.parent = remote;
    }
  }

  impl_->span  = tracer->StartSpan(std::string(name), options);
  impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->span) {
    impl_->span->End();
  }
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), std::string(value));
  }
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_ && impl_->span) {
    impl_->span->AddEvent(std::string(name));
  }
}

void SpanScope::RecordException(std::string_view description) {
  if (impl_ && impl_->span) {
    impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
    impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
  }
}

} // namespace analysis::observability

#endif
