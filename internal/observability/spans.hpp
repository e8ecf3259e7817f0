#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace analysis::runtime::config {
class RuntimeConfig;
}

namespace analysis::observability {

#ifdef ENABLE_OTEL
enum class OtlpSignal { kTraces, kMetrics };

struct OtlpExport {
  std::string service_name;
  // grpc "host:port" or http URL including the signal path
  std::string endpoint;
  bool        http     = false;
  bool        insecure = true;
};

/*
  Exporter settings for one signal. Endpoint precedence: observability.otlp_endpoint,
  then OTEL_EXPORTER_OTLP_{TRACES,METRICS}_ENDPOINT, then OTEL_EXPORTER_OTLP_ENDPOINT,
  then the collector default for the transport.
*/
OtlpExport ResolveOtlpExport(const analysis::runtime::config::RuntimeConfig& config, OtlpSignal signal);
#endif

// traceparent / tracestate headers carried inside a TaskEnvelope.
using TraceContext = std::map<std::string, std::string>;

bool InitializeTracing(const analysis::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const analysis::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// Context of the active span; empty when tracing is off.
TraceContext CurrentTraceContext();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  // Child of the span described by `parent`; a root span when it is empty.
  SpanScope(std::string_view name, const TraceContext& parent);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Process-wide instruments:
    analysis.task.outcomes     counter, labels task + status
    analysis.stage.latency_ms  histogram, label task
    analysis.cache.degraded    counter, label bucket
    analysis.rpc.requests      counter, labels route + ok
    analysis.rpc.latency_ms    histogram, label route
    analysis.broker.redelivered counter, label task
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordTaskOutcome(std::string_view task_name, std::string_view status);
  void ObserveStageLatencyMs(std::string_view task_name, double latency_ms);
  void RecordDegradedCache(std::string_view bucket);
  void RecordRequest(std::string_view route, bool ok);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  // A lease expired and the envelope went back to a worker.
  void RecordRedelivery(std::string_view task_name);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const analysis::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const analysis::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline TraceContext CurrentTraceContext() {
  return {};
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::SpanScope(std::string_view, const TraceContext&) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordTaskOutcome(std::string_view, std::string_view) {
}

inline void Metrics::ObserveStageLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordDegradedCache(std::string_view) {
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordRedelivery(std::string_view) {
}
#endif

} // namespace analysis::observability
