#include "broker_service.hpp"

#include <chrono>

#include "internal/broker/backend_channel.hpp"
#include "internal/broker/broker_channel.hpp"
#include "internal/broker/task_schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace analysis::service {

using namespace analysis::engine::v1;

namespace {

// Runs fn under a span and records request metrics; rethrows on failure.
template <typename Fn>
auto Instrumented(const char* route, Fn&& fn) -> decltype(fn(std::declval<analysis::observability::SpanScope&>())) {
  analysis::observability::SpanScope span(route);
  const auto                         started_at = std::chrono::steady_clock::now();
  auto latency = [&] { return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count(); };

  try {
    auto resp = fn(span);
    analysis::observability::Metrics::Instance().RecordRequest(route, true);
    analysis::observability::Metrics::Instance().ObserveRequestLatencyMs(route, latency());
    return resp;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    ANALYSIS_LOG_ERROR("RPC failed", {analysis::observability::StringField("route", route), analysis::observability::StringField("error", ex.what())});
    analysis::observability::Metrics::Instance().RecordRequest(route, false);
    analysis::observability::Metrics::Instance().ObserveRequestLatencyMs(route, latency());
    throw;
  }
}

} // namespace

BrokerService::BrokerService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

EnqueueResponse BrokerService::Enqueue(const EnqueueRequest& req) {
  return Instrumented("TaskBrokerService.Enqueue", [&](analysis::observability::SpanScope& span) {
    if (!req.has_envelope()) {
      throw analysis::util::InvalidPayload("envelope is required");
    }
    span.SetAttribute("task.name", analysis::broker::TaskNameToString(req.envelope().task_name()));

    auto envelope = req.envelope();
    if (envelope.trace_context().empty()) {
      for (const auto& [key, value] : analysis::observability::CurrentTraceContext()) {
        (*envelope.mutable_trace_context())[key] = value;
      }
    }

    EnqueueResponse resp;
    resp.set_task_id(ctx_.broker->Enqueue(std::move(envelope)));
    span.SetAttribute("task.id", resp.task_id());
    return resp;
  });
}

GetResultResponse BrokerService::GetResult(const GetResultRequest& req) {
  return Instrumented("TaskBrokerService.GetResult", [&](analysis::observability::SpanScope& span) {
    if (req.task_id().empty()) {
      throw analysis::util::InvalidPayload("task_id is required");
    }
    span.SetAttribute("task.id", req.task_id());

    GetResultResponse resp;
    if (auto record = ctx_.backend->Get(req.task_id())) {
      resp.set_found(true);
      *resp.mutable_result() = std::move(*record);
    }
    return resp;
  });
}

GetStatsResponse BrokerService::GetStats(const GetStatsRequest&) {
  return Instrumented("TaskBrokerService.GetStats", [&](analysis::observability::SpanScope&) {
    const auto stats = ctx_.broker->Stats();

    GetStatsResponse resp;
    resp.set_ready(stats.ready);
    resp.set_in_flight(stats.in_flight);
    resp.set_results(ctx_.backend->Count());
    return resp;
  });
}

} // namespace analysis::service
