#include "task_worker.hpp"

#include <algorithm>

#include "internal/broker/task_schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace analysis::worker {

using engine::v1::ResultRecord;
using engine::v1::TaskError;
using model::AttemptState;
using observability::IntField;
using observability::StringField;

namespace {

void Transition(AttemptState& state, AttemptState next) {
  if (!model::CanTransition(state, next)) {
    throw util::InvalidState("invalid attempt transition " + std::string(model::ToString(state)) + " -> " + std::string(model::ToString(next)));
  }
  state = next;
}

ResultRecord NewRecord(const engine::v1::TaskEnvelope& envelope, engine::v1::TaskStatus status) {
  ResultRecord record;
  record.set_task_id(envelope.task_id());
  record.set_task_name(envelope.task_name());
  record.set_status(status);
  record.set_attempt(envelope.retry_count() + 1);
  *record.mutable_completed_at() = util::ToProto(util::Now());
  return record;
}

const char* StatusLabel(engine::v1::TaskStatus status) {
  switch (status) {
    case engine::v1::TASK_STATUS_SUCCESS:
      return "success";
    case engine::v1::TASK_STATUS_FAILED:
      return "failed";
    case engine::v1::TASK_STATUS_RETRYING:
      return "retrying";
    default:
      return "unknown";
  }
}

} // namespace

std::chrono::milliseconds RetryPolicy::BackoffFor(uint32_t retry_count) const {
  auto delay = backoff;
  for (uint32_t i = 0; i < retry_count && delay < backoff_max; ++i) {
    delay *= 2;
  }
  return std::min(delay, backoff_max);
}

TaskWorker::TaskWorker(std::string name, broker::CapabilitySet capabilities, std::shared_ptr<broker::BrokerChannel> broker,
                       std::shared_ptr<broker::BackendChannel> backend, std::shared_ptr<pipeline::StageRegistry> stages,
                       std::shared_ptr<PipelineServices> services, RetryPolicy policy)
    : name_(std::move(name)),
      capabilities_(std::move(capabilities)),
      broker_(std::move(broker)),
      backend_(std::move(backend)),
      stages_(std::move(stages)),
      services_(std::move(services)),
      policy_(policy) {
  for (auto task : capabilities_) {
    if (!stages_->Find(task)) {
      throw util::InvalidState("worker " + name_ + " declares " + broker::TaskNameToString(task) + " but no stage handles it");
    }
  }
}

TaskWorker::~TaskWorker() {
  Stop();
}

void TaskWorker::Start() {
  running_ = true;
  thread_  = std::thread(&TaskWorker::Run, this);
}

void TaskWorker::Stop() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
  }
}

void TaskWorker::Run() {
  ANALYSIS_LOG_INFO("worker started", {StringField("worker", name_), IntField("capabilities", static_cast<int64_t>(capabilities_.size()))});

  while (running_ && !broker_->IsShutdown()) {
    try {
      RunOnce(broker_->Options().poll_interval);
    } catch (const std::exception& e) {
      ANALYSIS_LOG_ERROR("worker loop error", {StringField("worker", name_), StringField("error", e.what())});
      std::this_thread::sleep_for(policy_.backoff);
    }
  }

  ANALYSIS_LOG_INFO("worker stopped", {StringField("worker", name_)});
}

bool TaskWorker::RunOnce(std::chrono::milliseconds timeout) {
  auto delivery = broker_->DequeueFor(capabilities_, timeout);
  if (!delivery) {
    return false;
  }
  Process(*delivery);
  return true;
}

AttemptState TaskWorker::Process(const broker::Delivery& delivery) {
  const auto& envelope  = delivery.envelope;
  const auto  task_name = broker::TaskNameToString(envelope.task_name());

  AttemptState state = AttemptState::kDequeued;
  Transition(state, AttemptState::kRunning);

  observability::TraceContext parent;
  for (const auto& [key, value] : envelope.trace_context()) {
    parent[key] = value;
  }
  observability::SpanScope span("TaskWorker/" + task_name, parent);
  span.SetAttribute("task.id", envelope.task_id());
  span.SetAttribute("task.attempt", static_cast<std::int64_t>(envelope.retry_count() + 1));

  observability::LogScope log_scope({StringField("task_id", envelope.task_id())});
  if (delivery.delivery_count > policy_.MaxDeliveries()) {
    return AbandonRedelivered(delivery, state);
  }
  ANALYSIS_LOG_DEBUG("task running", {StringField("worker", name_), StringField("task", task_name), IntField("retry_count", envelope.retry_count())});

  pipeline::StageResult result;
  if (auto* stage = stages_->Find(envelope.task_name())) {
    auto       context = services_->Context();
    const auto started = std::chrono::steady_clock::now();
    result             = pipeline::RunStage(*stage, envelope, context);
    const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
    observability::Metrics::Instance().ObserveStageLatencyMs(task_name, elapsed);
  } else {
    TaskError error;
    error.set_kind(engine::v1::ERROR_KIND_VALIDATION);
    error.set_message("no stage registered for " + task_name);
    result.error = std::move(error);
  }

  if (result.Ok()) {
    return Complete(delivery, result, state);
  }

  span.RecordException(result.error->message());
  return Fail(delivery, *result.error, state);
}

AttemptState TaskWorker::Complete(const broker::Delivery& delivery, pipeline::StageResult& result, AttemptState& state) {
  const auto& envelope = delivery.envelope;

  // Deterministic ids: a redelivered parent re-enqueues the same ids, which
  // are no-ops while the follow-ups are still queued.
  try {
    const auto trace = observability::CurrentTraceContext();
    for (size_t i = 0; i < result.follow_ups.size(); ++i) {
      auto& follow_up = result.follow_ups[i];
      follow_up.set_task_id(pipeline::FollowUpTaskId(envelope.task_id(), i));
      follow_up.set_parent_task_id(envelope.task_id());
      for (const auto& [key, value] : trace) {
        (*follow_up.mutable_trace_context())[key] = value;
      }
      broker_->Enqueue(follow_up);
    }
  } catch (const std::exception& e) {
    ANALYSIS_LOG_WARN("follow-up enqueue failed", {StringField("task_id", envelope.task_id()), StringField("error", e.what())});
    return Fail(delivery, pipeline::ClassifyException(e), state);
  }

  auto record = NewRecord(envelope, engine::v1::TASK_STATUS_SUCCESS);
  if (result.ref) {
    *record.mutable_result_ref() = *result.ref;
  }
  for (const auto& [key, value] : result.record) {
    (*record.mutable_record())[key] = value;
  }
  if (!result.follow_ups.empty()) {
    (*record.mutable_record())["follow_ups"] = std::to_string(result.follow_ups.size());
  }

  try {
    backend_->Store(record);
  } catch (const std::exception& e) {
    return RequeueAfterBackendFailure(delivery, state, e);
  }

  Transition(state, AttemptState::kSucceeded);
  if (!broker_->Ack(delivery)) {
    ANALYSIS_LOG_WARN("ack after success rejected; result already stored", {StringField("task_id", envelope.task_id())});
  }

  observability::Metrics::Instance().RecordTaskOutcome(broker::TaskNameToString(envelope.task_name()), StatusLabel(record.status()));
  ANALYSIS_LOG_INFO("task succeeded", {StringField("worker", name_), StringField("task", broker::TaskNameToString(envelope.task_name())),
                                       StringField("task_id", envelope.task_id()),
                                       IntField("follow_ups", static_cast<int64_t>(result.follow_ups.size()))});
  return state;
}

AttemptState TaskWorker::Fail(const broker::Delivery& delivery, const TaskError& error, AttemptState& state) {
  const auto& envelope  = delivery.envelope;
  const auto  task_name = broker::TaskNameToString(envelope.task_name());
  const bool  soft      = pipeline::IsSoftWait(error);
  const bool  transient = error.kind() == engine::v1::ERROR_KIND_TRANSIENT_INFRA || soft;
  const bool  budget    = envelope.retry_count() < policy_.max_retries;

  bool requeue = false;
  if (transient) {
    Transition(state, AttemptState::kFailedTransient);
    requeue = soft ? (envelope.soft_waits() == 0 && budget) : budget;
  }

  if (requeue) {
    const auto delay = soft ? policy_.soft_wait_delay : policy_.BackoffFor(envelope.retry_count());

    auto record                 = NewRecord(envelope, engine::v1::TASK_STATUS_RETRYING);
    *record.mutable_error()     = error;
    (*record.mutable_record())["retry_in_ms"] = std::to_string(delay.count());
    try {
      backend_->Store(record);
    } catch (const std::exception& e) {
      ANALYSIS_LOG_WARN("retrying marker not stored", {StringField("task_id", envelope.task_id()), StringField("error", e.what())});
    }

    Transition(state, AttemptState::kRequeued);
    broker_->Nack(delivery, true, delay, soft);

    observability::Metrics::Instance().RecordTaskOutcome(task_name, StatusLabel(record.status()));
    ANALYSIS_LOG_WARN(soft ? "task waiting on upstream data; requeued" : "task failed transiently; requeued",
                      {StringField("task", task_name), StringField("task_id", envelope.task_id()), IntField("retry_count", envelope.retry_count()),
                       IntField("delay_ms", delay.count()), StringField("error", error.message())});
    return state;
  }

  Transition(state, AttemptState::kFailedPermanent);

  auto record             = NewRecord(envelope, engine::v1::TASK_STATUS_FAILED);
  *record.mutable_error() = error;
  if (transient) {
    (*record.mutable_error()->mutable_details())["retries_exhausted"] = "true";
  }

  try {
    backend_->Store(record);
  } catch (const std::exception& e) {
    return RequeueAfterBackendFailure(delivery, state, e);
  }

  Transition(state, AttemptState::kReported);
  broker_->Nack(delivery, false);

  observability::Metrics::Instance().RecordTaskOutcome(task_name, StatusLabel(record.status()));
  ANALYSIS_LOG_ERROR("task failed", {StringField("task", task_name), StringField("task_id", envelope.task_id()),
                                     StringField("kind", engine::v1::ErrorKind_Name(error.kind())), StringField("error", error.message())});
  return state;
}

AttemptState TaskWorker::AbandonRedelivered(const broker::Delivery& delivery, AttemptState& state) {
  const auto& envelope  = delivery.envelope;
  const auto  task_name = broker::TaskNameToString(envelope.task_name());
  Transition(state, AttemptState::kFailedPermanent);

  TaskError error;
  error.set_kind(engine::v1::ERROR_KIND_TRANSIENT_INFRA);
  error.set_message("delivered " + std::to_string(delivery.delivery_count) + " times without completing");
  (*error.mutable_details())["redeliveries_exhausted"] = "true";
  (*error.mutable_details())["delivery_count"]         = std::to_string(delivery.delivery_count);

  auto record             = NewRecord(envelope, engine::v1::TASK_STATUS_FAILED);
  *record.mutable_error() = error;
  try {
    backend_->Store(record);
  } catch (const std::exception& e) {
    return RequeueAfterBackendFailure(delivery, state, e);
  }

  Transition(state, AttemptState::kReported);
  broker_->Nack(delivery, false);

  observability::Metrics::Instance().RecordTaskOutcome(task_name, StatusLabel(record.status()));
  ANALYSIS_LOG_ERROR("task abandoned after repeated lease expiry",
                     {StringField("task", task_name), IntField("delivery_count", delivery.delivery_count)});
  return state;
}

bool TaskWorker::BudgetExhausted(const broker::Delivery& delivery) const {
  return delivery.envelope.retry_count() >= policy_.max_retries || delivery.delivery_count >= policy_.MaxDeliveries();
}

AttemptState TaskWorker::RequeueAfterBackendFailure(const broker::Delivery& delivery, AttemptState& state, const std::exception& e) {
  const auto& envelope = delivery.envelope;

  if (BudgetExhausted(delivery)) {
    ANALYSIS_LOG_ERROR("result not stored and retry budget spent; dropping task",
                       {StringField("task", broker::TaskNameToString(envelope.task_name())), IntField("retry_count", envelope.retry_count()),
                        IntField("delivery_count", delivery.delivery_count), StringField("error", e.what())});
    state = AttemptState::kFailedPermanent;
    broker_->Nack(delivery, false);
    observability::Metrics::Instance().RecordTaskOutcome(broker::TaskNameToString(envelope.task_name()), "dropped");
    return state;
  }

  ANALYSIS_LOG_ERROR("result not stored; requeueing", {StringField("error", e.what())});

  // Succeeded/Reported were not reached; the attempt counts as transient.
  state = AttemptState::kFailedTransient;
  Transition(state, AttemptState::kRequeued);
  broker_->Nack(delivery, true, policy_.BackoffFor(envelope.retry_count()));
  return state;
}

} // namespace analysis::worker
