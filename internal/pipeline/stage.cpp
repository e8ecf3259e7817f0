#include "stage.hpp"

#include "internal/broker/task_schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace analysis::pipeline {

using engine::v1::ErrorKind;
using engine::v1::TaskError;

namespace {

TaskError MakeError(ErrorKind kind, const std::exception& e, const char* type) {
  TaskError error;
  error.set_kind(kind);
  error.set_message(e.what());
  (*error.mutable_details())["exception"] = type;
  return error;
}

} // namespace

TaskError ClassifyException(const std::exception& e) {
  if (dynamic_cast<const util::InvalidPayload*>(&e)) {
    return MakeError(engine::v1::ERROR_KIND_VALIDATION, e, "InvalidPayload");
  }
  if (dynamic_cast<const util::InsufficientData*>(&e)) {
    return MakeError(engine::v1::ERROR_KIND_VALIDATION, e, "InsufficientData");
  }
  if (dynamic_cast<const util::TransientInfraError*>(&e)) {
    return MakeError(engine::v1::ERROR_KIND_TRANSIENT_INFRA, e, "TransientInfraError");
  }
  if (dynamic_cast<const util::BrokerUnavailable*>(&e)) {
    return MakeError(engine::v1::ERROR_KIND_TRANSIENT_INFRA, e, "BrokerUnavailable");
  }
  if (const auto* unavailable = dynamic_cast<const util::DataUnavailable*>(&e)) {
    auto error = MakeError(engine::v1::ERROR_KIND_DATA_UNAVAILABLE, e,
                           dynamic_cast<const util::DatasetNotReady*>(&e) ? "DatasetNotReady" : "DataUnavailable");
    if (unavailable->Soft()) {
      (*error.mutable_details())["soft"] = "true";
    }
    return error;
  }
  if (dynamic_cast<const util::NotFound*>(&e)) {
    return MakeError(engine::v1::ERROR_KIND_DATA_UNAVAILABLE, e, "NotFound");
  }
  if (dynamic_cast<const util::AlgorithmError*>(&e)) {
    return MakeError(engine::v1::ERROR_KIND_ALGORITHM, e, "AlgorithmError");
  }
  return MakeError(engine::v1::ERROR_KIND_ALGORITHM, e, "unclassified");
}

bool IsSoftWait(const TaskError& error) {
  if (error.kind() != engine::v1::ERROR_KIND_DATA_UNAVAILABLE) {
    return false;
  }
  auto it = error.details().find("soft");
  return it != error.details().end() && it->second == "true";
}

StageResult RunStage(Stage& stage, const engine::v1::TaskEnvelope& envelope, StageContext& context) {
  try {
    return stage.Execute(envelope, context);
  } catch (const std::exception& e) {
    StageResult result;
    result.error = ClassifyException(e);
    ANALYSIS_LOG_DEBUG("stage raised", {observability::StringField("task", broker::TaskNameToString(stage.Name())),
                                        observability::StringField("task_id", envelope.task_id()),
                                        observability::StringField("error", e.what())});
    return result;
  }
}

engine::v1::TaskEnvelope MakeFollowUp(const engine::v1::TaskEnvelope& parent, engine::v1::TaskName name) {
  engine::v1::TaskEnvelope follow_up;
  follow_up.set_task_name(name);
  follow_up.set_parent_task_id(parent.task_id());
  return follow_up;
}

std::string FollowUpTaskId(const std::string& parent_task_id, size_t index) {
  return parent_task_id + ":" + std::to_string(index);
}

} // namespace analysis::pipeline
