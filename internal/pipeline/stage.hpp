#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "analysis/engine/v1/dataset.pb.h"
#include "analysis/engine/v1/result.pb.h"
#include "analysis/engine/v1/task.pb.h"
#include "config/config.pb.h"

namespace analysis::storage {
class DatasetStore;
}
namespace analysis::algo {
class AlgorithmRegistry;
}
namespace analysis::aggregate {
class AggregateCoordinator;
}

namespace analysis::pipeline {

class PricingSource;

/*
  Collaborators a stage may touch.

  Everything is owned by the worker process; stages keep no state of their
  own between executions.
*/
struct StageContext {
  storage::DatasetStore&                     store;
  const runtime::config::PipelineConfig&     pipeline;
  PricingSource&                             source;
  algo::AlgorithmRegistry&                   algorithms;
  aggregate::AggregateCoordinator&           aggregates;
};

struct StageResult {
  std::optional<engine::v1::DatasetRef>   ref;
  std::vector<engine::v1::TaskEnvelope>   follow_ups;
  std::map<std::string, std::string>      record;
  std::optional<engine::v1::TaskError>    error;

  bool Ok() const {
    return !error.has_value();
  }
};

class Stage {
 public:
  virtual ~Stage() = default;

  virtual engine::v1::TaskName Name() const = 0;

  // May throw; RunStage converts exceptions into StageResult::error.
  virtual StageResult Execute(const engine::v1::TaskEnvelope& envelope, StageContext& context) = 0;
};

/*
  Exception -> ErrorKind:

    util::InvalidPayload, util::InsufficientData     VALIDATION
    util::TransientInfraError, util::BrokerUnavailable TRANSIENT_INFRA
    util::DataUnavailable, util::NotFound            DATA_UNAVAILABLE
    util::AlgorithmError                             ALGORITHM

  Soft DataUnavailable sets details["soft"] = "true". Anything else is
  reported as ALGORITHM with details["exception"] = "unclassified".
*/
engine::v1::TaskError ClassifyException(const std::exception& e);

bool IsSoftWait(const engine::v1::TaskError& error);

// Stage boundary: no exception escapes.
StageResult RunStage(Stage& stage, const engine::v1::TaskEnvelope& envelope, StageContext& context);

// Follow-up envelope; task_id is assigned by the worker as "<parent>:<n>".
engine::v1::TaskEnvelope MakeFollowUp(const engine::v1::TaskEnvelope& parent, engine::v1::TaskName name);

std::string FollowUpTaskId(const std::string& parent_task_id, size_t index);

} // namespace analysis::pipeline
