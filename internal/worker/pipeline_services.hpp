#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/aggregate/aggregate_coordinator.hpp"
#include "internal/algo/algorithm_registry.hpp"
#include "internal/pipeline/pricing_source.hpp"
#include "internal/pipeline/stage.hpp"
#include "internal/storage/dataset_store.hpp"

namespace analysis::worker {

/*
  Long-lived collaborators shared by every worker thread.
*/
struct PipelineServices {
  std::shared_ptr<storage::DatasetStore>           store;
  runtime::config::PipelineConfig                  pipeline;
  std::shared_ptr<pipeline::PricingSource>         source;
  std::shared_ptr<algo::AlgorithmRegistry>         algorithms;
  std::shared_ptr<aggregate::AggregateCoordinator> aggregates;

  pipeline::StageContext Context() {
    return pipeline::StageContext{*store, pipeline, *source, *algorithms, *aggregates};
  }
};

} // namespace analysis::worker
