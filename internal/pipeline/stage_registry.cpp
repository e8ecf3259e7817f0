#include "stage_registry.hpp"

#include "internal/broker/task_schema.hpp"
#include "internal/util/errors.hpp"
#include "stages/stages.hpp"

namespace analysis::pipeline {

std::shared_ptr<StageRegistry> StageRegistry::WithDefaults() {
  auto registry = std::make_shared<StageRegistry>();
  registry->Register(std::make_unique<stages::GetNewPricingDataStage>());
  registry->Register(std::make_unique<stages::PreparePricingDatasetStage>());
  registry->Register(std::make_unique<stages::HandlePricingUpdateStage>());
  registry->Register(std::make_unique<stages::PublishPricingUpdateStage>());
  registry->Register(std::make_unique<stages::PublishFromS3ToRedisStage>());
  registry->Register(std::make_unique<stages::ScreenerAnalysisStage>());
  registry->Register(std::make_unique<stages::PublishTickerAggregateStage>());
  registry->Register(std::make_unique<stages::RunAlgoStage>());
  return registry;
}

void StageRegistry::Register(std::unique_ptr<Stage> stage) {
  const auto name = stage->Name();
  if (stages_.contains(name)) {
    throw util::AlreadyExists("stage already registered: " + broker::TaskNameToString(name));
  }
  stages_.emplace(name, std::move(stage));
}

Stage* StageRegistry::Find(engine::v1::TaskName name) const {
  auto it = stages_.find(name);
  return it == stages_.end() ? nullptr : it->second.get();
}

broker::CapabilitySet StageRegistry::Capabilities() const {
  broker::CapabilitySet out;
  for (const auto& [name, _] : stages_) {
    out.insert(name);
  }
  return out;
}

} // namespace analysis::pipeline
