#pragma once

#include <map>
#include <memory>

#include "internal/broker/broker_channel.hpp"
#include "stage.hpp"

namespace analysis::pipeline {

/*
  task_name -> stage. Populated once at startup, read-only afterwards.
*/
class StageRegistry {
 public:
  // All eight pipeline stages.
  static std::shared_ptr<StageRegistry> WithDefaults();

  // Throws util::AlreadyExists when the task name is taken.
  void Register(std::unique_ptr<Stage> stage);

  // nullptr when no stage handles the task.
  Stage* Find(engine::v1::TaskName name) const;

  broker::CapabilitySet Capabilities() const;

 private:
  std::map<engine::v1::TaskName, std::unique_ptr<Stage>> stages_;
};

} // namespace analysis::pipeline
