#pragma once

#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "task_worker.hpp"

namespace analysis::worker {

/*
  Named groups of TaskWorker threads, one capability set per group.
*/
class WorkerPool {
 public:
  WorkerPool(const runtime::config::WorkerConfig& config, std::shared_ptr<broker::BrokerChannel> broker,
             std::shared_ptr<broker::BackendChannel> backend, std::shared_ptr<pipeline::StageRegistry> stages,
             std::shared_ptr<PipelineServices> services);
  ~WorkerPool();

  void Start();
  void Stop();

  size_t Size() const {
    return workers_.size();
  }

  const std::vector<std::unique_ptr<TaskWorker>>& Workers() const {
    return workers_;
  }

  static RetryPolicy PolicyFrom(const runtime::config::WorkerConfig& config);

  // Throws util::InvalidState for unknown task names.
  static broker::CapabilitySet CapabilitiesFrom(const runtime::config::WorkerGroupConfig& group);

 private:
  std::vector<std::unique_ptr<TaskWorker>> workers_;
  bool                                     started_ = false;
};

} // namespace analysis::worker
