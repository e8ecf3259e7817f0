#include "worker_pool.hpp"

#include <algorithm>

#include "internal/broker/task_schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace analysis::worker {

RetryPolicy WorkerPool::PolicyFrom(const runtime::config::WorkerConfig& config) {
  RetryPolicy policy;
  policy.max_retries     = config.max_retries();
  policy.backoff         = std::chrono::milliseconds(config.retry_backoff_ms());
  policy.backoff_max     = std::chrono::milliseconds(config.retry_backoff_max_ms());
  policy.soft_wait_delay = std::chrono::milliseconds(config.soft_wait_delay_ms());
  if (policy.backoff_max < policy.backoff) {
    policy.backoff_max = policy.backoff;
  }
  return policy;
}

broker::CapabilitySet WorkerPool::CapabilitiesFrom(const runtime::config::WorkerGroupConfig& group) {
  broker::CapabilitySet capabilities;
  for (const auto& name : group.capabilities()) {
    auto task = broker::ParseTaskName(name);
    if (!task) {
      throw util::InvalidState("worker group " + group.name() + " has unknown capability " + name);
    }
    capabilities.insert(*task);
  }
  return capabilities;
}

WorkerPool::WorkerPool(const runtime::config::WorkerConfig& config, std::shared_ptr<broker::BrokerChannel> broker,
                       std::shared_ptr<broker::BackendChannel> backend, std::shared_ptr<pipeline::StageRegistry> stages,
                       std::shared_ptr<PipelineServices> services) {
  const auto policy = PolicyFrom(config);

  for (const auto& group : config.groups()) {
    const auto capabilities = CapabilitiesFrom(group);
    const auto threads      = std::max<uint32_t>(group.threads(), 1);
    for (uint32_t i = 0; i < threads; ++i) {
      workers_.push_back(std::make_unique<TaskWorker>(group.name() + "-" + std::to_string(i), capabilities, broker, backend, stages, services, policy));
    }
  }

  if (workers_.empty()) {
    throw util::InvalidState("worker pool has no workers");
  }
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  if (started_) {
    return;
  }
  for (auto& worker : workers_) {
    worker->Start();
  }
  started_ = true;
  ANALYSIS_LOG_INFO("worker pool started", {observability::IntField("workers", static_cast<int64_t>(workers_.size()))});
}

void WorkerPool::Stop() {
  if (!started_) {
    return;
  }
  for (auto& worker : workers_) {
    worker->Stop();
  }
  started_ = false;
  ANALYSIS_LOG_INFO("worker pool stopped");
}

} // namespace analysis::worker
