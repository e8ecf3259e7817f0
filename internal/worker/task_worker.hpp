#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include "internal/broker/backend_channel.hpp"
#include "internal/broker/broker_channel.hpp"
#include "internal/model/task_state.hpp"
#include "internal/pipeline/stage_registry.hpp"
#include "pipeline_services.hpp"

namespace analysis::worker {

struct RetryPolicy {
  // Requeues allowed for one task; max_retries + 1 executions in total.
  uint32_t                  max_retries = 3;
  std::chrono::milliseconds backoff{500};
  std::chrono::milliseconds backoff_max{30000};
  std::chrono::milliseconds soft_wait_delay{5000};

  // backoff * 2^retry_count, capped at backoff_max.
  std::chrono::milliseconds BackoffFor(uint32_t retry_count) const;

  // Lease expiries count against the same budget as requeues.
  uint32_t MaxDeliveries() const { return max_retries + 1; }
};

/*
  One dequeue -> execute -> ack loop on its own thread.

  The worker alone decides between requeue and terminal failure:
    TRANSIENT_INFRA       requeue with backoff until max_retries
    soft DATA_UNAVAILABLE requeue once after soft_wait_delay
    anything else         FAILED record, envelope dropped

  A delivery past MaxDeliveries() (its leases kept expiring) is not run
  again: it gets a FAILED record with redeliveries_exhausted and is dropped.

  No state is carried from one envelope to the next.
*/
class TaskWorker {
 public:
  TaskWorker(std::string name, broker::CapabilitySet capabilities, std::shared_ptr<broker::BrokerChannel> broker,
             std::shared_ptr<broker::BackendChannel> backend, std::shared_ptr<pipeline::StageRegistry> stages,
             std::shared_ptr<PipelineServices> services, RetryPolicy policy);
  ~TaskWorker();

  void Start();
  void Stop();

  // Processes at most one envelope; false when nothing arrived in time.
  bool RunOnce(std::chrono::milliseconds timeout);

  // Returns the state the attempt ended in: Succeeded, Requeued or Reported;
  // FailedPermanent when the task was dropped without a stored record.
  model::AttemptState Process(const broker::Delivery& delivery);

  const std::string& Name() const {
    return name_;
  }

  const broker::CapabilitySet& Capabilities() const {
    return capabilities_;
  }

 private:
  void Run();

  model::AttemptState Complete(const broker::Delivery& delivery, pipeline::StageResult& result, model::AttemptState& state);
  model::AttemptState Fail(const broker::Delivery& delivery, const engine::v1::TaskError& error, model::AttemptState& state);

  model::AttemptState AbandonRedelivered(const broker::Delivery& delivery, model::AttemptState& state);

  // Backend write failed: hand the envelope back for another attempt, or
  // drop it once the retry budget is spent.
  model::AttemptState RequeueAfterBackendFailure(const broker::Delivery& delivery, model::AttemptState& state, const std::exception& e);

  bool BudgetExhausted(const broker::Delivery& delivery) const;

  std::string                               name_;
  broker::CapabilitySet                     capabilities_;
  std::shared_ptr<broker::BrokerChannel>    broker_;
  std::shared_ptr<broker::BackendChannel>   backend_;
  std::shared_ptr<pipeline::StageRegistry>  stages_;
  std::shared_ptr<PipelineServices>         services_;
  RetryPolicy                               policy_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace analysis::worker
