#include "internal/worker/task_worker.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/storage/dataset_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/worker/worker_pool.hpp"
#include "support/test_support.hpp"

namespace {

using namespace std::chrono_literals;
using analysis::broker::StringValue;
using analysis::engine::v1::TaskEnvelope;
using analysis::engine::v1::TaskName;
using analysis::model::AttemptState;
using analysis::pipeline::StageContext;
using analysis::pipeline::StageResult;
using analysis::testing::Harness;
using analysis::worker::RetryPolicy;
using analysis::worker::TaskWorker;

const TaskName kAlgo     = analysis::engine::v1::TASK_NAME_RUN_ALGO;
const TaskName kScreener = analysis::engine::v1::TASK_NAME_SCREENER_ANALYSIS;

// Stage whose behaviour is supplied by the test; counts executions.
class ScriptedStage : public analysis::pipeline::Stage {
 public:
  using Script = std::function<StageResult(const TaskEnvelope&, int call)>;

  ScriptedStage(TaskName name, Script script) : name_(name), script_(std::move(script)) {
  }

  TaskName Name() const override {
    return name_;
  }

  StageResult Execute(const TaskEnvelope& envelope, StageContext&) override {
    return script_(envelope, ++calls_);
  }

  int Calls() const {
    return calls_.load();
  }

 private:
  TaskName         name_;
  Script           script_;
  std::atomic<int> calls_{0};
};

// Backend repository whose result writes always fail; everything else is in memory.
class UnwritableResults final : public analysis::db::Repository {
 public:
  std::unique_ptr<analysis::db::Transaction> Begin() override {
    return inner_.Begin();
  }
  analysis::db::Result InsertTask(analysis::db::Transaction& tx, analysis::db::model::TaskRecord& record) override {
    return inner_.InsertTask(tx, record);
  }
  std::optional<analysis::db::model::TaskRecord> GetTask(analysis::db::Transaction& tx, const std::string& channel,
                                                         const std::string& task_id) override {
    return inner_.GetTask(tx, channel, task_id);
  }
  std::vector<analysis::db::model::TaskRecord> ListTasks(analysis::db::Transaction& tx, const std::string& channel) override {
    return inner_.ListTasks(tx, channel);
  }
  analysis::db::Result UpdateTask(analysis::db::Transaction& tx, const analysis::db::model::TaskRecord& record) override {
    return inner_.UpdateTask(tx, record);
  }
  analysis::db::Result DeleteTask(analysis::db::Transaction& tx, const std::string& channel, const std::string& task_id) override {
    return inner_.DeleteTask(tx, channel, task_id);
  }
  analysis::db::Result InsertResult(analysis::db::Transaction&, const analysis::db::model::ResultRow&) override {
    return analysis::db::Result::Err(analysis::db::ErrorCode::IOError, "disk full");
  }
  analysis::db::Result UpdateResult(analysis::db::Transaction&, const analysis::db::model::ResultRow&) override {
    return analysis::db::Result::Err(analysis::db::ErrorCode::IOError, "disk full");
  }
  std::optional<analysis::db::model::ResultRow> GetResult(analysis::db::Transaction& tx, const std::string& channel,
                                                          const std::string& task_id) override {
    return inner_.GetResult(tx, channel, task_id);
  }
  uint64_t CountResults(analysis::db::Transaction& tx, const std::string& channel) override {
    return inner_.CountResults(tx, channel);
  }

 private:
  analysis::db::memory::MemoryRepository inner_;
};

struct Rig {
  Harness                                          harness;
  std::shared_ptr<analysis::pipeline::StageRegistry> stages = std::make_shared<analysis::pipeline::StageRegistry>();
  ScriptedStage*                                   algo     = nullptr;
  ScriptedStage*                                   screener = nullptr;

  Rig(const std::string& name, ScriptedStage::Script algo_script, ScriptedStage::Script screener_script = nullptr) : harness(name) {
    auto algo_stage = std::make_unique<ScriptedStage>(kAlgo, std::move(algo_script));
    algo            = algo_stage.get();
    stages->Register(std::move(algo_stage));

    auto screener_stage = std::make_unique<ScriptedStage>(kScreener, screener_script ? std::move(screener_script) : [](const TaskEnvelope&, int) {
      return StageResult{};
    });
    screener = screener_stage.get();
    stages->Register(std::move(screener_stage));
  }

  std::unique_ptr<TaskWorker> Worker(RetryPolicy policy = FastPolicy()) {
    return std::make_unique<TaskWorker>("test-worker", analysis::broker::CapabilitySet{kAlgo, kScreener}, harness.broker, harness.backend, stages,
                                        harness.services, policy);
  }

  static RetryPolicy FastPolicy() {
    RetryPolicy policy;
    policy.max_retries     = 2;
    policy.backoff         = 1ms;
    policy.backoff_max     = 2ms;
    policy.soft_wait_delay = 1ms;
    return policy;
  }

  std::string EnqueueAlgo(const std::string& id, const std::string& ticker = "SPY") {
    auto envelope = analysis::testing::Envelope(kAlgo, id);
    analysis::testing::Put(envelope, "ticker", StringValue(ticker));
    return harness.broker->Enqueue(envelope);
  }

  // Runs the worker until the task has a terminal record.
  analysis::engine::v1::ResultRecord Drain(TaskWorker& worker, const std::string& task_id) {
    for (int i = 0; i < 100; ++i) {
      worker.RunOnce(50ms);
      auto record = harness.backend->Get(task_id);
      if (record && analysis::broker::IsTerminal(record->status())) {
        return *record;
      }
    }
    assert(false && "task never reached a terminal record");
    return {};
  }
};

void TestSuccessStoresRecordAndEnqueuesFollowUps() {
  Rig rig("worker_success", [](const TaskEnvelope&, int) { return StageResult{}; },
          [](const TaskEnvelope& envelope, int) {
            StageResult result;
            result.ref.emplace();
            result.ref->mutable_key()->set_bucket("compileddatasets");
            result.ref->mutable_key()->set_key("screen_latest");
            result.ref->set_version("0123456789abcdef");
            result.record["selected"] = "SPY,AAPL";
            for (const char* ticker : {"SPY", "AAPL"}) {
              auto follow_up = analysis::pipeline::MakeFollowUp(envelope, kAlgo);
              analysis::testing::Put(follow_up, "ticker", StringValue(ticker));
              result.follow_ups.push_back(std::move(follow_up));
            }
            return result;
          });
  auto worker = rig.Worker();

  rig.harness.broker->Enqueue(analysis::testing::Envelope(kScreener, "screen-1"));
  auto delivery = rig.harness.broker->DequeueFor({kScreener}, 100ms);
  assert(delivery.has_value());
  assert(worker->Process(*delivery) == AttemptState::kSucceeded);

  auto record = rig.harness.backend->Get("screen-1");
  assert(record.has_value());
  assert(record->status() == analysis::engine::v1::TASK_STATUS_SUCCESS);
  assert(record->attempt() == 1);
  assert(record->result_ref().version() == "0123456789abcdef");
  assert(record->record().at("selected") == "SPY,AAPL");
  assert(record->record().at("follow_ups") == "2");

  auto first = rig.harness.broker->DequeueFor({kAlgo}, 100ms);
  assert(first.has_value());
  assert(first->envelope.task_id() == "screen-1:0");
  assert(first->envelope.parent_task_id() == "screen-1");
  auto second = rig.harness.broker->DequeueFor({kAlgo}, 100ms);
  assert(second.has_value());
  assert(second->envelope.task_id() == "screen-1:1");

  // the screener envelope itself was acked
  assert(rig.harness.broker->Stats().ready == 0);
}

void TestTransientFailureIsRetriedUpToBound() {
  Rig rig("worker_retry_bound", [](const TaskEnvelope&, int) -> StageResult { throw analysis::util::TransientInfraError("object store down"); });
  auto worker = rig.Worker();

  rig.EnqueueAlgo("flaky");
  const auto record = rig.Drain(*worker, "flaky");

  // max_retries = 2: one execution plus two retries
  assert(rig.algo->Calls() == 3);
  assert(record.status() == analysis::engine::v1::TASK_STATUS_FAILED);
  assert(record.attempt() == 3);
  assert(record.error().kind() == analysis::engine::v1::ERROR_KIND_TRANSIENT_INFRA);
  assert(record.error().details().at("retries_exhausted") == "true");

  auto stats = rig.harness.broker->Stats();
  assert(stats.ready == 0 && stats.in_flight == 0);
}

void TestTransientFailureThenSuccess() {
  Rig rig("worker_recover", [](const TaskEnvelope&, int call) -> StageResult {
    if (call == 1) {
      throw analysis::util::TransientInfraError("blip");
    }
    return StageResult{};
  });
  auto worker = rig.Worker();

  rig.EnqueueAlgo("recovers");
  const auto record = rig.Drain(*worker, "recovers");
  assert(record.status() == analysis::engine::v1::TASK_STATUS_SUCCESS);
  assert(record.attempt() == 2);
  assert(rig.algo->Calls() == 2);
}

void TestValidationFailureIsNotRetried() {
  Rig rig("worker_validation", [](const TaskEnvelope&, int) -> StageResult { throw analysis::util::InvalidPayload("bad ticker"); });
  auto worker = rig.Worker();

  rig.EnqueueAlgo("invalid");
  const auto record = rig.Drain(*worker, "invalid");
  assert(rig.algo->Calls() == 1);
  assert(record.status() == analysis::engine::v1::TASK_STATUS_FAILED);
  assert(record.error().kind() == analysis::engine::v1::ERROR_KIND_VALIDATION);
  assert(record.error().details().count("retries_exhausted") == 0);
}

void TestAlgorithmErrorIsPermanent() {
  Rig rig("worker_algorithm", [](const TaskEnvelope&, int) -> StageResult { throw analysis::util::AlgorithmError("diverged"); });
  auto worker = rig.Worker();

  rig.EnqueueAlgo("diverges");
  const auto record = rig.Drain(*worker, "diverges");
  assert(rig.algo->Calls() == 1);
  assert(record.error().kind() == analysis::engine::v1::ERROR_KIND_ALGORITHM);
}

void TestSoftWaitRequeuesOnceThenFails() {
  Rig rig("worker_soft_wait", [](const TaskEnvelope&, int) -> StageResult { throw analysis::util::DatasetNotReady("no prepared dataset"); });
  auto worker = rig.Worker();

  rig.EnqueueAlgo("waits");

  auto delivery = rig.harness.broker->DequeueFor({kAlgo}, 100ms);
  assert(delivery.has_value());
  assert(worker->Process(*delivery) == AttemptState::kRequeued);
  auto marker = rig.harness.backend->Get("waits");
  assert(marker.has_value());
  assert(marker->status() == analysis::engine::v1::TASK_STATUS_RETRYING);
  assert(marker->error().details().at("soft") == "true");

  const auto record = rig.Drain(*worker, "waits");
  assert(rig.algo->Calls() == 2);
  assert(record.status() == analysis::engine::v1::TASK_STATUS_FAILED);
  assert(record.error().kind() == analysis::engine::v1::ERROR_KIND_DATA_UNAVAILABLE);
}

void TestSoftWaitThenDataArrives() {
  Rig rig("worker_soft_wait_ok", [](const TaskEnvelope&, int call) -> StageResult {
    if (call == 1) {
      throw analysis::util::DatasetNotReady("not yet");
    }
    return StageResult{};
  });
  auto worker = rig.Worker();

  rig.EnqueueAlgo("arrives");
  const auto record = rig.Drain(*worker, "arrives");
  assert(record.status() == analysis::engine::v1::TASK_STATUS_SUCCESS);
  assert(rig.algo->Calls() == 2);
}

void TestRedeliveryYieldsIdenticalTerminalRecord() {
  Rig rig("worker_redelivery", [](const TaskEnvelope&, int) {
    StageResult result;
    result.record["rows"] = "30";
    return result;
  });

  // broker with a short visibility timeout on its own repository
  analysis::broker::BrokerOptions options;
  options.channel            = "localhost:6379/0";
  options.visibility_timeout = 30ms;
  options.poll_interval      = 5ms;
  rig.harness.broker = std::make_shared<analysis::broker::BrokerChannel>(std::make_shared<analysis::db::memory::MemoryRepository>(), options);
  auto worker        = rig.Worker();

  rig.EnqueueAlgo("at-least-once");

  // first worker stalls past the visibility timeout
  auto stalled = rig.harness.broker->DequeueFor({kAlgo}, 100ms);
  assert(stalled.has_value());

  const auto record = rig.Drain(*worker, "at-least-once");
  assert(record.status() == analysis::engine::v1::TASK_STATUS_SUCCESS);
  const auto stored = analysis::storage::SerializeDeterministic(record);

  // the stalled worker finishes late: its result and ack are ignored
  assert(worker->Process(*stalled) == AttemptState::kSucceeded);
  auto after = rig.harness.backend->Get("at-least-once");
  assert(after.has_value());
  assert(analysis::storage::SerializeDeterministic(*after) == stored);
  assert(rig.algo->Calls() == 2);
  assert(rig.harness.broker->Stats().in_flight == 0);
}

void TestUnwritableBackendStopsAtRetryBound() {
  Rig rig("worker_unwritable_backend", [](const TaskEnvelope&, int) { return StageResult{}; });
  rig.harness.backend = std::make_shared<analysis::broker::BackendChannel>(std::make_shared<UnwritableResults>(), "localhost:6379/1");
  auto worker         = rig.Worker();

  rig.EnqueueAlgo("no-backend");
  for (int i = 0; i < 50 && rig.harness.broker->Stats().ready + rig.harness.broker->Stats().in_flight > 0; ++i) {
    worker->RunOnce(20ms);
  }

  // max_retries 2: three executions, then the envelope is dropped
  assert(rig.algo->Calls() == 3);
  assert(rig.harness.broker->Stats().ready == 0);
  assert(rig.harness.broker->Stats().in_flight == 0);
}

void TestRepeatedLeaseExpiryIsReportedFailed() {
  Rig rig("worker_lease_expiry", [](const TaskEnvelope&, int) { return StageResult{}; });

  analysis::broker::BrokerOptions options;
  options.channel            = "localhost:6379/0";
  options.visibility_timeout = 20ms;
  options.poll_interval      = 5ms;
  rig.harness.broker = std::make_shared<analysis::broker::BrokerChannel>(std::make_shared<analysis::db::memory::MemoryRepository>(), options);
  auto worker        = rig.Worker();

  rig.EnqueueAlgo("crashes-worker");

  // every holder dies before acking; max_retries 2 allows three deliveries
  for (uint32_t expected = 1; expected <= 3; ++expected) {
    auto lost = rig.harness.broker->DequeueFor({kAlgo}, 200ms);
    assert(lost.has_value());
    assert(lost->delivery_count == expected);
  }

  auto fourth = rig.harness.broker->DequeueFor({kAlgo}, 200ms);
  assert(fourth.has_value());
  assert(fourth->delivery_count == 4);
  assert(worker->Process(*fourth) == AttemptState::kReported);
  assert(rig.algo->Calls() == 0);

  auto record = rig.harness.backend->Get("crashes-worker");
  assert(record.has_value());
  assert(record->status() == analysis::engine::v1::TASK_STATUS_FAILED);
  assert(record->error().details().at("redeliveries_exhausted") == "true");
  assert(record->error().details().at("delivery_count") == "4");
  assert(rig.harness.broker->Stats().ready == 0);
  assert(rig.harness.broker->Stats().in_flight == 0);
}

void TestWorkerRejectsCapabilityWithoutStage() {
  Harness harness("worker_no_stage");
  auto    empty = std::make_shared<analysis::pipeline::StageRegistry>();

  bool threw = false;
  try {
    TaskWorker worker("w", {kAlgo}, harness.broker, harness.backend, empty, harness.services, RetryPolicy{});
  } catch (const analysis::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestBackoffIsExponentialAndCapped() {
  RetryPolicy policy;
  policy.backoff     = 100ms;
  policy.backoff_max = 1000ms;
  assert(policy.BackoffFor(0) == 100ms);
  assert(policy.BackoffFor(1) == 200ms);
  assert(policy.BackoffFor(3) == 800ms);
  assert(policy.BackoffFor(4) == 1000ms);
  assert(policy.BackoffFor(30) == 1000ms);
}

void TestPoolProcessesAcrossGroups() {
  Rig rig("worker_pool", [](const TaskEnvelope&, int) { return StageResult{}; });

  analysis::runtime::config::WorkerConfig config;
  config.set_max_retries(1);
  config.set_retry_backoff_ms(1);
  config.set_retry_backoff_max_ms(2);
  config.set_soft_wait_delay_ms(1);
  auto* algo_group = config.add_groups();
  algo_group->set_name("algo");
  algo_group->set_threads(2);
  algo_group->add_capabilities("task_run_algo");
  auto* screen_group = config.add_groups();
  screen_group->set_name("screen");
  screen_group->set_threads(1);
  screen_group->add_capabilities("task_screener_analysis");

  analysis::worker::WorkerPool pool(config, rig.harness.broker, rig.harness.backend, rig.stages, rig.harness.services);
  assert(pool.Size() == 3);
  assert(pool.Workers()[0]->Name() == "algo-0");
  assert(pool.Workers()[2]->Name() == "screen-0");
  assert(pool.Workers()[2]->Capabilities().count(kAlgo) == 0);

  for (int i = 0; i < 6; ++i) {
    rig.EnqueueAlgo("pool-" + std::to_string(i), i % 2 ? "SPY" : "AAPL");
  }
  rig.harness.broker->Enqueue(analysis::testing::Envelope(kScreener, "pool-screen"));

  pool.Start();
  for (int i = 0; i < 200 && rig.harness.backend->Count() < 7; ++i) {
    std::this_thread::sleep_for(10ms);
  }
  pool.Stop();

  assert(rig.harness.backend->Count() == 7);
  assert(rig.algo->Calls() == 6);
  assert(rig.screener->Calls() == 1);
}

void TestPoolRejectsUnknownCapability() {
  analysis::runtime::config::WorkerGroupConfig group;
  group.set_name("bad");
  group.add_capabilities("send_email");

  bool threw = false;
  try {
    (void)analysis::worker::WorkerPool::CapabilitiesFrom(group);
  } catch (const analysis::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSuccessStoresRecordAndEnqueuesFollowUps();
  TestTransientFailureIsRetriedUpToBound();
  TestTransientFailureThenSuccess();
  TestValidationFailureIsNotRetried();
  TestAlgorithmErrorIsPermanent();
  TestSoftWaitRequeuesOnceThenFails();
  TestSoftWaitThenDataArrives();
  TestRedeliveryYieldsIdenticalTerminalRecord();
  TestUnwritableBackendStopsAtRetryBound();
  TestRepeatedLeaseExpiryIsReportedFailed();
  TestWorkerRejectsCapabilityWithoutStage();
  TestBackoffIsExponentialAndCapped();
  TestPoolProcessesAcrossGroups();
  TestPoolRejectsUnknownCapability();

  std::cout << "analysis_unit_task_worker: pass\n";
  return 0;
}
