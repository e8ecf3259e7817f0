#include "internal/broker/broker_channel.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include "internal/broker/task_schema.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using analysis::broker::BrokerChannel;
using analysis::broker::BrokerOptions;
using analysis::broker::CapabilitySet;
using analysis::broker::StringValue;
using analysis::engine::v1::TaskEnvelope;
using analysis::engine::v1::TaskName;

std::shared_ptr<BrokerChannel> MakeChannel(std::chrono::milliseconds visibility = 60000ms) {
  BrokerOptions options;
  options.channel            = "localhost:6379/0";
  options.visibility_timeout = visibility;
  options.poll_interval      = 5ms;
  return std::make_shared<BrokerChannel>(std::make_shared<analysis::db::memory::MemoryRepository>(), options);
}

TaskEnvelope Task(TaskName name, const std::string& id, const std::string& ticker = "SPY") {
  TaskEnvelope envelope;
  envelope.set_task_id(id);
  envelope.set_task_name(name);
  if (name == analysis::engine::v1::TASK_NAME_PUBLISH_FROM_S3_TO_REDIS) {
    (*envelope.mutable_payload())["s3_key"] = StringValue(ticker + "_latest");
  } else {
    (*envelope.mutable_payload())["ticker"] = StringValue(ticker);
  }
  return envelope;
}

const CapabilitySet kAlgoOnly{analysis::engine::v1::TASK_NAME_RUN_ALGO};
const CapabilitySet kPrepareOnly{analysis::engine::v1::TASK_NAME_PREPARE_PRICING_DATASET};

void TestEnqueueAssignsIdAndTimestamp() {
  auto broker = MakeChannel();

  auto envelope = Task(analysis::engine::v1::TASK_NAME_RUN_ALGO, "");
  const auto id = broker->Enqueue(envelope);
  assert(!id.empty());

  auto delivery = broker->DequeueFor(kAlgoOnly, 100ms);
  assert(delivery.has_value());
  assert(delivery->envelope.task_id() == id);
  assert(delivery->envelope.has_enqueued_at());
  assert(delivery->delivery_count == 1);
  assert(broker->Ack(*delivery));
}

void TestInvalidPayloadIsRejectedAtEnqueue() {
  auto broker = MakeChannel();

  TaskEnvelope envelope;
  envelope.set_task_name(analysis::engine::v1::TASK_NAME_RUN_ALGO);

  bool threw = false;
  try {
    broker->Enqueue(envelope);
  } catch (const analysis::util::InvalidPayload&) {
    threw = true;
  }
  assert(threw);
  assert(broker->Stats().ready == 0);
}

void TestCapabilityRouting() {
  auto broker = MakeChannel();
  broker->Enqueue(Task(analysis::engine::v1::TASK_NAME_PREPARE_PRICING_DATASET, "prepare-1"));

  // a worker that cannot handle prepare never sees it
  assert(!broker->DequeueFor(kAlgoOnly, 30ms).has_value());

  auto delivery = broker->DequeueFor(kPrepareOnly, 100ms);
  assert(delivery.has_value());
  assert(delivery->envelope.task_id() == "prepare-1");
  assert(broker->Ack(*delivery));
}

void TestFifoAmongVisibleEnvelopes() {
  auto broker = MakeChannel();
  broker->Enqueue(Task(analysis::engine::v1::TASK_NAME_RUN_ALGO, "a", "SPY"));
  broker->Enqueue(Task(analysis::engine::v1::TASK_NAME_RUN_ALGO, "b", "AAPL"));
  broker->Enqueue(Task(analysis::engine::v1::TASK_NAME_RUN_ALGO, "c", "QQQ"));

  for (const char* expected : {"a", "b", "c"}) {
    auto delivery = broker->DequeueFor(kAlgoOnly, 100ms);
    assert(delivery.has_value());
    assert(delivery->envelope.task_id() == expected);
    assert(broker->Ack(*delivery));
  }
}

void TestEnqueueIsIdempotentOnTaskId() {
  auto broker = MakeChannel();
  assert(broker->Enqueue(Task(analysis::engine::v1::TASK_NAME_RUN_ALGO, "dup")) == "dup");
  assert(broker->Enqueue(Task(analysis::engine::v1::TASK_NAME_RUN_ALGO, "dup")) == "dup");
  assert(broker->Stats().ready == 1);
}

void TestAckedTaskIdCanBeEnqueuedAgain() {
  auto broker = MakeChannel();
  broker->Enqueue(Task(analysis::engine::v1::TASK_NAME_RUN_ALGO, "parent:0"));

  auto first = broker->DequeueFor(kAlgoOnly, 100ms);
  assert(first.has_value());
  // duplicate while in flight
  assert(broker->Enqueue(Task(analysis::engine::v1::TASK_NAME_RUN_ALGO, "parent:0")) == "parent:0");
  assert(broker->Stats().ready == 0);
  assert(broker->Stats().in_flight == 1);
  assert(broker->Ack(*first));

  // a redelivered parent enqueues the acked id again; it is a new task
  assert(broker->Enqueue(Task(analysis::engine::v1::TASK_NAME_RUN_ALGO, "parent:0")) == "parent:0");
  assert(broker->Stats().ready == 1);
  auto second = broker->DequeueFor(kAlgoOnly, 100ms);
  assert(second.has_value());
  assert(second->envelope.task_id() == "parent:0");
  assert(second->delivery_count == 1);
  assert(broker->Ack(*second));
}

void TestNackRequeueIncrementsRetryCount() {
  auto broker = MakeChannel();
  broker->Enqueue(Task(analysis::engine::v1::TASK_NAME_RUN_ALGO, "retry"));

  auto first = broker->DequeueFor(kAlgoOnly, 100ms);
  assert(first.has_value());
  assert(first->envelope.retry_count() == 0);
  assert(broker->Nack(*first, true, 0ms));

  auto second = broker->DequeueFor(kAlgoOnly, 100ms);
  assert(second.has_value());
  assert(second->envelope.retry_count() == 1);
  assert(second->envelope.soft_waits() == 0);
  assert(broker->Nack(*second, true, 0ms, true));

  auto third = broker->DequeueFor(kAlgoOnly, 100ms);
  assert(third.has_value());
  assert(third->envelope.retry_count() == 2);
  assert(third->envelope.soft_waits() == 1);

  assert(broker->Nack(*third, false));
  assert(broker->Stats().ready == 0);
  assert(broker->Stats().in_flight == 0);
}

void TestNackDelayHidesEnvelope() {
  auto broker = MakeChannel();
  broker->Enqueue(Task(analysis::engine::v1::TASK_NAME_RUN_ALGO, "delayed"));

  auto first = broker->DequeueFor(kAlgoOnly, 100ms);
  assert(first.has_value());
  assert(broker->Nack(*first, true, 150ms));

  assert(!broker->DequeueFor(kAlgoOnly, 20ms).has_value());
  auto later = broker->DequeueFor(kAlgoOnly, 1000ms);
  assert(later.has_value());
  assert(later->envelope.task_id() == "delayed");
}

void TestVisibilityTimeoutRedelivers() {
  auto broker = MakeChannel(50ms);
  broker->Enqueue(Task(analysis::engine::v1::TASK_NAME_RUN_ALGO, "lost"));

  auto first = broker->DequeueFor(kAlgoOnly, 100ms);
  assert(first.has_value());

  // worker "crashed": no ack; the envelope comes back under a new lease
  auto second = broker->DequeueFor(kAlgoOnly, 1000ms);
  assert(second.has_value());
  assert(second->envelope.task_id() == "lost");
  assert(second->lease_id != first->lease_id);
  assert(second->delivery_count == 2);

  // the stale lease can no longer settle the envelope
  assert(!broker->Ack(*first));
  assert(!broker->Nack(*first, false));
  assert(broker->Ack(*second));
}

void TestSingleWriterPerTickerPartition() {
  auto broker = MakeChannel();
  broker->Enqueue(Task(analysis::engine::v1::TASK_NAME_PREPARE_PRICING_DATASET, "spy-1", "SPY"));
  broker->Enqueue(Task(analysis::engine::v1::TASK_NAME_PREPARE_PRICING_DATASET, "spy-2", "SPY"));
  broker->Enqueue(Task(analysis::engine::v1::TASK_NAME_PREPARE_PRICING_DATASET, "aapl-1", "AAPL"));

  auto first = broker->DequeueFor(kPrepareOnly, 100ms);
  assert(first.has_value());
  assert(first->envelope.task_id() == "spy-1");
  assert(first->envelope.routing_key() == "pricing:SPY");

  // spy-2 shares the partition and must wait; aapl-1 is free
  auto second = broker->DequeueFor(kPrepareOnly, 100ms);
  assert(second.has_value());
  assert(second->envelope.task_id() == "aapl-1");
  assert(!broker->DequeueFor(kPrepareOnly, 30ms).has_value());

  assert(broker->Ack(*first));
  auto third = broker->DequeueFor(kPrepareOnly, 100ms);
  assert(third.has_value());
  assert(third->envelope.task_id() == "spy-2");
  assert(broker->Ack(*second));
  assert(broker->Ack(*third));
}

void TestConcurrentWorkersNeverOverlapOnPartition() {
  auto broker = MakeChannel();
  for (int i = 0; i < 20; ++i) {
    broker->Enqueue(Task(analysis::engine::v1::TASK_NAME_PREPARE_PRICING_DATASET, "spy-" + std::to_string(i), "SPY"));
  }

  std::atomic<int>  active{0};
  std::atomic<int>  processed{0};
  std::atomic<bool> overlap{false};

  auto consume = [&] {
    while (processed.load() < 20) {
      auto delivery = broker->DequeueFor(kPrepareOnly, 20ms);
      if (!delivery) {
        continue;
      }
      if (active.fetch_add(1) != 0) {
        overlap = true;
      }
      std::this_thread::sleep_for(1ms);
      active.fetch_sub(1);
      broker->Ack(*delivery);
      processed.fetch_add(1);
    }
  };

  std::thread a(consume);
  std::thread b(consume);
  std::thread c(consume);
  a.join();
  b.join();
  c.join();

  assert(!overlap.load());
  assert(processed.load() == 20);
}

void TestShutdownWakesBlockedDequeue() {
  auto broker = MakeChannel();

  std::atomic<bool> returned{false};
  std::thread       waiter([&] {
    auto delivery = broker->Dequeue(kAlgoOnly);
    assert(!delivery.has_value());
    returned = true;
  });

  std::this_thread::sleep_for(20ms);
  broker->Shutdown();
  waiter.join();
  assert(returned.load());
  assert(broker->IsShutdown());

  bool threw = false;
  try {
    broker->Enqueue(Task(analysis::engine::v1::TASK_NAME_RUN_ALGO, "late"));
  } catch (const analysis::util::BrokerUnavailable&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEnqueueAssignsIdAndTimestamp();
  TestInvalidPayloadIsRejectedAtEnqueue();
  TestCapabilityRouting();
  TestFifoAmongVisibleEnvelopes();
  TestEnqueueIsIdempotentOnTaskId();
  TestAckedTaskIdCanBeEnqueuedAgain();
  TestNackRequeueIncrementsRetryCount();
  TestNackDelayHidesEnvelope();
  TestVisibilityTimeoutRedelivers();
  TestSingleWriterPerTickerPartition();
  TestConcurrentWorkersNeverOverlapOnPartition();
  TestShutdownWakesBlockedDequeue();

  std::cout << "analysis_unit_broker_channel: pass\n";
  return 0;
}
