#include "broker_channel.hpp"

#include <algorithm>
#include <limits>
#include <unordered_set>

#include "internal/broker/task_schema.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace analysis::broker {

namespace {

uint64_t NowMs() {
  return util::ToUnixMillis(util::Now());
}

bool IsTimestampSet(const google::protobuf::Timestamp& ts) {
  return ts.seconds() != 0 || ts.nanos() != 0;
}

} // namespace

BrokerChannel::BrokerChannel(std::shared_ptr<db::Repository> repository, BrokerOptions options)
    : repository_(std::move(repository)), options_(std::move(options)) {
}

std::string BrokerChannel::Enqueue(engine::v1::TaskEnvelope envelope) {
  ValidateEnvelope(envelope);

  if (envelope.task_id().empty()) {
    envelope.set_task_id(util::GenerateUUIDString());
  }
  if (!IsTimestampSet(envelope.enqueued_at())) {
    *envelope.mutable_enqueued_at() = util::ToProto(util::Now());
  }
  if (envelope.routing_key().empty()) {
    envelope.set_routing_key(RoutingKeyFor(envelope));
  }

  db::model::TaskRecord record;
  record.channel        = options_.channel;
  record.task_id        = envelope.task_id();
  record.task_name      = TaskNameToString(envelope.task_name());
  record.routing_key    = envelope.routing_key();
  record.state          = db::model::TaskState::Ready;
  record.enqueued_at_ms = util::ToUnixMillis(util::FromProto(envelope.enqueued_at()));
  record.visible_at_ms  = IsTimestampSet(envelope.not_before()) ? util::ToUnixMillis(util::FromProto(envelope.not_before())) : record.enqueued_at_ms;
  if (!envelope.SerializeToString(&record.envelope)) {
    throw util::InvalidPayload("enqueue: envelope could not be serialized");
  }

  bool inserted = false;
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      throw util::BrokerUnavailable("enqueue: broker channel is shut down");
    }

    inserted = db::Transact<util::BrokerUnavailable>(*repository_, "enqueue", [&](db::Transaction& tx) {
      auto result = repository_->InsertTask(tx, record);
      if (result.code == db::ErrorCode::AlreadyExists) {
        return false;
      }
      db::ThrowIfError<util::BrokerUnavailable>(result, "enqueue");
      return true;
    });
  }

  if (inserted) {
    cv_.notify_all();
    ANALYSIS_LOG_DEBUG("task enqueued", {observability::StringField("task_id", record.task_id), observability::StringField("task", record.task_name),
                                         observability::StringField("routing_key", record.routing_key)});
  } else {
    ANALYSIS_LOG_INFO("duplicate enqueue ignored", {observability::StringField("task_id", record.task_id)});
  }
  return record.task_id;
}

std::optional<Delivery> BrokerChannel::Dequeue(const CapabilitySet& capabilities) {
  return DequeueUntil(capabilities, std::nullopt);
}

std::optional<Delivery> BrokerChannel::DequeueFor(const CapabilitySet& capabilities, std::chrono::milliseconds timeout) {
  return DequeueUntil(capabilities, std::chrono::steady_clock::now() + timeout);
}

std::optional<Delivery> BrokerChannel::DequeueUntil(const CapabilitySet&                                   capabilities,
                                                    std::optional<std::chrono::steady_clock::time_point> deadline) {
  std::unique_lock lock(mutex_);

  while (!shutdown_) {
    const auto now_ms      = NowMs();
    uint64_t   next_due_ms = std::numeric_limits<uint64_t>::max();

    if (auto delivery = TryClaimLocked(capabilities, now_ms, next_due_ms)) {
      return delivery;
    }

    // sleep until the next known due time, but poll anyway so writes from
    // other processes sharing the repository are noticed
    auto wait = options_.poll_interval;
    if (next_due_ms > now_ms && next_due_ms - now_ms < static_cast<uint64_t>(wait.count())) {
      wait = std::chrono::milliseconds(next_due_ms - now_ms);
    }

    if (deadline) {
      const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0) {
        return std::nullopt;
      }
      wait = std::min(wait, remaining);
    }

    cv_.wait_for(lock, wait);
  }
  return std::nullopt;
}

std::optional<Delivery> BrokerChannel::TryClaimLocked(const CapabilitySet& capabilities, uint64_t now_ms, uint64_t& next_due_ms) {
  return db::Transact<util::BrokerUnavailable>(*repository_, "dequeue", [&](db::Transaction& tx) -> std::optional<Delivery> {
    auto tasks = repository_->ListTasks(tx, options_.channel);

    std::unordered_set<std::string> busy_keys;
    for (const auto& task : tasks) {
      if (task.state == db::model::TaskState::InFlight && task.lease_expires_at_ms > now_ms && !task.routing_key.empty()) {
        busy_keys.insert(task.routing_key);
      }
    }

    for (auto& task : tasks) {
      const auto name = ParseTaskName(task.task_name);
      if (!name || !capabilities.contains(*name)) {
        continue;
      }

      const bool expired_lease = task.state == db::model::TaskState::InFlight && task.lease_expires_at_ms <= now_ms;
      const bool ready         = task.state == db::model::TaskState::Ready && task.visible_at_ms <= now_ms;

      if (!ready && !expired_lease) {
        const auto due = task.state == db::model::TaskState::Ready ? task.visible_at_ms : task.lease_expires_at_ms;
        next_due_ms    = std::min(next_due_ms, due);
        continue;
      }
      if (!task.routing_key.empty() && busy_keys.contains(task.routing_key)) {
        continue;
      }

      if (expired_lease) {
        ANALYSIS_LOG_WARN("visibility timeout expired; redelivering",
                          {observability::StringField("task_id", task.task_id), observability::IntField("delivery_count", task.delivery_count)});
        observability::Metrics::Instance().RecordRedelivery(task.task_name);
      }

      Delivery delivery;
      if (!delivery.envelope.ParseFromString(task.envelope)) {
        // undecodable rows can never succeed; drop them so they do not block the queue
        ANALYSIS_LOG_ERROR("dropping undecodable envelope", {observability::StringField("task_id", task.task_id)});
        db::ThrowIfError<util::BrokerUnavailable>(repository_->DeleteTask(tx, options_.channel, task.task_id), "dequeue");
        continue;
      }

      task.state               = db::model::TaskState::InFlight;
      task.lease_id            = util::GenerateUUIDString();
      task.lease_expires_at_ms = now_ms + static_cast<uint64_t>(options_.visibility_timeout.count());
      task.delivery_count += 1;
      db::ThrowIfError<util::BrokerUnavailable>(repository_->UpdateTask(tx, task), "dequeue");

      delivery.lease_id       = task.lease_id;
      delivery.deadline_ms    = task.lease_expires_at_ms;
      delivery.delivery_count = task.delivery_count;
      return delivery;
    }
    return std::nullopt;
  });
}

bool BrokerChannel::Ack(const Delivery& delivery) {
  std::lock_guard lock(mutex_);

  const bool acked = db::Transact<util::BrokerUnavailable>(*repository_, "ack", [&](db::Transaction& tx) {
    auto task = repository_->GetTask(tx, options_.channel, delivery.envelope.task_id());
    if (!task || task->state != db::model::TaskState::InFlight || task->lease_id != delivery.lease_id) {
      return false;
    }
    db::ThrowIfError<util::BrokerUnavailable>(repository_->DeleteTask(tx, options_.channel, task->task_id), "ack");
    return true;
  });

  if (!acked) {
    ANALYSIS_LOG_WARN("ack rejected: stale lease", {observability::StringField("task_id", delivery.envelope.task_id())});
  }
  cv_.notify_all();
  return acked;
}

bool BrokerChannel::Nack(const Delivery& delivery, bool requeue, std::chrono::milliseconds delay, bool soft_wait) {
  bool accepted = false;
  {
    std::lock_guard lock(mutex_);

    accepted = db::Transact<util::BrokerUnavailable>(*repository_, "nack", [&](db::Transaction& tx) {
      auto task = repository_->GetTask(tx, options_.channel, delivery.envelope.task_id());
      if (!task || task->state != db::model::TaskState::InFlight || task->lease_id != delivery.lease_id) {
        return false;
      }

      if (!requeue) {
        db::ThrowIfError<util::BrokerUnavailable>(repository_->DeleteTask(tx, options_.channel, task->task_id), "nack");
        return true;
      }

      auto envelope = delivery.envelope;
      envelope.set_retry_count(envelope.retry_count() + 1);
      if (soft_wait) {
        envelope.set_soft_waits(envelope.soft_waits() + 1);
      }
      if (!envelope.SerializeToString(&task->envelope)) {
        throw util::BrokerUnavailable("nack: envelope could not be serialized");
      }

      task->state               = db::model::TaskState::Ready;
      task->visible_at_ms       = NowMs() + static_cast<uint64_t>(std::max<int64_t>(0, delay.count()));
      task->lease_id.clear();
      task->lease_expires_at_ms = 0;
      db::ThrowIfError<util::BrokerUnavailable>(repository_->UpdateTask(tx, *task), "nack");
      return true;
    });
  }

  if (!accepted) {
    ANALYSIS_LOG_WARN("nack rejected: stale lease", {observability::StringField("task_id", delivery.envelope.task_id())});
  }
  // a released routing key may unblock other envelopes
  cv_.notify_all();
  return accepted;
}

BrokerStats BrokerChannel::Stats() {
  std::lock_guard lock(mutex_);

  return db::Transact<util::BrokerUnavailable>(*repository_, "stats", [&](db::Transaction& tx) {
    BrokerStats stats;
    for (const auto& task : repository_->ListTasks(tx, options_.channel)) {
      if (task.state == db::model::TaskState::InFlight) {
        ++stats.in_flight;
      } else {
        ++stats.ready;
      }
    }
    return stats;
  });
}

void BrokerChannel::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

bool BrokerChannel::IsShutdown() const {
  std::lock_guard lock(mutex_);
  return shutdown_;
}

} // namespace analysis::broker
