#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "analysis/engine/v1/task.pb.h"
#include "internal/db/api/repository.hpp"

namespace analysis::broker {

using CapabilitySet = std::set<engine::v1::TaskName>;

/*
  One claimed envelope.

  lease_id identifies this particular delivery; after the visibility
  deadline passes the envelope may be handed to another worker under a new
  lease and the old one can no longer ack or nack.
*/
struct Delivery {
  engine::v1::TaskEnvelope envelope;
  std::string              lease_id;
  uint64_t                 deadline_ms    = 0;
  uint32_t                 delivery_count = 0;
};

struct BrokerOptions {
  // Namespace key of the broker address (see ChannelAddress::NamespaceKey).
  std::string               channel;
  std::chrono::milliseconds visibility_timeout{60000};
  std::chrono::milliseconds poll_interval{250};
};

struct BrokerStats {
  uint64_t ready     = 0;
  uint64_t in_flight = 0;
};

/*
  At-least-once task queue on top of db::Repository.

  - Enqueue validates the payload and is idempotent on task_id while the
    id is queued or in flight; an acked id can be enqueued again
  - Dequeue filters by capability and never hands out two live deliveries
    sharing a routing key
  - Unacked deliveries become visible again after the visibility timeout

  All repository access is serialized by mutex_; the repository must not be
  shared with another channel.
*/
class BrokerChannel {
 public:
  BrokerChannel(std::shared_ptr<db::Repository> repository, BrokerOptions options);

  // Throws util::InvalidPayload, util::BrokerUnavailable.
  std::string Enqueue(engine::v1::TaskEnvelope envelope);

  // Blocks until a matching envelope is visible; nullopt after Shutdown().
  std::optional<Delivery> Dequeue(const CapabilitySet& capabilities);

  std::optional<Delivery> DequeueFor(const CapabilitySet& capabilities, std::chrono::milliseconds timeout);

  // false when the lease is stale (already redelivered, acked or dropped).
  bool Ack(const Delivery& delivery);

  // requeue: visible again after delay with retry_count + 1 (and
  // soft_waits + 1 when soft_wait); otherwise the envelope is dropped.
  bool Nack(const Delivery& delivery, bool requeue, std::chrono::milliseconds delay = std::chrono::milliseconds(0), bool soft_wait = false);

  BrokerStats Stats();

  void Shutdown();
  bool IsShutdown() const;

  const BrokerOptions& Options() const {
    return options_;
  }

 private:
  std::optional<Delivery> DequeueUntil(const CapabilitySet& capabilities, std::optional<std::chrono::steady_clock::time_point> deadline);

  // Caller holds mutex_. next_due_ms receives the earliest time a matching
  // envelope becomes claimable.
  std::optional<Delivery> TryClaimLocked(const CapabilitySet& capabilities, uint64_t now_ms, uint64_t& next_due_ms);

  std::shared_ptr<db::Repository> repository_;
  BrokerOptions                   options_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  bool                    shutdown_ = false;
};

} // namespace analysis::broker
