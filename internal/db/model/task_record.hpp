#pragma once

#include <cstdint>
#include <string>

namespace analysis::db::model {

enum class TaskState : int {
  Ready    = 0,
  InFlight = 1,
};

/*
  One queued envelope on a broker channel.

  envelope holds the serialized TaskEnvelope; task_name and routing_key are
  denormalized so dequeue can filter without decoding.
*/
struct TaskRecord {
  std::string channel;
  std::string task_id;
  uint64_t    seq = 0;
  std::string task_name;
  std::string routing_key;
  std::string envelope;

  TaskState   state               = TaskState::Ready;
  uint64_t    visible_at_ms       = 0;
  std::string lease_id;
  uint64_t    lease_expires_at_ms = 0;
  uint32_t    delivery_count      = 0;
  uint64_t    enqueued_at_ms      = 0;
};

} // namespace analysis::db::model
