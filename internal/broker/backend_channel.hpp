#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "analysis/engine/v1/result.pb.h"
#include "internal/db/api/repository.hpp"

namespace analysis::broker {

/*
  Result store keyed by task id.

  Terminal records (SUCCESS / FAILED) are write-once: the first terminal
  write wins and later writes return the stored record unchanged.
  RETRYING records are progress markers and are replaced by later attempts.
*/
class BackendChannel {
 public:
  BackendChannel(std::shared_ptr<db::Repository> repository, std::string channel);

  // Returns the record now stored for the task. Throws util::BrokerUnavailable.
  engine::v1::ResultRecord Store(const engine::v1::ResultRecord& record);

  std::optional<engine::v1::ResultRecord> Get(const std::string& task_id);

  // Polls until a terminal record exists or the timeout elapses.
  std::optional<engine::v1::ResultRecord> WaitForTerminal(const std::string& task_id, std::chrono::milliseconds timeout,
                                                          std::chrono::milliseconds poll = std::chrono::milliseconds(20));

  uint64_t Count();

  const std::string& Channel() const {
    return channel_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  std::string                     channel_;
  std::mutex                      mutex_;
};

bool IsTerminal(engine::v1::TaskStatus status);

} // namespace analysis::broker
