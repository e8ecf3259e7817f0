#include "backend_channel.hpp"

#include <thread>

#include "internal/broker/task_schema.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace analysis::broker {

using engine::v1::ResultRecord;

namespace {

ResultRecord Decode(const db::model::ResultRow& row) {
  ResultRecord record;
  if (!record.ParseFromString(row.record)) {
    throw util::BrokerUnavailable("backend: stored result for " + row.task_id + " is corrupt");
  }
  return record;
}

} // namespace

bool IsTerminal(engine::v1::TaskStatus status) {
  return status == engine::v1::TASK_STATUS_SUCCESS || status == engine::v1::TASK_STATUS_FAILED;
}

BackendChannel::BackendChannel(std::shared_ptr<db::Repository> repository, std::string channel)
    : repository_(std::move(repository)), channel_(std::move(channel)) {
}

ResultRecord BackendChannel::Store(const ResultRecord& record) {
  if (record.task_id().empty()) {
    throw util::InvalidPayload("backend: result record without task_id");
  }

  db::model::ResultRow row;
  row.channel         = channel_;
  row.task_id         = record.task_id();
  row.task_name       = TaskNameToString(record.task_name());
  row.status          = static_cast<int>(record.status());
  row.terminal        = IsTerminal(record.status());
  row.completed_at_ms = record.has_completed_at() ? util::ToUnixMillis(util::FromProto(record.completed_at())) : util::ToUnixMillis(util::Now());
  if (!record.SerializeToString(&row.record)) {
    throw util::BrokerUnavailable("backend: result could not be serialized");
  }

  std::lock_guard lock(mutex_);

  return db::Transact<util::BrokerUnavailable>(*repository_, "backend store", [&](db::Transaction& tx) {
    auto existing = repository_->GetResult(tx, channel_, record.task_id());
    if (existing && existing->terminal) {
      ANALYSIS_LOG_INFO("terminal result already recorded; keeping first",
                        {observability::StringField("task_id", record.task_id()), observability::IntField("status", existing->status)});
      return Decode(*existing);
    }

    if (existing) {
      db::ThrowIfError<util::BrokerUnavailable>(repository_->UpdateResult(tx, row), "backend store");
    } else {
      db::ThrowIfError<util::BrokerUnavailable>(repository_->InsertResult(tx, row), "backend store");
    }
    return record;
  });
}

std::optional<ResultRecord> BackendChannel::Get(const std::string& task_id) {
  std::lock_guard lock(mutex_);

  auto row = db::Transact<util::BrokerUnavailable>(*repository_, "backend get",
                                                   [&](db::Transaction& tx) { return repository_->GetResult(tx, channel_, task_id); });
  if (!row) {
    return std::nullopt;
  }
  return Decode(*row);
}

std::optional<ResultRecord> BackendChannel::WaitForTerminal(const std::string& task_id, std::chrono::milliseconds timeout,
                                                            std::chrono::milliseconds poll) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    auto record = Get(task_id);
    if (record && IsTerminal(record->status())) {
      return record;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return std::nullopt;
    }
    std::this_thread::sleep_for(poll);
  }
}

uint64_t BackendChannel::Count() {
  std::lock_guard lock(mutex_);
  return db::Transact<util::BrokerUnavailable>(*repository_, "backend count",
                                               [&](db::Transaction& tx) { return repository_->CountResults(tx, channel_); });
}

} // namespace analysis::broker
