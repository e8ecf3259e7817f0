#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/broker/backend_channel.hpp"
#include "internal/broker/broker_channel.hpp"
#include "internal/broker/task_schema.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

#if ANALYSIS_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using namespace std::chrono_literals;
using analysis::db::ErrorCode;
using analysis::db::Repository;
using analysis::db::memory::MemoryRepository;
using analysis::db::model::ResultRow;
using analysis::db::model::TaskRecord;
using analysis::db::model::TaskState;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

TaskRecord Task(const std::string& channel, const std::string& id, const std::string& routing_key = {}) {
  TaskRecord record;
  record.channel        = channel;
  record.task_id        = id;
  record.task_name      = "task_run_algo";
  record.routing_key    = routing_key;
  record.envelope       = "envelope-" + id;
  record.visible_at_ms  = NowMs();
  record.enqueued_at_ms = NowMs();
  return record;
}

ResultRow Row(const std::string& channel, const std::string& id, int status, bool terminal) {
  ResultRow row;
  row.channel         = channel;
  row.task_id         = id;
  row.task_name       = "task_run_algo";
  row.status          = status;
  row.terminal        = terminal;
  row.record          = "record-" + id + "-" + std::to_string(status);
  row.completed_at_ms = NowMs();
  return row;
}

void VerifyTaskLifecycle(Repository& repo, const std::string& channel) {
  auto tx = repo.Begin();

  auto first  = Task(channel, "a", "pricing:SPY");
  auto second = Task(channel, "b");
  assert(repo.InsertTask(*tx, first));
  assert(repo.InsertTask(*tx, second));
  assert(second.seq > first.seq);

  auto duplicate = Task(channel, "a");
  assert(repo.InsertTask(*tx, duplicate).code == ErrorCode::AlreadyExists);

  auto read = repo.GetTask(*tx, channel, "a");
  assert(read.has_value());
  assert(read->routing_key == "pricing:SPY");
  assert(read->envelope == "envelope-a");
  assert(read->state == TaskState::Ready);

  read->state               = TaskState::InFlight;
  read->lease_id            = "lease-1";
  read->lease_expires_at_ms = NowMs() + 1000;
  read->delivery_count      = 1;
  assert(repo.UpdateTask(*tx, *read));

  auto updated = repo.GetTask(*tx, channel, "a");
  assert(updated->state == TaskState::InFlight);
  assert(updated->lease_id == "lease-1");
  assert(updated->delivery_count == 1);
  assert(updated->seq == first.seq);

  const auto listed = repo.ListTasks(*tx, channel);
  assert(listed.size() == 2);
  assert(listed[0].task_id == "a");
  assert(listed[1].task_id == "b");

  assert(repo.DeleteTask(*tx, channel, "a"));
  assert(repo.DeleteTask(*tx, channel, "a").code == ErrorCode::NotFound);
  assert(!repo.GetTask(*tx, channel, "a").has_value());

  auto missing = Task(channel, "ghost");
  assert(repo.UpdateTask(*tx, missing).code == ErrorCode::NotFound);

  tx->Commit();
}

void VerifyResultLifecycle(Repository& repo, const std::string& channel) {
  auto tx = repo.Begin();

  assert(repo.InsertResult(*tx, Row(channel, "r1", 4, false)));
  assert(repo.InsertResult(*tx, Row(channel, "r1", 2, true)).code == ErrorCode::AlreadyExists);
  assert(repo.UpdateResult(*tx, Row(channel, "r1", 2, true)));
  assert(repo.UpdateResult(*tx, Row(channel, "r-missing", 2, true)).code == ErrorCode::NotFound);

  auto read = repo.GetResult(*tx, channel, "r1");
  assert(read.has_value());
  assert(read->status == 2);
  assert(read->terminal);
  assert(read->record == "record-r1-2");

  assert(repo.InsertResult(*tx, Row(channel, "r2", 3, true)));
  assert(repo.CountResults(*tx, channel) == 2);
  assert(!repo.GetResult(*tx, channel, "r3").has_value());

  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& channel) {
  {
    auto tx     = repo.Begin();
    auto record = Task(channel, "rolled-back");
    assert(repo.InsertTask(*tx, record));
    assert(repo.InsertResult(*tx, Row(channel, "rolled-back", 2, true)));
    tx->Rollback();
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetTask(*check_tx, channel, "rolled-back").has_value());
  assert(!repo.GetResult(*check_tx, channel, "rolled-back").has_value());
  check_tx->Commit();
}

void VerifyChannelIsolation(Repository& repo, const std::string& prefix) {
  const auto one = prefix + "-host:6379/0";
  const auto two = prefix + "-host:6379/1";

  auto tx  = repo.Begin();
  auto in1 = Task(one, "shared-id");
  auto in2 = Task(two, "shared-id");
  assert(repo.InsertTask(*tx, in1));
  assert(repo.InsertTask(*tx, in2));
  assert(repo.InsertResult(*tx, Row(one, "shared-id", 2, true)));

  assert(repo.ListTasks(*tx, one).size() == 1);
  assert(repo.ListTasks(*tx, two).size() == 1);
  assert(repo.CountResults(*tx, one) == 1);
  assert(repo.CountResults(*tx, two) == 0);
  assert(!repo.GetResult(*tx, two, "shared-id").has_value());
  tx->Commit();
}

// Broker and backend channels behave the same on every repository.
void VerifyChannelsOnRepository(const std::shared_ptr<Repository>& broker_repo, const std::shared_ptr<Repository>& backend_repo,
                                const std::string& prefix) {
  analysis::broker::BrokerOptions options;
  options.channel            = prefix + "-broker:6379/0";
  options.visibility_timeout = 20ms;
  options.poll_interval      = 5ms;
  analysis::broker::BrokerChannel  broker(broker_repo, options);
  analysis::broker::BackendChannel backend(backend_repo, prefix + "-backend:6379/1");

  analysis::engine::v1::TaskEnvelope envelope;
  envelope.set_task_id(prefix + "-job");
  envelope.set_task_name(analysis::engine::v1::TASK_NAME_RUN_ALGO);
  (*envelope.mutable_payload())["ticker"] = analysis::broker::StringValue("SPY");
  assert(broker.Enqueue(envelope) == prefix + "-job");
  assert(broker.Enqueue(envelope) == prefix + "-job");
  assert(broker.Stats().ready == 1);

  auto first = broker.DequeueFor({analysis::engine::v1::TASK_NAME_RUN_ALGO}, 100ms);
  assert(first.has_value());
  assert(first->delivery_count == 1);

  // lease expires; the envelope comes back under a new lease
  auto second = broker.DequeueFor({analysis::engine::v1::TASK_NAME_RUN_ALGO}, 200ms);
  assert(second.has_value());
  assert(second->delivery_count == 2);
  assert(second->lease_id != first->lease_id);
  assert(!broker.Ack(*first));
  assert(broker.Ack(*second));
  assert(broker.Stats().ready == 0 && broker.Stats().in_flight == 0);

  analysis::engine::v1::ResultRecord record;
  record.set_task_id(prefix + "-job");
  record.set_task_name(analysis::engine::v1::TASK_NAME_RUN_ALGO);
  record.set_status(analysis::engine::v1::TASK_STATUS_SUCCESS);
  (*record.mutable_record())["attempt"] = "first";
  backend.Store(record);

  (*record.mutable_record())["attempt"] = "second";
  const auto stored = backend.Store(record);
  assert(stored.record().at("attempt") == "first");
  assert(backend.Count() == 1);
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& channel) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx     = repo->Begin();
    auto record = Task(channel, "durable", "pricing:AAPL");
    assert(repo->InsertTask(*tx, record));
    assert(repo->InsertResult(*tx, Row(channel, "durable", 2, true)));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx   = repo->Begin();
  auto task = repo->GetTask(*tx, channel, "durable");
  assert(task.has_value());
  assert(task->routing_key == "pricing:AAPL");
  auto row = repo->GetResult(*tx, channel, "durable");
  assert(row.has_value());
  assert(row->terminal);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if ANALYSIS_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("analysis_engine_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<analysis::db::sqlite::SqliteDB>(db_path);
    analysis::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<analysis::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifyTaskLifecycle(*repo, backend.name + "-tasks");
  VerifyResultLifecycle(*repo, backend.name + "-results");
  VerifyRollbackBehavior(*repo, backend.name + "-rollback");
  VerifyChannelIsolation(*repo, backend.name);
  VerifyChannelsOnRepository(backend.make_repository(), backend.make_repository(), backend.name);

  VerifyRestartDurability(backend, backend.name + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if ANALYSIS_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "analysis_integration_repository_parity: pass\n";
  return 0;
}
