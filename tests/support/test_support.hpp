#pragma once

#include <arrow/filesystem/localfs.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "analysis/engine/v1/task.pb.h"
#include "internal/aggregate/aggregate_coordinator.hpp"
#include "internal/algo/algorithm_registry.hpp"
#include "internal/broker/backend_channel.hpp"
#include "internal/broker/broker_channel.hpp"
#include "internal/broker/task_schema.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/pipeline/pricing_source.hpp"
#include "internal/storage/cache/ram_cache_store.hpp"
#include "internal/storage/dataset_store.hpp"
#include "internal/storage/object/object_arrow_store.hpp"
#include "internal/util/time.hpp"
#include "internal/worker/pipeline_services.hpp"

namespace analysis::testing {

// Fresh, empty directory under the system temp dir.
inline std::filesystem::path TempDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "analysis_engine_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

inline std::shared_ptr<storage::ObjectArrowStore> LocalObjectStore(const std::filesystem::path& root) {
  return std::make_shared<storage::ObjectArrowStore>(std::make_shared<arrow::fs::LocalFileSystem>(), root.string());
}

/*
  Writes <dir>/<ticker>.csv with `rows` consecutive weekday rows starting
  2020-01-06 (a Monday). Closes follow a small zig-zag around `base` so the
  reference algorithm produces crossings.
*/
inline void WriteCsv(const std::filesystem::path& dir, const std::string& ticker, int rows, double base = 100.0) {
  constexpr int64_t kDayMs = 24LL * 60 * 60 * 1000;

  std::ofstream out(dir / (ticker + ".csv"));
  out << "Date,Open,High,Low,Close,Volume\n";

  int64_t day_ms = *util::ParseDateMillis("2020-01-06");
  for (int written = 0; written < rows; day_ms += kDayMs) {
    if (util::WeekdayOf(day_ms) >= 5) {
      continue;
    }
    const double close = base + ((written / 3) % 2 == 0 ? written % 3 : -(written % 3)) + written * 0.1;
    out << util::FormatDate(day_ms) << "," << close - 0.5 << "," << close + 1.0 << "," << close - 1.0 << "," << close << "," << 1000 + written
        << "\n";
    ++written;
  }
}

inline engine::v1::TaskEnvelope Envelope(engine::v1::TaskName name, const std::string& task_id = {}) {
  engine::v1::TaskEnvelope envelope;
  envelope.set_task_id(task_id);
  envelope.set_task_name(name);
  return envelope;
}

inline void Put(engine::v1::TaskEnvelope& envelope, const std::string& key, engine::v1::PayloadValue value) {
  (*envelope.mutable_payload())[key] = std::move(value);
}

/*
  In-process world: memory broker/backend, local object tier, RAM cache,
  CSV pricing source and the default registries.
*/
struct Harness {
  std::filesystem::path root;
  std::filesystem::path csv_dir;

  std::shared_ptr<db::memory::MemoryRepository> broker_repository  = std::make_shared<db::memory::MemoryRepository>();
  std::shared_ptr<db::memory::MemoryRepository> backend_repository = std::make_shared<db::memory::MemoryRepository>();
  std::shared_ptr<broker::BrokerChannel>        broker;
  std::shared_ptr<broker::BackendChannel>       backend;

  std::shared_ptr<storage::ObjectArrowStore> durable;
  std::shared_ptr<storage::RamCacheStore>    cache;
  std::shared_ptr<worker::PipelineServices>  services = std::make_shared<worker::PipelineServices>();

  explicit Harness(const std::string& name, storage::DatasetStoreOptions store_options = {}) {
    root    = TempDir(name);
    csv_dir = root / "sources";
    std::filesystem::create_directories(csv_dir);

    broker::BrokerOptions options;
    options.channel            = "localhost:6379/0";
    options.visibility_timeout = std::chrono::milliseconds(60000);
    options.poll_interval      = std::chrono::milliseconds(10);
    broker  = std::make_shared<broker::BrokerChannel>(broker_repository, options);
    backend = std::make_shared<broker::BackendChannel>(backend_repository, "localhost:6379/1");

    durable = LocalObjectStore(root / "objects");
    cache   = std::make_shared<storage::RamCacheStore>(0);

    services->store = std::make_shared<storage::DatasetStore>(durable, cache, store_options);
    services->pipeline.set_min_prepared_rows(1);
    services->pipeline.set_default_ticker_id(1);
    services->pipeline.set_default_algo("base");
    services->pipeline.set_starting_balance(10000.0);
    services->pipeline.set_commission(6.0);
    services->pipeline.set_sma_window(5);
    services->source     = std::make_shared<pipeline::CsvPricingSource>(csv_dir.string());
    services->algorithms = algo::AlgorithmRegistry::WithDefaults();
    services->aggregates = std::make_shared<aggregate::AggregateCoordinator>(
        services->store, aggregate::AggregateOptions{std::chrono::milliseconds(50), std::chrono::milliseconds(5)});
  }

  storage::DatasetStore& Store() {
    return *services->store;
  }
};

} // namespace analysis::testing
