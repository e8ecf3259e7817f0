#include "factory.hpp"

#include <chrono>
#include <memory>
#include <string>

#include "internal/aggregate/aggregate_coordinator.hpp"
#include "internal/algo/algorithm_registry.hpp"
#include "internal/broker/backend_channel.hpp"
#include "internal/broker/broker_channel.hpp"
#include "internal/config/channel_address.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/broker_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/pricing_source.hpp"
#include "internal/pipeline/stage_registry.hpp"
#include "internal/service/broker_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/storage/dataset_store.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/util/errors.hpp"
#include "internal/worker/pipeline_services.hpp"
#include "internal/worker/worker_pool.hpp"
#if ANALYSIS_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace analysis::factory {

using namespace analysis;

namespace {

/*
  Each channel gets its own repository (and its own SQLite connection) so
  broker and backend transactions never nest on one handle.
*/
std::shared_ptr<db::Repository> BuildRepository(const analysis::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if ANALYSIS_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode(),
                                                            std::chrono::milliseconds(database.sqlite().busy_timeout_ms()));
    db::sqlite::BootstrapSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::InvalidState("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

storage::DatasetStoreOptions StoreOptionsFrom(const analysis::runtime::config::StorageConfig& storage) {
  storage::DatasetStoreOptions options;
  options.enabled_upload  = !storage.object().has_enabled_upload() || storage.object().enabled_upload();
  options.enabled_publish = !storage.cache().has_enabled_publish() || storage.cache().enabled_publish();
  options.default_ttl     = std::chrono::seconds(storage.cache().default_ttl_sec());
  return options;
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const analysis::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Channels
  // ------------------------------------------------------------------
  const auto& channels        = config.channels();
  const auto  broker_address  = analysis::config::ParseChannelAddress(channels.broker_url());
  const auto  backend_address = analysis::config::ParseChannelAddress(channels.backend_url());
  if (broker_address.SameNamespace(backend_address)) {
    throw util::InvalidState("broker and backend share namespace " + broker_address.NamespaceKey());
  }

  broker::BrokerOptions broker_options;
  broker_options.channel            = broker_address.NamespaceKey();
  broker_options.visibility_timeout = std::chrono::milliseconds(channels.visibility_timeout_ms());
  broker_options.poll_interval      = std::chrono::milliseconds(channels.poll_interval_ms());

  app.broker  = std::make_shared<broker::BrokerChannel>(BuildRepository(config), broker_options);
  app.backend = std::make_shared<broker::BackendChannel>(BuildRepository(config), backend_address.NamespaceKey());

  // ------------------------------------------------------------------
  // Storage tiers
  // ------------------------------------------------------------------
  auto tiers = storage::StorageFactory::Build(config.storage());
  auto store = std::make_shared<storage::DatasetStore>(tiers.durable, tiers.cache, StoreOptionsFrom(config.storage()));

  // ------------------------------------------------------------------
  // Pipeline
  // ------------------------------------------------------------------
  const auto& pipeline_config = config.pipeline();

  aggregate::AggregateOptions aggregate_options;
  aggregate_options.wait = std::chrono::milliseconds(pipeline_config.aggregate_wait_ms());
  aggregate_options.poll = std::chrono::milliseconds(pipeline_config.aggregate_poll_ms());

  app.services             = std::make_shared<worker::PipelineServices>();
  app.services->store      = store;
  app.services->pipeline   = pipeline_config;
  app.services->source     = std::make_shared<pipeline::CsvPricingSource>(pipeline_config.csv_source_dir());
  app.services->algorithms = algo::AlgorithmRegistry::WithDefaults();
  app.services->aggregates = std::make_shared<aggregate::AggregateCoordinator>(store, aggregate_options);

  if (!app.services->algorithms->Contains(pipeline_config.default_algo())) {
    throw util::InvalidState("default algorithm is not registered: " + pipeline_config.default_algo());
  }

  app.stages = pipeline::StageRegistry::WithDefaults();
  app.pool   = std::make_shared<worker::WorkerPool>(config.workers(), app.broker, app.backend, app.stages, app.services);

  // ------------------------------------------------------------------
  // Producer-facing gRPC
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.broker  = app.broker;
  ctx.backend = app.backend;

  app.grpc_services.push_back(std::make_unique<grpc::BrokerServer>(std::make_shared<service::BrokerService>(ctx)));

  ANALYSIS_LOG_INFO("application built", {observability::StringField("broker", broker_address.NamespaceKey()),
                                          observability::StringField("backend", backend_address.NamespaceKey()),
                                          observability::IntField("workers", static_cast<int64_t>(app.pool->Size()))});
  return app;
}

} // namespace analysis::factory
