#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

#include "internal/broker/task_schema.hpp"
#include "internal/config/channel_address.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace analysis::config {

using analysis::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("6379", "true")
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

namespace {

const char* Env(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

bool ParseBool(const std::string& name, const std::string& value) {
  if (value == "1" || value == "true" || value == "TRUE" || value == "yes") {
    return true;
  }
  if (value == "0" || value == "false" || value == "FALSE" || value == "no") {
    return false;
  }
  throw std::runtime_error("Invalid boolean for " + name + ": " + value);
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyEnvironmentOverrides(config);
  ApplyDefaults(config);
  Validate(config);
  return config;
}

RuntimeConfig ConfigLoader::LoadFromEnvironment() {
  RuntimeConfig config;
  ApplyEnvironmentOverrides(config);
  ApplyDefaults(config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyEnvironmentOverrides(RuntimeConfig& config) {
  if (const char* v = Env("ANALYSIS_TICKER")) config.mutable_pipeline()->set_default_ticker(v);
  if (const char* v = Env("ANALYSIS_TICKER_ID")) config.mutable_pipeline()->set_default_ticker_id(std::stoll(v));
  if (const char* v = Env("ANALYSIS_BROKER_URL")) config.mutable_channels()->set_broker_url(v);
  if (const char* v = Env("ANALYSIS_BACKEND_URL")) config.mutable_channels()->set_backend_url(v);
  if (const char* v = Env("ANALYSIS_CACHE_URL")) config.mutable_storage()->mutable_cache()->set_address(v);
  if (const char* v = Env("ANALYSIS_ENABLED_UPLOAD")) {
    config.mutable_storage()->mutable_object()->set_enabled_upload(ParseBool("ANALYSIS_ENABLED_UPLOAD", v));
  }
  if (const char* v = Env("ANALYSIS_ENABLED_PUBLISH")) {
    config.mutable_storage()->mutable_cache()->set_enabled_publish(ParseBool("ANALYSIS_ENABLED_PUBLISH", v));
  }
  if (const char* v = Env("ANALYSIS_S3_ACCESS_KEY")) config.mutable_storage()->mutable_object()->mutable_s3()->set_access_key(v);
  if (const char* v = Env("ANALYSIS_S3_SECRET_KEY")) config.mutable_storage()->mutable_object()->mutable_s3()->set_secret_key(v);
  if (const char* v = Env("ANALYSIS_S3_ENDPOINT")) config.mutable_storage()->mutable_object()->mutable_s3()->set_endpoint_override(v);
  if (const char* v = Env("ANALYSIS_S3_REGION")) config.mutable_storage()->mutable_object()->mutable_s3()->set_region(v);
  if (const char* v = Env("ANALYSIS_LOG_LEVEL")) config.mutable_logging()->set_level(v);
  if (const char* v = Env("ANALYSIS_LOG_DESTINATION")) config.mutable_logging()->set_destination(v);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->shutdown_grace_ms() == 0) server->set_shutdown_grace_ms(2000);
  if (server->max_receive_message_bytes() == 0) server->set_max_receive_message_bytes(16 * 1024 * 1024);

  auto* channels = config.mutable_channels();
  if (channels->broker_url().empty()) channels->set_broker_url("memory://localhost:6379/0");
  if (channels->backend_url().empty()) channels->set_backend_url("memory://localhost:6379/1");
  if (channels->visibility_timeout_ms() == 0) channels->set_visibility_timeout_ms(60000);
  if (channels->poll_interval_ms() == 0) channels->set_poll_interval_ms(250);

  if (!config.database().has_memory() && !config.database().has_sqlite()) {
    config.mutable_database()->mutable_memory();
  }
  if (config.database().has_sqlite() && config.database().sqlite().busy_timeout_ms() == 0) {
    config.mutable_database()->mutable_sqlite()->set_busy_timeout_ms(5000);
  }

  auto* object = config.mutable_storage()->mutable_object();
  if (object->root_path().empty()) object->set_root_path("/tmp/analysis-engine/objects");
  if (!object->has_enabled_upload()) object->set_enabled_upload(true);

  auto* cache = config.mutable_storage()->mutable_cache();
  if (cache->address().empty()) cache->set_address("memory://localhost:6379/0");
  if (cache->default_ttl_sec() == 0) cache->set_default_ttl_sec(3600);
  if (!cache->has_enabled_publish()) cache->set_enabled_publish(true);

  auto* workers = config.mutable_workers();
  if (workers->groups().empty()) {
    auto* group = workers->add_groups();
    group->set_name("default");
    group->set_threads(2);
    for (auto name : broker::AllTaskNames()) {
      group->add_capabilities(broker::TaskNameToString(name));
    }
  }
  if (workers->max_retries() == 0) workers->set_max_retries(3);
  if (workers->retry_backoff_ms() == 0) workers->set_retry_backoff_ms(500);
  if (workers->retry_backoff_max_ms() == 0) workers->set_retry_backoff_max_ms(30000);
  if (workers->soft_wait_delay_ms() == 0) workers->set_soft_wait_delay_ms(5000);

  auto* pipeline = config.mutable_pipeline();
  if (pipeline->default_ticker().empty()) pipeline->set_default_ticker("SPY");
  if (pipeline->default_ticker_id() == 0) pipeline->set_default_ticker_id(1);
  if (pipeline->min_prepared_rows() == 0) pipeline->set_min_prepared_rows(1);
  if (pipeline->csv_source_dir().empty()) pipeline->set_csv_source_dir("/tmp/analysis-engine/sources");
  if (pipeline->default_algo().empty()) pipeline->set_default_algo("base");
  if (pipeline->starting_balance() == 0) pipeline->set_starting_balance(10000.0);
  if (pipeline->sma_window() == 0) pipeline->set_sma_window(5);
  if (pipeline->aggregate_wait_ms() == 0) pipeline->set_aggregate_wait_ms(2000);
  if (pipeline->aggregate_poll_ms() == 0) pipeline->set_aggregate_poll_ms(100);

  auto* observability = config.mutable_observability();
  if (observability->service_name().empty()) observability->set_service_name("analysis-engine");
  if (observability->metrics_export_interval_ms() == 0) observability->set_metrics_export_interval_ms(5000);

  if (config.logging().level().empty()) config.mutable_logging()->set_level("info");
  if (config.logging().destination().empty()) config.mutable_logging()->set_destination("stdout");
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto broker  = ParseChannelAddress(config.channels().broker_url());
  const auto backend = ParseChannelAddress(config.channels().backend_url());
  (void)ParseChannelAddress(config.storage().cache().address());

  if (broker.SameNamespace(backend)) {
    throw util::InvalidState("broker and backend must use distinct namespaces: " + config.channels().broker_url() + " vs " +
                             config.channels().backend_url());
  }

  if (!observability::IsKnownLogLevel(config.logging().level())) {
    throw util::InvalidState("unknown logging.level: " + config.logging().level());
  }

  for (const auto& group : config.workers().groups()) {
    if (group.capabilities().empty()) {
      throw util::InvalidState("worker group '" + group.name() + "' declares no capabilities");
    }
    for (const auto& capability : group.capabilities()) {
      if (!broker::ParseTaskName(capability).has_value()) {
        throw util::InvalidState("worker group '" + group.name() + "' declares unknown task: " + capability);
      }
    }
  }
}

} // namespace analysis::config
