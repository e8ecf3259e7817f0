#include "task_schema.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace analysis::broker {

namespace {

using engine::v1::TASK_NAME_GET_NEW_PRICING_DATA;
using engine::v1::TASK_NAME_HANDLE_PRICING_UPDATE;
using engine::v1::TASK_NAME_PREPARE_PRICING_DATASET;
using engine::v1::TASK_NAME_PUBLISH_FROM_S3_TO_REDIS;
using engine::v1::TASK_NAME_PUBLISH_PRICING_UPDATE;
using engine::v1::TASK_NAME_PUBLISH_TICKER_AGGREGATE;
using engine::v1::TASK_NAME_RUN_ALGO;
using engine::v1::TASK_NAME_SCREENER_ANALYSIS;

enum class Kind {
  kString,
  kInt,
  kDouble, // int accepted
  kBool,
  kBytes,  // blob or string
  kDate,   // string parseable by ParseDateMillis
  kTicker, // string, NormalizeTicker must succeed
  kTask,   // string naming a declared task
};

struct FieldSpec {
  const char* key;
  Kind        kind;
  bool        required;
};

using Schema = std::vector<FieldSpec>;

const std::map<TaskName, std::string>& WireNames() {
  static const std::map<TaskName, std::string> kNames = {
      {TASK_NAME_GET_NEW_PRICING_DATA, "get_new_pricing_data"},
      {TASK_NAME_HANDLE_PRICING_UPDATE, "handle_pricing_update_task"},
      {TASK_NAME_PREPARE_PRICING_DATASET, "prepare_pricing_dataset"},
      {TASK_NAME_PUBLISH_FROM_S3_TO_REDIS, "publish_from_s3_to_redis"},
      {TASK_NAME_PUBLISH_PRICING_UPDATE, "publish_pricing_update"},
      {TASK_NAME_SCREENER_ANALYSIS, "task_screener_analysis"},
      {TASK_NAME_PUBLISH_TICKER_AGGREGATE, "publish_ticker_aggregate_from_s3"},
      {TASK_NAME_RUN_ALGO, "task_run_algo"},
  };
  return kNames;
}

const Schema& SchemaFor(TaskName name) {
  static const std::map<TaskName, Schema> kSchemas = {
      {TASK_NAME_GET_NEW_PRICING_DATA,
       {{"ticker", Kind::kTicker, true},
        {"ticker_id", Kind::kInt, false},
        {"date_from", Kind::kDate, false},
        {"date_to", Kind::kDate, false},
        {"source", Kind::kString, false}}},
      {TASK_NAME_PREPARE_PRICING_DATASET,
       {{"ticker", Kind::kTicker, true},
        {"ticker_id", Kind::kInt, false},
        {"source_bucket", Kind::kString, false},
        {"source_key", Kind::kString, false},
        {"raw", Kind::kBytes, false},
        {"min_rows", Kind::kInt, false}}},
      {TASK_NAME_HANDLE_PRICING_UPDATE,
       {{"ticker", Kind::kTicker, true},
        {"ticker_id", Kind::kInt, false},
        {"s3_bucket", Kind::kString, false},
        {"s3_key", Kind::kString, false},
        {"redis_key", Kind::kString, false},
        {"s3_enabled", Kind::kBool, false},
        {"redis_enabled", Kind::kBool, false},
        {"redis_expire", Kind::kInt, false}}},
      {TASK_NAME_PUBLISH_PRICING_UPDATE,
       {{"ticker", Kind::kTicker, true},
        {"ticker_id", Kind::kInt, false},
        {"s3_bucket", Kind::kString, false},
        {"s3_key", Kind::kString, false},
        {"redis_key", Kind::kString, false},
        {"data", Kind::kBytes, false},
        {"updated", Kind::kString, false},
        {"s3_enabled", Kind::kBool, false},
        {"redis_enabled", Kind::kBool, false},
        {"redis_expire", Kind::kInt, false}}},
      {TASK_NAME_PUBLISH_FROM_S3_TO_REDIS,
       {{"s3_key", Kind::kString, true},
        {"ticker", Kind::kTicker, false},
        {"ticker_id", Kind::kInt, false},
        {"s3_bucket", Kind::kString, false},
        {"redis_key", Kind::kString, false},
        {"redis_expire", Kind::kInt, false}}},
      {TASK_NAME_SCREENER_ANALYSIS,
       {{"tickers", Kind::kString, false},
        {"min_rows", Kind::kInt, false},
        {"min_close", Kind::kDouble, false},
        {"max_close", Kind::kDouble, false},
        {"next_task", Kind::kTask, false},
        {"algo", Kind::kString, false}}},
      {TASK_NAME_PUBLISH_TICKER_AGGREGATE,
       {{"tickers", Kind::kString, true},
        {"name", Kind::kString, false},
        {"wait_ms", Kind::kInt, false}}},
      {TASK_NAME_RUN_ALGO,
       {{"ticker", Kind::kTicker, true},
        {"ticker_id", Kind::kInt, false},
        {"algo", Kind::kString, false},
        {"starting_balance", Kind::kDouble, false},
        {"commission", Kind::kDouble, false}}},
  };
  return kSchemas.at(name);
}

bool Matches(const PayloadValue& value, Kind kind) {
  switch (kind) {
    case Kind::kString:
    case Kind::kDate:
    case Kind::kTicker:
    case Kind::kTask:
      return value.kind_case() == PayloadValue::kStringValue;
    case Kind::kInt:
      return value.kind_case() == PayloadValue::kIntValue;
    case Kind::kDouble:
      return value.kind_case() == PayloadValue::kDoubleValue || value.kind_case() == PayloadValue::kIntValue;
    case Kind::kBool:
      return value.kind_case() == PayloadValue::kBoolValue;
    case Kind::kBytes:
      return value.kind_case() == PayloadValue::kBlobValue || value.kind_case() == PayloadValue::kStringValue;
  }
  return false;
}

void ValidateField(const std::string& task, const FieldSpec& spec, const PayloadValue& value) {
  if (!Matches(value, spec.kind)) {
    throw util::InvalidPayload(task + ": payload key '" + spec.key + "' has the wrong type");
  }

  switch (spec.kind) {
    case Kind::kTicker:
      (void)NormalizeTicker(value.string_value());
      break;
    case Kind::kDate:
      if (!util::ParseDateMillis(value.string_value()).has_value()) {
        throw util::InvalidPayload(task + ": payload key '" + spec.key + "' is not a date: " + value.string_value());
      }
      break;
    case Kind::kTask:
      if (!ParseTaskName(value.string_value()).has_value()) {
        throw util::InvalidPayload(task + ": payload key '" + spec.key + "' names an unknown task: " + value.string_value());
      }
      break;
    default:
      break;
  }
}

} // namespace

const std::vector<TaskName>& AllTaskNames() {
  static const std::vector<TaskName> kAll = [] {
    std::vector<TaskName> names;
    for (const auto& [name, _] : WireNames()) {
      names.push_back(name);
    }
    return names;
  }();
  return kAll;
}

std::string TaskNameToString(TaskName name) {
  const auto& names = WireNames();
  const auto  it    = names.find(name);
  return it == names.end() ? "unknown" : it->second;
}

std::optional<TaskName> ParseTaskName(std::string_view name) {
  for (const auto& [value, wire] : WireNames()) {
    if (wire == name) {
      return value;
    }
  }
  return std::nullopt;
}

void ValidateEnvelope(const TaskEnvelope& envelope) {
  if (!WireNames().contains(envelope.task_name())) {
    throw util::InvalidPayload("unknown task_name: " + std::to_string(static_cast<int>(envelope.task_name())));
  }

  const auto  task   = TaskNameToString(envelope.task_name());
  const auto& schema = SchemaFor(envelope.task_name());

  for (const auto& spec : schema) {
    const auto it = envelope.payload().find(spec.key);
    if (it == envelope.payload().end()) {
      if (spec.required) {
        throw util::InvalidPayload(task + ": missing required payload key '" + spec.key + "'");
      }
      continue;
    }
    ValidateField(task, spec, it->second);
  }

  for (const auto& [key, _] : envelope.payload()) {
    const bool declared = std::any_of(schema.begin(), schema.end(), [&](const FieldSpec& spec) { return key == spec.key; });
    if (!declared) {
      throw util::InvalidPayload(task + ": undeclared payload key '" + key + "'");
    }
  }
}

std::string NormalizeTicker(const std::string& ticker) {
  if (ticker.empty() || ticker.size() > 16) {
    throw util::InvalidPayload("invalid ticker: '" + ticker + "'");
  }

  std::string out;
  out.reserve(ticker.size());
  for (char c : ticker) {
    const auto uc = static_cast<unsigned char>(c);
    if (!std::isalnum(uc) && c != '.' && c != '-' && c != '^') {
      throw util::InvalidPayload("invalid ticker: '" + ticker + "'");
    }
    out.push_back(static_cast<char>(std::toupper(uc)));
  }
  return out;
}

std::string RoutingKeyFor(const TaskEnvelope& envelope) {
  const auto ticker = GetString(envelope, "ticker");
  if (!ticker) {
    return {};
  }

  switch (envelope.task_name()) {
    case TASK_NAME_PREPARE_PRICING_DATASET:
      return "pricing:" + NormalizeTicker(*ticker);
    case TASK_NAME_PUBLISH_PRICING_UPDATE:
      if (GetString(envelope, "s3_bucket").value_or("pricing") == "pricing") {
        return "pricing:" + NormalizeTicker(*ticker);
      }
      return {};
    default:
      return {};
  }
}

PayloadValue StringValue(std::string value) {
  PayloadValue v;
  v.set_string_value(std::move(value));
  return v;
}

PayloadValue IntValue(int64_t value) {
  PayloadValue v;
  v.set_int_value(value);
  return v;
}

PayloadValue DoubleValue(double value) {
  PayloadValue v;
  v.set_double_value(value);
  return v;
}

PayloadValue BoolValue(bool value) {
  PayloadValue v;
  v.set_bool_value(value);
  return v;
}

PayloadValue BlobValue(std::string bytes) {
  PayloadValue v;
  v.set_blob_value(std::move(bytes));
  return v;
}

std::optional<std::string> GetString(const TaskEnvelope& envelope, const std::string& key) {
  const auto it = envelope.payload().find(key);
  if (it == envelope.payload().end() || it->second.kind_case() != PayloadValue::kStringValue) {
    return std::nullopt;
  }
  return it->second.string_value();
}

std::optional<int64_t> GetInt(const TaskEnvelope& envelope, const std::string& key) {
  const auto it = envelope.payload().find(key);
  if (it == envelope.payload().end() || it->second.kind_case() != PayloadValue::kIntValue) {
    return std::nullopt;
  }
  return it->second.int_value();
}

std::optional<double> GetDouble(const TaskEnvelope& envelope, const std::string& key) {
  const auto it = envelope.payload().find(key);
  if (it == envelope.payload().end()) {
    return std::nullopt;
  }
  if (it->second.kind_case() == PayloadValue::kDoubleValue) {
    return it->second.double_value();
  }
  if (it->second.kind_case() == PayloadValue::kIntValue) {
    return static_cast<double>(it->second.int_value());
  }
  return std::nullopt;
}

std::optional<bool> GetBool(const TaskEnvelope& envelope, const std::string& key) {
  const auto it = envelope.payload().find(key);
  if (it == envelope.payload().end() || it->second.kind_case() != PayloadValue::kBoolValue) {
    return std::nullopt;
  }
  return it->second.bool_value();
}

std::optional<std::string> GetBytes(const TaskEnvelope& envelope, const std::string& key) {
  const auto it = envelope.payload().find(key);
  if (it == envelope.payload().end()) {
    return std::nullopt;
  }
  if (it->second.kind_case() == PayloadValue::kBlobValue) {
    return it->second.blob_value();
  }
  if (it->second.kind_case() == PayloadValue::kStringValue) {
    return it->second.string_value();
  }
  return std::nullopt;
}

std::vector<std::string> SplitTickers(const std::string& list) {
  std::vector<std::string> out;
  std::stringstream        in(list);
  std::string              item;
  while (std::getline(in, item, ',')) {
    item.erase(std::remove_if(item.begin(), item.end(), [](unsigned char c) { return std::isspace(c); }), item.end());
    if (item.empty()) {
      continue;
    }
    auto ticker = NormalizeTicker(item);
    if (std::find(out.begin(), out.end(), ticker) == out.end()) {
      out.push_back(std::move(ticker));
    }
  }
  return out;
}

} // namespace analysis::broker
