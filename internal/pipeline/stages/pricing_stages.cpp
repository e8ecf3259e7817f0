#include <chrono>

#include "internal/broker/task_schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/pricing_normalizer.hpp"
#include "internal/pipeline/pricing_source.hpp"
#include "internal/storage/dataset_keys.hpp"
#include "internal/storage/dataset_store.hpp"
#include "internal/util/errors.hpp"
#include "stages.hpp"

namespace analysis::pipeline::stages {

using broker::BlobValue;
using broker::GetBool;
using broker::GetBytes;
using broker::GetInt;
using broker::GetString;
using broker::IntValue;
using broker::StringValue;
using engine::v1::TaskEnvelope;
using observability::IntField;
using observability::StringField;

namespace {

std::string RequireTicker(const TaskEnvelope& envelope) {
  auto ticker = GetString(envelope, "ticker");
  if (!ticker) {
    throw util::InvalidPayload("ticker is required");
  }
  return broker::NormalizeTicker(*ticker);
}

int64_t TickerId(const TaskEnvelope& envelope, const StageContext& context) {
  return GetInt(envelope, "ticker_id").value_or(context.pipeline.default_ticker_id());
}

void CopyIfPresent(const TaskEnvelope& from, TaskEnvelope& to, const std::string& key) {
  auto it = from.payload().find(key);
  if (it != from.payload().end()) {
    (*to.mutable_payload())[key] = it->second;
  }
}

std::optional<std::chrono::milliseconds> ExpireTtl(const TaskEnvelope& envelope) {
  auto seconds = GetInt(envelope, "redis_expire");
  if (!seconds || *seconds <= 0) {
    return std::nullopt;
  }
  return std::chrono::seconds(*seconds);
}

const char* YesNo(bool value) {
  return value ? "true" : "false";
}

} // namespace

StageResult GetNewPricingDataStage::Execute(const TaskEnvelope& envelope, StageContext& context) {
  const auto ticker    = RequireTicker(envelope);
  const auto date_from = GetString(envelope, "date_from").value_or("");
  const auto date_to   = GetString(envelope, "date_to").value_or("");

  auto raw = context.source.Fetch(ticker, date_from, date_to);
  raw.set_ticker(ticker);
  if (auto source = GetString(envelope, "source")) {
    raw.set_source(*source);
  }
  if (raw.records_size() == 0) {
    throw util::DataUnavailable("pricing source returned no rows for " + ticker);
  }

  const auto bytes   = storage::SerializeDeterministic(raw);
  const auto raw_key = storage::PricingRawKey(ticker);
  auto       outcome = context.store.Publish(raw_key, bytes);

  auto prepare = MakeFollowUp(envelope, engine::v1::TASK_NAME_PREPARE_PRICING_DATASET);
  auto& payload = *prepare.mutable_payload();
  payload["ticker"]        = StringValue(ticker);
  payload["ticker_id"]     = IntValue(TickerId(envelope, context));
  payload["source_bucket"] = StringValue(raw_key.bucket());
  payload["source_key"]    = StringValue(raw_key.key());
  payload["raw"]           = BlobValue(bytes);

  StageResult result;
  result.ref = outcome.ref;
  result.follow_ups.push_back(std::move(prepare));
  result.record["ticker"]         = ticker;
  result.record["rows"]           = std::to_string(raw.records_size());
  result.record["source"]         = raw.source();
  result.record["cache_degraded"] = YesNo(outcome.cache_degraded);
  return result;
}

StageResult PreparePricingDatasetStage::Execute(const TaskEnvelope& envelope, StageContext& context) {
  const auto ticker = RequireTicker(envelope);

  engine::v1::RawPricing raw;
  if (auto inline_rows = GetBytes(envelope, "raw")) {
    if (!raw.ParseFromString(*inline_rows)) {
      throw util::InvalidPayload("raw is not a serialized RawPricing");
    }
  } else if (auto source_key = GetString(envelope, "source_key")) {
    const auto key = storage::KeyOf(GetString(envelope, "source_bucket").value_or(storage::kPricingBucket), *source_key);
    std::string bytes;
    try {
      bytes = context.store.Fetch(key);
    } catch (const util::NotFound& e) {
      throw util::DataUnavailable(e.what());
    }
    if (!raw.ParseFromString(bytes)) {
      throw util::DataUnavailable("source object is not raw pricing: " + key.bucket() + "/" + key.key());
    }
  } else {
    throw util::InvalidPayload("prepare_pricing_dataset needs raw or source_key");
  }

  auto dataset = NormalizePricing(raw);
  dataset.set_ticker(ticker);

  const auto min_rows = GetInt(envelope, "min_rows").value_or(context.pipeline.min_prepared_rows());
  if (dataset.records_size() < min_rows) {
    throw util::InsufficientData(ticker + " has " + std::to_string(dataset.records_size()) + " rows after normalization, need " +
                                 std::to_string(min_rows));
  }

  auto outcome = context.store.PublishMessage(storage::PricingLatestKey(ticker), dataset);

  ANALYSIS_LOG_INFO("pricing dataset prepared", {StringField("ticker", ticker), IntField("rows", dataset.records_size()),
                                                 IntField("dropped", dataset.dropped_rows()), IntField("gaps", dataset.gap_count()),
                                                 StringField("version", outcome.ref.version())});

  StageResult result;
  result.ref                      = outcome.ref;
  result.record["ticker"]         = ticker;
  result.record["rows"]           = std::to_string(dataset.records_size());
  result.record["dropped_rows"]   = std::to_string(dataset.dropped_rows());
  result.record["gap_count"]      = std::to_string(dataset.gap_count());
  result.record["cache_degraded"] = YesNo(outcome.cache_degraded);
  return result;
}

StageResult HandlePricingUpdateStage::Execute(const TaskEnvelope& envelope, StageContext& context) {
  const auto ticker    = RequireTicker(envelope);
  const auto bucket    = GetString(envelope, "s3_bucket").value_or(storage::kPricingBucket);
  const auto s3_key    = GetString(envelope, "s3_key").value_or(storage::PricingLatestKey(ticker).key());
  const auto redis_key = GetString(envelope, "redis_key").value_or(s3_key);

  std::string bytes;
  try {
    bytes = context.store.FetchDurable(storage::KeyOf(bucket, s3_key));
  } catch (const util::NotFound& e) {
    throw util::DataUnavailable(e.what());
  }

  engine::v1::PricingDataset dataset;
  const bool                 parsed = dataset.ParseFromString(bytes);

  auto publish  = MakeFollowUp(envelope, engine::v1::TASK_NAME_PUBLISH_PRICING_UPDATE);
  auto& payload = *publish.mutable_payload();
  payload["ticker"]    = StringValue(ticker);
  payload["ticker_id"] = IntValue(TickerId(envelope, context));
  payload["s3_bucket"] = StringValue(bucket);
  payload["s3_key"]    = StringValue(s3_key);
  payload["redis_key"] = StringValue(redis_key);
  payload["data"]      = BlobValue(bytes);
  payload["updated"]   = StringValue(parsed ? dataset.as_of() : "");
  CopyIfPresent(envelope, publish, "s3_enabled");
  CopyIfPresent(envelope, publish, "redis_enabled");
  CopyIfPresent(envelope, publish, "redis_expire");

  StageResult result;
  result.follow_ups.push_back(std::move(publish));
  result.record["ticker"]    = ticker;
  result.record["s3_bucket"] = bucket;
  result.record["s3_key"]    = s3_key;
  result.record["redis_key"] = redis_key;
  return result;
}

StageResult PublishPricingUpdateStage::Execute(const TaskEnvelope& envelope, StageContext& context) {
  const auto ticker    = RequireTicker(envelope);
  const auto bucket    = GetString(envelope, "s3_bucket").value_or(storage::kPricingBucket);
  const auto s3_key    = GetString(envelope, "s3_key").value_or(storage::PricingLatestKey(ticker).key());
  const auto redis_key = GetString(envelope, "redis_key").value_or(s3_key);
  const auto data      = GetBytes(envelope, "data");
  if (!data) {
    throw util::InvalidPayload("publish_pricing_update requires data");
  }

  const auto& gates         = context.store.Options();
  const bool  s3_enabled    = GetBool(envelope, "s3_enabled").value_or(gates.enabled_upload);
  const bool  redis_enabled = GetBool(envelope, "redis_enabled").value_or(gates.enabled_publish);

  storage::PublishOptions durable;
  durable.upload  = s3_enabled;
  durable.publish = redis_enabled && redis_key == s3_key;
  durable.ttl     = ExpireTtl(envelope);

  auto outcome = context.store.Publish(storage::KeyOf(bucket, s3_key), *data, durable);

  if (redis_enabled && redis_key != s3_key) {
    storage::PublishOptions cache;
    cache.upload        = false;
    cache.publish       = true;
    cache.ttl           = ExpireTtl(envelope);
    cache.write_version = false;

    auto cached            = context.store.Publish(storage::KeyOf(bucket, redis_key), *data, cache);
    outcome.cache_written  = cached.cache_written;
    outcome.cache_degraded = cached.cache_degraded;
  }

  StageResult result;
  result.ref                      = outcome.ref;
  result.record["ticker"]         = ticker;
  result.record["ticker_id"]      = std::to_string(TickerId(envelope, context));
  result.record["s3_bucket"]      = bucket;
  result.record["s3_key"]         = s3_key;
  result.record["redis_key"]      = redis_key;
  result.record["updated"]        = GetString(envelope, "updated").value_or("");
  result.record["s3_enabled"]     = YesNo(s3_enabled);
  result.record["redis_enabled"]  = YesNo(redis_enabled);
  result.record["cache_degraded"] = YesNo(outcome.cache_degraded);
  return result;
}

StageResult PublishFromS3ToRedisStage::Execute(const TaskEnvelope& envelope, StageContext& context) {
  const auto s3_key = GetString(envelope, "s3_key");
  if (!s3_key) {
    throw util::InvalidPayload("s3_key is required");
  }
  const auto bucket    = GetString(envelope, "s3_bucket").value_or(storage::kPricingBucket);
  const auto redis_key = GetString(envelope, "redis_key").value_or(*s3_key);

  storage::PublishOutcome outcome;
  try {
    outcome = context.store.PromoteToCache(storage::KeyOf(bucket, *s3_key), storage::KeyOf(bucket, redis_key), ExpireTtl(envelope));
  } catch (const util::NotFound& e) {
    throw util::DataUnavailable(e.what());
  }

  StageResult result;
  result.ref                      = outcome.ref;
  result.record["s3_bucket"]      = bucket;
  result.record["s3_key"]         = *s3_key;
  result.record["redis_key"]      = redis_key;
  result.record["cache_written"]  = YesNo(outcome.cache_written);
  result.record["cache_degraded"] = YesNo(outcome.cache_degraded);
  if (auto ticker = GetString(envelope, "ticker")) {
    result.record["ticker"] = broker::NormalizeTicker(*ticker);
  }
  return result;
}

} // namespace analysis::pipeline::stages
