#include "dataset_store.hpp"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>

#include <cstdio>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/dataset_keys.hpp"

namespace analysis::storage {

using engine::v1::DatasetKey;
using engine::v1::DatasetRef;
using observability::BoolField;
using observability::StringField;

std::string SerializeDeterministic(const google::protobuf::Message& message) {
  std::string out;
  {
    google::protobuf::io::StringOutputStream raw(&out);
    google::protobuf::io::CodedOutputStream  coded(&raw);
    coded.SetSerializationDeterministic(true);
    if (!message.SerializeToCodedStream(&coded)) {
      throw util::InvalidState("failed to serialize " + message.GetTypeName());
    }
  }
  return out;
}

DatasetStore::DatasetStore(StorageBackendPtr durable, StorageBackendPtr cache, DatasetStoreOptions options)
    : durable_(std::move(durable)), cache_(std::move(cache)), options_(options) {
  if (!durable_ || !cache_) {
    throw util::InvalidState("dataset store requires both a durable and a cache tier");
  }
}

std::string DatasetStore::Digest(const std::string& bytes) {
  uint64_t hash = 0xcbf29ce484222325ULL;
  for (unsigned char c : bytes) {
    hash ^= c;
    hash *= 0x100000001b3ULL;
  }

  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));
  return buf;
}

DatasetKey DatasetStore::VersionKey(const DatasetKey& key, const std::string& digest) {
  return KeyOf(key.bucket(), key.key() + ".versions/" + digest);
}

bool DatasetStore::WriteCache(const DatasetKey& key, const std::shared_ptr<arrow::Buffer>& buffer, std::chrono::milliseconds ttl,
                              std::string* error) {
  try {
    cache_->Write(key, buffer, WriteOptions{ttl});
    return true;
  } catch (const std::exception& e) {
    *error = e.what();
    return false;
  }
}

PublishOutcome DatasetStore::Publish(const DatasetKey& key, const std::string& bytes, const PublishOptions& options) {
  common::ValidateDatasetKey(key);

  observability::SpanScope span("DatasetStore/Publish");
  span.SetAttribute("dataset.bucket", key.bucket());
  span.SetAttribute("dataset.key", key.key());

  const bool upload  = options.upload.value_or(options_.enabled_upload);
  const bool publish = options.publish.value_or(options_.enabled_publish);
  const auto ttl     = options.ttl.value_or(options_.default_ttl);

  PublishOutcome outcome;
  *outcome.ref.mutable_key() = key;
  outcome.ref.set_version(Digest(bytes));

  auto buffer = common::ToBuffer(bytes);

  if (upload) {
    try {
      durable_->Write(key, buffer, {});
      if (options.write_version) {
        durable_->Write(VersionKey(key, outcome.ref.version()), buffer, {});
      }
    } catch (const util::TransientInfraError&) {
      throw;
    } catch (const std::exception& e) {
      throw util::TransientInfraError("durable write failed for " + common::Describe(key) + ": " + e.what());
    }
    outcome.durable_written = true;
  } else {
    ANALYSIS_LOG_INFO("upload disabled; skipping durable write", {StringField("dataset", common::Describe(key))});
  }

  if (publish) {
    std::string error;
    outcome.cache_written = WriteCache(key, buffer, ttl, &error);
    if (!outcome.cache_written) {
      outcome.cache_degraded = true;
      outcome.cache_error    = error;
      observability::Metrics::Instance().RecordDegradedCache(key.bucket());
      ANALYSIS_LOG_WARN("degraded cache: publish succeeded without cache entry",
                        {StringField("dataset", common::Describe(key)), StringField("error", error)});
    }
  } else {
    ANALYSIS_LOG_INFO("publish disabled; skipping cache write", {StringField("dataset", common::Describe(key))});
  }

  ANALYSIS_LOG_DEBUG("dataset published", {StringField("dataset", common::Describe(key)), StringField("version", outcome.ref.version()),
                                           BoolField("durable", outcome.durable_written), BoolField("cache", outcome.cache_written)});
  return outcome;
}

PublishOutcome DatasetStore::PublishMessage(const DatasetKey& key, const google::protobuf::Message& message, const PublishOptions& options) {
  return Publish(key, SerializeDeterministic(message), options);
}

std::string DatasetStore::Fetch(const DatasetKey& key) {
  common::ValidateDatasetKey(key);

  try {
    return common::ToBytes(cache_->Read(key));
  } catch (const util::NotFound&) {
    // miss: fall through to the durable tier
  } catch (const std::exception& e) {
    ANALYSIS_LOG_WARN("cache read failed; falling back to durable tier", {StringField("dataset", common::Describe(key)), StringField("error", e.what())});
  }

  auto buffer = durable_->Read(key);

  if (options_.enabled_publish) {
    std::string error;
    if (!WriteCache(key, buffer, options_.default_ttl, &error)) {
      ANALYSIS_LOG_WARN("cache repopulation failed", {StringField("dataset", common::Describe(key)), StringField("error", error)});
    }
  }
  return common::ToBytes(buffer);
}

std::string DatasetStore::FetchDurable(const DatasetKey& key) {
  common::ValidateDatasetKey(key);
  return common::ToBytes(durable_->Read(key));
}

PublishOutcome DatasetStore::PromoteToCache(const DatasetKey& source, const DatasetKey& target, std::optional<std::chrono::milliseconds> ttl) {
  common::ValidateDatasetKey(source);
  common::ValidateDatasetKey(target);

  auto buffer = durable_->Read(source);

  PublishOutcome outcome;
  *outcome.ref.mutable_key() = source;
  outcome.ref.set_version(Digest(common::ToBytes(buffer)));

  if (!options_.enabled_publish) {
    ANALYSIS_LOG_INFO("publish disabled; skipping cache promotion", {StringField("dataset", common::Describe(source))});
    return outcome;
  }

  std::string error;
  outcome.cache_written = WriteCache(target, buffer, ttl.value_or(options_.default_ttl), &error);
  if (!outcome.cache_written) {
    outcome.cache_degraded = true;
    outcome.cache_error    = error;
    observability::Metrics::Instance().RecordDegradedCache(target.bucket());
    ANALYSIS_LOG_WARN("degraded cache: promotion failed", {StringField("dataset", common::Describe(target)), StringField("error", error)});
  }
  return outcome;
}

void DatasetStore::Invalidate(const DatasetKey& key) {
  common::ValidateDatasetKey(key);
  cache_->Remove(key);
}

} // namespace analysis::storage
