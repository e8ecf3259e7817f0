#pragma once

#include <google/protobuf/message.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "analysis/engine/v1/dataset.pb.h"
#include "internal/storage/storage_backend.hpp"
#include "internal/util/errors.hpp"

namespace analysis::storage {

struct DatasetStoreOptions {
  // Durable writes (enabled_upload) and cache writes (enabled_publish).
  bool                      enabled_upload  = true;
  bool                      enabled_publish = true;
  std::chrono::milliseconds default_ttl{std::chrono::hours(1)};
};

// Per-call overrides; unset fields fall back to DatasetStoreOptions.
struct PublishOptions {
  std::optional<bool>                      upload;
  std::optional<bool>                      publish;
  std::optional<std::chrono::milliseconds> ttl;
  // Also write the immutable "<key>.versions/<digest>" copy.
  bool write_version = true;
};

struct PublishOutcome {
  engine::v1::DatasetRef ref;
  bool                   durable_written = false;
  bool                   cache_written   = false;
  // Cache write was attempted and failed; data is still durable.
  bool        cache_degraded = false;
  std::string cache_error;
};

/*
  Dual-tier dataset store.

  Publish:      durable first, then cache with TTL. Durable failure throws
                util::TransientInfraError; cache failure only degrades.
  Fetch:        cache, else durable + repopulate cache (read-through).
  FetchDurable: durable only, for stages that need "latest".
  Invalidate:   cache only; the durable tier is authoritative.

  Cache entries may be stale relative to the durable tier for up to the TTL.
*/
class DatasetStore {
 public:
  DatasetStore(StorageBackendPtr durable, StorageBackendPtr cache, DatasetStoreOptions options);

  PublishOutcome Publish(const engine::v1::DatasetKey& key, const std::string& bytes, const PublishOptions& options = {});

  PublishOutcome PublishMessage(const engine::v1::DatasetKey& key, const google::protobuf::Message& message, const PublishOptions& options = {});

  // Throws util::NotFound when neither tier has the key.
  std::string Fetch(const engine::v1::DatasetKey& key);

  std::string FetchDurable(const engine::v1::DatasetKey& key);

  // Copies the durable object into the cache tier; returns the durable ref.
  PublishOutcome PromoteToCache(const engine::v1::DatasetKey& source, const engine::v1::DatasetKey& target,
                                std::optional<std::chrono::milliseconds> ttl = std::nullopt);

  void Invalidate(const engine::v1::DatasetKey& key);

  template <typename Message>
  Message FetchAs(const engine::v1::DatasetKey& key, bool bypass_cache = false) {
    const auto bytes = bypass_cache ? FetchDurable(key) : Fetch(key);
    Message    message;
    if (!message.ParseFromString(bytes)) {
      throw util::DataUnavailable("dataset at " + key.bucket() + "/" + key.key() + " is not a valid " + Message::descriptor()->name());
    }
    return message;
  }

  const DatasetStoreOptions& Options() const {
    return options_;
  }

  // FNV-1a 64, 16 lowercase hex digits.
  static std::string Digest(const std::string& bytes);

  static engine::v1::DatasetKey VersionKey(const engine::v1::DatasetKey& key, const std::string& digest);

 private:
  bool WriteCache(const engine::v1::DatasetKey& key, const std::shared_ptr<arrow::Buffer>& buffer, std::chrono::milliseconds ttl,
                  std::string* error);

  StorageBackendPtr   durable_;
  StorageBackendPtr   cache_;
  DatasetStoreOptions options_;
};

/*
  Deterministic protobuf encoding (stable map ordering) so identical
  datasets produce identical bytes and digests.
*/
std::string SerializeDeterministic(const google::protobuf::Message& message);

} // namespace analysis::storage
