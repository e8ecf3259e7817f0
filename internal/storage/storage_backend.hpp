#pragma once

#include <arrow/buffer.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "analysis/engine/v1/dataset.pb.h"

namespace analysis::storage {

enum class Tier {
  kCache,
  kObject,
};

constexpr std::string_view ToString(Tier tier) {
  return tier == Tier::kCache ? "cache" : "object";
}

struct WriteOptions {
  // Cache tier only; ignored by durable tiers. nullopt means no expiry.
  std::optional<std::chrono::milliseconds> ttl;
};

/*
  Tier storage abstraction.

  Every dataset is represented as an Arrow Buffer addressed by DatasetKey;
  both tiers use the same key so a miss in one can fall back to the other.

  Implementations:
    CACHE    → in-memory Arrow buffers with TTL (RamCacheStore)
    OBJECT   → Arrow filesystem, local or S3 / MinIO (ObjectArrowStore)

  Errors:
    util::NotFound             key absent (or expired)
    util::TransientInfraError  tier unreachable / IO failure
*/

class StorageBackend {
 public:
  virtual ~StorageBackend() = default;

  virtual std::shared_ptr<arrow::Buffer> Read(const engine::v1::DatasetKey& key) = 0;

  virtual bool Exists(const engine::v1::DatasetKey& key) = 0;

  virtual void Write(const engine::v1::DatasetKey& key, const std::shared_ptr<arrow::Buffer>& buffer, const WriteOptions& options) = 0;

  // Removing a missing key is not an error.
  virtual void Remove(const engine::v1::DatasetKey& key) = 0;

  virtual Tier TierType() const = 0;
};

using StorageBackendPtr = std::shared_ptr<StorageBackend>;

} // namespace analysis::storage
