#pragma once

#include <arrow/buffer.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <memory>
#include <shared_mutex>
#include <unordered_map>

#include "internal/storage/storage_backend.hpp"

namespace analysis::storage {

/*
  Cache storage tier.

  Arrow buffers held in-memory under "<namespace>/<bucket>/<key>" with a
  per-entry expiry. Expired entries read as NotFound; they are reclaimed
  when read and swept on every write, so keys nobody reads again do not
  accumulate.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class RamCacheStore final : public StorageBackend {
public:
  using Clock = std::chrono::steady_clock;

  explicit RamCacheStore(uint32_t namespace_index = 0);
  ~RamCacheStore() override = default;

  std::shared_ptr<arrow::Buffer> Read(const engine::v1::DatasetKey& key) override;

  bool Exists(const engine::v1::DatasetKey& key) override;

  void Write(const engine::v1::DatasetKey& key,
             const std::shared_ptr<arrow::Buffer>& buffer,
             const WriteOptions& options) override;

  void Remove(const engine::v1::DatasetKey& key) override;

  Tier TierType() const override {
    return Tier::kCache;
  }

  // Drops every entry; used to simulate a cache flush.
  void Clear();

  size_t Size() const;

  uint32_t NamespaceIndex() const {
    return namespace_index_;
  }

private:
  struct Entry {
    std::shared_ptr<arrow::Buffer>  buffer;
    std::optional<Clock::time_point> expires_at;
  };

  std::string CacheKey(const engine::v1::DatasetKey& key) const;

  // Caller holds the exclusive lock.
  void PurgeExpired(Clock::time_point now);

  static bool Expired(const Entry& entry, Clock::time_point now) {
    return entry.expires_at.has_value() && *entry.expires_at <= now;
  }

  uint32_t namespace_index_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
};

} // namespace analysis::storage
