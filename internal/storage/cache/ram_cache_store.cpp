#include "ram_cache_store.hpp"

#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace analysis::storage {

using engine::v1::DatasetKey;

RamCacheStore::RamCacheStore(uint32_t namespace_index) : namespace_index_(namespace_index) {
}

std::string RamCacheStore::CacheKey(const DatasetKey& key) const {
  return std::to_string(namespace_index_) + "/" + common::RelativePath(key);
}

/*
  Zero-copy read.
*/
std::shared_ptr<arrow::Buffer> RamCacheStore::Read(const DatasetKey& key) {
  const auto cache_key = CacheKey(key);
  {
    std::shared_lock lock(mutex_);

    auto it = entries_.find(cache_key);
    if (it == entries_.end()) throw util::NotFound("cache miss: " + cache_key);
    if (!Expired(it->second, Clock::now())) return it->second.buffer;
  }

  // expired: reclaim under the exclusive lock
  std::unique_lock lock(mutex_);
  auto it = entries_.find(cache_key);
  if (it != entries_.end() && Expired(it->second, Clock::now())) {
    entries_.erase(it);
  }
  throw util::NotFound("cache entry expired: " + cache_key);
}

bool RamCacheStore::Exists(const DatasetKey& key) {
  std::shared_lock lock(mutex_);

  auto it = entries_.find(CacheKey(key));
  return it != entries_.end() && !Expired(it->second, Clock::now());
}

void RamCacheStore::Write(const DatasetKey& key, const std::shared_ptr<arrow::Buffer>& buffer, const WriteOptions& options) {
  Entry entry;
  entry.buffer = buffer;
  if (options.ttl.has_value()) {
    entry.expires_at = Clock::now() + *options.ttl;
  }

  std::unique_lock lock(mutex_);
  PurgeExpired(Clock::now());
  entries_[CacheKey(key)] = std::move(entry);
}

/*
  Eviction or invalidate.
*/
void RamCacheStore::Remove(const DatasetKey& key) {
  std::unique_lock lock(mutex_);
  entries_.erase(CacheKey(key));
}

void RamCacheStore::Clear() {
  std::unique_lock lock(mutex_);
  entries_.clear();
}

void RamCacheStore::PurgeExpired(Clock::time_point now) {
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (Expired(it->second, now)) {
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }
}

size_t RamCacheStore::Size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

} // namespace analysis::storage
