#include "internal/storage/dataset_store.hpp"

#include <atomic>
#include <cassert>
#include <filesystem>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/dataset_keys.hpp"
#include "internal/util/errors.hpp"
#include "support/test_support.hpp"

namespace {

using namespace std::chrono_literals;
using analysis::engine::v1::DatasetKey;
using analysis::storage::DatasetStore;
using analysis::storage::DatasetStoreOptions;
using analysis::storage::KeyOf;
using analysis::storage::PublishOptions;
using analysis::storage::RamCacheStore;

// Tier that is always unreachable.
class FailingBackend final : public analysis::storage::StorageBackend {
 public:
  explicit FailingBackend(analysis::storage::Tier tier) : tier_(tier) {
  }

  std::shared_ptr<arrow::Buffer> Read(const DatasetKey&) override {
    throw analysis::util::TransientInfraError("tier down");
  }
  bool Exists(const DatasetKey&) override {
    throw analysis::util::TransientInfraError("tier down");
  }
  void Write(const DatasetKey&, const std::shared_ptr<arrow::Buffer>&, const analysis::storage::WriteOptions&) override {
    throw analysis::util::TransientInfraError("tier down");
  }
  void Remove(const DatasetKey&) override {
    throw analysis::util::TransientInfraError("tier down");
  }
  analysis::storage::Tier TierType() const override {
    return tier_;
  }

 private:
  analysis::storage::Tier tier_;
};

void TestPublishWritesBothTiersAndVersion() {
  const auto root    = analysis::testing::TempDir("dataset_store_publish");
  auto       durable = analysis::testing::LocalObjectStore(root);
  auto       cache   = std::make_shared<RamCacheStore>(0);
  DatasetStore store(durable, cache, {});

  const auto key     = KeyOf("pricing", "SPY_latest");
  auto       outcome = store.Publish(key, "payload-bytes");

  assert(outcome.durable_written);
  assert(outcome.cache_written);
  assert(!outcome.cache_degraded);
  assert(outcome.ref.key().key() == "SPY_latest");
  assert(outcome.ref.version() == DatasetStore::Digest("payload-bytes"));
  assert(outcome.ref.version().size() == 16);

  assert(durable->Exists(key));
  assert(cache->Exists(key));
  assert(durable->Exists(DatasetStore::VersionKey(key, outcome.ref.version())));
  assert(store.Fetch(key) == "payload-bytes");
}

void TestFetchFallsBackToDurableAfterEviction() {
  const auto root    = analysis::testing::TempDir("dataset_store_eviction");
  auto       durable = analysis::testing::LocalObjectStore(root);
  auto       cache   = std::make_shared<RamCacheStore>(0);
  DatasetStore store(durable, cache, {});

  const auto key = KeyOf("pricing", "AAPL_latest");
  store.Publish(key, "v1");

  store.Invalidate(key);
  assert(!cache->Exists(key));
  assert(store.Fetch(key) == "v1");
  // read-through repopulated the cache
  assert(cache->Exists(key));

  cache->Clear();
  assert(cache->Size() == 0);
  assert(store.Fetch(key) == "v1");
  assert(store.FetchDurable(key) == "v1");
}

void TestExpiredCacheEntryReadsFromDurable() {
  const auto root    = analysis::testing::TempDir("dataset_store_ttl");
  auto       durable = analysis::testing::LocalObjectStore(root);
  auto       cache   = std::make_shared<RamCacheStore>(0);
  DatasetStore store(durable, cache, {});

  const auto     key = KeyOf("pricing", "QQQ_latest");
  PublishOptions options;
  options.ttl = 20ms;
  store.Publish(key, "short-lived", options);

  std::this_thread::sleep_for(40ms);
  assert(!cache->Exists(key));
  assert(store.Fetch(key) == "short-lived");
}

void TestMissingEverywhereIsNotFound() {
  const auto root = analysis::testing::TempDir("dataset_store_missing");
  DatasetStore store(analysis::testing::LocalObjectStore(root), std::make_shared<RamCacheStore>(0), {});

  bool threw = false;
  try {
    (void)store.Fetch(KeyOf("pricing", "NOPE_latest"));
  } catch (const analysis::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestCacheFailureDegradesButSucceeds() {
  const auto root    = analysis::testing::TempDir("dataset_store_degraded");
  auto       durable = analysis::testing::LocalObjectStore(root);
  DatasetStore store(durable, std::make_shared<FailingBackend>(analysis::storage::Tier::kCache), {});

  const auto key     = KeyOf("pricing", "SPY_latest");
  auto       outcome = store.Publish(key, "durable-only");
  assert(outcome.durable_written);
  assert(!outcome.cache_written);
  assert(outcome.cache_degraded);
  assert(!outcome.cache_error.empty());

  // reads survive a dead cache as well
  assert(store.Fetch(key) == "durable-only");
}

void TestDurableFailureIsTransient() {
  DatasetStore store(std::make_shared<FailingBackend>(analysis::storage::Tier::kObject), std::make_shared<RamCacheStore>(0), {});

  bool threw = false;
  try {
    store.Publish(KeyOf("pricing", "SPY_latest"), "bytes");
  } catch (const analysis::util::TransientInfraError&) {
    threw = true;
  }
  assert(threw);
}

void TestGatesSkipWrites() {
  const auto root    = analysis::testing::TempDir("dataset_store_gates");
  auto       durable = analysis::testing::LocalObjectStore(root);
  auto       cache   = std::make_shared<RamCacheStore>(0);

  DatasetStoreOptions options;
  options.enabled_upload  = false;
  options.enabled_publish = true;
  DatasetStore store(durable, cache, options);

  const auto key     = KeyOf("pricing", "SPY_latest");
  auto       outcome = store.Publish(key, "cache-only");
  assert(!outcome.durable_written);
  assert(outcome.cache_written);
  assert(!durable->Exists(key));

  // a per-request override wins over the configured gate
  PublishOptions request;
  request.upload  = true;
  request.publish = false;
  cache->Clear();
  outcome = store.Publish(key, "durable-only", request);
  assert(outcome.durable_written);
  assert(!outcome.cache_written);
  assert(durable->Exists(key));
  assert(!cache->Exists(key));
}

void TestRepublishKeepsEarlierVersion() {
  const auto root    = analysis::testing::TempDir("dataset_store_versions");
  auto       durable = analysis::testing::LocalObjectStore(root);
  DatasetStore store(durable, std::make_shared<RamCacheStore>(0), {});

  const auto key    = KeyOf("pricing", "SPY_latest");
  const auto first  = store.Publish(key, "first").ref.version();
  const auto second = store.Publish(key, "second").ref.version();
  assert(first != second);

  assert(store.FetchDurable(key) == "second");
  assert(store.FetchDurable(DatasetStore::VersionKey(key, first)) == "first");
}

// Readers racing a republish see the old or the new bytes, never a prefix.
void TestOverwriteIsAtomicForReaders() {
  const auto root    = analysis::testing::TempDir("dataset_store_atomic");
  auto       durable = analysis::testing::LocalObjectStore(root);
  DatasetStore store(durable, std::make_shared<RamCacheStore>(0), {});

  const auto        key = KeyOf("pricing", "SPY_latest");
  const std::string large(256 * 1024, 'L');
  const std::string small(16, 's');
  PublishOptions    durable_only;
  durable_only.publish       = false;
  durable_only.write_version = false;
  store.Publish(key, large, durable_only);

  std::atomic<bool> done{false};
  std::thread       writer([&] {
    for (int i = 0; i < 200; ++i) {
      store.Publish(key, i % 2 == 0 ? small : large, durable_only);
    }
    done = true;
  });

  int reads = 0;
  while (!done || reads == 0) {
    const auto bytes = store.FetchDurable(key);
    assert(bytes == large || bytes == small);
    ++reads;
  }
  writer.join();

  for (const auto& entry : std::filesystem::directory_iterator(root / "pricing")) {
    assert(entry.path().filename().string().find(".tmp-") == std::string::npos);
  }
}

void TestPublishSweepsExpiredCacheEntries() {
  const auto root  = analysis::testing::TempDir("dataset_store_sweep");
  auto       cache = std::make_shared<RamCacheStore>(0);
  DatasetStore store(analysis::testing::LocalObjectStore(root), cache, {});

  PublishOptions short_lived;
  short_lived.ttl = 1ms;
  for (int i = 0; i < 5; ++i) {
    store.Publish(KeyOf("scratch", "written-once-" + std::to_string(i)), "x", short_lived);
  }
  assert(cache->Size() == 5);
  std::this_thread::sleep_for(10ms);

  // nothing reads the scratch keys again; the next write reclaims them
  store.Publish(KeyOf("pricing", "SPY_latest"), "fresh");
  assert(cache->Size() == 1);
  assert(store.Fetch(KeyOf("pricing", "SPY_latest")) == "fresh");
}

void TestPromoteToCache() {
  const auto root    = analysis::testing::TempDir("dataset_store_promote");
  auto       durable = analysis::testing::LocalObjectStore(root);
  auto       cache   = std::make_shared<RamCacheStore>(0);
  DatasetStore store(durable, cache, {});

  const auto     source = KeyOf("pricing", "SPY_latest");
  PublishOptions durable_only;
  durable_only.publish = false;
  store.Publish(source, "promote-me", durable_only);
  assert(!cache->Exists(source));

  const auto target  = KeyOf("pricing", "SPY_hot");
  auto       outcome = store.PromoteToCache(source, target);
  assert(outcome.cache_written);
  assert(outcome.ref.version() == DatasetStore::Digest("promote-me"));
  assert(analysis::storage::common::ToBytes(cache->Read(target)) == "promote-me");
}

void TestInvalidKeysAreRejected() {
  const auto root = analysis::testing::TempDir("dataset_store_keys");
  DatasetStore store(analysis::testing::LocalObjectStore(root), std::make_shared<RamCacheStore>(0), {});

  for (const auto& key : {KeyOf("", "SPY_latest"), KeyOf("pricing", "../etc/passwd"), KeyOf("pri/cing", "x"), KeyOf("pricing", "")}) {
    bool threw = false;
    try {
      store.Publish(key, "x");
    } catch (const analysis::util::InvalidPayload&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestDeterministicSerialization() {
  analysis::engine::v1::PricingDataset dataset;
  dataset.set_ticker("SPY");
  auto* row = dataset.add_records();
  row->set_date("2020-01-06");
  row->set_close(300.0);

  const auto a = analysis::storage::SerializeDeterministic(dataset);
  const auto b = analysis::storage::SerializeDeterministic(dataset);
  assert(a == b);
  assert(DatasetStore::Digest(a) == DatasetStore::Digest(b));

  // FNV-1a 64 of the empty string is the offset basis
  assert(DatasetStore::Digest("") == "cbf29ce484222325");
}

} // namespace

int main() {
  TestPublishWritesBothTiersAndVersion();
  TestFetchFallsBackToDurableAfterEviction();
  TestExpiredCacheEntryReadsFromDurable();
  TestMissingEverywhereIsNotFound();
  TestCacheFailureDegradesButSucceeds();
  TestDurableFailureIsTransient();
  TestGatesSkipWrites();
  TestRepublishKeepsEarlierVersion();
  TestOverwriteIsAtomicForReaders();
  TestPublishSweepsExpiredCacheEntries();
  TestPromoteToCache();
  TestInvalidKeysAreRejected();
  TestDeterministicSerialization();

  std::cout << "analysis_unit_dataset_store: pass\n";
  return 0;
}
