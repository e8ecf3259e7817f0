#include "aggregate_coordinator.hpp"

#include <algorithm>
#include <map>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/storage/dataset_keys.hpp"
#include "internal/storage/dataset_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace analysis::aggregate {

using observability::IntField;
using observability::StringField;

AggregateCoordinator::AggregateCoordinator(std::shared_ptr<storage::DatasetStore> store, AggregateOptions options)
    : store_(std::move(store)), options_(options) {
  if (options_.poll.count() <= 0) {
    options_.poll = std::chrono::milliseconds(1);
  }
}

std::optional<engine::v1::AggregateEntry> AggregateCoordinator::TryRead(const std::string& ticker) {
  std::string bytes;
  try {
    bytes = store_->Fetch(storage::PricingLatestKey(ticker));
  } catch (const util::NotFound&) {
    return std::nullopt;
  } catch (const util::TransientInfraError& e) {
    ANALYSIS_LOG_WARN("aggregate read failed; will retry", {StringField("ticker", ticker), StringField("error", e.what())});
    return std::nullopt;
  }

  engine::v1::PricingDataset dataset;
  if (!dataset.ParseFromString(bytes)) {
    ANALYSIS_LOG_WARN("aggregate input is not a pricing dataset", {StringField("ticker", ticker)});
    return std::nullopt;
  }

  engine::v1::AggregateEntry entry;
  entry.set_ticker(ticker);
  *entry.mutable_ref()->mutable_key() = storage::PricingLatestKey(ticker);
  entry.mutable_ref()->set_version(storage::DatasetStore::Digest(bytes));
  entry.set_rows(static_cast<uint32_t>(dataset.records_size()));
  return entry;
}

engine::v1::AggregateDataset AggregateCoordinator::Compile(const std::vector<std::string>& tickers,
                                                           std::optional<std::chrono::milliseconds> wait) {
  const auto deadline = std::chrono::steady_clock::now() + wait.value_or(options_.wait);

  std::map<std::string, engine::v1::AggregateEntry> found;
  std::vector<std::string>                          pending = tickers;

  while (true) {
    std::vector<std::string> still_missing;
    for (const auto& ticker : pending) {
      if (found.contains(ticker)) {
        continue;
      }
      if (auto entry = TryRead(ticker)) {
        found.emplace(ticker, std::move(*entry));
      } else {
        still_missing.push_back(ticker);
      }
    }
    pending = std::move(still_missing);

    if (pending.empty() || std::chrono::steady_clock::now() >= deadline) {
      break;
    }
    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(options_.poll, deadline - std::chrono::steady_clock::now()));
  }

  engine::v1::AggregateDataset dataset;
  *dataset.mutable_compiled_at() = util::ToProto(util::Now());
  for (const auto& ticker : tickers) {
    dataset.add_tickers(ticker);
    if (auto it = found.find(ticker); it != found.end()) {
      *dataset.add_entries() = it->second;
    }
  }
  for (const auto& ticker : pending) {
    dataset.add_skipped_tickers(ticker);
  }
  dataset.set_partial(!pending.empty());

  if (dataset.partial()) {
    ANALYSIS_LOG_WARN("partial aggregate: skipped tickers after bounded wait",
                      {IntField("found", dataset.entries_size()), IntField("skipped", dataset.skipped_tickers_size())});
  }
  return dataset;
}

} // namespace analysis::aggregate
