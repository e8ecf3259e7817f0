#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "analysis/engine/v1/dataset.pb.h"

namespace analysis::storage {
class DatasetStore;
}

namespace analysis::aggregate {

struct AggregateOptions {
  std::chrono::milliseconds wait{2000};
  std::chrono::milliseconds poll{100};
};

/*
  Compiles the latest prepared dataset of every requested ticker.

  Tickers that are still missing when the wait expires are skipped and
  the result is flagged partial; Compile never waits past the deadline.
*/
class AggregateCoordinator {
 public:
  AggregateCoordinator(std::shared_ptr<storage::DatasetStore> store, AggregateOptions options);

  engine::v1::AggregateDataset Compile(const std::vector<std::string>& tickers,
                                       std::optional<std::chrono::milliseconds> wait = std::nullopt);

 private:
  // nullopt while the ticker's dataset is absent or unreadable.
  std::optional<engine::v1::AggregateEntry> TryRead(const std::string& ticker);

  std::shared_ptr<storage::DatasetStore> store_;
  AggregateOptions                       options_;
};

} // namespace analysis::aggregate
