#pragma once

#include <cstdint>
#include <deque>
#include <string>

#include "algorithm.hpp"

namespace analysis::algo {

/*
  Reference algorithm.

  Bookkeeping:
    buy   all-in at close: shares = floor((balance - commission) / close)
    sell  every owned share at close, minus commission
  One history row per processed record.

  Signals: close crossing above its simple moving average buys, crossing
  below sells.
*/
class BaseAlgo : public Algorithm {
 public:
  static constexpr const char* kName = "base";

  std::string Name() const override {
    return kName;
  }

  engine::v1::AlgorithmReport Run(const engine::v1::PricingDataset& dataset, const AlgorithmParams& params) override;

 private:
  void Buy(const engine::v1::PriceRecord& row);
  void Sell(const engine::v1::PriceRecord& row);

  engine::v1::TradeOrder NewOrder(const engine::v1::PriceRecord& row, const char* kind) const;

  engine::v1::AlgorithmReport report_;
  double                      balance_    = 0.0;
  double                      commission_ = 0.0;
  int64_t                     owned_      = 0;
};

} // namespace analysis::algo
