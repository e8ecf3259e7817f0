#include "internal/algo/base_algo.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

#include "internal/algo/algorithm_registry.hpp"
#include "internal/storage/dataset_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using analysis::algo::AlgorithmParams;
using analysis::algo::BaseAlgo;
using analysis::engine::v1::PricingDataset;

PricingDataset Dataset(const std::vector<double>& closes) {
  PricingDataset dataset;
  dataset.set_ticker("SPY");
  for (size_t i = 0; i < closes.size(); ++i) {
    auto* row = dataset.add_records();
    row->set_date("2020-01-0" + std::to_string(i + 1));
    row->set_close(closes[i]);
    row->set_open(closes[i]);
    row->set_high(closes[i]);
    row->set_low(closes[i]);
  }
  if (!closes.empty()) {
    dataset.set_as_of(dataset.records(dataset.records_size() - 1).date());
  }
  return dataset;
}

AlgorithmParams Params(double balance, double commission, uint32_t window) {
  AlgorithmParams params;
  params.ticker           = "SPY";
  params.starting_balance = balance;
  params.commission       = commission;
  params.sma_window       = window;
  return params;
}

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

void TestCrossingsDriveBuysAndSells() {
  BaseAlgo algo;
  const auto report = algo.Run(Dataset({10, 12, 8, 14, 10}), Params(1000.0, 1.0, 2));

  assert(report.name() == "base");
  assert(report.ticker() == "SPY");
  assert(report.created() == "2020-01-01");
  assert(report.updated() == "2020-01-05");
  assert(report.num_processed() == 5);
  assert(report.history_size() == 5);

  // first crossing is downward with nothing owned
  assert(report.sells_size() == 2);
  assert(report.sells(0).status() == analysis::engine::v1::TRADE_STATUS_NOT_OWNED);

  assert(report.buys_size() == 1);
  assert(report.buys(0).status() == analysis::engine::v1::TRADE_STATUS_FILLED);
  assert(report.buys(0).shares() == 71);
  assert(Near(report.buys(0).balance(), 5.0));

  assert(report.sells(1).status() == analysis::engine::v1::TRADE_STATUS_FILLED);
  assert(report.sells(1).shares() == 71);
  assert(Near(report.balance(), 714.0));
  assert(report.shares_owned() == 0);

  assert(report.history(0).signal() == "hold");
  assert(report.history(1).signal() == "hold");
  assert(report.history(2).signal() == "sell");
  assert(report.history(3).signal() == "buy");
  assert(report.history(3).num_owned() == 71);
  assert(Near(report.history(3).net_value(), 999.0));
  assert(report.history(4).signal() == "sell");
}

void TestBuyWithoutFundsIsRecorded() {
  BaseAlgo algo;
  const auto report = algo.Run(Dataset({10, 8, 12}), Params(5.0, 1.0, 2));

  assert(report.buys_size() == 1);
  assert(report.buys(0).status() == analysis::engine::v1::TRADE_STATUS_NOT_ENOUGH_FUNDS);
  assert(report.buys(0).shares() == 0);
  assert(Near(report.balance(), 5.0));
}

void TestRunIsDeterministicAndStateless() {
  BaseAlgo   algo;
  const auto dataset = Dataset({10, 12, 8, 14, 10, 11, 9});

  const auto first  = analysis::storage::SerializeDeterministic(algo.Run(dataset, Params(1000.0, 1.0, 3)));
  const auto second = analysis::storage::SerializeDeterministic(algo.Run(dataset, Params(1000.0, 1.0, 3)));
  assert(first == second);
}

void TestInvalidParametersRaiseAlgorithmError() {
  BaseAlgo algo;

  bool threw = false;
  try {
    (void)algo.Run(Dataset({10, 11}), Params(1000.0, 1.0, 0));
  } catch (const analysis::util::AlgorithmError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)algo.Run(Dataset({10, -1}), Params(1000.0, 1.0, 2));
  } catch (const analysis::util::AlgorithmError&) {
    threw = true;
  }
  assert(threw);
}

void TestRegistryResolvesByName() {
  auto registry = analysis::algo::AlgorithmRegistry::WithDefaults();
  assert(registry->Contains("base"));
  assert(registry->Create("base")->Name() == "base");

  bool threw = false;
  try {
    (void)registry->Create("momentum");
  } catch (const analysis::util::InvalidPayload&) {
    threw = true;
  }
  assert(threw);

  registry->Register("momentum", [] { return std::make_unique<BaseAlgo>(); });
  assert(registry->Names().size() == 2);
}

} // namespace

int main() {
  TestCrossingsDriveBuysAndSells();
  TestBuyWithoutFundsIsRecorded();
  TestRunIsDeterministicAndStateless();
  TestInvalidParametersRaiseAlgorithmError();
  TestRegistryResolvesByName();

  std::cout << "analysis_unit_base_algo: pass\n";
  return 0;
}
