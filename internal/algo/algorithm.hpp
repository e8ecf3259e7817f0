#pragma once

#include <cstdint>
#include <string>

#include "analysis/engine/v1/dataset.pb.h"

namespace analysis::algo {

struct AlgorithmParams {
  std::string ticker;
  double      starting_balance = 10000.0;
  double      commission       = 6.0;
  uint32_t    sma_window       = 5;
};

/*
  Trading algorithm capability injected into task_run_algo.

  Run must be a function of (dataset, params) only; it is re-executed on
  redelivery and the report must come out the same. Throws
  util::AlgorithmError on failure.
*/
class Algorithm {
 public:
  virtual ~Algorithm() = default;

  virtual std::string Name() const = 0;

  virtual engine::v1::AlgorithmReport Run(const engine::v1::PricingDataset& dataset, const AlgorithmParams& params) = 0;
};

} // namespace analysis::algo
