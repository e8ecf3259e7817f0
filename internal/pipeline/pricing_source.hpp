#pragma once

#include <string>

#include "analysis/engine/v1/dataset.pb.h"

namespace analysis::pipeline {

/*
  Where get_new_pricing_data pulls raw rows from.

  Implementations throw util::DataUnavailable when the ticker is unknown and
  util::TransientInfraError when the source cannot be reached.
*/
class PricingSource {
 public:
  virtual ~PricingSource() = default;

  // Empty dates mean unbounded.
  virtual engine::v1::RawPricing Fetch(const std::string& ticker, const std::string& date_from, const std::string& date_to) = 0;

  virtual std::string Name() const = 0;
};

/*
  One "<TICKER>.csv" per ticker under a directory:

      Date,Open,High,Low,Close,Volume
      2020-01-02,300.35,305.13,299.00,303.00,33911900

  Header row optional, extra columns ignored, unparseable lines skipped.
  Empty open/high/low fields are passed through as 0 for the normalizer.
*/
class CsvPricingSource : public PricingSource {
 public:
  explicit CsvPricingSource(std::string directory);

  engine::v1::RawPricing Fetch(const std::string& ticker, const std::string& date_from, const std::string& date_to) override;

  std::string Name() const override;

 private:
  std::string directory_;
};

} // namespace analysis::pipeline
