#pragma once

#include <string>

#include "analysis/engine/v1/dataset.pb.h"

namespace analysis::storage {

inline constexpr const char* kPricingBucket   = "pricing";
inline constexpr const char* kCompiledBucket  = "compileddatasets";
inline constexpr const char* kAlgoBucket      = "algo";
inline constexpr const char* kLatestSuffix    = "_latest";

inline engine::v1::DatasetKey KeyOf(const std::string& bucket, const std::string& key) {
  engine::v1::DatasetKey out;
  out.set_bucket(bucket);
  out.set_key(key);
  return out;
}

// pricing/<TICKER>_latest, written only by prepare_pricing_dataset.
inline engine::v1::DatasetKey PricingLatestKey(const std::string& ticker) {
  return KeyOf(kPricingBucket, ticker + kLatestSuffix);
}

inline engine::v1::DatasetKey PricingRawKey(const std::string& ticker) {
  return KeyOf(kPricingBucket, ticker + "_raw");
}

inline engine::v1::DatasetKey AggregateKey(const std::string& name) {
  return KeyOf(kCompiledBucket, name + kLatestSuffix);
}

inline engine::v1::DatasetKey AlgoReportKey(const std::string& ticker, const std::string& algo) {
  return KeyOf(kAlgoBucket, ticker + "_" + algo + kLatestSuffix);
}

} // namespace analysis::storage
