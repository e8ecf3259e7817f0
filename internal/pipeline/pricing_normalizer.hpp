#pragma once

#include "analysis/engine/v1/dataset.pb.h"

namespace analysis::pipeline {

/*
  Raw rows -> PricingDataset.

    - timestamp from the row date (or timestamp_ms when no date), canonical
      "YYYY-MM-DD" date
    - rows with no usable timestamp or close <= 0 are dropped
    - missing open/high/low (<= 0) are filled from close and flagged
    - duplicate timestamps: last row wins
    - sorted ascending, gap_before set when a weekday was skipped

  Output depends only on the input rows so replays publish identical bytes.
*/
engine::v1::PricingDataset NormalizePricing(const engine::v1::RawPricing& raw);

} // namespace analysis::pipeline
