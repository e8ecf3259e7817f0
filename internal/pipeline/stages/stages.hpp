#pragma once

#include "internal/pipeline/stage.hpp"

namespace analysis::pipeline::stages {

/*
  Pricing ingestion chain:

    get_new_pricing_data -> prepare_pricing_dataset
    handle_pricing_update_task -> publish_pricing_update
*/

// Pulls raw rows from the PricingSource, publishes pricing/<TICKER>_raw and
// chains prepare_pricing_dataset with the rows inline.
class GetNewPricingDataStage : public Stage {
 public:
  engine::v1::TaskName Name() const override {
    return engine::v1::TASK_NAME_GET_NEW_PRICING_DATA;
  }
  StageResult Execute(const engine::v1::TaskEnvelope& envelope, StageContext& context) override;
};

// Normalizes raw rows and publishes pricing/<TICKER>_latest.
class PreparePricingDatasetStage : public Stage {
 public:
  engine::v1::TaskName Name() const override {
    return engine::v1::TASK_NAME_PREPARE_PRICING_DATASET;
  }
  StageResult Execute(const engine::v1::TaskEnvelope& envelope, StageContext& context) override;
};

class HandlePricingUpdateStage : public Stage {
 public:
  engine::v1::TaskName Name() const override {
    return engine::v1::TASK_NAME_HANDLE_PRICING_UPDATE;
  }
  StageResult Execute(const engine::v1::TaskEnvelope& envelope, StageContext& context) override;
};

/*
  Writes "data" to s3_bucket/s3_key (durable) and s3_bucket/redis_key
  (cache). s3_enabled / redis_enabled override the configured gates for
  this request; redis_expire is the cache TTL in seconds.
*/
class PublishPricingUpdateStage : public Stage {
 public:
  engine::v1::TaskName Name() const override {
    return engine::v1::TASK_NAME_PUBLISH_PRICING_UPDATE;
  }
  StageResult Execute(const engine::v1::TaskEnvelope& envelope, StageContext& context) override;
};

class PublishFromS3ToRedisStage : public Stage {
 public:
  engine::v1::TaskName Name() const override {
    return engine::v1::TASK_NAME_PUBLISH_FROM_S3_TO_REDIS;
  }
  StageResult Execute(const engine::v1::TaskEnvelope& envelope, StageContext& context) override;
};

/*
  Analysis:

    task_screener_analysis -> N x next_task (default task_run_algo)
*/

class ScreenerAnalysisStage : public Stage {
 public:
  engine::v1::TaskName Name() const override {
    return engine::v1::TASK_NAME_SCREENER_ANALYSIS;
  }
  StageResult Execute(const engine::v1::TaskEnvelope& envelope, StageContext& context) override;
};

class PublishTickerAggregateStage : public Stage {
 public:
  engine::v1::TaskName Name() const override {
    return engine::v1::TASK_NAME_PUBLISH_TICKER_AGGREGATE;
  }
  StageResult Execute(const engine::v1::TaskEnvelope& envelope, StageContext& context) override;
};

/*
  Reads pricing/<TICKER>_latest from the durable tier, runs the algorithm
  and publishes algo/<TICKER>_<ALGO>_latest. A missing dataset raises
  util::DatasetNotReady (soft wait).
*/
class RunAlgoStage : public Stage {
 public:
  engine::v1::TaskName Name() const override {
    return engine::v1::TASK_NAME_RUN_ALGO;
  }
  StageResult Execute(const engine::v1::TaskEnvelope& envelope, StageContext& context) override;
};

} // namespace analysis::pipeline::stages
