#include <chrono>
#include <sstream>

#include "internal/aggregate/aggregate_coordinator.hpp"
#include "internal/algo/algorithm_registry.hpp"
#include "internal/broker/task_schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/dataset_keys.hpp"
#include "internal/storage/dataset_store.hpp"
#include "internal/util/errors.hpp"
#include "stages.hpp"

namespace analysis::pipeline::stages {

using broker::GetDouble;
using broker::GetInt;
using broker::GetString;
using broker::StringValue;
using engine::v1::TaskEnvelope;
using engine::v1::TaskName;
using observability::IntField;
using observability::StringField;

namespace {

std::string Join(const std::vector<std::string>& items) {
  std::ostringstream out;
  for (size_t i = 0; i < items.size(); ++i) {
    out << (i ? "," : "") << items[i];
  }
  return out.str();
}

// nullopt when pricing/<TICKER>_latest has not been prepared yet.
std::optional<engine::v1::PricingDataset> ReadPrepared(storage::DatasetStore& store, const std::string& ticker) {
  std::string bytes;
  try {
    bytes = store.FetchDurable(storage::PricingLatestKey(ticker));
  } catch (const util::NotFound&) {
    return std::nullopt;
  }

  engine::v1::PricingDataset dataset;
  if (!dataset.ParseFromString(bytes)) {
    throw util::DataUnavailable("pricing/" + ticker + "_latest is not a pricing dataset");
  }
  return dataset;
}

// Follow-up tasks the screener can fan out to; each only needs a ticker.
bool IsTickerTask(TaskName name) {
  switch (name) {
    case engine::v1::TASK_NAME_RUN_ALGO:
    case engine::v1::TASK_NAME_HANDLE_PRICING_UPDATE:
    case engine::v1::TASK_NAME_GET_NEW_PRICING_DATA:
      return true;
    default:
      return false;
  }
}

} // namespace

StageResult ScreenerAnalysisStage::Execute(const TaskEnvelope& envelope, StageContext& context) {
  std::vector<std::string> universe;
  if (auto list = GetString(envelope, "tickers")) {
    universe = broker::SplitTickers(*list);
  } else {
    for (const auto& ticker : context.pipeline.screener_universe()) {
      universe.push_back(broker::NormalizeTicker(ticker));
    }
  }
  if (universe.empty()) {
    throw util::InvalidPayload("screener universe is empty");
  }

  TaskName next = engine::v1::TASK_NAME_RUN_ALGO;
  if (auto name = GetString(envelope, "next_task")) {
    auto parsed = broker::ParseTaskName(*name);
    if (!parsed || !IsTickerTask(*parsed)) {
      throw util::InvalidPayload("screener cannot fan out to " + *name);
    }
    next = *parsed;
  }

  const auto min_rows  = GetInt(envelope, "min_rows").value_or(context.pipeline.min_prepared_rows());
  const auto min_close = GetDouble(envelope, "min_close");
  const auto max_close = GetDouble(envelope, "max_close");
  const auto algo      = GetString(envelope, "algo");

  std::vector<std::string> selected;
  std::vector<std::string> rejected;
  for (const auto& ticker : universe) {
    auto dataset = ReadPrepared(context.store, ticker);
    bool keep    = dataset && dataset->records_size() >= min_rows && dataset->records_size() > 0;
    if (keep) {
      const double last_close = dataset->records(dataset->records_size() - 1).close();
      keep = (!min_close || last_close >= *min_close) && (!max_close || last_close <= *max_close);
    }
    (keep ? selected : rejected).push_back(ticker);
  }

  StageResult result;
  for (const auto& ticker : selected) {
    auto follow_up                             = MakeFollowUp(envelope, next);
    (*follow_up.mutable_payload())["ticker"] = StringValue(ticker);
    if (algo && next == engine::v1::TASK_NAME_RUN_ALGO) {
      (*follow_up.mutable_payload())["algo"] = StringValue(*algo);
    }
    result.follow_ups.push_back(std::move(follow_up));
  }

  ANALYSIS_LOG_INFO("screener finished", {IntField("universe", static_cast<int64_t>(universe.size())),
                                          IntField("selected", static_cast<int64_t>(selected.size())),
                                          StringField("next_task", broker::TaskNameToString(next))});

  result.record["universe"]  = Join(universe);
  result.record["selected"]  = Join(selected);
  result.record["rejected"]  = Join(rejected);
  result.record["next_task"] = broker::TaskNameToString(next);
  return result;
}

StageResult PublishTickerAggregateStage::Execute(const TaskEnvelope& envelope, StageContext& context) {
  const auto tickers = broker::SplitTickers(GetString(envelope, "tickers").value_or(""));
  if (tickers.empty()) {
    throw util::InvalidPayload("tickers must name at least one ticker");
  }
  const auto name = GetString(envelope, "name").value_or("aggregate");

  std::optional<std::chrono::milliseconds> wait;
  if (auto wait_ms = GetInt(envelope, "wait_ms"); wait_ms && *wait_ms >= 0) {
    wait = std::chrono::milliseconds(*wait_ms);
  }

  auto compiled = context.aggregates.Compile(tickers, wait);
  if (compiled.entries_size() == 0) {
    throw util::DataUnavailable("none of " + Join(tickers) + " has a prepared dataset");
  }

  auto outcome = context.store.PublishMessage(storage::AggregateKey(name), compiled);

  std::vector<std::string> skipped(compiled.skipped_tickers().begin(), compiled.skipped_tickers().end());

  StageResult result;
  result.ref                = outcome.ref;
  result.record["name"]     = name;
  result.record["entries"]  = std::to_string(compiled.entries_size());
  result.record["skipped"]  = Join(skipped);
  result.record["partial"]  = compiled.partial() ? "true" : "false";
  return result;
}

StageResult RunAlgoStage::Execute(const TaskEnvelope& envelope, StageContext& context) {
  auto ticker = GetString(envelope, "ticker");
  if (!ticker) {
    throw util::InvalidPayload("ticker is required");
  }
  const auto symbol    = broker::NormalizeTicker(*ticker);
  const auto algo_name = GetString(envelope, "algo").value_or(context.pipeline.default_algo());

  auto algorithm = context.algorithms.Create(algo_name);

  const auto input_key = storage::PricingLatestKey(symbol);
  std::string bytes;
  try {
    bytes = context.store.FetchDurable(input_key);
  } catch (const util::NotFound&) {
    throw util::DatasetNotReady("no prepared dataset for " + symbol);
  }

  engine::v1::PricingDataset dataset;
  if (!dataset.ParseFromString(bytes)) {
    throw util::DataUnavailable(input_key.key() + " is not a pricing dataset");
  }
  if (dataset.records_size() == 0) {
    throw util::DatasetNotReady("prepared dataset for " + symbol + " is empty");
  }

  algo::AlgorithmParams params;
  params.ticker           = symbol;
  params.starting_balance = GetDouble(envelope, "starting_balance").value_or(context.pipeline.starting_balance());
  params.commission       = GetDouble(envelope, "commission").value_or(context.pipeline.commission());
  params.sma_window       = context.pipeline.sma_window();

  auto report = algorithm->Run(dataset, params);
  *report.mutable_input()->mutable_key() = input_key;
  report.mutable_input()->set_version(storage::DatasetStore::Digest(bytes));

  auto outcome = context.store.PublishMessage(storage::AlgoReportKey(symbol, algorithm->Name()), report);

  StageResult result;
  result.ref                     = outcome.ref;
  result.record["ticker"]        = symbol;
  result.record["algo"]          = algorithm->Name();
  result.record["input_version"] = report.input().version();
  result.record["num_processed"] = std::to_string(report.num_processed());
  result.record["buys"]          = std::to_string(report.buys_size());
  result.record["sells"]         = std::to_string(report.sells_size());
  result.record["balance"]       = std::to_string(report.balance());
  return result;
}

} // namespace analysis::pipeline::stages
