#include "base_algo.hpp"

#include <cmath>
#include <optional>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace analysis::algo {

using engine::v1::PriceRecord;
using engine::v1::TradeOrder;

namespace {

enum class Signal { kHold, kBuy, kSell };

const char* ToString(Signal signal) {
  switch (signal) {
    case Signal::kBuy:
      return "buy";
    case Signal::kSell:
      return "sell";
    case Signal::kHold:
      break;
  }
  return "hold";
}

} // namespace

TradeOrder BaseAlgo::NewOrder(const PriceRecord& row, const char* kind) const {
  TradeOrder order;
  order.set_ticker(report_.ticker());
  order.set_date(row.date());
  order.set_price(row.close());
  order.set_commission(commission_);
  order.set_key(report_.ticker() + "_" + row.date() + "_" + kind);
  return order;
}

void BaseAlgo::Buy(const PriceRecord& row) {
  auto order = NewOrder(row, "buy");

  const auto shares = static_cast<int64_t>(std::floor((balance_ - commission_) / row.close()));
  if (shares <= 0) {
    order.set_status(engine::v1::TRADE_STATUS_NOT_ENOUGH_FUNDS);
    order.set_reason("balance does not cover one share plus commission");
    order.set_balance(balance_);
    *report_.add_buys() = std::move(order);
    return;
  }

  balance_ -= static_cast<double>(shares) * row.close() + commission_;
  owned_ += shares;

  order.set_status(engine::v1::TRADE_STATUS_FILLED);
  order.set_shares(shares);
  order.set_balance(balance_);
  *report_.add_buys() = std::move(order);
}

void BaseAlgo::Sell(const PriceRecord& row) {
  auto order = NewOrder(row, "sell");

  if (owned_ <= 0) {
    order.set_status(engine::v1::TRADE_STATUS_NOT_OWNED);
    order.set_reason("no shares owned");
    order.set_balance(balance_);
    *report_.add_sells() = std::move(order);
    return;
  }

  balance_ += static_cast<double>(owned_) * row.close() - commission_;

  order.set_status(engine::v1::TRADE_STATUS_FILLED);
  order.set_shares(owned_);
  order.set_balance(balance_);
  owned_ = 0;
  *report_.add_sells() = std::move(order);
}

engine::v1::AlgorithmReport BaseAlgo::Run(const engine::v1::PricingDataset& dataset, const AlgorithmParams& params) {
  if (params.sma_window == 0) {
    throw util::AlgorithmError("sma window must be positive");
  }
  if (!(params.starting_balance >= 0.0) || !(params.commission >= 0.0)) {
    throw util::AlgorithmError("starting balance and commission must be non-negative");
  }

  report_     = {};
  balance_    = params.starting_balance;
  commission_ = params.commission;
  owned_      = 0;

  report_.set_name(Name());
  report_.set_ticker(params.ticker.empty() ? dataset.ticker() : params.ticker);
  report_.set_algo_id(Name() + "_" + report_.ticker());
  report_.set_starting_balance(params.starting_balance);
  report_.set_commission(params.commission);
  if (dataset.records_size() > 0) {
    report_.set_created(dataset.records(0).date());
  }
  report_.set_updated(dataset.as_of());

  const size_t        window = params.sma_window;
  std::deque<double>  closes;
  double              sum = 0.0;
  std::optional<bool> was_above;

  for (const auto& row : dataset.records()) {
    if (!std::isfinite(row.close()) || row.close() <= 0.0) {
      throw util::AlgorithmError("invalid close on " + row.date());
    }

    closes.push_back(row.close());
    sum += row.close();
    if (closes.size() > window) {
      sum -= closes.front();
      closes.pop_front();
    }

    Signal signal = Signal::kHold;
    if (closes.size() == window) {
      const double sma   = sum / static_cast<double>(window);
      const bool   above = row.close() > sma;
      if (was_above && above != *was_above) {
        signal = above ? Signal::kBuy : Signal::kSell;
      }
      was_above = above;
    }

    if (signal == Signal::kBuy) {
      Buy(row);
    } else if (signal == Signal::kSell) {
      Sell(row);
    }

    auto* entry = report_.add_history();
    entry->set_date(row.date());
    entry->set_close(row.close());
    entry->set_balance(balance_);
    entry->set_num_owned(owned_);
    entry->set_net_value(balance_ + static_cast<double>(owned_) * row.close());
    entry->set_signal(ToString(signal));
  }

  if (!std::isfinite(balance_)) {
    throw util::AlgorithmError("balance diverged for " + report_.ticker());
  }

  report_.set_balance(balance_);
  report_.set_shares_owned(owned_);
  report_.set_num_processed(static_cast<uint32_t>(dataset.records_size()));

  ANALYSIS_LOG_DEBUG("algorithm finished",
                     {observability::StringField("algo", Name()), observability::StringField("ticker", report_.ticker()),
                      observability::IntField("buys", report_.buys_size()), observability::IntField("sells", report_.sells_size())});
  return report_;
}

} // namespace analysis::algo
