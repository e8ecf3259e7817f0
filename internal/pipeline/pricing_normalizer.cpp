#include "pricing_normalizer.hpp"

#include <algorithm>
#include <map>
#include <optional>

#include "internal/util/time.hpp"

namespace analysis::pipeline {

namespace {

constexpr int64_t kDayMs = 24LL * 60 * 60 * 1000;

int64_t DayIndex(int64_t unix_ms) {
  return unix_ms >= 0 ? unix_ms / kDayMs : (unix_ms - kDayMs + 1) / kDayMs;
}

// Day index of the first weekday after `day`.
int64_t NextTradingDay(int64_t day) {
  int64_t next = day + 1;
  while (util::WeekdayOf(next * kDayMs) >= 5) {
    ++next;
  }
  return next;
}

} // namespace

engine::v1::PricingDataset NormalizePricing(const engine::v1::RawPricing& raw) {
  engine::v1::PricingDataset dataset;
  dataset.set_ticker(raw.ticker());
  dataset.set_source_provenance(raw.source());

  std::map<int64_t, engine::v1::PriceRecord> by_timestamp;
  uint32_t                                   dropped = 0;

  for (const auto& in : raw.records()) {
    std::optional<int64_t> ts;
    if (!in.date().empty()) {
      ts = util::ParseDateMillis(in.date());
    } else if (in.timestamp_ms() > 0) {
      ts = in.timestamp_ms();
    }

    if (!ts || !(in.close() > 0.0)) {
      ++dropped;
      continue;
    }

    engine::v1::PriceRecord out;
    out.set_timestamp_ms(*ts);
    out.set_date(util::FormatDate(*ts));
    out.set_close(in.close());
    out.set_volume(std::max<int64_t>(in.volume(), 0));

    // a row filled by an earlier pass stays flagged
    bool filled = in.filled();
    auto fill   = [&](double value) {
      if (value > 0.0) {
        return value;
      }
      filled = true;
      return in.close();
    };
    out.set_open(fill(in.open()));
    out.set_high(fill(in.high()));
    out.set_low(fill(in.low()));
    out.set_filled(filled);

    auto [it, inserted] = by_timestamp.insert_or_assign(*ts, out);
    if (!inserted) {
      ++dropped;
    }
  }

  uint32_t                gaps = 0;
  std::optional<int64_t>  previous_day;
  for (auto& [ts, record] : by_timestamp) {
    const int64_t day = DayIndex(ts);
    if (previous_day && day > NextTradingDay(*previous_day)) {
      record.set_gap_before(true);
      ++gaps;
    }
    previous_day = day;
    *dataset.add_records() = record;
  }

  dataset.set_dropped_rows(dropped);
  dataset.set_gap_count(gaps);
  if (!by_timestamp.empty()) {
    dataset.set_as_of(util::FormatDate(by_timestamp.rbegin()->first));
  }
  return dataset;
}

} // namespace analysis::pipeline
