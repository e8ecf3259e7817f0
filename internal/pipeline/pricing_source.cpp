#include "pricing_source.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace analysis::pipeline {

using observability::IntField;
using observability::StringField;

namespace {

std::string Trim(const std::string& s) {
  auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
  auto end   = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
  return begin < end ? std::string(begin, end) : std::string();
}

std::vector<std::string> Split(const std::string& line, char delimiter) {
  std::vector<std::string> tokens;
  std::stringstream        ss(line);
  std::string              token;
  while (std::getline(ss, token, delimiter)) {
    tokens.push_back(Trim(token));
  }
  return tokens;
}

bool LooksLikeHeader(const std::string& line) {
  std::string lower(line);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lower.find("date") != std::string::npos || lower.find("close") != std::string::npos;
}

double ParseOptionalDouble(const std::string& field) {
  return field.empty() ? 0.0 : std::stod(field);
}

} // namespace

CsvPricingSource::CsvPricingSource(std::string directory) : directory_(std::move(directory)) {
}

std::string CsvPricingSource::Name() const {
  return "csv:" + directory_;
}

engine::v1::RawPricing CsvPricingSource::Fetch(const std::string& ticker, const std::string& date_from, const std::string& date_to) {
  const auto path = std::filesystem::path(directory_) / (ticker + ".csv");

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (ec) {
      throw util::TransientInfraError("cannot stat " + path.string() + ": " + ec.message());
    }
    throw util::DataUnavailable("no pricing source for " + ticker + " at " + path.string());
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    throw util::TransientInfraError("cannot open " + path.string());
  }

  std::optional<int64_t> from;
  std::optional<int64_t> to;
  if (!date_from.empty()) {
    from = util::ParseDateMillis(date_from);
  }
  if (!date_to.empty()) {
    to = util::ParseDateMillis(date_to);
  }

  engine::v1::RawPricing raw;
  raw.set_ticker(ticker);
  raw.set_source(Name());
  raw.set_date_from(date_from);
  raw.set_date_to(date_to);

  std::string line;
  size_t      line_num = 0;
  size_t      skipped  = 0;
  while (std::getline(file, line)) {
    ++line_num;
    line = Trim(line);
    if (line.empty()) {
      continue;
    }
    if (line_num == 1 && LooksLikeHeader(line)) {
      continue;
    }

    auto tokens = Split(line, ',');
    if (tokens.size() < 5) {
      ++skipped;
      continue;
    }

    try {
      engine::v1::PriceRecord record;
      record.set_date(tokens[0]);
      record.set_open(ParseOptionalDouble(tokens[1]));
      record.set_high(ParseOptionalDouble(tokens[2]));
      record.set_low(ParseOptionalDouble(tokens[3]));
      record.set_close(std::stod(tokens[4]));
      if (tokens.size() > 5 && !tokens[5].empty()) {
        record.set_volume(std::stoll(tokens[5]));
      }

      auto ts = util::ParseDateMillis(record.date());
      if (ts && ((from && *ts < *from) || (to && *ts > *to))) {
        continue;
      }
      *raw.add_records() = std::move(record);
    } catch (const std::exception& e) {
      ++skipped;
      ANALYSIS_LOG_WARN("skipping unparseable pricing row",
                        {StringField("file", path.string()), IntField("line", static_cast<int64_t>(line_num)), StringField("error", e.what())});
    }
  }

  ANALYSIS_LOG_DEBUG("pricing rows loaded", {StringField("ticker", ticker), IntField("rows", raw.records_size()),
                                             IntField("skipped", static_cast<int64_t>(skipped))});
  return raw;
}

} // namespace analysis::pipeline
