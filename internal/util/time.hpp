#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace analysis::util {

/*
  Time utilities — single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

// ISO-8601 UTC, millisecond precision: 2018-11-05T15:59:59.000Z
std::string FormatIso8601(TimePoint tp);

/*
  Pricing dates.

  Accepts "YYYY-MM-DD" and "YYYY-MM-DD HH:MM:SS" (also with 'T'), UTC.
*/
std::optional<int64_t> ParseDateMillis(const std::string& date);
std::string            FormatDate(int64_t unix_ms);

// Monday = 0 ... Sunday = 6
int WeekdayOf(int64_t unix_ms);

} // namespace analysis::util
