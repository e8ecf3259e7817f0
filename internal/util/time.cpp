#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace analysis::util {

namespace {

constexpr int64_t kMillisPerDay = 24LL * 60 * 60 * 1000;

int64_t FloorDiv(int64_t a, int64_t b) {
  return a / b - ((a % b != 0) && ((a < 0) != (b < 0)));
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string FormatIso8601(TimePoint tp) {
  const auto ms      = static_cast<int64_t>(ToUnixMillis(tp));
  const auto seconds = static_cast<std::time_t>(FloorDiv(ms, 1000));

  std::tm tm{};
  gmtime_r(&seconds, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << (ms - FloorDiv(ms, 1000) * 1000) << 'Z';
  return out.str();
}

std::optional<int64_t> ParseDateMillis(const std::string& date) {
  if (date.size() < 10) {
    return std::nullopt;
  }

  std::string normalized = date;
  if (normalized.size() > 10 && normalized[10] == 'T') {
    normalized[10] = ' ';
  }

  std::tm            tm{};
  std::istringstream in(normalized);
  if (normalized.size() >= 19) {
    in >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  } else {
    in >> std::get_time(&tm, "%Y-%m-%d");
  }
  if (in.fail()) {
    return std::nullopt;
  }

  return static_cast<int64_t>(timegm(&tm)) * 1000;
}

std::string FormatDate(int64_t unix_ms) {
  const auto seconds = static_cast<std::time_t>(FloorDiv(unix_ms, 1000));

  std::tm tm{};
  gmtime_r(&seconds, &tm);

  std::ostringstream out;
  if (tm.tm_hour == 0 && tm.tm_min == 0 && tm.tm_sec == 0) {
    out << std::put_time(&tm, "%Y-%m-%d");
  } else {
    out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  }
  return out.str();
}

int WeekdayOf(int64_t unix_ms) {
  // 1970-01-01 was a Thursday.
  const auto days = FloorDiv(unix_ms, kMillisPerDay);
  return static_cast<int>(((days % 7) + 7 + 3) % 7);
}

} // namespace analysis::util
