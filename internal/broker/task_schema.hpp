#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "analysis/engine/v1/task.pb.h"

namespace analysis::broker {

using engine::v1::PayloadValue;
using engine::v1::TaskEnvelope;
using engine::v1::TaskName;

/*
  Declared operation set.

  Wire names are the snake_case strings producers use; anything outside
  this set is rejected at enqueue time.
*/
const std::vector<TaskName>& AllTaskNames();

std::string             TaskNameToString(TaskName name);
std::optional<TaskName> ParseTaskName(std::string_view name);

/*
  Validates the payload against the per-operation schema:
    - required keys present
    - value kinds match (ints are accepted where doubles are expected)
    - no undeclared keys
    - ticker well formed, dates parseable

  Throws util::InvalidPayload.
*/
void ValidateEnvelope(const TaskEnvelope& envelope);

// Upper-cased ticker; throws util::InvalidPayload when malformed.
std::string NormalizeTicker(const std::string& ticker);

/*
  Partition key for single-writer routing.

  Every task that writes a ticker's pricing/<TICKER>_latest object is routed
  on "pricing:<TICKER>"; everything else is unpartitioned (empty).
*/
std::string RoutingKeyFor(const TaskEnvelope& envelope);

// ---------------------------------------------------------------------------
// Payload builders / accessors
// ---------------------------------------------------------------------------

PayloadValue StringValue(std::string value);
PayloadValue IntValue(int64_t value);
PayloadValue DoubleValue(double value);
PayloadValue BoolValue(bool value);
PayloadValue BlobValue(std::string bytes);

std::optional<std::string> GetString(const TaskEnvelope& envelope, const std::string& key);
std::optional<int64_t>     GetInt(const TaskEnvelope& envelope, const std::string& key);
std::optional<double>      GetDouble(const TaskEnvelope& envelope, const std::string& key);
std::optional<bool>        GetBool(const TaskEnvelope& envelope, const std::string& key);

// Blob or string value as raw bytes.
std::optional<std::string> GetBytes(const TaskEnvelope& envelope, const std::string& key);

// Splits "SPY, aapl,QQQ" into normalized tickers, dropping empties.
std::vector<std::string> SplitTickers(const std::string& list);

} // namespace analysis::broker
