#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace analysis::runtime::config {
class RuntimeConfig;
}

namespace analysis::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Installs the process-wide "analysis-engine" logger.

  logging.destination: "stdout" (default), "stderr" or a file path
  logging.level:       trace | debug | info | warn | error | critical | off
  logging.pattern:     spdlog pattern, ISO-8601 timestamps by default
*/
void InitializeLogging(const analysis::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

bool IsKnownLogLevel(std::string_view level);

/*
  Fields appended to every line logged by this thread while the scope is
  alive. A worker opens one per delivery so stage code logs carry the
  task id without threading it through.

      LogScope scope({StringField("task_id", envelope.task_id())});
*/
class LogScope {
public:
  explicit LogScope(std::initializer_list<LogField> fields);
  ~LogScope();

  LogScope(const LogScope&)            = delete;
  LogScope& operator=(const LogScope&) = delete;

private:
  std::size_t restore_size_;
};

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace analysis::observability

#define ANALYSIS_LOG_DEBUG(message, ...) ::analysis::observability::LogDebug((message), ##__VA_ARGS__)
#define ANALYSIS_LOG_INFO(message, ...) ::analysis::observability::LogInfo((message), ##__VA_ARGS__)
#define ANALYSIS_LOG_WARN(message, ...) ::analysis::observability::LogWarn((message), ##__VA_ARGS__)
#define ANALYSIS_LOG_ERROR(message, ...) ::analysis::observability::LogError((message), ##__VA_ARGS__)
