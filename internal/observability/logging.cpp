#include "internal/observability/logging.hpp"

#include <array>
#include <memory>
#include <string>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/context.h>
#include <opentelemetry/trace/span.h>
#endif

namespace analysis::observability {
namespace {

constexpr const char* kLoggerName     = "analysis-engine";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";

constexpr std::array<std::string_view, 7> kLevels = {"trace", "debug", "info", "warn", "error", "critical", "off"};

bool g_include_trace_context{false};

thread_local std::vector<LogField> t_scope_fields;

void AppendField(std::string& out, const LogField& field) {
  out.push_back(' ');
  out.append(field.key);
  out.push_back('=');
  // values with spaces are quoted so lines stay machine-splittable
  if (field.value.find(' ') == std::string::npos) {
    out.append(field.value);
    return;
  }
  out.push_back('"');
  out.append(field.value);
  out.push_back('"');
}

#ifdef ENABLE_OTEL
template <std::size_t N>
void AppendHex(std::string& out, const uint8_t (&bytes)[N]) {
  static constexpr char kHex[] = "0123456789abcdef";
  for (auto b : bytes) {
    out.push_back(kHex[(b >> 4) & 0x0F]);
    out.push_back(kHex[b & 0x0F]);
  }
}

void AppendTraceContext(std::string& out) {
  if (!g_include_trace_context) {
    return;
  }
  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span || !span->GetContext().IsValid()) {
    return;
  }

  const auto context = span->GetContext();
  uint8_t    trace_bytes[16];
  uint8_t    span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  out.append(" trace_id=");
  AppendHex(out, trace_bytes);
  out.append(" span_id=");
  AppendHex(out, span_bytes);
}
#else
void AppendTraceContext(std::string&) {}
#endif

std::shared_ptr<spdlog::logger> MakeLogger(const std::string& destination) {
  if (destination.empty() || destination == "stdout") {
    return spdlog::stdout_color_mt(kLoggerName);
  }
  if (destination == "stderr") {
    return spdlog::stderr_color_mt(kLoggerName);
  }
  return spdlog::basic_logger_mt(kLoggerName, destination);
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

bool IsKnownLogLevel(std::string_view level) {
  for (auto known : kLevels) {
    if (known == level) {
      return true;
    }
  }
  return false;
}

void InitializeLogging(const analysis::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();
  spdlog::drop(kLoggerName);

  auto logger = MakeLogger(logging.destination());
  logger->set_pattern(logging.pattern().empty() ? kDefaultPattern : logging.pattern());
  logger->set_level(spdlog::level::from_str(logging.level().empty() ? "info" : logging.level()));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));
  g_include_trace_context = logging.include_trace_context();
}

void ShutdownLogging() {
  spdlog::shutdown();
}

LogScope::LogScope(std::initializer_list<LogField> fields) : restore_size_(t_scope_fields.size()) {
  t_scope_fields.insert(t_scope_fields.end(), fields.begin(), fields.end());
}

LogScope::~LogScope() {
  t_scope_fields.resize(restore_size_);
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  std::string line(message);
  for (const auto& field : fields) {
    AppendField(line, field);
  }
  for (const auto& field : t_scope_fields) {
    AppendField(line, field);
  }
  AppendTraceContext(line);
  spdlog::log(level, "{}", line);
}

} // namespace analysis::observability
