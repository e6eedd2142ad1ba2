#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace profile::observability {
namespace {

constexpr const char* kLoggerName     = "profile-store";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";

bool g_include_trace_context{false};

std::string EnvOr(const char* name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(name)) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool ResolveTraceContextEnabled(const profile::runtime::config::RuntimeConfig& config) {
  if (const char* include_trace = std::getenv("PROFILE_LOG_INCLUDE_TRACE_CONTEXT")) {
    return std::string(include_trace) == "1" || std::string(include_trace) == "true";
  }
  return config.logging().include_trace_context();
}

// Values containing whitespace or quotes are quoted so key=value pairs stay parseable.
void AppendValue(std::ostringstream& out, const std::string& value) {
  if (value.find_first_of(" \t\"=") == std::string::npos && !value.empty()) {
    out << value;
    return;
  }
  out << '"';
  for (char c : value) {
    if (c == '"' || c == '\\') out << '\\';
    out << c;
  }
  out << '"';
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool               first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=';
    AppendValue(out, field.value);
  }
  return out.str();
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

std::string TraceContextFields() {
  if (!g_include_trace_context) {
    return {};
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span || !span->GetContext().IsValid()) {
    return {};
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  span->GetContext().trace_id().CopyBytesTo(trace_bytes);
  span->GetContext().span_id().CopyBytesTo(span_bytes);
  return "trace_id=" + HexId(trace_bytes, 16) + " span_id=" + HexId(span_bytes, 8);
}
#else
std::string TraceContextFields() {
  return {};
}
#endif

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

// Logs go to stderr so profilectl can keep stdout for command output.
void InitializeLogging(const profile::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stderr_color_mt(kLoggerName);
  }
  logger->set_pattern(EnvOr("PROFILE_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(EnvOr("PROFILE_LOG_LEVEL", config.logging().level(), "info")));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = ResolveTraceContextEnabled(config);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  auto line         = SerializeFields(fields);
  auto trace_fields = TraceContextFields();
  if (!trace_fields.empty()) {
    line = line.empty() ? trace_fields : line + ' ' + trace_fields;
  }

  if (line.empty()) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, line);
}

} // namespace profile::observability
