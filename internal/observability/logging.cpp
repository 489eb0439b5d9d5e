#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <optional>
#include <sstream>
#include <string>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace tracelens::observability {
namespace {

constexpr const char* kLoggerName     = "tracelens";
constexpr const char* kDefaultLevel   = "info";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::optional<std::string> Env(const char* name) {
  if (const char* value = std::getenv(name)) {
    return std::string(value);
  }
  return std::nullopt;
}

std::string ResolveLevel(const tracelens::runtime::config::RuntimeConfig& config) {
  if (auto level = Env("TRACELENS_LOG_LEVEL")) {
    return *level;
  }
  return config.logging().level().empty() ? kDefaultLevel : config.logging().level();
}

std::string ResolvePattern(const tracelens::runtime::config::RuntimeConfig& config) {
  if (auto pattern = Env("TRACELENS_LOG_PATTERN")) {
    return *pattern;
  }
  return config.logging().pattern().empty() ? kDefaultPattern : config.logging().pattern();
}

bool ResolveTraceContextEnabled(const tracelens::runtime::config::RuntimeConfig& config) {
  if (auto include_trace = Env("TRACELENS_LOG_INCLUDE_TRACE_CONTEXT")) {
    return *include_trace == "1" || *include_trace == "true";
  }
  return config.logging().include_trace_context();
}

bool g_include_trace_context{false};

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool               first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << field.value;
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
  if (!span) {
    return {};
  }

  auto context = span->GetContext();
  if (!context.IsValid()) {
    return {};
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  return "otel_trace_id=" + HexId(trace_bytes, 16) + " otel_span_id=" + HexId(span_bytes, 8);
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

LogField DoubleField(std::string_view key, double value) {
  return {std::string(key), fmt::format("{:.3f}", value)};
}

void InitializeLogging(const tracelens::runtime::config::RuntimeConfig& config) {
  spdlog::drop(kLoggerName);
  auto logger = config.logging().use_stderr() ? spdlog::stderr_color_mt(kLoggerName) : spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = ResolveTraceContextEnabled(config);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::default_logger_raw()->should_log(level)) {
    return;
  }

  std::string line(message);
  for (const auto& extra : {SerializeFields(fields), TraceContextFields()}) {
    if (!extra.empty()) {
      line += ' ';
      line += extra;
    }
  }
  spdlog::log(level, "{}", line);
}

} // namespace tracelens::observability
