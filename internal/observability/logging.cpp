#include "internal/observability/logging.hpp"

#include <atomic>
#include <cstdlib>
#include <string>

#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace recall::observability {
namespace {

constexpr const char* kLoggerName     = "recall";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::atomic<bool> g_include_trace_context{false};
std::atomic<bool> g_log_memory_content{false};

// Environment overrides config.
std::string EnvOr(const char* name, const std::string& fallback) {
  if (const char* value = std::getenv(name); value != nullptr && *value != '\0') return value;
  return fallback;
}

bool EnvFlagOr(const char* name, bool fallback) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') return fallback;
  const std::string v(value);
  return v == "1" || v == "true";
}

std::string QuoteIfNeeded(std::string_view value) {
  if (!value.empty() && value.find_first_of(" \t\"=") == std::string_view::npos) return std::string(value);

  std::string out = "\"";
  for (char c : value) {
    if (c == '"' || c == '\\') out.push_back('\\');
    if (c == '\n') {
      out += "\\n";
      continue;
    }
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) out.push_back(' ');
    out += field.key;
    out.push_back('=');
    out += QuoteIfNeeded(field.value);
  }
  return out;
}

#ifdef ENABLE_OTEL
std::string TraceContextFields() {
  if (!g_include_trace_context.load(std::memory_order_relaxed)) return {};

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return {};

  const auto context = span->GetContext();
  if (!context.IsValid()) return {};

  char trace_hex[32];
  char span_hex[16];
  context.trace_id().ToLowerBase16(trace_hex);
  context.span_id().ToLowerBase16(span_hex);
  return fmt::format("trace_id={} span_id={}", std::string_view(trace_hex, 32), std::string_view(span_hex, 16));
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
  return {std::string(key), fmt::format("{:.4g}", value)};
}

LogField ContentField(std::string_view key, std::string_view text) {
  if (g_log_memory_content.load(std::memory_order_relaxed)) return {std::string(key), std::string(text)};
  return {std::string(key) + "_len", std::to_string(text.size())};
}

void InitializeLogging(const recall::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  spdlog::drop(kLoggerName);
  auto logger = logging.sink() == "stderr" ? spdlog::stderr_color_mt(kLoggerName) : spdlog::stdout_color_mt(kLoggerName);

  logger->set_pattern(EnvOr("RECALL_LOG_PATTERN", logging.pattern().empty() ? kDefaultPattern : logging.pattern()));
  logger->set_level(spdlog::level::from_str(EnvOr("RECALL_LOG_LEVEL", logging.level().empty() ? "info" : logging.level())));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  g_include_trace_context = EnvFlagOr("RECALL_LOG_INCLUDE_TRACE_CONTEXT", logging.include_trace_context());
  g_log_memory_content    = logging.log_memory_content();
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  std::string line(message);
  if (auto serialized = SerializeFields(fields); !serialized.empty()) {
    line.push_back(' ');
    line += serialized;
  }
  if (auto trace = TraceContextFields(); !trace.empty()) {
    line.push_back(' ');
    line += trace;
  }
  spdlog::log(level, "{}", line);
}

} // namespace recall::observability
