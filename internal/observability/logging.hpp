#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace recall::runtime::config {
class RuntimeConfig;
}

namespace recall::observability {

// One key=value pair appended to a log line.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);

// Memory text (candidate facts, record content, queries). Rendered as its
// length unless logging.log_memory_content is enabled.
LogField ContentField(std::string_view key, std::string_view text);

void InitializeLogging(const recall::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

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

} // namespace recall::observability

#define RECALL_LOG_DEBUG(message, ...) ::recall::observability::LogDebug((message), ##__VA_ARGS__)
#define RECALL_LOG_INFO(message, ...) ::recall::observability::LogInfo((message), ##__VA_ARGS__)
#define RECALL_LOG_WARN(message, ...) ::recall::observability::LogWarn((message), ##__VA_ARGS__)
#define RECALL_LOG_ERROR(message, ...) ::recall::observability::LogError((message), ##__VA_ARGS__)
