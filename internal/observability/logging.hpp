#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace refstore::runtime::config {
class RuntimeConfig;
}

namespace refstore::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// "message key=value ..."; values with whitespace or quotes are quoted and escaped.
std::string FormatLogLine(std::string_view message, std::initializer_list<LogField> fields);

// Level and pattern come from REFSTORE_LOG_LEVEL / REFSTORE_LOG_PATTERN, then config.
void InitializeLogging(const refstore::runtime::config::RuntimeConfig& config);
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

} // namespace refstore::observability

#define REFSTORE_LOG_DEBUG(message, ...) ::refstore::observability::LogDebug((message), ##__VA_ARGS__)
#define REFSTORE_LOG_INFO(message, ...) ::refstore::observability::LogInfo((message), ##__VA_ARGS__)
#define REFSTORE_LOG_WARN(message, ...) ::refstore::observability::LogWarn((message), ##__VA_ARGS__)
#define REFSTORE_LOG_ERROR(message, ...) ::refstore::observability::LogError((message), ##__VA_ARGS__)
