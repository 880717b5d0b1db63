#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace stockcount::runtime::config {
class RuntimeConfig;
}

namespace stockcount::observability {

/*
  Structured logging over spdlog.

  Lines read "<message> key=value key=value"; string values containing
  spaces or quotes are quoted. The logger is named after the device id.
  STOCKCOUNT_LOG_LEVEL and STOCKCOUNT_LOG_PATTERN override the config.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

// May be called again to reconfigure. Logging before the first call goes to spdlog's default logger.
void InitializeLogging(const stockcount::runtime::config::RuntimeConfig& config);
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

} // namespace stockcount::observability

#define STOCKCOUNT_LOG_DEBUG(message, ...) ::stockcount::observability::LogDebug((message), ##__VA_ARGS__)
#define STOCKCOUNT_LOG_INFO(message, ...) ::stockcount::observability::LogInfo((message), ##__VA_ARGS__)
#define STOCKCOUNT_LOG_WARN(message, ...) ::stockcount::observability::LogWarn((message), ##__VA_ARGS__)
#define STOCKCOUNT_LOG_ERROR(message, ...) ::stockcount::observability::LogError((message), ##__VA_ARGS__)
