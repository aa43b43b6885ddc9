#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace negotiation::runtime::config {
class RuntimeConfig;
}

namespace negotiation::observability {

/*
  Structured logging on top of spdlog.

  Messages stay constant; variable parts go into key=value fields so log
  lines can be grepped by negotiation id.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// NEGOTIATION_LOG_LEVEL / NEGOTIATION_LOG_PATTERN override the config.
void InitializeLogging(const negotiation::runtime::config::RuntimeConfig& config);
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

} // namespace negotiation::observability

#define NEGOTIATION_LOG_DEBUG(message, ...) ::negotiation::observability::LogDebug((message), ##__VA_ARGS__)
#define NEGOTIATION_LOG_INFO(message, ...) ::negotiation::observability::LogInfo((message), ##__VA_ARGS__)
#define NEGOTIATION_LOG_WARN(message, ...) ::negotiation::observability::LogWarn((message), ##__VA_ARGS__)
#define NEGOTIATION_LOG_ERROR(message, ...) ::negotiation::observability::LogError((message), ##__VA_ARGS__)
