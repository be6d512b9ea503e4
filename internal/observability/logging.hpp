#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace fnpipe::runtime::config {
class RuntimeConfig;
}

namespace fnpipe::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Logs go to stderr; stdout is reserved for dry-run output.
void InitializeLogging(const fnpipe::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// "message key=value ..."; values are quoted and escaped as needed so the
// result never spans lines.
std::string FormatLine(std::string_view message, std::initializer_list<LogField> fields);

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

} // namespace fnpipe::observability

#define FNPIPE_LOG_DEBUG(message, ...) ::fnpipe::observability::LogDebug((message), ##__VA_ARGS__)
#define FNPIPE_LOG_INFO(message, ...) ::fnpipe::observability::LogInfo((message), ##__VA_ARGS__)
#define FNPIPE_LOG_WARN(message, ...) ::fnpipe::observability::LogWarn((message), ##__VA_ARGS__)
#define FNPIPE_LOG_ERROR(message, ...) ::fnpipe::observability::LogError((message), ##__VA_ARGS__)
