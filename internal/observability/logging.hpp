#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace sitepull::runtime::config {
class RuntimeConfig;
}

namespace sitepull::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Human readable byte count, e.g. "1.50 MB".
std::string FormatBytes(std::uint64_t bytes);

void InitializeLogging(const sitepull::runtime::config::RuntimeConfig& config, std::string_view logger_name = "sitepull");
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

} // namespace sitepull::observability

#define SITEPULL_LOG_DEBUG(message, ...) ::sitepull::observability::LogDebug((message), ##__VA_ARGS__)
#define SITEPULL_LOG_INFO(message, ...) ::sitepull::observability::LogInfo((message), ##__VA_ARGS__)
#define SITEPULL_LOG_WARN(message, ...) ::sitepull::observability::LogWarn((message), ##__VA_ARGS__)
#define SITEPULL_LOG_ERROR(message, ...) ::sitepull::observability::LogError((message), ##__VA_ARGS__)
