#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace research::runtime::config {
class RuntimeConfig;
}

namespace research::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);

// kStderr keeps stdout free for command output (researchctl).
enum class LogSink {
  kStdout,
  kStderr,
};

void InitializeLogging(const research::runtime::config::RuntimeConfig& config, LogSink sink = LogSink::kStdout);
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

} // namespace research::observability

#define RESEARCH_LOG_DEBUG(message, ...) ::research::observability::LogDebug((message), ##__VA_ARGS__)
#define RESEARCH_LOG_INFO(message, ...) ::research::observability::LogInfo((message), ##__VA_ARGS__)
#define RESEARCH_LOG_WARN(message, ...) ::research::observability::LogWarn((message), ##__VA_ARGS__)
#define RESEARCH_LOG_ERROR(message, ...) ::research::observability::LogError((message), ##__VA_ARGS__)
