#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace bounty::runtime::config {
class RuntimeConfig;
}

namespace bounty::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
// Renders cents as "$12.34".
LogField MoneyField(std::string_view key, std::int64_t cents);
LogField BoolField(std::string_view key, bool value);

// Safe to call more than once; the last call wins.
void InitializeLogging(const bounty::runtime::config::RuntimeConfig& config);
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

} // namespace bounty::observability

#define BOUNTY_LOG_DEBUG(message, ...) ::bounty::observability::LogDebug((message), ##__VA_ARGS__)
#define BOUNTY_LOG_INFO(message, ...) ::bounty::observability::LogInfo((message), ##__VA_ARGS__)
#define BOUNTY_LOG_WARN(message, ...) ::bounty::observability::LogWarn((message), ##__VA_ARGS__)
#define BOUNTY_LOG_ERROR(message, ...) ::bounty::observability::LogError((message), ##__VA_ARGS__)
