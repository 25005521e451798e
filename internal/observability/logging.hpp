#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace mirrorsync::runtime::config {
class RuntimeConfig;
}

namespace mirrorsync::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField UintField(std::string_view key, std::uint64_t value);

void InitializeLogging(const mirrorsync::runtime::config::RuntimeConfig& config, std::string_view logger_name);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace mirrorsync::observability

#define MIRRORSYNC_LOG_DEBUG(message, ...) ::mirrorsync::observability::Log(spdlog::level::debug, (message), ##__VA_ARGS__)
#define MIRRORSYNC_LOG_INFO(message, ...) ::mirrorsync::observability::LogInfo((message), ##__VA_ARGS__)
#define MIRRORSYNC_LOG_WARN(message, ...) ::mirrorsync::observability::LogWarn((message), ##__VA_ARGS__)
#define MIRRORSYNC_LOG_ERROR(message, ...) ::mirrorsync::observability::LogError((message), ##__VA_ARGS__)
