#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace harvester {

struct HarvestSettings;

struct LogField {
	std::string key;
	std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Console sink plus an optional rotating file sink (settings.log_file).
// HARVEST_LOG_LEVEL / HARVEST_LOG_PATTERN override the settings.
void InitializeLogging(const HarvestSettings &settings);
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

} // namespace harvester

#define HARVEST_LOG_DEBUG(message, ...) ::harvester::LogDebug((message), ##__VA_ARGS__)
#define HARVEST_LOG_INFO(message, ...) ::harvester::LogInfo((message), ##__VA_ARGS__)
#define HARVEST_LOG_WARN(message, ...) ::harvester::LogWarn((message), ##__VA_ARGS__)
#define HARVEST_LOG_ERROR(message, ...) ::harvester::LogError((message), ##__VA_ARGS__)
