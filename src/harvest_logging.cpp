#include "harvest_logging.hpp"
#include "harvest_settings.hpp"

#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace harvester {
namespace {

constexpr std::size_t kLogFileMaxBytes = 10 * 1024 * 1024;
constexpr std::size_t kLogFileMaxFiles = 5;

std::string ResolveLevel(const HarvestSettings &settings) {
	if (const char *level = std::getenv("HARVEST_LOG_LEVEL")) {
		return level;
	}
	if (!settings.log_level.empty()) {
		return settings.log_level;
	}
	return "info";
}

std::string ResolvePattern() {
	if (const char *pattern = std::getenv("HARVEST_LOG_PATTERN")) {
		return pattern;
	}
	return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
	std::ostringstream out;
	bool first = true;
	for (const auto &field : fields) {
		if (!first) {
			out << ' ';
		}
		first = false;
		out << field.key << '=' << field.value;
	}
	return out.str();
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
	return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
	return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
	return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const HarvestSettings &settings) {
	std::vector<spdlog::sink_ptr> sinks;
	sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
	std::string file_sink_error;
	if (!settings.log_file.empty()) {
		try {
			sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(settings.log_file, kLogFileMaxBytes,
			                                                                       kLogFileMaxFiles));
		} catch (const spdlog::spdlog_ex &ex) {
			file_sink_error = ex.what();
		}
	}

	auto logger = std::make_shared<spdlog::logger>("harvester", sinks.begin(), sinks.end());
	logger->set_pattern(ResolvePattern());
	logger->set_level(spdlog::level::from_str(ResolveLevel(settings)));
	spdlog::set_default_logger(std::move(logger));
	spdlog::flush_on(spdlog::level::warn);

	if (!file_sink_error.empty()) {
		LogWarn("log file disabled", {StringField("path", settings.log_file), StringField("error", file_sink_error)});
	}
}

void ShutdownLogging() {
	spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
	auto serialized_fields = SerializeFields(fields);
	if (!serialized_fields.empty()) {
		spdlog::log(level, "{} {}", message, serialized_fields);
		return;
	}
	spdlog::log(level, "{}", message);
}

} // namespace harvester
