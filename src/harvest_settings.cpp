#include "harvest_settings.hpp"
#include "harvest_logging.hpp"

#include "duckdb.hpp"

#include <algorithm>

namespace harvester {

using duckdb::LogicalType;
using duckdb::StringValue;
using duckdb::Value;

void RegisterHarvestOptions(duckdb::DBConfig &config) {
	HarvestSettings defaults;

	config.AddExtensionOption("harvest_timeout_ms",
	                          "Per-attempt HTTP timeout in milliseconds",
	                          LogicalType::BIGINT,
	                          Value::BIGINT(defaults.timeout_ms));

	config.AddExtensionOption("harvest_max_retries",
	                          "Maximum fetch attempts per source",
	                          LogicalType::INTEGER,
	                          Value::INTEGER(defaults.max_retries));

	config.AddExtensionOption("harvest_backoff_unit_ms",
	                          "Backoff unit; attempt i waits 2^i units before the next attempt",
	                          LogicalType::BIGINT,
	                          Value::BIGINT(defaults.backoff_unit_ms));

	config.AddExtensionOption("harvest_max_concurrent",
	                          "Maximum number of fetches in flight",
	                          LogicalType::INTEGER,
	                          Value::INTEGER(defaults.max_concurrent));

	config.AddExtensionOption("harvest_dispatch_delay_ms",
	                          "Delay applied before each fetch is dispatched",
	                          LogicalType::BIGINT,
	                          Value::BIGINT(defaults.dispatch_delay_ms));

	config.AddExtensionOption("harvest_max_articles",
	                          "Maximum heading snippets collected per page",
	                          LogicalType::INTEGER,
	                          Value::INTEGER(defaults.max_articles));

	config.AddExtensionOption("harvest_max_response_bytes",
	                          "Maximum response body size in bytes (0 = unlimited)",
	                          LogicalType::BIGINT,
	                          Value::BIGINT(defaults.max_response_bytes));

	config.AddExtensionOption("harvest_results_dir",
	                          "Directory receiving harvest snapshots",
	                          LogicalType::VARCHAR,
	                          Value(defaults.results_dir));

	config.AddExtensionOption("harvest_log_file",
	                          "Rotating log file path (empty = console only)",
	                          LogicalType::VARCHAR,
	                          Value(defaults.log_file));

	config.AddExtensionOption("harvest_log_level",
	                          "Log level: trace, debug, info, warn, error",
	                          LogicalType::VARCHAR,
	                          Value(defaults.log_level));
}

HarvestSettings LoadHarvestSettings(duckdb::Connection &conn) {
	HarvestSettings settings;

	auto result = conn.Query(R"(
		SELECT
			current_setting('harvest_timeout_ms')::BIGINT AS timeout_ms,
			current_setting('harvest_max_retries')::INTEGER AS max_retries,
			current_setting('harvest_backoff_unit_ms')::BIGINT AS backoff_unit_ms,
			current_setting('harvest_max_concurrent')::INTEGER AS max_concurrent,
			current_setting('harvest_dispatch_delay_ms')::BIGINT AS dispatch_delay_ms,
			current_setting('harvest_max_articles')::INTEGER AS max_articles,
			current_setting('harvest_max_response_bytes')::BIGINT AS max_response_bytes,
			current_setting('harvest_results_dir')::VARCHAR AS results_dir,
			current_setting('harvest_log_file')::VARCHAR AS log_file,
			current_setting('harvest_log_level')::VARCHAR AS log_level
	)");

	if (result->HasError()) {
		HARVEST_LOG_WARN("harvest options unavailable, using defaults", {StringField("error", result->GetError())});
		return settings;
	}

	auto chunk = result->Fetch();
	if (!chunk || chunk->size() == 0) {
		return settings;
	}

	auto timeout_val = chunk->GetValue(0, 0);
	if (!timeout_val.IsNull()) {
		settings.timeout_ms = timeout_val.GetValue<int64_t>();
	}
	auto retries_val = chunk->GetValue(1, 0);
	if (!retries_val.IsNull()) {
		settings.max_retries = retries_val.GetValue<int32_t>();
	}
	auto backoff_val = chunk->GetValue(2, 0);
	if (!backoff_val.IsNull()) {
		settings.backoff_unit_ms = backoff_val.GetValue<int64_t>();
	}
	auto concurrent_val = chunk->GetValue(3, 0);
	if (!concurrent_val.IsNull()) {
		settings.max_concurrent = concurrent_val.GetValue<int32_t>();
	}
	auto delay_val = chunk->GetValue(4, 0);
	if (!delay_val.IsNull()) {
		settings.dispatch_delay_ms = delay_val.GetValue<int64_t>();
	}
	auto articles_val = chunk->GetValue(5, 0);
	if (!articles_val.IsNull()) {
		settings.max_articles = articles_val.GetValue<int32_t>();
	}
	auto bytes_val = chunk->GetValue(6, 0);
	if (!bytes_val.IsNull()) {
		settings.max_response_bytes = bytes_val.GetValue<int64_t>();
	}
	auto dir_val = chunk->GetValue(7, 0);
	if (!dir_val.IsNull()) {
		settings.results_dir = StringValue::Get(dir_val);
	}
	auto log_file_val = chunk->GetValue(8, 0);
	if (!log_file_val.IsNull()) {
		settings.log_file = StringValue::Get(log_file_val);
	}
	auto log_level_val = chunk->GetValue(9, 0);
	if (!log_level_val.IsNull()) {
		settings.log_level = StringValue::Get(log_level_val);
	}

	// Clamp values that would stall or explode the run
	settings.max_retries = std::max(1, settings.max_retries);
	settings.max_concurrent = std::max(1, settings.max_concurrent);
	// CollectText reads a zero limit as unlimited
	settings.max_articles = std::max(1, settings.max_articles);
	settings.dispatch_delay_ms = std::max<int64_t>(0, settings.dispatch_delay_ms);
	settings.backoff_unit_ms = std::max<int64_t>(0, settings.backoff_unit_ms);

	return settings;
}

} // namespace harvester
