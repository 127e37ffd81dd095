#pragma once

#include <cstdint>
#include <string>

namespace duckdb {
class Connection;
struct DBConfig;
} // namespace duckdb

namespace harvester {

struct HarvestSettings {
	int64_t timeout_ms = 10000;             // per attempt
	int max_retries = 3;
	int64_t backoff_unit_ms = 1000;         // backoff after attempt i is 2^i units
	int max_concurrent = 5;
	int64_t dispatch_delay_ms = 100;        // pacing before each dispatch
	int max_articles = 10;
	int64_t max_response_bytes = 10485760;  // 10MB, 0 = unlimited
	std::string results_dir = "data/scraping_results";
	std::string log_file = "logs/harvester.log";
	std::string log_level = "info";
};

// Register harvest_* options; call before the database is opened with this config
void RegisterHarvestOptions(duckdb::DBConfig &config);

// Read harvest_* options back via current_setting(). Unset or unreadable
// options keep their defaults.
HarvestSettings LoadHarvestSettings(duckdb::Connection &conn);

} // namespace harvester
