#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "concurrency_limiter.hpp"
#include "harvest_report.hpp"
#include "harvest_settings.hpp"
#include "site_extractors.hpp"

namespace harvester {

class CancellationToken;
class ExtractorRegistry;
class Fetcher;

enum class HarvestState : uint8_t { IDLE = 0, DISPATCHING = 1, AWAITING = 2, AGGREGATING = 3, DONE = 4 };

const char *HarvestStateToString(HarvestState state);

// Drives one harvest: worklist -> limiter -> fetcher -> extractor -> report.
// One run at a time per orchestrator.
class HarvestOrchestrator {
public:
	HarvestOrchestrator(Fetcher &fetcher, const ExtractorRegistry &registry, HarvestSettings settings);

	HarvestOrchestrator(const HarvestOrchestrator &) = delete;
	HarvestOrchestrator &operator=(const HarvestOrchestrator &) = delete;

	// Configured sources followed by ad hoc URLs, deduplicated by URL (first
	// occurrence wins). Ad hoc URLs get a synthetic "url:<host><path>" id and
	// the default extractor. Throws duckdb::InvalidInputException on an
	// invalid URL, a duplicate source id or an unregistered extractor.
	std::vector<Source> BuildWorklist(const std::vector<Source> &sources,
	                                  const std::vector<std::string> &extra_urls = {}) const;

	// Every worklist source appears in the report exactly once. Only
	// configuration errors throw, and only before anything is dispatched.
	// concurrency <= 0 falls back to settings.max_concurrent.
	HarvestReport RunHarvest(const std::vector<Source> &sources, const std::vector<std::string> &extra_urls = {},
	                         int concurrency = 5, const CancellationToken *cancel = nullptr);

	HarvestState State() const {
		return state_.load();
	}
	LimiterStats LastLimiterStats() const;

private:
	void Transition(HarvestState next);

	Fetcher &fetcher_;
	const ExtractorRegistry &registry_;
	HarvestSettings settings_;

	std::mutex run_mutex_;
	std::atomic<HarvestState> state_ {HarvestState::IDLE};
	mutable std::mutex stats_mutex_;
	LimiterStats last_stats_;
};

struct CycleStats {
	size_t completed = 0;
	size_t failed = 0;
};

// Runs `cycle` repeatedly, sleeping `interval` between runs, until cancelled
// or `max_cycles` runs were made (0 = no limit). A cycle that throws is logged
// and the next one starts after `retry_delay` instead.
CycleStats RunPeriodically(const std::function<void()> &cycle, std::chrono::milliseconds interval,
                           std::chrono::milliseconds retry_delay, const CancellationToken &cancel,
                           size_t max_cycles = 0);

} // namespace harvester
