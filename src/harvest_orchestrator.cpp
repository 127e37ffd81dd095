#include "harvest_orchestrator.hpp"
#include "cancellation_token.hpp"
#include "extractor_registry.hpp"
#include "fetcher.hpp"
#include "harvest_logging.hpp"
#include "harvest_utils.hpp"

#include "duckdb.hpp"

#include <memory>
#include <set>

namespace harvester {

const char *HarvestStateToString(HarvestState state) {
	switch (state) {
		case HarvestState::IDLE: return "idle";
		case HarvestState::DISPATCHING: return "dispatching";
		case HarvestState::AWAITING: return "awaiting";
		case HarvestState::AGGREGATING: return "aggregating";
		case HarvestState::DONE: return "done";
		default: return "unknown";
	}
}

// Written by exactly one worker, read by the coordinator after the join
struct FetchSlot {
	std::unique_ptr<FetchOutcome> outcome;
	std::string captured_at;
	bool crashed = false;
	std::string crash_error;
};

HarvestOrchestrator::HarvestOrchestrator(Fetcher &fetcher, const ExtractorRegistry &registry,
                                         HarvestSettings settings)
    : fetcher_(fetcher), registry_(registry), settings_(std::move(settings)) {
}

LimiterStats HarvestOrchestrator::LastLimiterStats() const {
	std::lock_guard<std::mutex> lock(stats_mutex_);
	return last_stats_;
}

void HarvestOrchestrator::Transition(HarvestState next) {
	HARVEST_LOG_DEBUG("harvest state", {StringField("from", HarvestStateToString(state_.load())),
	                                    StringField("to", HarvestStateToString(next))});
	state_.store(next);
}

//===--------------------------------------------------------------------===//
// Worklist
//===--------------------------------------------------------------------===//

std::vector<Source> HarvestOrchestrator::BuildWorklist(const std::vector<Source> &sources,
                                                       const std::vector<std::string> &extra_urls) const {
	std::vector<Source> worklist;
	std::set<std::string> seen_urls;
	std::set<std::string> seen_ids;

	for (const auto &source : sources) {
		if (source.id.empty()) {
			throw duckdb::InvalidInputException("source for '" + source.url + "' has an empty id");
		}
		auto url_error = GetUrlValidationError(source.url);
		if (!url_error.empty()) {
			throw duckdb::InvalidInputException("source '" + source.id + "': " + url_error);
		}
		if (!seen_ids.insert(source.id).second) {
			throw duckdb::InvalidInputException("duplicate source id '" + source.id + "'");
		}
		if (!seen_urls.insert(source.url).second) {
			HARVEST_LOG_WARN("duplicate url skipped", {StringField("source", source.id), StringField("url", source.url)});
			continue;
		}
		Source entry = source;
		if (entry.extractor.empty()) {
			entry.extractor = entry.id;
		}
		worklist.push_back(std::move(entry));
	}

	for (const auto &url : extra_urls) {
		auto url_error = GetUrlValidationError(url);
		if (!url_error.empty()) {
			throw duckdb::InvalidInputException("ad hoc url '" + url + "': " + url_error);
		}
		if (!seen_urls.insert(url).second) {
			HARVEST_LOG_DEBUG("duplicate url skipped", {StringField("url", url)});
			continue;
		}
		auto base_id = SyntheticSourceId(url);
		auto id = base_id;
		for (int n = 2; !seen_ids.insert(id).second; n++) {
			id = base_id + "#" + std::to_string(n);
		}
		if (id != base_id) {
			HARVEST_LOG_WARN("ad hoc url id collides with an existing source, renamed",
			                 {StringField("source", id), StringField("url", url)});
		}
		worklist.push_back(Source {id, url, DEFAULT_EXTRACTOR_ID});
	}

	std::vector<std::string> extractor_ids;
	extractor_ids.reserve(worklist.size());
	for (const auto &source : worklist) {
		extractor_ids.push_back(source.extractor);
	}
	registry_.RequireAll(extractor_ids);
	return worklist;
}

//===--------------------------------------------------------------------===//
// Run
//===--------------------------------------------------------------------===//

static ReportEntry BuildEntry(const Source &source, FetchSlot &slot, const ExtractorRegistry &registry) {
	ReportEntry entry;
	entry.source_id = source.id;
	entry.url = source.url;
	entry.captured_at = slot.captured_at;

	if (slot.crashed) {
		entry.status = EntryStatus::FETCH_FAILED;
		entry.failure = "fetch task crashed: " + slot.crash_error;
		return entry;
	}
	if (!slot.outcome) {
		entry.status = EntryStatus::INCOMPLETE;
		entry.failure = "cancelled before dispatch";
		entry.error_type = HarvestErrorType::CANCELLED;
		return entry;
	}

	auto &outcome = *slot.outcome;
	entry.attempts = outcome.Attempts();
	entry.elapsed_ms = outcome.Elapsed().count();
	entry.status_code = outcome.StatusCode();

	if (!outcome.Succeeded()) {
		entry.status =
		    outcome.ErrorType() == HarvestErrorType::CANCELLED ? EntryStatus::INCOMPLETE : EntryStatus::FETCH_FAILED;
		entry.failure = outcome.FailureReason();
		entry.error_type = outcome.ErrorType();
		return entry;
	}

	auto result = registry.Extract(source.extractor, source.id, outcome.TakePayload());
	if (!result.Succeeded()) {
		entry.status = EntryStatus::EXTRACTION_FAILED;
		entry.failure = result.GetError().summary;
		entry.error_type = HarvestErrorType::EXTRACTION_FAILED;
		return entry;
	}

	entry.status = EntryStatus::SUCCEEDED;
	entry.record = result.TakeRecord();
	auto &provenance = entry.record.provenance;
	provenance.url = entry.url;
	provenance.status_code = entry.status_code;
	provenance.latency_ms = entry.elapsed_ms;
	provenance.attempts = entry.attempts;
	provenance.captured_at = entry.captured_at;
	return entry;
}

HarvestReport HarvestOrchestrator::RunHarvest(const std::vector<Source> &sources,
                                              const std::vector<std::string> &extra_urls, int concurrency,
                                              const CancellationToken *cancel) {
	std::lock_guard<std::mutex> run_lock(run_mutex_);
	state_.store(HarvestState::IDLE);

	// Configuration errors surface here, before anything is dispatched
	auto worklist = BuildWorklist(sources, extra_urls);
	if (concurrency <= 0) {
		concurrency = settings_.max_concurrent;
	}

	HarvestReport report;
	report.SetStartedAt(std::chrono::system_clock::now());
	HARVEST_LOG_INFO("harvest started", {IntField("sources", worklist.size()), IntField("concurrency", concurrency)});

	std::vector<FetchSlot> slots(worklist.size());
	ConcurrencyLimiter limiter(concurrency, std::chrono::milliseconds(settings_.dispatch_delay_ms));

	Transition(HarvestState::DISPATCHING);
	limiter.Dispatch(
	    worklist.size(),
	    [&](size_t index) {
		    const auto &source = worklist[index];
		    HARVEST_LOG_DEBUG("fetch dispatched", {StringField("source", source.id), StringField("url", source.url)});
		    auto outcome = fetcher_.Fetch(source.url, cancel);
		    auto &slot = slots[index];
		    slot.captured_at = FormatIsoTimestamp(std::chrono::system_clock::now());
		    slot.outcome = std::unique_ptr<FetchOutcome>(new FetchOutcome(std::move(outcome)));
	    },
	    [&](size_t index, const std::string &error) {
		    auto &slot = slots[index];
		    slot.crashed = true;
		    slot.crash_error = error;
		    slot.captured_at = FormatIsoTimestamp(std::chrono::system_clock::now());
	    },
	    cancel);

	Transition(HarvestState::AWAITING);
	auto stats = limiter.Wait();
	{
		std::lock_guard<std::mutex> lock(stats_mutex_);
		last_stats_ = stats;
	}

	Transition(HarvestState::AGGREGATING);
	for (size_t i = 0; i < worklist.size(); i++) {
		report.Add(BuildEntry(worklist[i], slots[i], registry_));
	}
	report.Finalize(std::chrono::system_clock::now());

	Transition(HarvestState::DONE);
	HARVEST_LOG_INFO("harvest finished",
	                 {IntField("sources", report.Size()), IntField("succeeded", report.Count(EntryStatus::SUCCEEDED)),
	                  IntField("fetch_failed", report.Count(EntryStatus::FETCH_FAILED)),
	                  IntField("extraction_failed", report.Count(EntryStatus::EXTRACTION_FAILED)),
	                  IntField("incomplete", report.Count(EntryStatus::INCOMPLETE)),
	                  IntField("peak_in_flight", stats.peak_in_flight)});
	return report;
}

//===--------------------------------------------------------------------===//
// Continuous mode
//===--------------------------------------------------------------------===//

CycleStats RunPeriodically(const std::function<void()> &cycle, std::chrono::milliseconds interval,
                           std::chrono::milliseconds retry_delay, const CancellationToken &cancel,
                           size_t max_cycles) {
	CycleStats stats;
	while (!cancel.IsCancelled()) {
		auto delay = interval;
		try {
			cycle();
			stats.completed++;
		} catch (const std::exception &ex) {
			stats.failed++;
			delay = retry_delay;
			HARVEST_LOG_ERROR("harvest cycle failed",
			                  {StringField("error", ExceptionMessage(ex)), IntField("retry_in_ms", delay.count())});
		}
		if (max_cycles > 0 && stats.completed + stats.failed >= max_cycles) {
			break;
		}
		HARVEST_LOG_INFO("next harvest cycle scheduled", {IntField("in_ms", delay.count())});
		if (cancel.WaitFor(delay)) {
			break;
		}
	}
	HARVEST_LOG_INFO("continuous harvest stopped",
	                 {IntField("completed", stats.completed), IntField("failed", stats.failed)});
	return stats;
}

} // namespace harvester
