#include "harvest_orchestrator.hpp"
#include "cancellation_token.hpp"
#include "extractor_registry.hpp"
#include "fake_transport.hpp"
#include "fetcher.hpp"
#include "result_sink.hpp"

#include "duckdb.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <thread>
#include <unistd.h>

namespace {

using namespace harvester;
using harvester::testing::OkResponse;
using harvester::testing::ScriptedTransport;
using harvester::testing::StatusResponse;
using harvester::testing::TimeoutResponse;
using std::chrono::milliseconds;

class ThrowingExtractor : public Extractor {
public:
	NormalizedRecord Extract(const std::string &) const override {
		throw std::runtime_error("unexpected markup");
	}
};

// Transport whose Get throws for one URL
class ExplodingTransport : public ScriptedTransport {
public:
	HttpResponse Get(const HttpRequest &request) override {
		if (request.url == "http://x/boom") {
			throw std::runtime_error("transport exploded");
		}
		return ScriptedTransport::Get(request);
	}
};

HarvestSettings FastSettings() {
	HarvestSettings settings;
	settings.dispatch_delay_ms = 1;
	settings.max_concurrent = 5;
	return settings;
}

FetchConfig FastFetch(int max_retries) {
	FetchConfig config;
	config.max_retries = max_retries;
	config.backoff_unit = milliseconds(5);
	return config;
}

struct Harness {
	explicit Harness(int max_retries = 2) : fetcher(transport, FastFetch(max_retries)) {
		RegisterBuiltinExtractors(registry, 10);
		registry.Register("broken", std::unique_ptr<Extractor>(new ThrowingExtractor()));
		orchestrator.reset(new HarvestOrchestrator(fetcher, registry, FastSettings()));
	}

	ExplodingTransport transport;
	Fetcher fetcher;
	ExtractorRegistry registry;
	std::unique_ptr<HarvestOrchestrator> orchestrator;
};

void TestScenarioSuccessAndTimeout() {
	Harness harness(2);
	harness.transport.Script("http://x/ok", {OkResponse("<h3>Goal!</h3>")});
	harness.transport.Script("http://x/fail", {TimeoutResponse()});

	auto report = harness.orchestrator->RunHarvest(
	    {{"a", "http://x/ok", "default"}, {"b", "http://x/fail", "default"}});

	assert(report.Size() == 2);
	assert(report.IsFinalized());
	assert(report.IsComplete());
	assert(harness.orchestrator->State() == HarvestState::DONE);

	auto a = report.Find("a");
	assert(a != nullptr);
	assert(a->status == EntryStatus::SUCCEEDED);
	assert(a->record.title == "No title");
	assert((a->record.FindCollection("articles")->items == std::vector<std::string> {"Goal!"}));
	assert(a->record.provenance.url == "http://x/ok");
	assert(a->record.provenance.status_code == 200);
	assert(a->record.provenance.attempts == 1);
	assert(!a->record.provenance.captured_at.empty());

	auto b = report.Find("b");
	assert(b != nullptr);
	assert(b->status == EntryStatus::FETCH_FAILED);
	assert(b->failure == "failed after 2 attempts");
	assert(b->error_type == HarvestErrorType::NETWORK_TIMEOUT);
	assert(b->attempts == 2);
	assert(harness.transport.Calls("http://x/fail") == 2);
}

void TestEverySourceIsReportedOnce() {
	Harness harness(1);
	std::vector<Source> sources;
	for (int i = 0; i < 12; i++) {
		auto url = "http://x/page" + std::to_string(i);
		if (i % 3 == 0) {
			harness.transport.Script(url, {OkResponse("<title>P</title><h3>H</h3>")});
		} else if (i % 3 == 1) {
			harness.transport.Script(url, {StatusResponse(502)});
		}
		sources.push_back(Source {"s" + std::to_string(i), url, i == 6 ? "broken" : "default"});
	}
	sources.push_back(Source {"boom", "http://x/boom", "default"});

	auto report = harness.orchestrator->RunHarvest(sources, {}, 4);
	assert(report.Size() == sources.size());

	std::set<std::string> ids;
	for (size_t i = 0; i < sources.size(); i++) {
		// Worklist order, regardless of completion order
		assert(report.Entries()[i].source_id == sources[i].id);
		ids.insert(report.Entries()[i].source_id);
	}
	assert(ids.size() == sources.size());

	assert(report.Find("s0")->status == EntryStatus::SUCCEEDED);
	assert(report.Find("s1")->status == EntryStatus::FETCH_FAILED);
	assert(report.Find("s1")->status_code == 502);
	assert(report.Find("s1")->error_type == HarvestErrorType::HTTP_STATUS);
	assert(report.Find("s2")->status == EntryStatus::FETCH_FAILED);
	assert(report.Find("s6")->status == EntryStatus::EXTRACTION_FAILED);
	assert(report.Find("s6")->failure.find("unexpected markup") != std::string::npos);

	auto boom = report.Find("boom");
	assert(boom->status == EntryStatus::FETCH_FAILED);
	assert(boom->failure.find("transport exploded") != std::string::npos);

	auto stats = harness.orchestrator->LastLimiterStats();
	assert(stats.crashed == 1);
	assert(stats.peak_in_flight <= 4);
	assert(harness.transport.PeakInFlight() <= 4);
}

void TestAdHocUrlsAreDeduplicated() {
	Harness harness(1);
	std::vector<Source> sources = {{"espn", "https://www.espn.com/soccer/", "espn"}};
	auto worklist = harness.orchestrator->BuildWorklist(
	    sources, {"https://www.espn.com/soccer/", "https://example.com/news/", "https://example.com/news/",
	              "http://example.com/news"});

	assert(worklist.size() == 3);
	assert(worklist[0].id == "espn");
	assert(worklist[1].id == "url:example.com/news");
	assert(worklist[1].url == "https://example.com/news/");
	assert(worklist[1].extractor == DEFAULT_EXTRACTOR_ID);
	// Distinct URL, same synthetic id: kept under a suffixed id
	assert(worklist[2].id == "url:example.com/news#2");
	assert(worklist[2].url == "http://example.com/news");
	assert(worklist[2].extractor == DEFAULT_EXTRACTOR_ID);

	auto third = harness.orchestrator->BuildWorklist(
	    {}, {"https://example.com/a", "http://example.com/a", "https://EXAMPLE.com/a/"});
	assert(third.size() == 3);
	assert(third[2].id == "url:example.com/a#3");

	// Duplicate configured URLs: first occurrence wins
	auto same_url = harness.orchestrator->BuildWorklist(
	    {{"goal", "https://www.goal.com/en", "goal"}, {"goal_mirror", "https://www.goal.com/en", "default"}});
	assert(same_url.size() == 1);
	assert(same_url[0].id == "goal");
}

void TestConfigurationErrorsAbortBeforeDispatch() {
	Harness harness(1);

	bool threw = false;
	try {
		harness.orchestrator->RunHarvest({{"a", "http://x/1", "default"}, {"a", "http://x/2", "default"}});
	} catch (const duckdb::InvalidInputException &) {
		threw = true;
	}
	assert(threw);

	threw = false;
	try {
		harness.orchestrator->RunHarvest({{"a", "http://x/1", "default"}, {"c", "http://x/3", "no_such_site"}});
	} catch (const duckdb::InvalidInputException &) {
		threw = true;
	}
	assert(threw);

	threw = false;
	try {
		harness.orchestrator->RunHarvest({}, {"not-a-url"});
	} catch (const duckdb::InvalidInputException &) {
		threw = true;
	}
	assert(threw);
	assert(harness.transport.Started() == 0);
}

void TestEmptyWorklist() {
	Harness harness(1);
	auto report = harness.orchestrator->RunHarvest({});
	assert(report.Size() == 0);
	assert(report.IsComplete());
}

HarvestReport RunCancelled(Harness &harness, const std::vector<Source> &sources, int concurrency, int wait_started) {
	CancellationToken cancel;
	HarvestReport report;
	std::thread runner([&]() { report = harness.orchestrator->RunHarvest(sources, {}, concurrency, &cancel); });

	auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
	while (harness.transport.Started() < wait_started && std::chrono::steady_clock::now() < deadline) {
		std::this_thread::sleep_for(milliseconds(5));
	}
	assert(harness.transport.Started() == wait_started);
	cancel.Cancel();
	runner.join();
	return report;
}

void TestCancelAfterDispatchMarksIncomplete() {
	Harness harness(3);
	std::vector<Source> sources;
	for (int i = 0; i < 3; i++) {
		auto url = "http://x/slow" + std::to_string(i);
		harness.transport.Block(url);
		sources.push_back(Source {"slow" + std::to_string(i), url, "default"});
	}

	auto report = RunCancelled(harness, sources, 5, 3);
	assert(report.Size() == 3);
	assert(!report.IsComplete());
	for (const auto &entry : report.Entries()) {
		assert(entry.status == EntryStatus::INCOMPLETE);
		assert(entry.error_type == HarvestErrorType::CANCELLED);
	}
}

void TestCancelSkipsUndispatchedSources() {
	Harness harness(3);
	std::vector<Source> sources;
	for (int i = 0; i < 5; i++) {
		auto url = "http://x/queued" + std::to_string(i);
		harness.transport.Block(url);
		sources.push_back(Source {"queued" + std::to_string(i), url, "default"});
	}

	auto report = RunCancelled(harness, sources, 2, 2);
	assert(report.Size() == 5);
	assert(report.Count(EntryStatus::INCOMPLETE) == 5);
	assert(report.Find("queued4")->failure == "cancelled before dispatch");
	assert(harness.orchestrator->LastLimiterStats().skipped == 3);
}

void TestRosterSourceFeedsPlayerStore() {
	Harness harness(1);
	harness.transport.Script("http://x/squad", {OkResponse(R"(<html><head><title>Squad</title></head><body>
<table><tr><th>Name</th><th>Age</th><th>Club</th></tr>
<tr><td>Bukayo Saka</td><td>23</td><td>Arsenal</td></tr>
<tr><td>Nobody</td><td>-1</td><td>Arsenal</td></tr></table></body></html>)")});

	auto source = ParseSourceOption("squad=http://x/squad@roster");
	auto report = harness.orchestrator->RunHarvest({source}, {}, 1);
	assert(report.Find("squad")->status == EntryStatus::SUCCEEDED);
	assert(report.Find("squad")->record.players.size() == 2);

	auto dir = std::filesystem::temp_directory_path() / ("harvester_roster_" + std::to_string(getpid()));
	std::filesystem::remove_all(dir);
	duckdb::DuckDB db(nullptr);
	DuckDBPlayerStore store(db);
	ResultSink sink(dir.string(), store);
	auto persisted = sink.Persist(report, "roster.json");
	assert(persisted.snapshot_written);
	assert(persisted.inserted == 1);
	assert(persisted.dropped == 1);
	assert(store.GetTableStats().at("players") == 1);
	std::filesystem::remove_all(dir);
}

void TestPeriodicCyclesRetryAfterFailure() {
	CancellationToken cancel;
	int calls = 0;
	auto stats = RunPeriodically(
	    [&]() {
		    calls++;
		    if (calls == 2) {
			    throw duckdb::IOException("results disk full");
		    }
		    if (calls == 4) {
			    cancel.Cancel();
		    }
	    },
	    milliseconds(1), milliseconds(1), cancel);
	assert(calls == 4);
	assert(stats.completed == 3);
	assert(stats.failed == 1);

	CancellationToken unused;
	calls = 0;
	stats = RunPeriodically([&]() { calls++; }, milliseconds(1), milliseconds(1), unused, 2);
	assert(calls == 2);
	assert(stats.completed == 2);
}

void TestPeriodicWaitEndsOnCancel() {
	CancellationToken cancel;
	std::thread interrupter([&]() {
		std::this_thread::sleep_for(milliseconds(30));
		cancel.Cancel();
	});
	auto started = std::chrono::steady_clock::now();
	int calls = 0;
	auto stats = RunPeriodically([&]() { calls++; }, std::chrono::minutes(30), std::chrono::minutes(1), cancel);
	interrupter.join();
	assert(calls == 1);
	assert(stats.completed == 1);
	assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(10));

	// Already cancelled: no cycle runs
	calls = 0;
	RunPeriodically([&]() { calls++; }, milliseconds(1), milliseconds(1), cancel);
	assert(calls == 0);
}

} // namespace

int main() {
	TestScenarioSuccessAndTimeout();
	TestEverySourceIsReportedOnce();
	TestAdHocUrlsAreDeduplicated();
	TestConfigurationErrorsAbortBeforeDispatch();
	TestEmptyWorklist();
	TestCancelAfterDispatchMarksIncomplete();
	TestCancelSkipsUndispatchedSources();
	TestRosterSourceFeedsPlayerStore();
	TestPeriodicCyclesRetryAfterFailure();
	TestPeriodicWaitEndsOnCancel();

	std::cout << "harvester_unit_orchestrator: pass\n";
	return 0;
}
