#include "cancellation_token.hpp"
#include "extractor_registry.hpp"
#include "fetcher.hpp"
#include "harvest_logging.hpp"
#include "harvest_orchestrator.hpp"
#include "harvest_settings.hpp"
#include "harvest_utils.hpp"
#include "http_client.hpp"
#include "result_sink.hpp"
#include "site_extractors.hpp"

#include "duckdb.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace harvester;

// A second SIGINT within this window exits without waiting for the run
static constexpr int64_t FORCE_EXIT_WINDOW_NS = 3LL * 1000 * 1000 * 1000;
// Continuous mode: wait before retrying a cycle that failed
static constexpr std::chrono::seconds CYCLE_RETRY_DELAY {60};

static std::atomic<bool> g_interrupted {false};
static std::atomic<int64_t> g_first_interrupt_ns {0};

static int64_t MonotonicNanos() {
	struct timespec ts;
	clock_gettime(CLOCK_MONOTONIC, &ts);
	return static_cast<int64_t>(ts.tv_sec) * 1000000000LL + ts.tv_nsec;
}

// Async-signal-safe: only lock-free atomics and _exit
static void HarvesterSignalHandler(int signum) {
	if (signum != SIGINT) {
		return;
	}
	int64_t now = MonotonicNanos();
	int64_t first = g_first_interrupt_ns.load();
	if (first != 0 && now - first < FORCE_EXIT_WINDOW_NS) {
		_exit(130);
	}
	g_first_interrupt_ns.store(now);
	g_interrupted.store(true);
}

struct CliOptions {
	std::string db_path = "data/harvester.duckdb";
	std::string results_dir;
	std::string output;
	int concurrency = 0;
	std::vector<std::string> urls;
	std::vector<Source> sources;
	int interval_minutes = 0;  // 0 = single run
	std::vector<std::pair<std::string, std::string>> settings;
	bool stats = false;
	bool builtin_sources = true;
};

static void Usage() {
	std::cout << "Usage:\n"
	          << "  harvester [options]\n"
	          << "\n"
	          << "Options:\n"
	          << "  --db PATH           DuckDB database (default data/harvester.duckdb, :memory: for none)\n"
	          << "  --results-dir DIR   snapshot directory (overrides harvest_results_dir)\n"
	          << "  --output NAME       snapshot file name (default harvest_results_<unix>.json)\n"
	          << "  --concurrency N     fetches in flight (overrides harvest_max_concurrent)\n"
	          << "  --url URL           extra URL to harvest, repeatable\n"
	          << "  --source ID=URL[@EXTRACTOR]\n"
	          << "                      configured source bound to a registered extractor\n"
	          << "                      (default: the extractor named ID), repeatable\n"
	          << "  --only-urls         skip the built-in soccer sources\n"
	          << "  --interval MINUTES  repeat the harvest every MINUTES until interrupted\n"
	          << "  --set NAME=VALUE    set a harvest_* option for this run\n"
	          << "  --stats             print table row counts after the run\n"
	          << "  --help              show this message\n";
}

static bool ParseArgs(int argc, char **argv, CliOptions &options) {
	for (int i = 1; i < argc; i++) {
		std::string arg = argv[i];
		auto next = [&](std::string &value) {
			if (i + 1 >= argc) {
				std::cerr << "missing value for " << arg << "\n";
				return false;
			}
			value = argv[++i];
			return true;
		};

		std::string value;
		if (arg == "--help" || arg == "-h") {
			Usage();
			std::exit(0);
		} else if (arg == "--db") {
			if (!next(options.db_path)) {
				return false;
			}
		} else if (arg == "--results-dir") {
			if (!next(options.results_dir)) {
				return false;
			}
		} else if (arg == "--output") {
			if (!next(options.output)) {
				return false;
			}
		} else if (arg == "--concurrency") {
			if (!next(value)) {
				return false;
			}
			options.concurrency = std::atoi(value.c_str());
			if (options.concurrency <= 0) {
				std::cerr << "invalid concurrency '" << value << "'\n";
				return false;
			}
		} else if (arg == "--url") {
			if (!next(value)) {
				return false;
			}
			options.urls.push_back(value);
		} else if (arg == "--source") {
			if (!next(value)) {
				return false;
			}
			try {
				options.sources.push_back(ParseSourceOption(value));
			} catch (const std::exception &ex) {
				std::cerr << ExceptionMessage(ex) << "\n";
				return false;
			}
		} else if (arg == "--interval") {
			if (!next(value)) {
				return false;
			}
			options.interval_minutes = std::atoi(value.c_str());
			if (options.interval_minutes <= 0) {
				std::cerr << "invalid interval '" << value << "'\n";
				return false;
			}
		} else if (arg == "--only-urls") {
			options.builtin_sources = false;
		} else if (arg == "--set") {
			if (!next(value)) {
				return false;
			}
			auto eq = value.find('=');
			if (eq == std::string::npos || value.compare(0, 8, "harvest_") != 0) {
				std::cerr << "expected harvest_<option>=<value>, got '" << value << "'\n";
				return false;
			}
			options.settings.emplace_back(value.substr(0, eq), value.substr(eq + 1));
		} else if (arg == "--stats") {
			options.stats = true;
		} else {
			std::cerr << "unknown argument '" << arg << "'\n";
			return false;
		}
	}
	return true;
}

static std::string QuoteSqlString(const std::string &value) {
	std::string quoted = "'";
	for (char c : value) {
		if (c == '\'') {
			quoted += '\'';
		}
		quoted += c;
	}
	return quoted + "'";
}

static void PrintSummary(const HarvestReport &report, const PersistSummary &persisted) {
	for (const auto &entry : report.Entries()) {
		std::cout << "  " << entry.source_id << ": " << EntryStatusToString(entry.status);
		if (entry.Succeeded()) {
			std::cout << " \"" << entry.record.title << "\"";
			for (const auto &collection : entry.record.collections) {
				if (!collection.items.empty()) {
					std::cout << " " << collection.label << "=" << collection.items.size();
				}
			}
		} else {
			std::cout << " (" << entry.failure << ")";
		}
		std::cout << "\n";
	}
	std::cout << "succeeded " << report.Count(EntryStatus::SUCCEEDED) << "/" << report.Size();
	if (!report.IsComplete()) {
		std::cout << ", run incomplete";
	}
	std::cout << "\n";
	if (persisted.snapshot_written) {
		std::cout << "snapshot: " << persisted.snapshot_path << "\n";
	} else {
		std::cout << "snapshot not written: " << persisted.snapshot_error << "\n";
	}
	std::cout << "players: " << persisted.inserted << " inserted, " << persisted.dropped << " dropped\n";
}

static void PrintStats(PlayerStore &store) {
	std::cout << "table stats:\n";
	for (const auto &stat : store.GetTableStats()) {
		std::cout << "  " << stat.first << ": " << stat.second << "\n";
	}
}

static int Run(const CliOptions &options) {
	duckdb::DBConfig config;
	RegisterHarvestOptions(config);

	const char *path = nullptr;
	if (options.db_path != ":memory:") {
		auto parent = std::filesystem::path(options.db_path).parent_path();
		if (!parent.empty()) {
			std::filesystem::create_directories(parent);
		}
		path = options.db_path.c_str();
	}
	duckdb::DuckDB db(path, &config);
	duckdb::Connection conn(db);

	for (const auto &setting : options.settings) {
		auto result = conn.Query("SET " + setting.first + " = " + QuoteSqlString(setting.second));
		if (result->HasError()) {
			throw duckdb::InvalidInputException("cannot set " + setting.first + ": " + result->GetError());
		}
	}

	auto settings = LoadHarvestSettings(conn);
	if (!options.results_dir.empty()) {
		settings.results_dir = options.results_dir;
	}
	if (options.concurrency > 0) {
		settings.max_concurrent = options.concurrency;
	}
	InitializeLogging(settings);

	ExtractorRegistry registry;
	RegisterBuiltinExtractors(registry, static_cast<size_t>(settings.max_articles));

	HttpSession session;
	session.Open();

	FetchConfig fetch_config;
	fetch_config.max_retries = settings.max_retries;
	fetch_config.backoff_unit = std::chrono::milliseconds(settings.backoff_unit_ms);
	fetch_config.timeout_ms = settings.timeout_ms;
	fetch_config.max_response_bytes = settings.max_response_bytes;
	Fetcher fetcher(session, fetch_config);

	HarvestOrchestrator orchestrator(fetcher, registry, settings);

	DuckDBPlayerStore store(db);
	ResultSink sink(settings.results_dir, store);

	std::vector<Source> sources;
	if (options.builtin_sources) {
		sources = BuiltinSources();
	}
	sources.insert(sources.end(), options.sources.begin(), options.sources.end());
	// Surface configuration errors before any run starts
	orchestrator.BuildWorklist(sources, options.urls);

	// The signal handler only flips an atomic; this thread forwards it to the token
	CancellationToken cancel;
	std::atomic<bool> run_finished {false};
	std::thread watcher([&]() {
		while (!run_finished.load()) {
			if (g_interrupted.load()) {
				HARVEST_LOG_WARN("interrupt received, cancelling harvest");
				cancel.Cancel();
				return;
			}
			std::this_thread::sleep_for(std::chrono::milliseconds(100));
		}
	});

	int exit_code = 0;
	auto cycle = [&]() {
		auto report = orchestrator.RunHarvest(sources, options.urls, settings.max_concurrent, &cancel);
		auto persisted = sink.Persist(report, options.output);
		PrintSummary(report, persisted);
		if (options.stats) {
			PrintStats(store);
		}
		if (!report.IsComplete()) {
			exit_code = 130;
		} else {
			exit_code = report.Count(EntryStatus::SUCCEEDED) > 0 || report.Size() == 0 ? 0 : 2;
		}
	};

	try {
		if (options.interval_minutes > 0) {
			HARVEST_LOG_INFO("continuous harvest started", {IntField("interval_minutes", options.interval_minutes)});
			RunPeriodically(cycle, std::chrono::minutes(options.interval_minutes), CYCLE_RETRY_DELAY, cancel);
			// Continuous mode only ends on an interrupt
			exit_code = 130;
		} else {
			cycle();
		}
	} catch (...) {
		run_finished.store(true);
		watcher.join();
		throw;
	}
	run_finished.store(true);
	watcher.join();
	session.Close();

	ShutdownLogging();
	return exit_code;
}

int main(int argc, char **argv) {
	CliOptions options;
	if (!ParseArgs(argc, argv, options)) {
		Usage();
		return 1;
	}

	std::signal(SIGINT, HarvesterSignalHandler);

	try {
		return Run(options);
	} catch (const std::exception &ex) {
		std::cerr << "harvester: " << ExceptionMessage(ex) << "\n";
		ShutdownLogging();
		return 1;
	}
}
