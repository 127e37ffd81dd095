#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "duckdb.hpp"
#include "harvest_report.hpp"

namespace harvester {

// A player that passed validation
struct PlayerRow {
	std::string name;
	int age = 0;
	std::string club;
};

struct InsertSummary {
	size_t inserted = 0;
	size_t failed = 0;
};

// Persistence collaborator
class PlayerStore {
public:
	virtual ~PlayerStore() = default;

	// Rows that fail to insert are logged and counted; never throws
	virtual InsertSummary BulkInsert(const std::vector<PlayerRow> &rows) = 0;

	// Row counts for countries, competitions, clubs, players and matches;
	// 0 for a table that does not exist
	virtual std::map<std::string, int64_t> GetTableStats() = 0;
};

// players(name, age, club) in a DuckDB database
class DuckDBPlayerStore : public PlayerStore {
public:
	// Creates the players table if needed; throws duckdb::IOException on failure
	explicit DuckDBPlayerStore(duckdb::DuckDB &db);

	InsertSummary BulkInsert(const std::vector<PlayerRow> &rows) override;
	std::map<std::string, int64_t> GetTableStats() override;

	static const std::vector<std::string> &StatTables();

private:
	std::mutex conn_mutex_;
	duckdb::Connection conn_;
};

// Name and club non-empty after trimming, age a positive integer. On
// failure `reason` says which field was rejected.
bool ValidatePlayer(const PlayerCandidate &candidate, PlayerRow &row, std::string &reason);

struct PersistSummary {
	std::string snapshot_path;
	bool snapshot_written = false;
	std::string snapshot_error;
	size_t forwarded = 0;  // rows handed to the store
	size_t inserted = 0;
	size_t insert_failures = 0;
	size_t dropped = 0;  // candidates that failed validation
};

// Writes the snapshot and forwards valid players to the store
class ResultSink {
public:
	ResultSink(std::string results_dir, PlayerStore &store);

	// Never throws; failures are logged and reported in the summary.
	// An empty filename means "harvest_results_<unix seconds>.json".
	PersistSummary Persist(const HarvestReport &report, const std::string &filename = "");

	// Creates results_dir if needed and writes the snapshot under a name that
	// does not exist yet, appending _1, _2, ... to the stem as needed. Returns
	// the path written. Throws duckdb::IOException, or InvalidInputException
	// when filename is not a plain file name (separators, "..").
	std::string WriteSnapshot(const HarvestReport &report, const std::string &filename) const;

	static std::string DefaultSnapshotName(std::chrono::system_clock::time_point time);

private:
	std::string results_dir_;
	PlayerStore &store_;
};

} // namespace harvester
