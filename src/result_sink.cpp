#include "result_sink.hpp"
#include "harvest_logging.hpp"
#include "harvest_utils.hpp"

#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstring>
#include <filesystem>

namespace harvester {

//===--------------------------------------------------------------------===//
// DuckDBPlayerStore
//===--------------------------------------------------------------------===//

DuckDBPlayerStore::DuckDBPlayerStore(duckdb::DuckDB &db) : conn_(db) {
	auto result = conn_.Query("CREATE SEQUENCE IF NOT EXISTS players_id_seq");
	if (result->HasError()) {
		throw duckdb::IOException("cannot create players sequence: " + result->GetError());
	}
	result = conn_.Query("CREATE TABLE IF NOT EXISTS players ("
	                     "id INTEGER PRIMARY KEY DEFAULT nextval('players_id_seq'), "
	                     "name VARCHAR NOT NULL, "
	                     "age INTEGER NOT NULL CHECK (age > 0), "
	                     "club VARCHAR NOT NULL, "
	                     "created_at TIMESTAMP DEFAULT current_timestamp)");
	if (result->HasError()) {
		throw duckdb::IOException("cannot create players table: " + result->GetError());
	}
}

const std::vector<std::string> &DuckDBPlayerStore::StatTables() {
	static const std::vector<std::string> tables = {"countries", "competitions", "clubs", "players", "matches"};
	return tables;
}

InsertSummary DuckDBPlayerStore::BulkInsert(const std::vector<PlayerRow> &rows) {
	InsertSummary summary;
	std::lock_guard<std::mutex> lock(conn_mutex_);
	for (const auto &row : rows) {
		auto result = conn_.Query("INSERT INTO players (name, age, club) VALUES ($1, $2, $3)", row.name,
		                          static_cast<int32_t>(row.age), row.club);
		if (result->HasError()) {
			summary.failed++;
			HARVEST_LOG_ERROR("player insert failed",
			                  {StringField("name", row.name), StringField("error", result->GetError())});
			continue;
		}
		summary.inserted++;
	}
	return summary;
}

std::map<std::string, int64_t> DuckDBPlayerStore::GetTableStats() {
	std::map<std::string, int64_t> stats;
	std::lock_guard<std::mutex> lock(conn_mutex_);
	for (const auto &table : StatTables()) {
		stats[table] = 0;
		auto exists = conn_.Query("SELECT 1 FROM information_schema.tables WHERE table_name = '" + table + "'");
		if (exists->HasError() || exists->RowCount() == 0) {
			continue;
		}
		auto count = conn_.Query("SELECT count(*) FROM " + table);
		if (count->HasError() || count->RowCount() == 0) {
			HARVEST_LOG_WARN("table count failed", {StringField("table", table)});
			continue;
		}
		stats[table] = count->GetValue(0, 0).GetValue<int64_t>();
	}
	return stats;
}

//===--------------------------------------------------------------------===//
// Validation
//===--------------------------------------------------------------------===//

// Strict decimal parse: digits only, no sign, no fraction
static bool ParsePositiveInt(const std::string &text, int &value) {
	if (text.empty() || text.size() > 9) {
		return false;
	}
	long parsed = 0;
	for (char c : text) {
		if (c < '0' || c > '9') {
			return false;
		}
		parsed = parsed * 10 + (c - '0');
	}
	if (parsed <= 0 || parsed > INT_MAX) {
		return false;
	}
	value = static_cast<int>(parsed);
	return true;
}

bool ValidatePlayer(const PlayerCandidate &candidate, PlayerRow &row, std::string &reason) {
	row.name = TrimString(candidate.name);
	if (row.name.empty()) {
		reason = "name is empty";
		return false;
	}
	if (!ParsePositiveInt(TrimString(candidate.age), row.age)) {
		reason = "age '" + candidate.age + "' is not a positive integer";
		return false;
	}
	row.club = TrimString(candidate.club);
	if (row.club.empty()) {
		reason = "club is empty";
		return false;
	}
	return true;
}

//===--------------------------------------------------------------------===//
// ResultSink
//===--------------------------------------------------------------------===//

ResultSink::ResultSink(std::string results_dir, PlayerStore &store)
    : results_dir_(std::move(results_dir)), store_(store) {
}

std::string ResultSink::DefaultSnapshotName(std::chrono::system_clock::time_point time) {
	return "harvest_results_" + std::to_string(ToUnixSeconds(time)) + ".json";
}

// Exclusive create; false if the file already exists
static bool WriteNewFile(const std::string &path, const std::string &content) {
	FILE *file = fopen(path.c_str(), "wx");
	if (!file) {
		if (errno == EEXIST) {
			return false;
		}
		throw duckdb::IOException("cannot create snapshot '" + path + "': " + strerror(errno));
	}
	size_t written = fwrite(content.data(), 1, content.size(), file);
	bool ok = written == content.size();
	if (fclose(file) != 0) {
		ok = false;
	}
	if (!ok) {
		std::remove(path.c_str());
		throw duckdb::IOException("cannot write snapshot '" + path + "'");
	}
	return true;
}

std::string ResultSink::WriteSnapshot(const HarvestReport &report, const std::string &filename) const {
	namespace fs = std::filesystem;

	// Snapshots stay inside results_dir
	if (filename.empty() || filename.find_first_of("/\\") != std::string::npos ||
	    filename.find("..") != std::string::npos) {
		throw duckdb::InvalidInputException("snapshot name '" + filename + "' must be a plain file name");
	}

	std::error_code ec;
	fs::create_directories(results_dir_, ec);
	if (ec) {
		throw duckdb::IOException("cannot create results directory '" + results_dir_ + "': " + ec.message());
	}

	auto content = SerializeReport(report);
	fs::path name(filename);
	auto stem = name.stem().string();
	auto extension = name.extension().string();

	for (int suffix = 0; suffix < 1000; suffix++) {
		auto candidate = suffix == 0 ? name.string() : stem + "_" + std::to_string(suffix) + extension;
		auto path = (fs::path(results_dir_) / candidate).string();
		if (WriteNewFile(path, content)) {
			return path;
		}
	}
	throw duckdb::IOException("no free snapshot name for '" + filename + "' in '" + results_dir_ + "'");
}

PersistSummary ResultSink::Persist(const HarvestReport &report, const std::string &filename) {
	PersistSummary summary;

	auto name = filename.empty() ? DefaultSnapshotName(std::chrono::system_clock::now()) : filename;
	try {
		summary.snapshot_path = WriteSnapshot(report, name);
		summary.snapshot_written = true;
		HARVEST_LOG_INFO("snapshot written",
		                 {StringField("path", summary.snapshot_path), IntField("entries", report.Size())});
	} catch (const std::exception &ex) {
		summary.snapshot_error = ExceptionMessage(ex);
		HARVEST_LOG_ERROR("snapshot failed", {StringField("error", summary.snapshot_error)});
	}

	std::vector<PlayerRow> rows;
	for (const auto &entry : report.Entries()) {
		if (!entry.Succeeded()) {
			continue;
		}
		for (const auto &candidate : entry.record.players) {
			PlayerRow row;
			std::string reason;
			if (!ValidatePlayer(candidate, row, reason)) {
				summary.dropped++;
				HARVEST_LOG_WARN("player dropped", {StringField("source", entry.source_id),
				                                    StringField("name", candidate.name), StringField("reason", reason)});
				continue;
			}
			rows.push_back(std::move(row));
		}
	}

	if (!rows.empty()) {
		summary.forwarded = rows.size();
		try {
			auto inserted = store_.BulkInsert(rows);
			summary.inserted = inserted.inserted;
			summary.insert_failures = inserted.failed;
		} catch (const std::exception &ex) {
			summary.insert_failures = rows.size();
			HARVEST_LOG_ERROR("player insert failed", {StringField("error", ExceptionMessage(ex))});
		}
	}
	HARVEST_LOG_INFO("players persisted", {IntField("forwarded", summary.forwarded),
	                                       IntField("inserted", summary.inserted),
	                                       IntField("dropped", summary.dropped)});
	return summary;
}

} // namespace harvester
