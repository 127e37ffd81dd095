#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "harvest_utils.hpp"
#include "normalized_record.hpp"

namespace harvester {

enum class EntryStatus : uint8_t {
	SUCCEEDED = 0,
	FETCH_FAILED = 1,
	EXTRACTION_FAILED = 2,
	INCOMPLETE = 3  // cancelled or never dispatched
};

const char *EntryStatusToString(EntryStatus status);
// Throws duckdb::InvalidInputException for an unknown name
EntryStatus EntryStatusFromString(const std::string &name);

// One worklist source's outcome. `record` is only meaningful for SUCCEEDED,
// `failure` for everything else.
struct ReportEntry {
	std::string source_id;
	std::string url;
	EntryStatus status = EntryStatus::INCOMPLETE;
	NormalizedRecord record;
	std::string failure;
	HarvestErrorType error_type = HarvestErrorType::NONE;
	int attempts = 0;
	int64_t elapsed_ms = 0;
	int status_code = 0;
	std::string captured_at;

	bool Succeeded() const {
		return status == EntryStatus::SUCCEEDED;
	}
};

// Source id -> entry, in worklist order. Sealed by Finalize().
class HarvestReport {
public:
	HarvestReport() = default;

	// Throws duckdb::InvalidInputException on a duplicate source id and
	// duckdb::InternalException once finalized
	void Add(ReportEntry entry);
	void Finalize(std::chrono::system_clock::time_point finished_at);

	const std::vector<ReportEntry> &Entries() const {
		return entries_;
	}
	// nullptr if the id is not in the report
	const ReportEntry *Find(const std::string &source_id) const;
	size_t Size() const {
		return entries_.size();
	}
	size_t Count(EntryStatus status) const;

	// False when any entry is INCOMPLETE
	bool IsComplete() const;
	bool IsFinalized() const {
		return finalized_;
	}

	std::chrono::system_clock::time_point StartedAt() const {
		return started_at_;
	}
	void SetStartedAt(std::chrono::system_clock::time_point started_at) {
		started_at_ = started_at;
	}
	std::chrono::system_clock::time_point FinishedAt() const {
		return finished_at_;
	}

private:
	std::vector<ReportEntry> entries_;
	std::map<std::string, size_t> index_;
	bool finalized_ = false;
	std::chrono::system_clock::time_point started_at_;
	std::chrono::system_clock::time_point finished_at_;
};

//===--------------------------------------------------------------------===//
// Snapshot JSON
//===--------------------------------------------------------------------===//

// Pretty-printed (two-space) JSON object keyed by source id
std::string SerializeReport(const HarvestReport &report);

// Inverse of SerializeReport; throws duckdb::InvalidInputException on malformed input
HarvestReport ParseSnapshot(const std::string &json);

// Throws duckdb::IOException if the file cannot be read
HarvestReport LoadSnapshot(const std::string &path);

} // namespace harvester
