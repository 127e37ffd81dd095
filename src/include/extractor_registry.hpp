#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "normalized_record.hpp"

namespace harvester {

// Turns a raw payload into a record. Implementations may throw on malformed
// input; the registry converts that into an ExtractionError.
class Extractor {
public:
	virtual ~Extractor() = default;

	virtual NormalizedRecord Extract(const std::string &payload) const = 0;
};

struct ExtractionError {
	std::string source_id;
	std::string summary;
};

class ExtractionResult {
public:
	static ExtractionResult Ok(NormalizedRecord record);
	static ExtractionResult Failed(std::string source_id, std::string summary);

	bool Succeeded() const {
		return success_;
	}
	const NormalizedRecord &Record() const {
		return record_;
	}
	NormalizedRecord TakeRecord() {
		return std::move(record_);
	}
	const ExtractionError &GetError() const {
		return error_;
	}

private:
	ExtractionResult(bool success, NormalizedRecord record, ExtractionError error);

	bool success_;
	NormalizedRecord record_;
	ExtractionError error_;
};

// Name -> extractor map. Ids are exact, case-sensitive keys.
class ExtractorRegistry {
public:
	ExtractorRegistry() = default;

	ExtractorRegistry(const ExtractorRegistry &) = delete;
	ExtractorRegistry &operator=(const ExtractorRegistry &) = delete;

	// Throws duckdb::InvalidInputException for an empty or already registered id
	void Register(const std::string &id, std::unique_ptr<Extractor> extractor);

	bool Contains(const std::string &id) const;
	std::vector<std::string> Ids() const;

	// Throws duckdb::InvalidInputException naming every id without an extractor
	void RequireAll(const std::vector<std::string> &ids) const;

	// Never throws
	ExtractionResult Extract(const std::string &source_id, const std::string &payload) const;
	// Same, when the source is bound to an extractor registered under another id
	ExtractionResult Extract(const std::string &extractor_id, const std::string &source_id,
	                         const std::string &payload) const;

private:
	std::map<std::string, std::unique_ptr<Extractor>> extractors_;
};

} // namespace harvester
