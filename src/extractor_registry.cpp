#include "extractor_registry.hpp"
#include "harvest_logging.hpp"
#include "harvest_utils.hpp"

#include "duckdb.hpp"

namespace harvester {

ExtractionResult::ExtractionResult(bool success, NormalizedRecord record, ExtractionError error)
    : success_(success), record_(std::move(record)), error_(std::move(error)) {
}

ExtractionResult ExtractionResult::Ok(NormalizedRecord record) {
	return ExtractionResult(true, std::move(record), ExtractionError {});
}

ExtractionResult ExtractionResult::Failed(std::string source_id, std::string summary) {
	return ExtractionResult(false, NormalizedRecord {}, ExtractionError {std::move(source_id), std::move(summary)});
}

void ExtractorRegistry::Register(const std::string &id, std::unique_ptr<Extractor> extractor) {
	if (id.empty()) {
		throw duckdb::InvalidInputException("extractor id must not be empty");
	}
	if (!extractor) {
		throw duckdb::InvalidInputException("extractor for '" + id + "' is null");
	}
	if (extractors_.count(id) > 0) {
		throw duckdb::InvalidInputException("extractor '" + id + "' is already registered");
	}
	extractors_.emplace(id, std::move(extractor));
}

bool ExtractorRegistry::Contains(const std::string &id) const {
	return extractors_.count(id) > 0;
}

std::vector<std::string> ExtractorRegistry::Ids() const {
	std::vector<std::string> ids;
	ids.reserve(extractors_.size());
	for (const auto &entry : extractors_) {
		ids.push_back(entry.first);
	}
	return ids;
}

void ExtractorRegistry::RequireAll(const std::vector<std::string> &ids) const {
	std::string missing;
	for (const auto &id : ids) {
		if (!Contains(id)) {
			if (!missing.empty()) {
				missing += ", ";
			}
			missing += "'" + id + "'";
		}
	}
	if (!missing.empty()) {
		throw duckdb::InvalidInputException("no extractor registered for " + missing);
	}
}

ExtractionResult ExtractorRegistry::Extract(const std::string &source_id, const std::string &payload) const {
	return Extract(source_id, source_id, payload);
}

ExtractionResult ExtractorRegistry::Extract(const std::string &extractor_id, const std::string &source_id,
                                            const std::string &payload) const {
	auto entry = extractors_.find(extractor_id);
	if (entry == extractors_.end()) {
		return ExtractionResult::Failed(source_id, "no extractor registered for '" + extractor_id + "'");
	}

	try {
		return ExtractionResult::Ok(entry->second->Extract(payload));
	} catch (const std::exception &ex) {
		auto summary = ExceptionMessage(ex);
		HARVEST_LOG_WARN("extraction failed", {StringField("source", source_id), StringField("error", summary)});
		return ExtractionResult::Failed(source_id, summary);
	} catch (...) {
		HARVEST_LOG_WARN("extraction failed", {StringField("source", source_id), StringField("error", "unknown")});
		return ExtractionResult::Failed(source_id, "unknown extraction error");
	}
}

} // namespace harvester
