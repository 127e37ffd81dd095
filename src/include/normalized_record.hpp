#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <vector>

namespace harvester {

// One labeled list of text snippets ("articles", "headlines", ...)
struct TextCollection {
	std::string label;
	std::vector<std::string> items;
};

// Raw player row as scraped; validated by the sink before insertion
struct PlayerCandidate {
	std::string name;
	std::string age;
	std::string club;
};

struct Provenance {
	std::string url;
	int status_code = 0;
	int64_t latency_ms = 0;
	int attempts = 0;
	std::string captured_at;  // ISO-8601 UTC
};

struct NormalizedRecord {
	std::string site;
	std::string title;
	// deque: references returned by Collection() survive later appends
	std::deque<TextCollection> collections;
	// Per-source extension fields
	std::map<std::string, std::string> extensions;
	std::vector<PlayerCandidate> players;
	Provenance provenance;

	// nullptr if no collection carries this label
	const TextCollection *FindCollection(const std::string &label) const {
		for (const auto &collection : collections) {
			if (collection.label == label) {
				return &collection;
			}
		}
		return nullptr;
	}

	// Get or append the collection with this label
	TextCollection &Collection(const std::string &label) {
		for (auto &collection : collections) {
			if (collection.label == label) {
				return collection;
			}
		}
		collections.push_back(TextCollection {label, {}});
		return collections.back();
	}
};

} // namespace harvester
