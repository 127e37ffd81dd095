#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "extractor_registry.hpp"

namespace harvester {

class HtmlDocument;

// Baseline extractor: page title ("No title" when missing) and the first
// `max_articles` h3 texts as "articles". Used for ad hoc URLs.
class HeadingExtractor : public Extractor {
public:
	HeadingExtractor(std::string site, size_t max_articles);

	NormalizedRecord Extract(const std::string &payload) const override;

protected:
	// Site-specific collections on top of the title
	virtual void Populate(const HtmlDocument &doc, NormalizedRecord &record) const;

	const std::string site_;
	const size_t max_articles_;
};

class BbcSportExtractor : public HeadingExtractor {
public:
	explicit BbcSportExtractor(size_t max_articles) : HeadingExtractor("BBC Sport", max_articles) {
	}

protected:
	void Populate(const HtmlDocument &doc, NormalizedRecord &record) const override;
};

class SkySportsExtractor : public HeadingExtractor {
public:
	explicit SkySportsExtractor(size_t max_articles) : HeadingExtractor("Sky Sports", max_articles) {
	}

protected:
	void Populate(const HtmlDocument &doc, NormalizedRecord &record) const override;
};

class EspnExtractor : public HeadingExtractor {
public:
	explicit EspnExtractor(size_t max_articles) : HeadingExtractor("ESPN", max_articles) {
	}

protected:
	void Populate(const HtmlDocument &doc, NormalizedRecord &record) const override;
};

class GoalExtractor : public HeadingExtractor {
public:
	explicit GoalExtractor(size_t max_articles) : HeadingExtractor("Goal.com", max_articles) {
	}

protected:
	void Populate(const HtmlDocument &doc, NormalizedRecord &record) const override;
};

// Only the first `max_articles` anchors are looked at; the href filter runs after the cut
class TransfermarktExtractor : public HeadingExtractor {
public:
	explicit TransfermarktExtractor(size_t max_articles) : HeadingExtractor("Transfermarkt", max_articles) {
	}

protected:
	void Populate(const HtmlDocument &doc, NormalizedRecord &record) const override;
};

// Squad tables: any <table> whose header row names Name, Age and Club
// columns (case-insensitive) yields one PlayerCandidate per body row.
class RosterExtractor : public HeadingExtractor {
public:
	explicit RosterExtractor(size_t max_articles) : HeadingExtractor("Roster", max_articles) {
	}

protected:
	void Populate(const HtmlDocument &doc, NormalizedRecord &record) const override;
};

// A configured site: source id, URL and the extractor id it is bound to
struct Source {
	std::string id;
	std::string url;
	std::string extractor;
};

static constexpr const char *DEFAULT_EXTRACTOR_ID = "default";

// Registers the site extractors plus the baseline under DEFAULT_EXTRACTOR_ID
void RegisterBuiltinExtractors(ExtractorRegistry &registry, size_t max_articles);

// The soccer sites harvested by default
std::vector<Source> BuiltinSources();

// "ID=URL" or "ID=URL@EXTRACTOR". Without an extractor the source is bound to
// the extractor registered under its id. Throws duckdb::InvalidInputException.
Source ParseSourceOption(const std::string &option);

} // namespace harvester
