#include "site_extractors.hpp"
#include "harvest_utils.hpp"
#include "html_document.hpp"

#include "duckdb.hpp"
#include <memory>

namespace harvester {

//===--------------------------------------------------------------------===//
// Baseline
//===--------------------------------------------------------------------===//

HeadingExtractor::HeadingExtractor(std::string site, size_t max_articles)
    : site_(std::move(site)), max_articles_(max_articles) {
}

NormalizedRecord HeadingExtractor::Extract(const std::string &payload) const {
	// An empty body parses to no document; it still yields the baseline record
	HtmlDocument doc(payload);

	NormalizedRecord record;
	record.site = site_;
	record.title = doc.Title();
	if (record.title.empty()) {
		record.title = "No title";
	}
	Populate(doc, record);
	return record;
}

void HeadingExtractor::Populate(const HtmlDocument &doc, NormalizedRecord &record) const {
	record.Collection("articles").items = doc.CollectText("h3", max_articles_);
}

//===--------------------------------------------------------------------===//
// Sites
//===--------------------------------------------------------------------===//

void BbcSportExtractor::Populate(const HtmlDocument &doc, NormalizedRecord &record) const {
	record.Collection("articles").items = doc.CollectText("h3", max_articles_, "gs-c-promo-heading__title");
	record.Collection("matches");
	record.Collection("headlines").items = doc.CollectText("h2", 5);
}

void SkySportsExtractor::Populate(const HtmlDocument &doc, NormalizedRecord &record) const {
	record.Collection("articles");
	record.Collection("matches");
	record.Collection("news").items = doc.CollectText("h3", max_articles_);
}

void EspnExtractor::Populate(const HtmlDocument &doc, NormalizedRecord &record) const {
	record.Collection("articles");
	record.Collection("scores");
	record.Collection("headlines").items = doc.CollectText("h1", 5);
}

void GoalExtractor::Populate(const HtmlDocument &doc, NormalizedRecord &record) const {
	record.Collection("articles").items = doc.CollectText("h3", max_articles_);
	record.Collection("transfer_news");
	record.Collection("match_reports");
}

void TransfermarktExtractor::Populate(const HtmlDocument &doc, NormalizedRecord &record) const {
	std::vector<std::string> transfers;
	for (const auto &link : doc.CollectLinks(max_articles_)) {
		if (link.text.empty()) {
			continue;
		}
		if (ToLower(link.href).find("player") != std::string::npos) {
			transfers.push_back(link.text);
		}
	}

	record.Collection("transfers").items = std::move(transfers);
	record.Collection("player_values");
	record.Collection("market_updates");
}

static int FindColumn(const std::vector<std::string> &header, const char *name) {
	for (size_t i = 0; i < header.size(); i++) {
		if (ToLower(header[i]) == name) {
			return static_cast<int>(i);
		}
	}
	return -1;
}

void RosterExtractor::Populate(const HtmlDocument &doc, NormalizedRecord &record) const {
	size_t row_count = 0;
	for (const auto &table : doc.Tables()) {
		int name_col = FindColumn(table.header, "name");
		int age_col = FindColumn(table.header, "age");
		int club_col = FindColumn(table.header, "club");
		if (name_col < 0 || age_col < 0 || club_col < 0) {
			continue;
		}
		for (const auto &row : table.rows) {
			row_count++;
			PlayerCandidate candidate;
			auto cell = [&row](int col) { return col < static_cast<int>(row.size()) ? row[col] : std::string(); };
			candidate.name = cell(name_col);
			candidate.age = cell(age_col);
			candidate.club = cell(club_col);
			record.players.push_back(std::move(candidate));
		}
	}
	record.extensions["roster_rows"] = std::to_string(row_count);
}

//===--------------------------------------------------------------------===//
// Built-ins
//===--------------------------------------------------------------------===//

void RegisterBuiltinExtractors(ExtractorRegistry &registry, size_t max_articles) {
	registry.Register(DEFAULT_EXTRACTOR_ID, std::make_unique<HeadingExtractor>("Generic", max_articles));
	registry.Register("bbc_sport", std::make_unique<BbcSportExtractor>(max_articles));
	registry.Register("sky_sports", std::make_unique<SkySportsExtractor>(max_articles));
	registry.Register("espn", std::make_unique<EspnExtractor>(max_articles));
	registry.Register("goal", std::make_unique<GoalExtractor>(max_articles));
	registry.Register("transfermarkt", std::make_unique<TransfermarktExtractor>(max_articles));
	registry.Register("roster", std::make_unique<RosterExtractor>(max_articles));
}

std::vector<Source> BuiltinSources() {
	return {
	    {"bbc_sport", "https://www.bbc.com/sport/football", "bbc_sport"},
	    {"sky_sports", "https://www.skysports.com/football", "sky_sports"},
	    {"espn", "https://www.espn.com/soccer/", "espn"},
	    {"goal", "https://www.goal.com/en", "goal"},
	    {"transfermarkt", "https://www.transfermarkt.com", "transfermarkt"},
	};
}

Source ParseSourceOption(const std::string &option) {
	auto eq = option.find('=');
	if (eq == std::string::npos || eq == 0) {
		throw duckdb::InvalidInputException("expected ID=URL[@EXTRACTOR], got '" + option + "'");
	}

	Source source;
	source.id = option.substr(0, eq);
	source.url = option.substr(eq + 1);

	// The extractor suffix never contains URL punctuation, so "user@host/..." stays in the URL
	auto at = source.url.rfind('@');
	if (at != std::string::npos && source.url.find_first_of("/:.?#", at + 1) == std::string::npos) {
		source.extractor = source.url.substr(at + 1);
		source.url.resize(at);
		if (source.extractor.empty()) {
			throw duckdb::InvalidInputException("source '" + source.id + "' names an empty extractor");
		}
	}
	if (source.url.empty()) {
		throw duckdb::InvalidInputException("source '" + source.id + "' has no URL");
	}
	return source;
}

} // namespace harvester
