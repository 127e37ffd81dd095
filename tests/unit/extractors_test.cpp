#include "extractor_registry.hpp"
#include "html_document.hpp"
#include "site_extractors.hpp"

#include "duckdb.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

using namespace harvester;

class ThrowingExtractor : public Extractor {
public:
	NormalizedRecord Extract(const std::string &) const override {
		throw std::runtime_error("missing scoreboard");
	}
};

const char *kBbcPage = R"(<html><head><title>  Football - BBC Sport </title></head><body>
<h2>Premier League</h2><h2>Championship</h2>
<h3 class="gs-c-promo-heading__title">Late winner at Anfield</h3>
<h3 class="other">Not a promo</h3>
<h3 class="x gs-c-promo-heading__title">  Transfer
   deadline   day </h3>
</body></html>)";

void TestBaselineWithoutHeadings() {
	HeadingExtractor extractor("Generic", 10);
	auto record = extractor.Extract("<html><body><p>No headings here</p></body></html>");
	assert(record.title == "No title");
	auto articles = record.FindCollection("articles");
	assert(articles != nullptr);
	assert(articles->items.empty());
}

void TestBaselineTitleAndArticles() {
	HeadingExtractor extractor("Generic", 10);
	auto record = extractor.Extract("<html><head><title>Scores</title></head><body><h3>Goal!</h3><h3>  </h3>"
	                                "<div><h3> Red   card </h3></div></body></html>");
	assert(record.site == "Generic");
	assert(record.title == "Scores");
	auto articles = record.FindCollection("articles");
	assert(articles != nullptr);
	assert((articles->items == std::vector<std::string> {"Goal!", "Red card"}));
}

void TestBaselineArticleLimit() {
	std::string page = "<html><body>";
	for (int i = 0; i < 15; i++) {
		page += "<h3>Story " + std::to_string(i) + "</h3>";
	}
	page += "</body></html>";

	HeadingExtractor ten("Generic", 10);
	assert(ten.Extract(page).FindCollection("articles")->items.size() == 10);
	HeadingExtractor three("Generic", 3);
	auto items = three.Extract(page).FindCollection("articles")->items;
	assert((items == std::vector<std::string> {"Story 0", "Story 1", "Story 2"}));
}

void TestBbcSport() {
	BbcSportExtractor extractor(10);
	auto record = extractor.Extract(kBbcPage);
	assert(record.site == "BBC Sport");
	assert(record.title == "Football - BBC Sport");
	assert((record.FindCollection("articles")->items ==
	        std::vector<std::string> {"Late winner at Anfield", "Transfer deadline day"}));
	assert((record.FindCollection("headlines")->items == std::vector<std::string> {"Premier League", "Championship"}));
	assert(record.FindCollection("matches") != nullptr);
	assert(record.FindCollection("matches")->items.empty());
}

void TestSkyEspnGoal() {
	const char *page = "<html><head><title>T</title></head><body><h1>Big</h1><h1>Bigger</h1>"
	                   "<h3>One</h3><h3>Two</h3></body></html>";

	auto sky = SkySportsExtractor(10).Extract(page);
	assert((sky.FindCollection("news")->items == std::vector<std::string> {"One", "Two"}));
	assert(sky.FindCollection("articles")->items.empty());

	auto espn = EspnExtractor(10).Extract(page);
	assert((espn.FindCollection("headlines")->items == std::vector<std::string> {"Big", "Bigger"}));
	assert(espn.FindCollection("scores") != nullptr);

	auto goal = GoalExtractor(10).Extract(page);
	assert((goal.FindCollection("articles")->items == std::vector<std::string> {"One", "Two"}));
	assert(goal.FindCollection("transfer_news") != nullptr);
	assert(goal.FindCollection("match_reports") != nullptr);
}

void TestTransfermarktFiltersPlayerLinks() {
	const char *page = R"(<html><body>
<a href="/home">Home</a>
<a href="/erling-haaland/profil/spieler/418560/Player">Erling Haaland</a>
<a href="/jude-bellingham/PLAYER/581678">Jude Bellingham</a>
<a href="/player/empty"> </a>
<a href="/clubs">Clubs</a>
</body></html>)";
	auto record = TransfermarktExtractor(10).Extract(page);
	assert(record.site == "Transfermarkt");
	assert((record.FindCollection("transfers")->items ==
	        std::vector<std::string> {"Erling Haaland", "Jude Bellingham"}));

	assert(record.FindCollection("player_values") != nullptr);
	assert(record.FindCollection("market_updates") != nullptr);

	auto bare = TransfermarktExtractor(10).Extract("<a href='/player/1'>Messi</a><a href='/player/2'>Ronaldo</a>");
	assert((bare.FindCollection("transfers")->items == std::vector<std::string> {"Messi", "Ronaldo"}));

	// Only the first N anchors are considered
	auto limited = TransfermarktExtractor(1).Extract(page);
	assert(limited.FindCollection("transfers")->items.empty());
}

void TestCollectionReferencesSurviveAppends() {
	NormalizedRecord record;
	auto &first = record.Collection("transfers");
	for (int i = 0; i < 32; i++) {
		record.Collection("extra_" + std::to_string(i));
	}
	first.items.push_back("kept");
	assert(record.FindCollection("transfers")->items.size() == 1);
	assert(record.collections.front().items.front() == "kept");
}

void TestRosterTable() {
	const char *page = R"(<html><body>
<table><tr><th>Pos</th><th>Name</th></tr><tr><td>GK</td><td>Ignored</td></tr></table>
<table>
  <tr><th>Name</th><th>AGE</th><th>Club</th></tr>
  <tr><td>Bukayo Saka</td><td>23</td><td>Arsenal</td></tr>
  <tr><td>  </td><td>x</td></tr>
</table></body></html>)";
	auto record = RosterExtractor(10).Extract(page);
	assert(record.players.size() == 2);
	assert(record.players[0].name == "Bukayo Saka");
	assert(record.players[0].age == "23");
	assert(record.players[0].club == "Arsenal");
	assert(record.players[1].name.empty());
	assert(record.players[1].club.empty());
	assert(record.extensions.at("roster_rows") == "2");
}

void TestHtmlDocumentHelpers() {
	HtmlDocument empty("");
	assert(!empty.IsValid());
	assert(empty.Title().empty());
	assert(empty.CollectText("h3", 0).empty());

	HtmlDocument doc(R"(<p class="a  b">x</p><a href="/p">P</a>)");
	assert(doc.IsValid());
	auto links = doc.CollectLinks(0);
	assert(links.size() == 1);
	assert(links[0].href == "/p");
	assert(links[0].text == "P");
	assert(doc.CollectText("p", 0, "b").size() == 1);
	assert(doc.CollectText("p", 0, "c").empty());
}

void TestRegistryConvertsFailures() {
	ExtractorRegistry registry;
	registry.Register("broken", std::unique_ptr<Extractor>(new ThrowingExtractor()));
	registry.Register("default", std::unique_ptr<Extractor>(new HeadingExtractor("Generic", 10)));

	auto failed = registry.Extract("broken", "<h3>x</h3>");
	assert(!failed.Succeeded());
	assert(failed.GetError().source_id == "broken");
	assert(failed.GetError().summary.find("missing scoreboard") != std::string::npos);

	// An empty 200 body is a page without headings, not a failure
	for (const char *body : {"", "   \n"}) {
		auto blank = registry.Extract("default", "url:example.com", body);
		assert(blank.Succeeded());
		assert(blank.Record().site == "Generic");
		assert(blank.Record().title == "No title");
		assert(blank.Record().FindCollection("articles") != nullptr);
		assert(blank.Record().FindCollection("articles")->items.empty());
	}

	auto unknown = registry.Extract("nope", "<h3>x</h3>");
	assert(!unknown.Succeeded());
	assert(unknown.GetError().source_id == "nope");

	auto ok = registry.Extract("default", "a", "<h3>Goal!</h3>");
	assert(ok.Succeeded());
	assert(ok.Record().FindCollection("articles")->items.front() == "Goal!");
}

void TestParseSourceOption() {
	auto bound = ParseSourceOption("squad=https://example.com/team/squad@roster");
	assert(bound.id == "squad");
	assert(bound.url == "https://example.com/team/squad");
	assert(bound.extractor == "roster");

	// No suffix: extractor resolved from the id later
	auto plain = ParseSourceOption("espn=https://www.espn.com/soccer/");
	assert(plain.url == "https://www.espn.com/soccer/");
	assert(plain.extractor.empty());

	// '@' inside the URL is not an extractor suffix
	auto userinfo = ParseSourceOption("feed=https://bot@example.com/path");
	assert(userinfo.url == "https://bot@example.com/path");
	assert(userinfo.extractor.empty());

	for (const char *bad : {"no-equals", "=https://example.com", "x=", "x=https://example.com/a@"}) {
		bool threw = false;
		try {
			ParseSourceOption(bad);
		} catch (const duckdb::InvalidInputException &) {
			threw = true;
		}
		assert(threw);
	}
}

void TestRegistryConfigurationErrors() {
	ExtractorRegistry registry;
	RegisterBuiltinExtractors(registry, 10);
	for (const char *id : {"default", "bbc_sport", "sky_sports", "espn", "goal", "transfermarkt", "roster"}) {
		assert(registry.Contains(id));
	}
	// Exact, case-sensitive ids
	assert(!registry.Contains("BBC_SPORT"));

	bool threw = false;
	try {
		registry.Register("espn", std::unique_ptr<Extractor>(new EspnExtractor(5)));
	} catch (const duckdb::InvalidInputException &) {
		threw = true;
	}
	assert(threw);

	threw = false;
	try {
		registry.RequireAll({"bbc_sport", "missing_site", "espn"});
	} catch (const duckdb::InvalidInputException &ex) {
		threw = true;
		assert(std::string(ex.what()).find("missing_site") != std::string::npos);
	}
	assert(threw);
	registry.RequireAll({"bbc_sport", "espn"});

	for (const auto &source : BuiltinSources()) {
		assert(registry.Contains(source.extractor));
	}
}

} // namespace

int main() {
	TestBaselineWithoutHeadings();
	TestBaselineTitleAndArticles();
	TestBaselineArticleLimit();
	TestBbcSport();
	TestSkyEspnGoal();
	TestTransfermarktFiltersPlayerLinks();
	TestCollectionReferencesSurviveAppends();
	TestRosterTable();
	TestHtmlDocumentHelpers();
	TestRegistryConvertsFailures();
	TestRegistryConfigurationErrors();
	TestParseSourceOption();

	std::cout << "harvester_unit_extractors: pass\n";
	return 0;
}
