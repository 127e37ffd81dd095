#include "harvest_utils.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

#include <zlib.h>

namespace {

using namespace harvester;
using std::chrono::milliseconds;

std::string Gzip(const std::string &input) {
	z_stream zs {};
	assert(deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY) == Z_OK);
	std::string out(deflateBound(&zs, input.size()), '\0');
	zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(input.data()));
	zs.avail_in = static_cast<uInt>(input.size());
	zs.next_out = reinterpret_cast<Bytef *>(&out[0]);
	zs.avail_out = static_cast<uInt>(out.size());
	assert(deflate(&zs, Z_FINISH) == Z_STREAM_END);
	out.resize(zs.total_out);
	deflateEnd(&zs);
	return out;
}

void TestExponentialBackoffDoubles() {
	assert(ExponentialBackoff(0, milliseconds(1000)) == milliseconds(1000));
	assert(ExponentialBackoff(1, milliseconds(1000)) == milliseconds(2000));
	assert(ExponentialBackoff(3, milliseconds(10)) == milliseconds(80));
	assert(ExponentialBackoff(-2, milliseconds(10)) == milliseconds(10));
}

void TestTotalBackoffSkipsLastAttempt() {
	assert(TotalBackoff(1, milliseconds(1000)) == milliseconds(0));
	assert(TotalBackoff(2, milliseconds(1000)) == milliseconds(1000));
	assert(TotalBackoff(3, milliseconds(1000)) == milliseconds(3000));
	assert(TotalBackoff(4, milliseconds(5)) == milliseconds(35));
}

void TestUrlValidation() {
	assert(IsValidHarvestUrl("https://www.bbc.com/sport/football"));
	assert(IsValidHarvestUrl("HTTP://example.com"));
	assert(GetUrlValidationError("") == "URL is empty");
	assert(!IsValidHarvestUrl("ftp://example.com/file"));
	assert(!IsValidHarvestUrl("https:///path-only"));
	assert(!IsValidHarvestUrl("https://example.com/a b"));
}

void TestDomainAndPath() {
	assert(ExtractDomain("https://www.espn.com:8443/soccer/") == "www.espn.com");
	assert(ExtractDomain("not a url") == "");
	assert(ExtractPath("https://www.goal.com/en") == "/en");
	assert(ExtractPath("https://www.transfermarkt.com") == "/");
	assert(ExtractPath("https://x.org?q=1") == "/?q=1");
}

void TestSyntheticSourceId() {
	assert(SyntheticSourceId("https://WWW.Example.com/News/") == "url:www.example.com/News");
	assert(SyntheticSourceId("https://example.com") == "url:example.com");
	assert(SyntheticSourceId("https://example.com/") == "url:example.com");
	assert(SyntheticSourceId("http://example.com/a?b=1#frag") == "url:example.com/a?b=1");
}

void TestErrorClassification() {
	assert(ClassifyError(200, "") == HarvestErrorType::NONE);
	assert(ClassifyError(503, "") == HarvestErrorType::HTTP_STATUS);
	assert(ClassifyError(0, "Timeout was reached") == HarvestErrorType::NETWORK_TIMEOUT);
	assert(ClassifyError(0, "Could not resolve host: nowhere") == HarvestErrorType::NETWORK_DNS_FAILURE);
	assert(ClassifyError(0, "Couldn't connect to server") == HarvestErrorType::NETWORK_CONNECTION_REFUSED);
	assert(ClassifyError(0, "Callback aborted") == HarvestErrorType::CANCELLED);

	assert(ErrorTypeFromString("network_timeout") == HarvestErrorType::NETWORK_TIMEOUT);
	assert(ErrorTypeFromString(ErrorTypeToString(HarvestErrorType::EXTRACTION_FAILED)) ==
	       HarvestErrorType::EXTRACTION_FAILED);
	assert(ErrorTypeFromString("bogus") == HarvestErrorType::NONE);
}

void TestGzipRoundTrip() {
	const std::string page = "<html><head><title>Match day</title></head></html>";
	auto compressed = Gzip(page);
	assert(IsGzippedData(compressed));
	assert(!IsGzippedData(page));
	assert(DecompressGzip(compressed) == page);
	assert(DecompressGzip("\x1f\x8bgarbage").empty());
}

void TestWhitespaceHelpers() {
	assert(TrimString("  Goal!\n") == "Goal!");
	assert(TrimString(" \t ") == "");
	assert(CollapseWhitespace("  Late\n\n  winner   at Anfield ") == "Late winner at Anfield");
	assert(ToLower("BBC Sport") == "bbc sport");
}

void TestTimestamps() {
	auto epoch_plus = std::chrono::system_clock::time_point(std::chrono::seconds(1736856000));
	assert(FormatIsoTimestamp(epoch_plus) == "2025-01-14T12:00:00Z");
	assert(ToUnixSeconds(epoch_plus) == 1736856000);
}

} // namespace

int main() {
	TestExponentialBackoffDoubles();
	TestTotalBackoffSkipsLastAttempt();
	TestUrlValidation();
	TestDomainAndPath();
	TestSyntheticSourceId();
	TestErrorClassification();
	TestGzipRoundTrip();
	TestWhitespaceHelpers();
	TestTimestamps();

	std::cout << "harvester_unit_harvest_utils: pass\n";
	return 0;
}
