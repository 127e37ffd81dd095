#include "harvest_utils.hpp"
#include "duckdb.hpp"
#include <zlib.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <ctime>
#include <vector>

namespace harvester {

//===--------------------------------------------------------------------===//
// Error Classification
//===--------------------------------------------------------------------===//

const char *ErrorTypeToString(HarvestErrorType type) {
	switch (type) {
		case HarvestErrorType::NONE: return "";
		case HarvestErrorType::NETWORK_TIMEOUT: return "network_timeout";
		case HarvestErrorType::NETWORK_DNS_FAILURE: return "network_dns_failure";
		case HarvestErrorType::NETWORK_CONNECTION_REFUSED: return "network_connection_refused";
		case HarvestErrorType::NETWORK_SSL_ERROR: return "network_ssl_error";
		case HarvestErrorType::NETWORK_ERROR: return "network_error";
		case HarvestErrorType::HTTP_STATUS: return "http_status";
		case HarvestErrorType::CONTENT_TOO_LARGE: return "content_too_large";
		case HarvestErrorType::EXTRACTION_FAILED: return "extraction_failed";
		case HarvestErrorType::CANCELLED: return "cancelled";
		default: return "unknown";
	}
}

HarvestErrorType ErrorTypeFromString(const std::string &name) {
	static const HarvestErrorType all_types[] = {
	    HarvestErrorType::NETWORK_TIMEOUT,   HarvestErrorType::NETWORK_DNS_FAILURE,
	    HarvestErrorType::NETWORK_CONNECTION_REFUSED, HarvestErrorType::NETWORK_SSL_ERROR,
	    HarvestErrorType::NETWORK_ERROR,     HarvestErrorType::HTTP_STATUS,
	    HarvestErrorType::CONTENT_TOO_LARGE, HarvestErrorType::EXTRACTION_FAILED,
	    HarvestErrorType::CANCELLED};
	for (auto type : all_types) {
		if (name == ErrorTypeToString(type)) {
			return type;
		}
	}
	return HarvestErrorType::NONE;
}

HarvestErrorType ClassifyError(int status_code, const std::string &error_msg) {
	if (status_code > 0) {
		return status_code == 200 ? HarvestErrorType::NONE : HarvestErrorType::HTTP_STATUS;
	}
	// Network error - classify from message
	if (error_msg.find("timeout") != std::string::npos ||
	    error_msg.find("Timeout") != std::string::npos ||
	    error_msg.find("timed out") != std::string::npos) {
		return HarvestErrorType::NETWORK_TIMEOUT;
	}
	if (error_msg.find("resolve") != std::string::npos ||
	    error_msg.find("DNS") != std::string::npos) {
		return HarvestErrorType::NETWORK_DNS_FAILURE;
	}
	if (error_msg.find("SSL") != std::string::npos ||
	    error_msg.find("certificate") != std::string::npos) {
		return HarvestErrorType::NETWORK_SSL_ERROR;
	}
	if (error_msg.find("refused") != std::string::npos ||
	    error_msg.find("connect") != std::string::npos) {
		return HarvestErrorType::NETWORK_CONNECTION_REFUSED;
	}
	if (error_msg.find("callback") != std::string::npos ||
	    error_msg.find("aborted") != std::string::npos) {
		return HarvestErrorType::CANCELLED;
	}
	return HarvestErrorType::NETWORK_ERROR;
}

//===--------------------------------------------------------------------===//
// Compression Utilities
//===--------------------------------------------------------------------===//

std::string DecompressGzip(const std::string &compressed_data) {
	if (compressed_data.empty()) {
		return "";
	}

	z_stream zs;
	memset(&zs, 0, sizeof(zs));

	// 16+MAX_WBITS selects the gzip wrapper
	if (inflateInit2(&zs, 16 + MAX_WBITS) != Z_OK) {
		return "";
	}

	zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(compressed_data.data()));
	zs.avail_in = static_cast<uInt>(compressed_data.size());

	std::string decompressed;
	char buffer[32768];

	int ret;
	do {
		zs.next_out = reinterpret_cast<Bytef *>(buffer);
		zs.avail_out = sizeof(buffer);

		ret = inflate(&zs, Z_NO_FLUSH);

		if (ret != Z_OK && ret != Z_STREAM_END) {
			inflateEnd(&zs);
			return "";
		}

		size_t have = sizeof(buffer) - zs.avail_out;
		decompressed.append(buffer, have);
	} while (ret != Z_STREAM_END);

	inflateEnd(&zs);
	return decompressed;
}

bool IsGzippedData(const std::string &data) {
	return data.size() >= 2 &&
	       static_cast<unsigned char>(data[0]) == 0x1f &&
	       static_cast<unsigned char>(data[1]) == 0x8b;
}

//===--------------------------------------------------------------------===//
// Backoff
//===--------------------------------------------------------------------===//

std::chrono::milliseconds ExponentialBackoff(int attempt, std::chrono::milliseconds unit) {
	if (attempt < 0) {
		attempt = 0;
	}
	// Cap the shift; 2^20 units is already far beyond any sane retry budget
	attempt = std::min(attempt, 20);
	return unit * (int64_t(1) << attempt);
}

std::chrono::milliseconds TotalBackoff(int max_retries, std::chrono::milliseconds unit) {
	std::chrono::milliseconds total(0);
	for (int attempt = 0; attempt + 1 < max_retries; attempt++) {
		total += ExponentialBackoff(attempt, unit);
	}
	return total;
}

//===--------------------------------------------------------------------===//
// URL Utilities
//===--------------------------------------------------------------------===//

std::string GetUrlValidationError(const std::string &url) {
	if (url.empty()) {
		return "URL is empty";
	}
	if (url.length() > 2048) {
		return "URL exceeds 2048 characters";
	}
	std::string lower = ToLower(url.substr(0, 8));
	if (lower.compare(0, 7, "http://") != 0 && lower.compare(0, 8, "https://") != 0) {
		return "URL must use http or https scheme";
	}
	if (ExtractDomain(url).empty()) {
		return "URL has no hostname";
	}
	for (char c : url) {
		if (std::isspace(static_cast<unsigned char>(c))) {
			return "URL contains whitespace";
		}
	}
	return "";
}

bool IsValidHarvestUrl(const std::string &url) {
	return GetUrlValidationError(url).empty();
}

std::string ExtractDomain(const std::string &url) {
	size_t proto_end = url.find("://");
	if (proto_end == std::string::npos) {
		return "";
	}
	size_t domain_start = proto_end + 3;
	size_t domain_end = url.find_first_of("/?#", domain_start);
	if (domain_end == std::string::npos) {
		domain_end = url.length();
	}
	std::string domain = url.substr(domain_start, domain_end - domain_start);

	// Remove port if present
	size_t port_pos = domain.find(':');
	if (port_pos != std::string::npos) {
		domain = domain.substr(0, port_pos);
	}

	return domain;
}

std::string ExtractPath(const std::string &url) {
	size_t proto_end = url.find("://");
	if (proto_end == std::string::npos) {
		return "/";
	}
	size_t path_start = url.find_first_of("/?", proto_end + 3);
	if (path_start == std::string::npos) {
		return "/";
	}
	if (url[path_start] == '?') {
		return "/" + url.substr(path_start);
	}
	return url.substr(path_start);
}

std::string SyntheticSourceId(const std::string &url) {
	std::string path = ExtractPath(url);
	size_t fragment = path.find('#');
	if (fragment != std::string::npos) {
		path = path.substr(0, fragment);
	}
	while (path.size() > 1 && path.back() == '/') {
		path.pop_back();
	}
	if (path == "/") {
		path.clear();
	}
	return "url:" + ToLower(ExtractDomain(url)) + path;
}

//===--------------------------------------------------------------------===//
// String / Time Utilities
//===--------------------------------------------------------------------===//

std::string TrimString(const std::string &str) {
	size_t start = str.find_first_not_of(" \t\r\n\f\v");
	if (start == std::string::npos) {
		return "";
	}
	size_t end = str.find_last_not_of(" \t\r\n\f\v");
	return str.substr(start, end - start + 1);
}

std::string CollapseWhitespace(const std::string &str) {
	std::string result;
	result.reserve(str.size());
	bool pending_space = false;
	for (char c : str) {
		if (std::isspace(static_cast<unsigned char>(c))) {
			pending_space = !result.empty();
			continue;
		}
		if (pending_space) {
			result += ' ';
			pending_space = false;
		}
		result += c;
	}
	return result;
}

std::string ToLower(const std::string &str) {
	std::string result = str;
	std::transform(result.begin(), result.end(), result.begin(),
	               [](unsigned char c) { return std::tolower(c); });
	return result;
}

std::string FormatIsoTimestamp(std::chrono::system_clock::time_point time) {
	time_t raw = std::chrono::system_clock::to_time_t(time);
	struct tm gmt = {};
	gmtime_r(&raw, &gmt);
	char buf[32];
	strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &gmt);
	return std::string(buf);
}

int64_t ToUnixSeconds(std::chrono::system_clock::time_point time) {
	return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
}

std::string ExceptionMessage(const std::exception &ex) {
	duckdb::ErrorData error(ex);
	return error.RawMessage();
}

} // namespace harvester
