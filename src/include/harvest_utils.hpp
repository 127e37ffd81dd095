#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <string>

namespace harvester {

//===--------------------------------------------------------------------===//
// Error Classification
//===--------------------------------------------------------------------===//

enum class HarvestErrorType : uint8_t {
	NONE = 0,
	NETWORK_TIMEOUT = 1,
	NETWORK_DNS_FAILURE = 2,
	NETWORK_CONNECTION_REFUSED = 3,
	NETWORK_SSL_ERROR = 4,
	NETWORK_ERROR = 5,
	HTTP_STATUS = 6,
	CONTENT_TOO_LARGE = 7,
	EXTRACTION_FAILED = 8,
	CANCELLED = 9
};

const char *ErrorTypeToString(HarvestErrorType type);
HarvestErrorType ErrorTypeFromString(const std::string &name);
HarvestErrorType ClassifyError(int status_code, const std::string &error_msg);

//===--------------------------------------------------------------------===//
// Compression Utilities
//===--------------------------------------------------------------------===//

// Decompress gzip data. Returns empty string on error.
std::string DecompressGzip(const std::string &compressed_data);

// Check if data starts with gzip magic bytes (0x1f 0x8b)
bool IsGzippedData(const std::string &data);

//===--------------------------------------------------------------------===//
// Backoff
//===--------------------------------------------------------------------===//

// Exponential backoff: 2^attempt units (attempt is 0-based)
std::chrono::milliseconds ExponentialBackoff(int attempt, std::chrono::milliseconds unit);

// Sum of the delays slept between max_retries attempts
std::chrono::milliseconds TotalBackoff(int max_retries, std::chrono::milliseconds unit);

//===--------------------------------------------------------------------===//
// URL Utilities
//===--------------------------------------------------------------------===//

// Validate URL for harvesting. Checks: http/https scheme, non-empty hostname, max length
bool IsValidHarvestUrl(const std::string &url);

// Get validation error message for URL. Returns empty string if valid.
std::string GetUrlValidationError(const std::string &url);

// Extract domain from URL (without port)
std::string ExtractDomain(const std::string &url);

// Extract path from URL (including query string)
std::string ExtractPath(const std::string &url);

// Source id for an ad hoc URL: "url:" + host + path, lowercased host, no trailing slash
std::string SyntheticSourceId(const std::string &url);

//===--------------------------------------------------------------------===//
// String / Time Utilities
//===--------------------------------------------------------------------===//

std::string TrimString(const std::string &str);

// Trim and collapse internal whitespace runs to a single space
std::string CollapseWhitespace(const std::string &str);

std::string ToLower(const std::string &str);

// "2025-01-14T12:00:00Z"
std::string FormatIsoTimestamp(std::chrono::system_clock::time_point time);

int64_t ToUnixSeconds(std::chrono::system_clock::time_point time);

// Human-readable message; unwraps the JSON payload of duckdb::Exception
std::string ExceptionMessage(const std::exception &ex);

} // namespace harvester
