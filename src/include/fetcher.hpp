#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include "harvest_utils.hpp"

namespace harvester {

class CancellationToken;
class HttpTransport;

//===--------------------------------------------------------------------===//
// FetchOutcome
//===--------------------------------------------------------------------===//

// Result of one attempt sequence against a URL. Exactly one of payload and
// failure reason is set; only the named constructors can build one.
class FetchOutcome {
public:
	static FetchOutcome Success(std::string url, std::string payload, int status_code,
	                            std::chrono::milliseconds elapsed, int attempts);
	static FetchOutcome Failure(std::string url, std::string reason, HarvestErrorType error_type,
	                            std::chrono::milliseconds elapsed, int attempts, int last_status_code = 0);

	bool Succeeded() const {
		return success_;
	}
	const std::string &Url() const {
		return url_;
	}
	// Empty for failures
	const std::string &Payload() const {
		return payload_;
	}
	std::string TakePayload() {
		return std::move(payload_);
	}
	// Empty for successes
	const std::string &FailureReason() const {
		return failure_reason_;
	}
	HarvestErrorType ErrorType() const {
		return error_type_;
	}
	bool HasStatusCode() const {
		return status_code_ > 0;
	}
	// Last HTTP status seen, 0 when no response arrived
	int StatusCode() const {
		return status_code_;
	}
	std::chrono::milliseconds Elapsed() const {
		return elapsed_;
	}
	int Attempts() const {
		return attempts_;
	}

private:
	FetchOutcome(std::string url, bool success, std::string payload, std::string failure_reason,
	             HarvestErrorType error_type, int status_code, std::chrono::milliseconds elapsed, int attempts);

	std::string url_;
	bool success_;
	std::string payload_;
	std::string failure_reason_;
	HarvestErrorType error_type_;
	int status_code_;
	std::chrono::milliseconds elapsed_;
	int attempts_;
};

//===--------------------------------------------------------------------===//
// IdentityPool
//===--------------------------------------------------------------------===//

// Fixed pool of User-Agent strings; Next() picks one uniformly at random
class IdentityPool {
public:
	explicit IdentityPool(std::vector<std::string> user_agents);
	IdentityPool(std::vector<std::string> user_agents, uint32_t seed);

	IdentityPool(const IdentityPool &) = delete;
	IdentityPool &operator=(const IdentityPool &) = delete;

	static const std::vector<std::string> &DefaultUserAgents();

	std::string Next();
	const std::vector<std::string> &UserAgents() const {
		return user_agents_;
	}

private:
	std::vector<std::string> user_agents_;
	std::mutex rng_mutex_;
	std::mt19937 rng_;
};

//===--------------------------------------------------------------------===//
// Fetcher
//===--------------------------------------------------------------------===//

struct FetchConfig {
	int max_retries = 3;
	std::chrono::milliseconds backoff_unit {1000};
	int64_t timeout_ms = 10000;
	int64_t connect_timeout_ms = 5000;
	int64_t max_response_bytes = 10 * 1024 * 1024;
};

class Fetcher {
public:
	Fetcher(HttpTransport &transport, FetchConfig config);

	Fetcher(const Fetcher &) = delete;
	Fetcher &operator=(const Fetcher &) = delete;

	// Never throws; every failure path is a FetchOutcome
	FetchOutcome Fetch(const std::string &url, const CancellationToken *cancel = nullptr);
	FetchOutcome Fetch(const std::string &url, int max_retries, const CancellationToken *cancel = nullptr);

	// Static browser-like header set with a freshly rotated User-Agent
	std::vector<std::string> BuildHeaders();

	const FetchConfig &Config() const {
		return config_;
	}

private:
	HttpTransport &transport_;
	FetchConfig config_;
	IdentityPool identities_;
};

} // namespace harvester
