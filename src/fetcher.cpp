#include "fetcher.hpp"
#include "cancellation_token.hpp"
#include "harvest_logging.hpp"
#include "http_client.hpp"

#include <thread>

namespace harvester {

//===--------------------------------------------------------------------===//
// FetchOutcome
//===--------------------------------------------------------------------===//

FetchOutcome::FetchOutcome(std::string url, bool success, std::string payload, std::string failure_reason,
                           HarvestErrorType error_type, int status_code, std::chrono::milliseconds elapsed,
                           int attempts)
    : url_(std::move(url)), success_(success), payload_(std::move(payload)),
      failure_reason_(std::move(failure_reason)), error_type_(error_type), status_code_(status_code),
      elapsed_(elapsed), attempts_(attempts) {
}

FetchOutcome FetchOutcome::Success(std::string url, std::string payload, int status_code,
                                   std::chrono::milliseconds elapsed, int attempts) {
	return FetchOutcome(std::move(url), true, std::move(payload), "", HarvestErrorType::NONE, status_code, elapsed,
	                    attempts);
}

FetchOutcome FetchOutcome::Failure(std::string url, std::string reason, HarvestErrorType error_type,
                                   std::chrono::milliseconds elapsed, int attempts, int last_status_code) {
	if (reason.empty()) {
		reason = "unknown failure";
	}
	return FetchOutcome(std::move(url), false, "", std::move(reason), error_type, last_status_code, elapsed,
	                    attempts);
}

//===--------------------------------------------------------------------===//
// IdentityPool
//===--------------------------------------------------------------------===//

IdentityPool::IdentityPool(std::vector<std::string> user_agents)
    : IdentityPool(std::move(user_agents), std::random_device {}()) {
}

IdentityPool::IdentityPool(std::vector<std::string> user_agents, uint32_t seed)
    : user_agents_(std::move(user_agents)), rng_(seed) {
	if (user_agents_.empty()) {
		user_agents_ = DefaultUserAgents();
	}
}

const std::vector<std::string> &IdentityPool::DefaultUserAgents() {
	static const std::vector<std::string> agents = {
	    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/91.0.4472.124 "
	    "Safari/537.36",
	    "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/537.36 (KHTML, like Gecko) "
	    "Chrome/91.0.4472.124 Safari/537.36",
	    "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/91.0.4472.124 Safari/537.36",
	    "Mozilla/5.0 (Windows NT 10.0; Win64; x64; rv:89.0) Gecko/20100101 Firefox/89.0",
	    "Mozilla/5.0 (Macintosh; Intel Mac OS X 10.15; rv:89.0) Gecko/20100101 Firefox/89.0"};
	return agents;
}

std::string IdentityPool::Next() {
	std::lock_guard<std::mutex> lock(rng_mutex_);
	std::uniform_int_distribution<size_t> dist(0, user_agents_.size() - 1);
	return user_agents_[dist(rng_)];
}

//===--------------------------------------------------------------------===//
// Fetcher
//===--------------------------------------------------------------------===//

static std::chrono::milliseconds ElapsedSince(std::chrono::steady_clock::time_point start) {
	return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

static std::string AttemptsReason(const char *verb, int attempts) {
	return std::string(verb) + " after " + std::to_string(attempts) + (attempts == 1 ? " attempt" : " attempts");
}

Fetcher::Fetcher(HttpTransport &transport, FetchConfig config)
    : transport_(transport), config_(config), identities_(IdentityPool::DefaultUserAgents()) {
}

std::vector<std::string> Fetcher::BuildHeaders() {
	return {"User-Agent: " + identities_.Next(),
	        "Accept: text/html,application/xhtml+xml,application/xml;q=0.9,image/webp,*/*;q=0.8",
	        "Accept-Language: en-US,en;q=0.5",
	        "Connection: keep-alive",
	        "Upgrade-Insecure-Requests: 1"};
}

FetchOutcome Fetcher::Fetch(const std::string &url, const CancellationToken *cancel) {
	return Fetch(url, config_.max_retries, cancel);
}

FetchOutcome Fetcher::Fetch(const std::string &url, int max_retries, const CancellationToken *cancel) {
	auto start = std::chrono::steady_clock::now();
	if (max_retries < 1) {
		max_retries = 1;
	}

	int attempts = 0;
	int last_status = 0;
	HarvestErrorType last_error_type = HarvestErrorType::NONE;

	for (int attempt = 0; attempt < max_retries; attempt++) {
		if (cancel && cancel->IsCancelled()) {
			return FetchOutcome::Failure(url, AttemptsReason("cancelled", attempts), HarvestErrorType::CANCELLED,
			                             ElapsedSince(start), attempts, last_status);
		}

		HttpRequest request;
		request.url = url;
		request.headers = BuildHeaders();
		request.timeout_ms = config_.timeout_ms;
		request.connect_timeout_ms = config_.connect_timeout_ms;
		request.max_response_bytes = config_.max_response_bytes;
		request.cancel = cancel;

		attempts++;
		HttpResponse response = transport_.Get(request);

		if (response.success && response.status_code == 200) {
			std::string payload = std::move(response.body);
			if (IsGzippedData(payload)) {
				std::string inflated = DecompressGzip(payload);
				if (!inflated.empty()) {
					payload = std::move(inflated);
				}
			}
			auto elapsed = ElapsedSince(start);
			HARVEST_LOG_INFO("fetched", {StringField("url", url), IntField("attempt", attempts),
			                             IntField("elapsed_ms", elapsed.count()), IntField("bytes", payload.size())});
			return FetchOutcome::Success(url, std::move(payload), response.status_code, elapsed, attempts);
		}

		if (response.success) {
			last_status = response.status_code;
			last_error_type = HarvestErrorType::HTTP_STATUS;
			HARVEST_LOG_WARN("unexpected HTTP status", {StringField("url", url), IntField("status", last_status),
			                                            IntField("attempt", attempts)});
		} else {
			last_error_type = response.error_type == HarvestErrorType::NONE ? ClassifyError(0, response.error)
			                                                                 : response.error_type;
			if (last_error_type == HarvestErrorType::CANCELLED) {
				return FetchOutcome::Failure(url, AttemptsReason("cancelled", attempts), HarvestErrorType::CANCELLED,
				                             ElapsedSince(start), attempts, last_status);
			}
			HARVEST_LOG_WARN("fetch attempt failed", {StringField("url", url), StringField("error", response.error),
			                                          StringField("type", ErrorTypeToString(last_error_type)),
			                                          IntField("attempt", attempts)});
		}

		if (attempt + 1 < max_retries) {
			auto delay = ExponentialBackoff(attempt, config_.backoff_unit);
			if (cancel) {
				if (cancel->WaitFor(delay)) {
					return FetchOutcome::Failure(url, AttemptsReason("cancelled", attempts),
					                             HarvestErrorType::CANCELLED, ElapsedSince(start), attempts,
					                             last_status);
				}
			} else {
				std::this_thread::sleep_for(delay);
			}
		}
	}

	auto elapsed = ElapsedSince(start);
	HARVEST_LOG_ERROR("fetch failed", {StringField("url", url), IntField("attempts", attempts),
	                                   StringField("type", ErrorTypeToString(last_error_type))});
	return FetchOutcome::Failure(url, "failed after " + std::to_string(attempts) + " attempts", last_error_type,
	                             elapsed, attempts, last_status);
}

} // namespace harvester
