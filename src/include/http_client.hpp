#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <curl/curl.h>

#include "harvest_utils.hpp"

namespace harvester {

class CancellationToken;

struct HttpRequest {
	std::string url;
	// Full "Name: value" header lines, User-Agent included
	std::vector<std::string> headers;
	int64_t timeout_ms = 10000;
	int64_t connect_timeout_ms = 5000;
	int64_t max_response_bytes = 10 * 1024 * 1024;  // 0 = unlimited
	const CancellationToken *cancel = nullptr;
};

struct HttpResponse {
	int status_code = 0;          // 0 when no response was received
	std::string body;
	std::string content_type;
	std::string error;
	HarvestErrorType error_type = HarvestErrorType::NONE;
	bool success = false;         // transfer completed (any status)
};

// Anything that can perform a single GET. Implementations must be safe for
// concurrent use from the limiter's worker threads.
class HttpTransport {
public:
	virtual ~HttpTransport() = default;
	virtual HttpResponse Get(const HttpRequest &request) = 0;
};

// Thread-safe connection pool for curl handles
class HttpConnectionPool {
public:
	HttpConnectionPool() = default;
	~HttpConnectionPool();

	HttpConnectionPool(const HttpConnectionPool &) = delete;
	HttpConnectionPool &operator=(const HttpConnectionPool &) = delete;

	// Get a curl easy handle (reuses from pool or creates new)
	CURL *AcquireHandle();
	// Return handle to pool for reuse
	void ReleaseHandle(CURL *handle);

	void Clear();

private:
	std::mutex pool_mutex_;
	std::vector<CURL *> available_handles_;
};

// Scoped HTTP client lifetime: Open() initializes libcurl and the handle pool,
// Close() (or the destructor) releases them on every exit path.
class HttpSession : public HttpTransport {
public:
	HttpSession();
	~HttpSession() override;

	HttpSession(const HttpSession &) = delete;
	HttpSession &operator=(const HttpSession &) = delete;

	void Open();
	void Close();
	bool IsOpen() const {
		return pool_ != nullptr;
	}

	HttpResponse Get(const HttpRequest &request) override;

private:
	HttpResponse ExecuteHttpGet(const HttpRequest &request);

	std::unique_ptr<HttpConnectionPool> pool_;
};

} // namespace harvester
