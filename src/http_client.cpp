#include "http_client.hpp"
#include "cancellation_token.hpp"
#include "harvest_logging.hpp"

#include "duckdb.hpp"

namespace harvester {

// Determine HTTP version at compile time based on available features
#if defined(HARVESTER_HTTP2_SUPPORT) && HARVESTER_HTTP2_SUPPORT
static constexpr long HARVESTER_HTTP_VERSION = CURL_HTTP_VERSION_2TLS;
static constexpr const char *HARVESTER_HTTP_VERSION_STR = "HTTP/2";
#else
static constexpr long HARVESTER_HTTP_VERSION = CURL_HTTP_VERSION_1_1;
static constexpr const char *HARVESTER_HTTP_VERSION_STR = "HTTP/1.1";
#endif

// curl_global_init/cleanup are process-wide; sessions share them by refcount
static std::mutex g_curl_global_mutex;
static int g_curl_global_users = 0;

static void AcquireCurlGlobal() {
	std::lock_guard<std::mutex> lock(g_curl_global_mutex);
	if (g_curl_global_users == 0) {
		CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
		if (rc != CURLE_OK) {
			throw duckdb::IOException(std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
		}
	}
	g_curl_global_users++;
}

static void ReleaseCurlGlobal() {
	std::lock_guard<std::mutex> lock(g_curl_global_mutex);
	if (g_curl_global_users > 0 && --g_curl_global_users == 0) {
		curl_global_cleanup();
	}
}

//===--------------------------------------------------------------------===//
// HttpConnectionPool
//===--------------------------------------------------------------------===//

HttpConnectionPool::~HttpConnectionPool() {
	Clear();
}

void HttpConnectionPool::Clear() {
	std::lock_guard<std::mutex> lock(pool_mutex_);
	for (CURL *handle : available_handles_) {
		curl_easy_cleanup(handle);
	}
	available_handles_.clear();
}

CURL *HttpConnectionPool::AcquireHandle() {
	std::lock_guard<std::mutex> lock(pool_mutex_);
	if (!available_handles_.empty()) {
		CURL *handle = available_handles_.back();
		available_handles_.pop_back();
		curl_easy_reset(handle);  // Reset options but keep the connection alive
		return handle;
	}
	return curl_easy_init();
}

void HttpConnectionPool::ReleaseHandle(CURL *handle) {
	if (!handle) {
		return;
	}
	std::lock_guard<std::mutex> lock(pool_mutex_);
	if (available_handles_.size() < 32) {
		available_handles_.push_back(handle);
	} else {
		curl_easy_cleanup(handle);
	}
}

//===--------------------------------------------------------------------===//
// Callbacks
//===--------------------------------------------------------------------===//

struct WriteData {
	std::string *body;
	int64_t max_bytes;
	bool truncated;
};

struct HeaderData {
	std::string content_type;
};

static size_t WriteCallback(void *contents, size_t size, size_t nmemb, void *userp) {
	size_t total_size = size * nmemb;
	WriteData *data = static_cast<WriteData *>(userp);
	if (data->max_bytes > 0 && static_cast<int64_t>(data->body->size() + total_size) > data->max_bytes) {
		data->truncated = true;
		return 0;  // aborts the transfer with CURLE_WRITE_ERROR
	}
	data->body->append(static_cast<char *>(contents), total_size);
	return total_size;
}

static size_t HeaderCallback(char *buffer, size_t size, size_t nitems, void *userdata) {
	size_t total_size = size * nitems;
	HeaderData *headers = static_cast<HeaderData *>(userdata);

	std::string header(buffer, total_size);
	size_t colon_pos = header.find(':');
	if (colon_pos != std::string::npos) {
		std::string name = ToLower(TrimString(header.substr(0, colon_pos)));
		std::string value = TrimString(header.substr(colon_pos + 1));
		if (name == "content-type") {
			headers->content_type = value;
		}
	}
	return total_size;
}

// Non-zero return aborts the transfer (CURLE_ABORTED_BY_CALLBACK)
static int ProgressCallback(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
	auto *cancel = static_cast<const CancellationToken *>(clientp);
	return (cancel && cancel->IsCancelled()) ? 1 : 0;
}

//===--------------------------------------------------------------------===//
// HttpSession
//===--------------------------------------------------------------------===//

HttpSession::HttpSession() {
}

HttpSession::~HttpSession() {
	Close();
}

void HttpSession::Open() {
	if (pool_) {
		return;
	}
	AcquireCurlGlobal();
	pool_ = std::unique_ptr<HttpConnectionPool>(new HttpConnectionPool());
	HARVEST_LOG_DEBUG("http session opened", {StringField("http_version", HARVESTER_HTTP_VERSION_STR)});
}

void HttpSession::Close() {
	if (!pool_) {
		return;
	}
	pool_.reset();
	ReleaseCurlGlobal();
	HARVEST_LOG_DEBUG("http session closed");
}

HttpResponse HttpSession::Get(const HttpRequest &request) {
	if (!pool_) {
		HttpResponse response;
		response.error = "HTTP session is not open";
		response.error_type = HarvestErrorType::NETWORK_ERROR;
		return response;
	}
	return ExecuteHttpGet(request);
}

HttpResponse HttpSession::ExecuteHttpGet(const HttpRequest &request) {
	HttpResponse response;

	CURL *curl = pool_->AcquireHandle();
	if (!curl) {
		response.error = "Failed to acquire curl handle";
		response.error_type = HarvestErrorType::NETWORK_ERROR;
		return response;
	}

	std::string body;
	WriteData write_data {&body, request.max_response_bytes, false};
	HeaderData header_data;

	curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
	curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, HARVESTER_HTTP_VERSION);

	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &write_data);
	curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
	curl_easy_setopt(curl, CURLOPT_HEADERDATA, &header_data);

	curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
	curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, ProgressCallback);
	curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<CancellationToken *>(request.cancel));

	// Let curl decode gzip/deflate bodies
	curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "gzip, deflate");

	curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_ms));
	curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connect_timeout_ms));
	curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

	curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
	curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);

	struct curl_slist *custom_headers = nullptr;
	for (const auto &header : request.headers) {
		custom_headers = curl_slist_append(custom_headers, header.c_str());
	}
	if (custom_headers) {
		curl_easy_setopt(curl, CURLOPT_HTTPHEADER, custom_headers);
	}

	CURLcode res = curl_easy_perform(curl);

	if (res == CURLE_OK) {
		long status_code = 0;
		curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);
		response.status_code = static_cast<int>(status_code);

		response.body = std::move(body);
		response.content_type = std::move(header_data.content_type);
		response.success = true;
	} else if (write_data.truncated) {
		response.error = "response exceeds " + std::to_string(request.max_response_bytes) + " bytes";
		response.error_type = HarvestErrorType::CONTENT_TOO_LARGE;
	} else if (res == CURLE_ABORTED_BY_CALLBACK) {
		response.error = "transfer cancelled";
		response.error_type = HarvestErrorType::CANCELLED;
	} else if (res == CURLE_OPERATION_TIMEDOUT) {
		response.error = curl_easy_strerror(res);
		response.error_type = HarvestErrorType::NETWORK_TIMEOUT;
	} else {
		response.error = curl_easy_strerror(res);
		response.error_type = ClassifyError(0, response.error);
	}

	if (custom_headers) {
		curl_slist_free_all(custom_headers);
	}
	pool_->ReleaseHandle(curl);

	return response;
}

} // namespace harvester
