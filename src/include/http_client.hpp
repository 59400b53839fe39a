#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <mutex>
#include <curl/curl.h>

namespace duckdb {

class CancellationToken;

struct HttpResponse {
	int status_code = 0;
	std::string body;
	std::string content_type;
	std::string retry_after;
	std::string content_encoding;
	std::string error;
	int64_t content_length = -1;  // -1 if unknown
	int64_t range_total = -1;     // Full size from Content-Range, -1 if absent
	bool success = false;
	bool timed_out = false;       // Transport gave up on the timeout
	bool cancelled = false;       // Aborted through the cancellation token
	bool truncated = false;       // Body hit max_body_bytes
	std::string final_url;        // Final URL after redirects
	int redirect_count = 0;       // Number of redirects followed
};

enum class HttpMethod : uint8_t {
	GET = 0,
	HEAD = 1
};

struct HttpRequestOptions {
	HttpMethod method = HttpMethod::GET;
	std::string user_agent;
	int64_t timeout_ms = 30000;
	int64_t connect_timeout_ms = 10000;
	int max_redirects = 5;
	int64_t max_body_bytes = 0;    // 0 = unlimited
	std::string range;             // e.g. "0-1023"
	bool browser_headers = true;   // Send Accept / Accept-Language like a browser
	const CancellationToken *cancel = nullptr;
};

// Transport seam so the pipeline can run against canned responses
class HttpTransport {
public:
	virtual ~HttpTransport() = default;
	virtual HttpResponse Execute(const std::string &url, const HttpRequestOptions &options) = 0;
};

// Thread-safe connection pool for curl handles
class HttpConnectionPool {
public:
	HttpConnectionPool();
	~HttpConnectionPool();

	// Disable copy/move
	HttpConnectionPool(const HttpConnectionPool&) = delete;
	HttpConnectionPool& operator=(const HttpConnectionPool&) = delete;

	// Get a curl easy handle (reuses from pool or creates new)
	CURL* AcquireHandle();
	// Return handle to pool for reuse
	void ReleaseHandle(CURL* handle);

private:
	std::mutex pool_mutex_;
	std::vector<CURL*> available_handles_;
	bool initialized_ = false;
};

// Global curl init and connection pool (call in extension load)
void InitializeHttpClient();

class CurlHttpTransport : public HttpTransport {
public:
	HttpResponse Execute(const std::string &url, const HttpRequestOptions &options) override;
};

} // namespace duckdb
