#include "http_client.hpp"
#include "cancellation.hpp"
#include <cstdlib>
#include <cstring>
#include <algorithm>
#include <cctype>

namespace duckdb {

// Global connection pool (singleton)
static HttpConnectionPool* g_connection_pool = nullptr;
static std::mutex g_connection_pool_mutex;

static HttpConnectionPool& GetConnectionPool() {
	std::lock_guard<std::mutex> lock(g_connection_pool_mutex);
	if (!g_connection_pool) {
		g_connection_pool = new HttpConnectionPool();
	}
	return *g_connection_pool;
}

void InitializeHttpClient() {
	static std::once_flag curl_init;
	std::call_once(curl_init, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
	GetConnectionPool();
}

HttpConnectionPool::HttpConnectionPool() : initialized_(true) {
}

HttpConnectionPool::~HttpConnectionPool() {
	std::lock_guard<std::mutex> lock(pool_mutex_);
	for (CURL* handle : available_handles_) {
		curl_easy_cleanup(handle);
	}
	available_handles_.clear();
	initialized_ = false;
}

CURL* HttpConnectionPool::AcquireHandle() {
	std::lock_guard<std::mutex> lock(pool_mutex_);
	if (!available_handles_.empty()) {
		CURL* handle = available_handles_.back();
		available_handles_.pop_back();
		curl_easy_reset(handle);  // Reset for reuse but keep connection alive
		return handle;
	}
	return curl_easy_init();
}

void HttpConnectionPool::ReleaseHandle(CURL* handle) {
	if (!handle) return;
	std::lock_guard<std::mutex> lock(pool_mutex_);
	if (initialized_ && available_handles_.size() < 32) {  // Max 32 pooled handles
		available_handles_.push_back(handle);
	} else {
		curl_easy_cleanup(handle);
	}
}

// Callback data structures
struct WriteData {
	std::string* body;
	int64_t max_bytes;
	bool truncated;
};

struct HeaderData {
	std::string content_type;
	std::string retry_after;
	std::string content_encoding;
	int64_t content_length = -1;
	int64_t range_total = -1;
};

// Write callback for response body
static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
	size_t total_size = size * nmemb;
	WriteData* data = static_cast<WriteData*>(userp);
	if (data->max_bytes > 0 &&
	    static_cast<int64_t>(data->body->size() + total_size) > data->max_bytes) {
		size_t room = static_cast<size_t>(data->max_bytes) - data->body->size();
		data->body->append(static_cast<char*>(contents), room);
		data->truncated = true;
		// Returning a short count makes curl stop with CURLE_WRITE_ERROR
		return room;
	}
	data->body->append(static_cast<char*>(contents), total_size);
	return total_size;
}

// Helper to trim whitespace
static std::string TrimString(const std::string& str) {
	size_t start = str.find_first_not_of(" \t\r\n");
	if (start == std::string::npos) return "";
	size_t end = str.find_last_not_of(" \t\r\n");
	return str.substr(start, end - start + 1);
}

// Helper to lowercase string
static std::string ToLower(const std::string& str) {
	std::string result = str;
	std::transform(result.begin(), result.end(), result.begin(),
	               [](unsigned char c) { return std::tolower(c); });
	return result;
}

// Header callback for response headers
static size_t HeaderCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
	size_t total_size = size * nitems;
	HeaderData* headers = static_cast<HeaderData*>(userdata);

	std::string header(buffer, total_size);

	// A new status line starts a new header block (after a redirect)
	if (header.compare(0, 5, "HTTP/") == 0) {
		*headers = HeaderData();
		return total_size;
	}

	// Find colon separator
	size_t colon_pos = header.find(':');
	if (colon_pos != std::string::npos) {
		std::string name = ToLower(TrimString(header.substr(0, colon_pos)));
		std::string value = TrimString(header.substr(colon_pos + 1));

		if (name == "content-type") {
			headers->content_type = value;
		} else if (name == "retry-after") {
			headers->retry_after = value;
		} else if (name == "content-encoding") {
			headers->content_encoding = value;
		} else if (name == "content-length") {
			char *end = nullptr;
			long long parsed = std::strtoll(value.c_str(), &end, 10);
			headers->content_length = (end && *end == '\0' && parsed >= 0) ? parsed : -1;
		} else if (name == "content-range") {
			// bytes 0-1023/146515
			size_t slash = value.rfind('/');
			if (slash != std::string::npos) {
				char *end = nullptr;
				long long parsed = std::strtoll(value.c_str() + slash + 1, &end, 10);
				headers->range_total = (end && *end == '\0' && parsed >= 0) ? parsed : -1;
			}
		}
	}

	return total_size;
}

// Progress callback: aborts the transfer once the extraction is cancelled
static int ProgressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
	auto token = static_cast<const CancellationToken*>(clientp);
	return (token && token->ShouldStop()) ? 1 : 0;
}

HttpResponse CurlHttpTransport::Execute(const std::string &url, const HttpRequestOptions &options) {
	HttpResponse response;

	auto& pool = GetConnectionPool();
	CURL* curl = pool.AcquireHandle();
	if (!curl) {
		response.error = "Failed to acquire curl handle";
		return response;
	}

	// Response data
	std::string body;
	WriteData write_data{&body, options.max_body_bytes, false};
	HeaderData header_data;

	// Set URL
	curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

	// Set callbacks
	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &write_data);
	curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
	curl_easy_setopt(curl, CURLOPT_HEADERDATA, &header_data);

	if (options.cancel) {
		curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, ProgressCallback);
		curl_easy_setopt(curl, CURLOPT_XFERINFODATA, options.cancel);
		curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
	}

	// Set user agent
	if (!options.user_agent.empty()) {
		curl_easy_setopt(curl, CURLOPT_USERAGENT, options.user_agent.c_str());
	}

	// Enable compression
	curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "gzip, deflate");

	curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options.timeout_ms));
	curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
	                 static_cast<long>(std::min(options.connect_timeout_ms, options.timeout_ms)));

	// Follow redirects
	curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, options.max_redirects > 0 ? 1L : 0L);
	curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(options.max_redirects));
	curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
	curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");

	if (options.method == HttpMethod::HEAD) {
		curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
	}
	if (!options.range.empty()) {
		curl_easy_setopt(curl, CURLOPT_RANGE, options.range.c_str());
	}

	struct curl_slist* custom_headers = nullptr;
	if (options.browser_headers) {
		custom_headers = curl_slist_append(custom_headers,
		    "Accept: text/html,application/xhtml+xml,application/xml;q=0.9,image/webp,*/*;q=0.8");
		custom_headers = curl_slist_append(custom_headers, "Accept-Language: vi-VN,vi;q=0.9,en;q=0.8");
		custom_headers = curl_slist_append(custom_headers, "Upgrade-Insecure-Requests: 1");
	}
	if (custom_headers) {
		curl_easy_setopt(curl, CURLOPT_HTTPHEADER, custom_headers);
	}

	// Perform the request
	CURLcode res = curl_easy_perform(curl);

	// A body cut short at max_body_bytes still counts as a response
	bool write_cut = (res == CURLE_WRITE_ERROR && write_data.truncated);

	if (res == CURLE_OK || write_cut) {
		long status_code;
		curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);
		response.status_code = static_cast<int>(status_code);

		// Get redirect info
		char* effective_url = nullptr;
		curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective_url);
		if (effective_url) {
			response.final_url = effective_url;
		}
		long redirect_count = 0;
		curl_easy_getinfo(curl, CURLINFO_REDIRECT_COUNT, &redirect_count);
		response.redirect_count = static_cast<int>(redirect_count);

		response.body = std::move(body);
		response.truncated = write_data.truncated;
		response.content_type = std::move(header_data.content_type);
		response.retry_after = std::move(header_data.retry_after);
		response.content_encoding = std::move(header_data.content_encoding);
		response.content_length = header_data.content_length;
		response.range_total = header_data.range_total;

		response.success = response.status_code >= 200 && response.status_code < 400;
	} else {
		response.error = curl_easy_strerror(res);
		response.status_code = 0;
		response.success = false;
		response.timed_out = (res == CURLE_OPERATION_TIMEDOUT);
		response.cancelled = (res == CURLE_ABORTED_BY_CALLBACK);
	}

	// Cleanup
	if (custom_headers) {
		curl_slist_free_all(custom_headers);
	}
	pool.ReleaseHandle(curl);

	return response;
}

} // namespace duckdb
