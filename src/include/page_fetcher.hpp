#pragma once

#include "extractor_config.hpp"
#include "http_client.hpp"
#include "stream_types.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <string>

namespace duckdb {

class CancellationToken;

// Retried page GET on top of an HttpTransport
class PageFetcher {
public:
	PageFetcher(std::shared_ptr<HttpTransport> transport, RetryPolicy policy, std::string user_agent,
	            int max_redirects = 5, int64_t max_body_bytes = 0);

	// timeout_ms bounds the whole call, backoff included
	FetchResult Fetch(const std::string &url, int64_t timeout_ms, const CancellationToken *cancel = nullptr);

	// Replaces the sleep between attempts (tests); returns false to abort retrying
	using SleepFunction = std::function<bool(std::chrono::milliseconds)>;
	void SetSleepFunction(SleepFunction sleep) {
		sleep_ = std::move(sleep);
	}

private:
	double NextJitter();
	bool Sleep(std::chrono::milliseconds delay, const CancellationToken *cancel);

	std::shared_ptr<HttpTransport> transport_;
	RetryPolicy policy_;
	std::string user_agent_;
	int max_redirects_;
	int64_t max_body_bytes_;
	SleepFunction sleep_;

	std::mutex rng_mutex_;
	std::mt19937 rng_;
};

} // namespace duckdb
