#include "page_fetcher.hpp"
#include "cancellation.hpp"
#include "stream_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <thread>

namespace duckdb {

PageFetcher::PageFetcher(std::shared_ptr<HttpTransport> transport, RetryPolicy policy, std::string user_agent,
                         int max_redirects, int64_t max_body_bytes)
    : transport_(std::move(transport)), policy_(policy), user_agent_(std::move(user_agent)),
      max_redirects_(max_redirects), max_body_bytes_(max_body_bytes), rng_(std::random_device {}()) {
	if (policy_.max_attempts < 1) {
		policy_.max_attempts = 1;
	}
}

double PageFetcher::NextJitter() {
	std::lock_guard<std::mutex> lock(rng_mutex_);
	std::uniform_real_distribution<double> dist(-1.0, 1.0);
	return dist(rng_);
}

bool PageFetcher::Sleep(std::chrono::milliseconds delay, const CancellationToken *cancel) {
	if (sleep_) {
		return sleep_(delay);
	}
	if (cancel) {
		return cancel->SleepFor(delay);
	}
	std::this_thread::sleep_for(delay);
	return true;
}

FetchResult PageFetcher::Fetch(const std::string &url, int64_t timeout_ms, const CancellationToken *cancel) {
	using Clock = std::chrono::steady_clock;
	auto start = Clock::now();
	auto deadline = start + std::chrono::milliseconds(timeout_ms);
	auto remaining_ms = [&]() -> int64_t {
		int64_t left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
		if (cancel && cancel->RemainingMs() >= 0) {
			left = std::min(left, cancel->RemainingMs());
		}
		return std::max<int64_t>(left, 0);
	};

	FetchResult result;
	result.url = url;

	HttpRequestOptions options;
	options.user_agent = user_agent_;
	options.max_redirects = max_redirects_;
	options.max_body_bytes = max_body_bytes_;
	options.cancel = cancel;

	for (int attempt = 1; attempt <= policy_.max_attempts; attempt++) {
		if (cancel && cancel->IsCancelled()) {
			result.error = FetchErrorType::CANCELLED;
			result.error_message = "fetch cancelled";
			break;
		}
		int64_t budget = remaining_ms();
		if (budget <= 0) {
			if (attempt == 1 || result.error == FetchErrorType::NONE) {
				result.error = FetchErrorType::TIMEOUT;
				result.error_message = "no time left for request";
			}
			break;
		}

		options.timeout_ms = budget;
		result.attempts = attempt;
		HttpResponse response = transport_->Execute(url, options);

		result.http_status = response.status_code;
		result.content_type = response.content_type;
		result.final_url = response.final_url.empty() ? url : response.final_url;

		FetchErrorType error = ClassifyFetchError(response);
		if (error == FetchErrorType::NONE) {
			result.error = FetchErrorType::NONE;
			result.error_message.clear();
			result.body = std::move(response.body);
			// Some servers send gzip bodies without Content-Encoding
			if (IsGzippedData(result.body)) {
				std::string inflated = DecompressGzip(result.body);
				if (!inflated.empty()) {
					result.body = std::move(inflated);
				}
			}
			result.has_body = true;
			break;
		}

		result.error = error;
		result.error_message = response.error.empty() ? "HTTP " + std::to_string(response.status_code)
		                                              : response.error;
		if (error == FetchErrorType::CANCELLED) {
			break;
		}

		bool retryable = error == FetchErrorType::TIMEOUT || error == FetchErrorType::CONNECTION_FAILED ||
		                 (error == FetchErrorType::HTTP_ERROR && IsRetryableStatus(response.status_code));
		if (!retryable || attempt == policy_.max_attempts) {
			break;
		}

		int64_t delay_ms = ComputeBackoffMs(policy_, attempt, NextJitter());
		if (response.status_code == 429) {
			int64_t hinted = ParseRetryAfterMs(response.retry_after);
			if (hinted > 0) {
				delay_ms = std::min<int64_t>(hinted, policy_.max_retry_after_ms);
			}
		}
		if (delay_ms >= remaining_ms()) {
			spdlog::debug("Not retrying {}: backoff of {} ms exceeds the remaining budget", url, delay_ms);
			break;
		}

		spdlog::debug("Fetch of {} failed ({}: {}), retry {}/{} in {} ms", url, FetchErrorToString(error),
		              result.error_message, attempt, policy_.max_attempts - 1, delay_ms);
		if (!Sleep(std::chrono::milliseconds(delay_ms), cancel)) {
			if (cancel && cancel->IsCancelled()) {
				result.error = FetchErrorType::CANCELLED;
				result.error_message = "fetch cancelled";
			}
			break;
		}
	}

	result.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
	if (!result.Ok() && result.error != FetchErrorType::CANCELLED) {
		spdlog::warn("Giving up on {} after {} attempt(s): {} ({})", url, result.attempts,
		             FetchErrorToString(result.error), result.error_message);
	}
	return result;
}

} // namespace duckdb
