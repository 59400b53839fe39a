#include "rate_limiter.hpp"

#include <algorithm>

namespace duckdb {

RateLimiter::RateLimiter(int max_requests, std::chrono::seconds window, ClockFunction clock)
    : max_requests_(std::max(max_requests, 0)), window_(window), clock_(std::move(clock)) {
}

RateLimiter::Clock::time_point RateLimiter::Now() const {
	return clock_ ? clock_() : Clock::now();
}

RateLimiter::WindowState *RateLimiter::LiveWindow(const std::string &requester_id, Clock::time_point now) {
	auto it = windows_.find(requester_id);
	if (it == windows_.end()) {
		return nullptr;
	}
	if (now - it->second.window_start >= window_) {
		windows_.erase(it);
		return nullptr;
	}
	return &it->second;
}

bool RateLimiter::Allow(const std::string &requester_id) {
	return Check(requester_id).allowed;
}

RateDecision RateLimiter::Check(const std::string &requester_id) {
	auto now = Now();
	std::lock_guard<std::mutex> lock(mutex_);

	RateDecision decision;
	WindowState *state = LiveWindow(requester_id, now);
	if (state && state->count >= max_requests_) {
		decision.allowed = false;
		decision.remaining = 0;
		decision.retry_after =
		    std::chrono::duration_cast<std::chrono::milliseconds>(state->window_start + window_ - now);
		return decision;
	}
	if (!state) {
		if (max_requests_ <= 0) {
			decision.retry_after = std::chrono::duration_cast<std::chrono::milliseconds>(window_);
			return decision;
		}
		state = &windows_[requester_id];
		state->window_start = now;
		state->count = 0;
	}
	state->count++;
	decision.allowed = true;
	decision.remaining = max_requests_ - state->count;
	return decision;
}

int RateLimiter::Remaining(const std::string &requester_id) {
	auto now = Now();
	std::lock_guard<std::mutex> lock(mutex_);
	WindowState *state = LiveWindow(requester_id, now);
	if (!state) {
		return max_requests_;
	}
	return std::max(max_requests_ - state->count, 0);
}

std::chrono::milliseconds RateLimiter::ResetTime(const std::string &requester_id) {
	auto now = Now();
	std::lock_guard<std::mutex> lock(mutex_);
	WindowState *state = LiveWindow(requester_id, now);
	if (!state) {
		return std::chrono::milliseconds(0);
	}
	return std::chrono::duration_cast<std::chrono::milliseconds>(state->window_start + window_ - now);
}

void RateLimiter::Clear(const std::string &requester_id) {
	std::lock_guard<std::mutex> lock(mutex_);
	windows_.erase(requester_id);
}

void RateLimiter::ClearAll() {
	std::lock_guard<std::mutex> lock(mutex_);
	windows_.clear();
}

void RateLimiter::Configure(int max_requests, std::chrono::seconds window) {
	std::lock_guard<std::mutex> lock(mutex_);
	max_requests_ = std::max(max_requests, 0);
	window_ = window;
}

int RateLimiter::MaxRequests() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return max_requests_;
}

std::chrono::seconds RateLimiter::Window() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return window_;
}

} // namespace duckdb
