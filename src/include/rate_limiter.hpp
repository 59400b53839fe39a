#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace duckdb {

struct RateDecision {
	bool allowed = false;
	int remaining = 0;
	// Time until the requester's window resets; zero when allowed
	std::chrono::milliseconds retry_after {0};
};

// Fixed-window request counter per requester. Windows expire lazily on the
// next access; a denied call leaves the window untouched.
class RateLimiter {
public:
	using Clock = std::chrono::steady_clock;
	using ClockFunction = std::function<Clock::time_point()>;

	RateLimiter(int max_requests, std::chrono::seconds window, ClockFunction clock = nullptr);

	// Count one request if capacity remains
	bool Allow(const std::string &requester_id);
	// Allow() plus the remaining capacity and when to retry
	RateDecision Check(const std::string &requester_id);

	// Requests left in the current window (does not count a request)
	int Remaining(const std::string &requester_id);
	// Time until the current window resets, zero if no window is open
	std::chrono::milliseconds ResetTime(const std::string &requester_id);
	void Clear(const std::string &requester_id);
	void ClearAll();

	// Change the cap and window size; open windows keep their start time
	void Configure(int max_requests, std::chrono::seconds window);

	int MaxRequests() const;
	std::chrono::seconds Window() const;

private:
	struct WindowState {
		Clock::time_point window_start;
		int count = 0;
	};

	Clock::time_point Now() const;
	// Requires mutex_ held. Drops an expired window and returns the live one, or nullptr.
	WindowState *LiveWindow(const std::string &requester_id, Clock::time_point now);

	mutable std::mutex mutex_;
	int max_requests_;
	std::chrono::seconds window_;
	ClockFunction clock_;
	std::unordered_map<std::string, WindowState> windows_;
};

} // namespace duckdb
