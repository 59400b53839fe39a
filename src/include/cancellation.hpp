#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace duckdb {

// Cooperative cancellation shared by everything running on behalf of one
// extraction: curl transfers poll it from their progress callback, retry
// sleeps wait on it.
class CancellationToken {
public:
	using Clock = std::chrono::steady_clock;

	CancellationToken() = default;
	CancellationToken(const CancellationToken &) = delete;
	CancellationToken &operator=(const CancellationToken &) = delete;

	void Cancel();
	// Also observe a process-wide interrupt counter (bumped by a SIGINT
	// handler). Only increments after this call cancel the token.
	void LinkInterruptCounter(const std::atomic<uint64_t> *counter) {
		interrupt_baseline_ = counter ? counter->load() : 0;
		interrupts_ = counter;
	}
	void SetDeadline(Clock::time_point deadline);

	bool IsCancelled() const;
	bool DeadlineExpired() const;
	// Cancelled or past the deadline
	bool ShouldStop() const {
		return IsCancelled() || DeadlineExpired();
	}
	// Milliseconds left until the deadline, 0 if expired, -1 if no deadline
	int64_t RemainingMs() const;

	// Sleep up to duration. Returns false if woken by cancellation or the deadline.
	bool SleepFor(std::chrono::milliseconds duration) const;

private:
	std::atomic<bool> cancelled_ {false};
	const std::atomic<uint64_t> *interrupts_ = nullptr;
	uint64_t interrupt_baseline_ = 0;
	std::atomic<bool> has_deadline_ {false};
	std::atomic<int64_t> deadline_ns_ {0};

	mutable std::mutex mutex_;
	mutable std::condition_variable cv_;
};

} // namespace duckdb
