#include "cancellation.hpp"
#include <algorithm>

namespace duckdb {

void CancellationToken::Cancel() {
	{
		std::lock_guard<std::mutex> lock(mutex_);
		cancelled_ = true;
	}
	cv_.notify_all();
}

void CancellationToken::SetDeadline(Clock::time_point deadline) {
	deadline_ns_ = std::chrono::duration_cast<std::chrono::nanoseconds>(deadline.time_since_epoch()).count();
	has_deadline_ = true;
}

bool CancellationToken::IsCancelled() const {
	return cancelled_ || (interrupts_ && interrupts_->load() != interrupt_baseline_);
}

bool CancellationToken::DeadlineExpired() const {
	if (!has_deadline_) {
		return false;
	}
	auto now_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now().time_since_epoch()).count();
	return now_ns >= deadline_ns_.load();
}

int64_t CancellationToken::RemainingMs() const {
	if (!has_deadline_) {
		return -1;
	}
	auto now_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now().time_since_epoch()).count();
	int64_t left = (deadline_ns_.load() - now_ns) / 1000000;
	return left > 0 ? left : 0;
}

bool CancellationToken::SleepFor(std::chrono::milliseconds duration) const {
	auto wake_at = Clock::now() + duration;
	std::unique_lock<std::mutex> lock(mutex_);
	// Wake periodically so the external flag and the deadline are noticed
	while (!ShouldStop()) {
		auto now = Clock::now();
		if (now >= wake_at) {
			return true;
		}
		auto slice = std::min<Clock::duration>(wake_at - now, std::chrono::milliseconds(50));
		cv_.wait_for(lock, slice);
	}
	return false;
}

} // namespace duckdb
