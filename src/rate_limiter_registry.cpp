#include "rate_limiter_registry.hpp"

#include <mutex>
#include <unordered_map>

namespace duckdb {

// Global registry of rate limiters, keyed by database instance pointer
static std::mutex g_limiter_mutex;
static std::unordered_map<uintptr_t, std::shared_ptr<RateLimiter>> g_limiters;

std::shared_ptr<RateLimiter> GetRateLimiter(DatabaseInstance &db, int max_requests, int window_seconds) {
	uintptr_t key = reinterpret_cast<uintptr_t>(&db);
	std::lock_guard<std::mutex> lock(g_limiter_mutex);

	auto it = g_limiters.find(key);
	if (it != g_limiters.end()) {
		auto &limiter = it->second;
		if (limiter->MaxRequests() != max_requests || limiter->Window() != std::chrono::seconds(window_seconds)) {
			limiter->Configure(max_requests, std::chrono::seconds(window_seconds));
		}
		return limiter;
	}
	auto limiter = std::make_shared<RateLimiter>(max_requests, std::chrono::seconds(window_seconds));
	g_limiters[key] = limiter;
	return limiter;
}

} // namespace duckdb
