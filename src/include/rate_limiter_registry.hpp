#pragma once

#include "rate_limiter.hpp"
#include "duckdb/main/client_context.hpp"
#include <memory>

namespace duckdb {

// Rate limiter shared by every stream_links call on a database instance.
// Created on first use; later calls apply changed settings to it.
std::shared_ptr<RateLimiter> GetRateLimiter(DatabaseInstance &db, int max_requests, int window_seconds);

} // namespace duckdb
