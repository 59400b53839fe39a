#pragma once

#include "extractor_config.hpp"
#include "http_client.hpp"
#include "stream_types.hpp"

#include <string>
#include <cstdint>

namespace duckdb {

//===--------------------------------------------------------------------===//
// Error Classification
//===--------------------------------------------------------------------===//

// Map a transport response to a fetch error kind (NONE for 2xx/3xx)
FetchErrorType ClassifyFetchError(const HttpResponse &response);

// Transient statuses worth another attempt: 429 and 500-504
bool IsRetryableStatus(int status_code);

//===--------------------------------------------------------------------===//
// Compression Utilities
//===--------------------------------------------------------------------===//

// Decompress gzip data. Returns empty string on error.
std::string DecompressGzip(const std::string &compressed_data);

// Check if data starts with gzip magic bytes (0x1f 0x8b)
bool IsGzippedData(const std::string &data);

//===--------------------------------------------------------------------===//
// Backoff
//===--------------------------------------------------------------------===//

// Delay before retry number `attempt` (1-based). jitter_sample is in [-1, 1].
int64_t ComputeBackoffMs(const RetryPolicy &policy, int attempt, double jitter_sample);

// Retry-After in seconds -> milliseconds. HTTP-date values are not supported and yield 0.
int64_t ParseRetryAfterMs(const std::string &retry_after);

//===--------------------------------------------------------------------===//
// Host Utilities
//===--------------------------------------------------------------------===//

// localhost, loopback, 0.0.0.0, RFC1918 / link-local IPv4, local IPv6 literals
// and shorthand numeric hosts
bool IsPrivateOrLocalHost(const std::string &host);

// host equals domain or is a subdomain of it; both lowercase, "www." ignored on host
bool HostMatchesDomain(const std::string &host, const std::string &domain);

} // namespace duckdb
