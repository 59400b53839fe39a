#include "stream_utils.hpp"
#include <zlib.h>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <cstdio>
#include <cstring>
#include <vector>
#include <cctype>

namespace duckdb {

//===--------------------------------------------------------------------===//
// Error Classification
//===--------------------------------------------------------------------===//

FetchErrorType ClassifyFetchError(const HttpResponse &response) {
	if (response.cancelled) return FetchErrorType::CANCELLED;
	if (response.timed_out) return FetchErrorType::TIMEOUT;
	if (response.status_code <= 0) {
		// Network error - classify from message when the transport did not flag it
		if (response.error.find("timeout") != std::string::npos ||
		    response.error.find("Timeout") != std::string::npos ||
		    response.error.find("timed out") != std::string::npos) {
			return FetchErrorType::TIMEOUT;
		}
		return FetchErrorType::CONNECTION_FAILED;
	}
	if (response.status_code >= 400) return FetchErrorType::HTTP_ERROR;
	return FetchErrorType::NONE;
}

bool IsRetryableStatus(int status_code) {
	if (status_code == 429) {
		return true;
	}
	return status_code >= 500 && status_code <= 504;
}

//===--------------------------------------------------------------------===//
// Compression Utilities
//===--------------------------------------------------------------------===//

std::string DecompressGzip(const std::string &compressed_data) {
	if (compressed_data.empty()) {
		return "";
	}

	z_stream zs;
	memset(&zs, 0, sizeof(zs));

	// Use inflateInit2 with 16+MAX_WBITS to handle gzip format
	if (inflateInit2(&zs, 16 + MAX_WBITS) != Z_OK) {
		return "";
	}

	zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed_data.data()));
	zs.avail_in = static_cast<uInt>(compressed_data.size());

	std::string decompressed;
	char buffer[32768];

	int ret;
	do {
		zs.next_out = reinterpret_cast<Bytef*>(buffer);
		zs.avail_out = sizeof(buffer);

		ret = inflate(&zs, Z_NO_FLUSH);

		if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR) {
			inflateEnd(&zs);
			return "";
		}

		size_t have = sizeof(buffer) - zs.avail_out;
		decompressed.append(buffer, have);
		// Truncated input: no progress possible
		if (ret == Z_BUF_ERROR && zs.avail_in == 0) {
			break;
		}
	} while (ret != Z_STREAM_END);

	inflateEnd(&zs);
	return decompressed;
}

bool IsGzippedData(const std::string &data) {
	return data.size() >= 2 &&
	       static_cast<unsigned char>(data[0]) == 0x1f &&
	       static_cast<unsigned char>(data[1]) == 0x8b;
}

//===--------------------------------------------------------------------===//
// Backoff
//===--------------------------------------------------------------------===//

int64_t ComputeBackoffMs(const RetryPolicy &policy, int attempt, double jitter_sample) {
	if (attempt < 1 || policy.base_delay_ms <= 0) {
		return 0;
	}
	double delay = policy.base_delay_ms * std::pow(policy.backoff_multiplier, attempt - 1);
	delay = std::min(delay, static_cast<double>(policy.max_delay_ms));
	jitter_sample = std::max(-1.0, std::min(1.0, jitter_sample));
	delay += delay * policy.jitter_ratio * jitter_sample;
	return std::max<int64_t>(0, static_cast<int64_t>(delay));
}

int64_t ParseRetryAfterMs(const std::string &retry_after) {
	if (retry_after.empty()) {
		return 0;
	}
	char *end = nullptr;
	long seconds = std::strtol(retry_after.c_str(), &end, 10);
	if (end == retry_after.c_str() || seconds < 0) {
		return 0;
	}
	while (*end && std::isspace(static_cast<unsigned char>(*end))) {
		end++;
	}
	if (*end != '\0') {
		return 0;
	}
	return static_cast<int64_t>(seconds) * 1000;
}

//===--------------------------------------------------------------------===//
// Host Utilities
//===--------------------------------------------------------------------===//

static bool ParseIpv4(const std::string &host, int octets[4]) {
	if (host.empty() || !std::all_of(host.begin(), host.end(),
	                                 [](unsigned char c) { return std::isdigit(c) || c == '.'; })) {
		return false;
	}
	char trailing = 0;
	int parsed = sscanf(host.c_str(), "%d.%d.%d.%d%c", &octets[0], &octets[1], &octets[2], &octets[3], &trailing);
	if (parsed != 4) {
		return false;
	}
	for (int i = 0; i < 4; i++) {
		if (octets[i] < 0 || octets[i] > 255) {
			return false;
		}
	}
	return true;
}

bool IsPrivateOrLocalHost(const std::string &host) {
	if (host.empty()) {
		return true;
	}
	if (host == "localhost" || (host.size() > 10 && host.compare(host.size() - 10, 10, ".localhost") == 0)) {
		return true;
	}
	if (host.front() == '[') {
		// IPv6 literal: loopback, unspecified, link-local, unique-local, v4-mapped
		std::string lower = host;
		std::transform(lower.begin(), lower.end(), lower.begin(),
		               [](unsigned char c) { return std::tolower(c); });
		return lower == "[::1]" || lower == "[::]" || lower.compare(0, 4, "[fe8") == 0 ||
		       lower.compare(0, 4, "[fe9") == 0 || lower.compare(0, 4, "[fea") == 0 ||
		       lower.compare(0, 4, "[feb") == 0 || lower.compare(0, 3, "[fc") == 0 ||
		       lower.compare(0, 3, "[fd") == 0 || lower.compare(0, 8, "[::ffff:") == 0;
	}
	if (host == "::1") {
		return true;
	}
	bool numeric = std::all_of(host.begin(), host.end(), [](unsigned char c) { return std::isdigit(c) || c == '.'; });
	int o[4];
	if (!ParseIpv4(host, o)) {
		// Shorthand numeric forms (127.1, 2130706433) resolve to addresses we cannot vet
		return numeric;
	}
	return o[0] == 0 || o[0] == 10 || o[0] == 127 ||
	       (o[0] == 169 && o[1] == 254) ||
	       (o[0] == 172 && o[1] >= 16 && o[1] <= 31) ||
	       (o[0] == 192 && o[1] == 168);
}

bool HostMatchesDomain(const std::string &host, const std::string &domain) {
	if (host.empty() || domain.empty()) {
		return false;
	}
	std::string h = host;
	if (h.compare(0, 4, "www.") == 0) {
		h = h.substr(4);
	}
	if (h == domain) {
		return true;
	}
	std::string suffix = "." + domain;
	return h.size() > suffix.size() && h.compare(h.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace duckdb
