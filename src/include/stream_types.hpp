#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace duckdb {

//===--------------------------------------------------------------------===//
// Error Classification
//===--------------------------------------------------------------------===//

enum class UrlErrorType : uint8_t {
	NONE = 0,
	MALFORMED_URL = 1,
	UNSUPPORTED_DOMAIN = 2,
	HOMEPAGE_NOT_ALLOWED = 3
};

enum class FetchErrorType : uint8_t {
	NONE = 0,
	TIMEOUT = 1,
	CONNECTION_FAILED = 2,
	HTTP_ERROR = 3,
	CANCELLED = 4
};

enum class ExtractionErrorType : uint8_t {
	NONE = 0,
	INVALID_URL = 1,
	RATE_LIMITED = 2,
	FETCH_FAILED = 3,
	NO_LINKS_FOUND = 4,
	EXTRACTION_TIMEOUT = 5
};

const char *UrlErrorToString(UrlErrorType type);
const char *FetchErrorToString(FetchErrorType type);
const char *ExtractionErrorToString(ExtractionErrorType type);

//===--------------------------------------------------------------------===//
// Pipeline Records
//===--------------------------------------------------------------------===//

struct ExtractionRequest {
	std::string source_url;
	std::string requester_id;
	std::chrono::system_clock::time_point requested_at;
};

// Result of fetching one page. body is only meaningful when has_body is set.
struct FetchResult {
	std::string url;
	std::string final_url;   // After redirects
	int http_status = 0;
	std::string body;
	bool has_body = false;
	std::string content_type;
	int64_t elapsed_ms = 0;
	int attempts = 0;
	FetchErrorType error = FetchErrorType::NONE;
	std::string error_message;

	bool Ok() const {
		return error == FetchErrorType::NONE && has_body;
	}
};

enum class DiscoveryMethod : uint8_t {
	DIRECT = 0,
	SCRIPT = 1,
	IFRAME = 2
};

const char *DiscoveryMethodToString(DiscoveryMethod method);

// Unclassified URL found while scanning a page
struct Candidate {
	std::string raw_url;
	std::string source_page_url;
	DiscoveryMethod method = DiscoveryMethod::DIRECT;
	int depth = 0;
	// Quality descriptor found next to the URL (e.g. a player source "label")
	std::string quality_hint;
};

enum class StreamFormat : uint8_t {
	UNKNOWN = 0,
	MP4,
	M3U8,
	MKV,
	AVI,
	WEBM
};

enum class StreamQuality : uint8_t {
	UNKNOWN = 0,
	Q360P,
	Q480P,
	Q720P,
	Q1080P,
	Q4K
};

const char *StreamFormatToString(StreamFormat format);
const char *StreamQualityToString(StreamQuality quality);
// Fixed total order: 4K > 1080p > 720p > 480p > 360p > Unknown
int QualityRank(StreamQuality quality);

struct StreamLink {
	std::string url;
	StreamFormat format = StreamFormat::UNKNOWN;
	StreamQuality quality = StreamQuality::UNKNOWN;
	int quality_rank = 0;
	bool validated = false;

	DiscoveryMethod method = DiscoveryMethod::DIRECT;
	int depth = 0;
	std::string source_page_url;
	std::string content_type;     // From validation probe, if any
	int64_t content_length = -1;  // -1 if unknown
	size_t discovery_order = 0;
};

// Outcome of a full extraction call. links may be non-empty together with
// partial = true when the overall budget cut iframe resolution short.
struct ExtractionOutcome {
	std::vector<StreamLink> links;
	ExtractionErrorType error = ExtractionErrorType::NONE;
	UrlErrorType url_error = UrlErrorType::NONE;
	FetchErrorType fetch_error = FetchErrorType::NONE;
	int http_status = 0;
	std::string message;
	bool partial = false;
	std::chrono::milliseconds retry_after {0};

	bool Ok() const {
		return error == ExtractionErrorType::NONE;
	}
};

} // namespace duckdb
