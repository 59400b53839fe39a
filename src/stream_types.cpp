#include "stream_types.hpp"

namespace duckdb {

const char *UrlErrorToString(UrlErrorType type) {
	switch (type) {
		case UrlErrorType::NONE: return "";
		case UrlErrorType::MALFORMED_URL: return "malformed_url";
		case UrlErrorType::UNSUPPORTED_DOMAIN: return "unsupported_domain";
		case UrlErrorType::HOMEPAGE_NOT_ALLOWED: return "homepage_not_allowed";
		default: return "unknown";
	}
}

const char *FetchErrorToString(FetchErrorType type) {
	switch (type) {
		case FetchErrorType::NONE: return "";
		case FetchErrorType::TIMEOUT: return "timeout";
		case FetchErrorType::CONNECTION_FAILED: return "connection_failed";
		case FetchErrorType::HTTP_ERROR: return "http_error";
		case FetchErrorType::CANCELLED: return "cancelled";
		default: return "unknown";
	}
}

const char *ExtractionErrorToString(ExtractionErrorType type) {
	switch (type) {
		case ExtractionErrorType::NONE: return "";
		case ExtractionErrorType::INVALID_URL: return "invalid_url";
		case ExtractionErrorType::RATE_LIMITED: return "rate_limited";
		case ExtractionErrorType::FETCH_FAILED: return "fetch_failed";
		case ExtractionErrorType::NO_LINKS_FOUND: return "no_links_found";
		case ExtractionErrorType::EXTRACTION_TIMEOUT: return "extraction_timeout";
		default: return "unknown";
	}
}

const char *DiscoveryMethodToString(DiscoveryMethod method) {
	switch (method) {
		case DiscoveryMethod::DIRECT: return "direct";
		case DiscoveryMethod::SCRIPT: return "script";
		case DiscoveryMethod::IFRAME: return "iframe";
		default: return "unknown";
	}
}

const char *StreamFormatToString(StreamFormat format) {
	switch (format) {
		case StreamFormat::MP4: return "MP4";
		case StreamFormat::M3U8: return "M3U8";
		case StreamFormat::MKV: return "MKV";
		case StreamFormat::AVI: return "AVI";
		case StreamFormat::WEBM: return "WebM";
		default: return "Unknown";
	}
}

const char *StreamQualityToString(StreamQuality quality) {
	switch (quality) {
		case StreamQuality::Q4K: return "4K";
		case StreamQuality::Q1080P: return "1080p";
		case StreamQuality::Q720P: return "720p";
		case StreamQuality::Q480P: return "480p";
		case StreamQuality::Q360P: return "360p";
		default: return "Unknown";
	}
}

int QualityRank(StreamQuality quality) {
	switch (quality) {
		case StreamQuality::Q4K: return 5;
		case StreamQuality::Q1080P: return 4;
		case StreamQuality::Q720P: return 3;
		case StreamQuality::Q480P: return 2;
		case StreamQuality::Q360P: return 1;
		default: return 0;
	}
}

} // namespace duckdb
