#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace duckdb {

// Retry behaviour for page fetches. Delays grow as
// base_delay_ms * backoff_multiplier^(attempt-1), capped at max_delay_ms,
// with +/- jitter_ratio randomization.
struct RetryPolicy {
	int max_attempts = 3;
	int base_delay_ms = 500;
	double backoff_multiplier = 2.0;
	int max_delay_ms = 8000;
	double jitter_ratio = 0.2;
	// Upper bound for a server supplied Retry-After on 429
	int max_retry_after_ms = 10000;
};

static constexpr const char *DEFAULT_BROWSER_USER_AGENT =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
    "Chrome/124.0.0.0 Safari/537.36";

static constexpr const char *DEFAULT_ALLOWED_DOMAINS =
    "phimmoi.net,fimplus.org,phim3s.info,motphim.net,xemphim.app,phimhay.org,bilutv.org,"
    "kkphim.vip,phim1080.org,hdviet.tv,thuvienhd.com,phimkk.com,luotphim.org,vuviphim.org,"
    "phimdinhcao.com,lauphim.tv";

struct ExtractorConfig {
	std::vector<std::string> allowed_domains;
	int min_path_segments = 1;

	std::string user_agent = DEFAULT_BROWSER_USER_AGENT;
	int64_t fetch_timeout_ms = 30000;
	int64_t extraction_timeout_ms = 60000;
	int max_redirects = 5;
	int64_t max_body_bytes = 10485760; // 10MB
	RetryPolicy retry;

	int max_iframe_depth = 2;
	int max_concurrent_iframes = 5;
	std::vector<std::string> iframe_blocked_hosts = {
	    "facebook.com", "twitter.com", "x.com", "disqus.com", "doubleclick.net",
	    "googlesyndication.com", "google-analytics.com", "googletagmanager.com"};

	bool validate_links = true;
	int64_t validation_timeout_ms = 5000;

	int rate_limit_requests = 5;
	int rate_limit_window_seconds = 60;

	// 0 = unlimited
	int max_links = 10;
};

// Split a comma separated domain list, lowercasing and stripping "www." and blanks
std::vector<std::string> ParseDomainList(const std::string &list);

// Config populated with the built-in defaults, including the default domain list
ExtractorConfig DefaultExtractorConfig();

} // namespace duckdb
