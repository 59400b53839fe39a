#pragma once

#include "pattern_extractor.hpp"
#include "page_fetcher.hpp"
#include "stream_types.hpp"

#include <string>
#include <vector>

namespace duckdb {

class CancellationToken;

struct IframeResolution {
	// Non-iframe candidates found inside the fetched iframe documents, in discovery order
	std::vector<Candidate> candidates;
	std::vector<std::string> fetched_pages;
	int failed_fetches = 0;
	// Budget ran out or the token was cancelled with iframes still pending
	bool truncated = false;
};

// Follows iframe candidates level by level up to max_depth, fetching each
// level in bounded batches and never fetching a page twice
class IframeResolver {
public:
	IframeResolver(PageFetcher &fetcher, const PatternExtractor &extractor, int max_depth, int max_concurrent,
	               int64_t fetch_timeout_ms);

	// root_url seeds the visited set so a page embedding itself is not refetched
	IframeResolution Resolve(const std::string &root_url, const std::vector<Candidate> &iframes,
	                         const CancellationToken *cancel = nullptr) const;

private:
	PageFetcher &fetcher_;
	const PatternExtractor &extractor_;
	int max_depth_;
	int max_concurrent_;
	int64_t fetch_timeout_ms_;
};

} // namespace duckdb
