#include "iframe_resolver.hpp"
#include "cancellation.hpp"
#include "link_parser.hpp"
#include "stream_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>
#include <unordered_set>

namespace duckdb {

IframeResolver::IframeResolver(PageFetcher &fetcher, const PatternExtractor &extractor, int max_depth,
                               int max_concurrent, int64_t fetch_timeout_ms)
    : fetcher_(fetcher), extractor_(extractor), max_depth_(max_depth), max_concurrent_(std::max(max_concurrent, 1)),
      fetch_timeout_ms_(fetch_timeout_ms) {
}

IframeResolution IframeResolver::Resolve(const std::string &root_url, const std::vector<Candidate> &iframes,
                                         const CancellationToken *cancel) const {
	IframeResolution resolution;
	std::unordered_set<std::string> visited;
	visited.insert(LinkParser::NormalizeUrl(root_url));

	std::vector<Candidate> level = iframes;
	while (!level.empty()) {
		// Select this level's pages: within depth and not seen before
		std::vector<Candidate> to_fetch;
		for (auto &candidate : level) {
			if (candidate.depth > max_depth_) {
				spdlog::debug("Iframe {} at depth {} exceeds max depth {}", candidate.raw_url, candidate.depth,
				              max_depth_);
				continue;
			}
			std::string key = LinkParser::NormalizeUrl(candidate.raw_url);
			if (key.empty() || !visited.insert(key).second) {
				continue;
			}
			if (IsPrivateOrLocalHost(LinkParser::ExtractDomain(key))) {
				spdlog::warn("Refusing iframe on local or private host: {}", candidate.raw_url);
				continue;
			}
			to_fetch.push_back(std::move(candidate));
		}

		std::vector<Candidate> next_level;
		size_t idx = 0;
		while (idx < to_fetch.size()) {
			if (cancel && cancel->ShouldStop()) {
				spdlog::warn("Iframe resolution cut short, {} iframes abandoned", to_fetch.size() - idx);
				resolution.truncated = true;
				return resolution;
			}

			int64_t timeout = fetch_timeout_ms_;
			if (cancel && cancel->RemainingMs() >= 0) {
				timeout = std::min(timeout, cancel->RemainingMs());
			}

			// Launch batch of fetches
			std::vector<std::pair<size_t, std::future<FetchResult>>> futures;
			for (int i = 0; i < max_concurrent_ && idx < to_fetch.size(); i++, idx++) {
				std::string url = to_fetch[idx].raw_url;
				futures.emplace_back(idx, std::async(std::launch::async, [this, url, timeout, cancel]() {
					                     return fetcher_.Fetch(url, timeout, cancel);
				                     }));
			}

			// Collect results from this batch
			for (auto &entry : futures) {
				const Candidate &iframe = to_fetch[entry.first];
				FetchResult page;
				try {
					page = entry.second.get();
				} catch (const std::exception &e) {
					spdlog::warn("Iframe fetch failed for {}: {}", iframe.raw_url, e.what());
					resolution.failed_fetches++;
					continue;
				}
				if (!page.Ok()) {
					if (page.error == FetchErrorType::CANCELLED || (cancel && cancel->ShouldStop())) {
						resolution.truncated = true;
					}
					spdlog::warn("Skipping iframe {}: {} {}", iframe.raw_url, FetchErrorToString(page.error),
					             page.error_message);
					resolution.failed_fetches++;
					continue;
				}

				resolution.fetched_pages.push_back(iframe.raw_url);
				const std::string &page_url = page.final_url.empty() ? iframe.raw_url : page.final_url;
				for (auto &found : extractor_.Extract(page.body, page_url, iframe.depth)) {
					if (found.method == DiscoveryMethod::IFRAME) {
						next_level.push_back(std::move(found));
					} else {
						resolution.candidates.push_back(std::move(found));
					}
				}
			}
		}
		level = std::move(next_level);
	}
	return resolution;
}

} // namespace duckdb
