#include "stream_extractor.hpp"
#include "cancellation.hpp"
#include "iframe_resolver.hpp"
#include "link_parser.hpp"
#include "quality_classifier.hpp"
#include "stream_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <unordered_map>

namespace duckdb {

static ExtractionOutcome Fail(ExtractionErrorType error, std::string message) {
	ExtractionOutcome outcome;
	outcome.error = error;
	outcome.message = std::move(message);
	return outcome;
}

// Highest quality first, then probed-reachable links, then discovery order
static bool StreamLinkBefore(const StreamLink &a, const StreamLink &b) {
	if (a.quality_rank != b.quality_rank) {
		return a.quality_rank > b.quality_rank;
	}
	if (a.validated != b.validated) {
		return a.validated;
	}
	return a.discovery_order < b.discovery_order;
}

// First occurrence of each normalized URL wins; a later duplicate can still
// contribute the quality descriptor the first one lacked
static std::vector<Candidate> DedupeCandidates(std::vector<Candidate> candidates) {
	std::vector<Candidate> unique;
	std::unordered_map<std::string, size_t> index;
	for (auto &candidate : candidates) {
		std::string key = LinkParser::NormalizeUrl(candidate.raw_url);
		if (key.empty()) {
			continue;
		}
		auto it = index.find(key);
		if (it != index.end()) {
			Candidate &first = unique[it->second];
			if (first.quality_hint.empty() && !candidate.quality_hint.empty()) {
				first.quality_hint = candidate.quality_hint;
			}
			continue;
		}
		index.emplace(key, unique.size());
		candidate.raw_url = key;
		unique.push_back(std::move(candidate));
	}
	return unique;
}

StreamExtractor::StreamExtractor(ExtractorConfig config, std::shared_ptr<HttpTransport> transport,
                                 std::shared_ptr<RateLimiter> limiter)
    : config_(std::move(config)), transport_(std::move(transport)), limiter_(std::move(limiter)),
      validator_(config_.allowed_domains, config_.min_path_segments),
      fetcher_(transport_, config_.retry, config_.user_agent, config_.max_redirects, config_.max_body_bytes),
      patterns_(config_.iframe_blocked_hosts),
      link_validator_(transport_, config_.user_agent, config_.validation_timeout_ms, config_.max_concurrent_iframes) {
	if (!limiter_) {
		limiter_ = std::make_shared<RateLimiter>(config_.rate_limit_requests,
		                                         std::chrono::seconds(config_.rate_limit_window_seconds));
	}
}

ExtractionOutcome StreamExtractor::ExtractLinks(const std::string &raw_url, const std::string &requester_id) {
	ExtractionRequest request;
	request.source_url = raw_url;
	request.requester_id = requester_id;
	request.requested_at = std::chrono::system_clock::now();
	return Extract(request);
}

ExtractionOutcome StreamExtractor::Extract(const ExtractionRequest &request) {
	spdlog::info("Extracting stream links from {} for {}", request.source_url, request.requester_id);

	// 1. Rate limit
	RateDecision decision = limiter_->Check(request.requester_id);
	if (!decision.allowed) {
		spdlog::warn("Rate limit exceeded for {}, retry in {} ms", request.requester_id, decision.retry_after.count());
		int64_t retry_seconds = (decision.retry_after.count() + 999) / 1000;
		auto outcome = Fail(ExtractionErrorType::RATE_LIMITED,
		                    "Rate limit exceeded, retry in " + std::to_string(retry_seconds) + "s");
		outcome.retry_after = decision.retry_after;
		return outcome;
	}

	// 2. Validate
	UrlValidationResult validation = validator_.Validate(request.source_url);
	if (!validation.IsValid()) {
		spdlog::warn("Rejected URL {}: {}", request.source_url, validation.message);
		auto outcome = Fail(ExtractionErrorType::INVALID_URL, validation.message);
		outcome.url_error = validation.error;
		return outcome;
	}
	const std::string &page_url = validation.normalized_url;

	CancellationToken cancel;
	cancel.SetDeadline(CancellationToken::Clock::now() + std::chrono::milliseconds(config_.extraction_timeout_ms));
	if (interrupt_) {
		cancel.LinkInterruptCounter(interrupt_);
	}

	// 3. Root page
	FetchResult root = fetcher_.Fetch(page_url, config_.fetch_timeout_ms, &cancel);
	if (!root.Ok()) {
		FetchErrorType kind = root.error;
		if (kind == FetchErrorType::CANCELLED && cancel.DeadlineExpired()) {
			kind = FetchErrorType::TIMEOUT;
		}
		if (kind == FetchErrorType::NONE) {
			kind = FetchErrorType::CONNECTION_FAILED;
		}
		spdlog::error("Failed to fetch {} after {} attempts: {} {}", page_url, root.attempts,
		              FetchErrorToString(kind), root.error_message);
		auto outcome = Fail(ExtractionErrorType::FETCH_FAILED, root.error_message);
		outcome.fetch_error = kind;
		outcome.http_status = root.http_status;
		return outcome;
	}
	const std::string &base_url = root.final_url.empty() ? page_url : root.final_url;

	// 4. Page patterns
	std::vector<Candidate> candidates;
	std::vector<Candidate> iframes;
	for (auto &candidate : patterns_.Extract(root.body, base_url, 0)) {
		if (candidate.method == DiscoveryMethod::IFRAME) {
			iframes.push_back(std::move(candidate));
		} else {
			candidates.push_back(std::move(candidate));
		}
	}
	spdlog::debug("Root page yielded {} candidates and {} iframes", candidates.size(), iframes.size());

	// 5. Iframes
	bool partial = false;
	if (!iframes.empty()) {
		IframeResolver resolver(fetcher_, patterns_, config_.max_iframe_depth, config_.max_concurrent_iframes,
		                        config_.fetch_timeout_ms);
		IframeResolution resolution = resolver.Resolve(base_url, iframes, &cancel);
		partial = resolution.truncated;
		spdlog::debug("Resolved {} iframe pages ({} failed), {} candidates", resolution.fetched_pages.size(),
		              resolution.failed_fetches, resolution.candidates.size());
		candidates.insert(candidates.end(), std::make_move_iterator(resolution.candidates.begin()),
		                  std::make_move_iterator(resolution.candidates.end()));
	}

	// 6-7. Deduplicate, classify, keep links that satisfy the host/format rule
	std::vector<StreamLink> links;
	for (auto &candidate : DedupeCandidates(std::move(candidates))) {
		StreamLink link = QualityClassifier::Classify(candidate);
		if (link.format == StreamFormat::UNKNOWN && !validator_.IsAllowedHost(link.url)) {
			continue;
		}
		if (IsPrivateOrLocalHost(LinkParser::ExtractDomain(link.url))) {
			spdlog::warn("Dropping link on local or private host: {}", link.url);
			continue;
		}
		link.discovery_order = links.size();
		links.push_back(std::move(link));
	}

	// 8. Probe
	if (config_.validate_links && !links.empty()) {
		if (!link_validator_.ValidateAll(links, &cancel)) {
			partial = true;
		}
	}

	// 9-10. Rank and cap
	std::stable_sort(links.begin(), links.end(), StreamLinkBefore);
	if (config_.max_links > 0 && links.size() > static_cast<size_t>(config_.max_links)) {
		links.resize(static_cast<size_t>(config_.max_links));
	}

	if (cancel.ShouldStop()) {
		partial = true;
	}

	if (links.empty()) {
		if (cancel.ShouldStop()) {
			spdlog::warn("No stream links found in {} before the extraction budget ran out", page_url);
			return Fail(ExtractionErrorType::EXTRACTION_TIMEOUT,
			            cancel.IsCancelled() ? "Extraction interrupted" : "Extraction timed out");
		}
		spdlog::info("No stream links found in {}", page_url);
		return Fail(ExtractionErrorType::NO_LINKS_FOUND, "No stream links found");
	}

	ExtractionOutcome outcome;
	outcome.links = std::move(links);
	outcome.partial = partial;
	outcome.http_status = root.http_status;
	spdlog::info("Found {} stream links in {}{}", outcome.links.size(), page_url, partial ? " (partial)" : "");
	return outcome;
}

} // namespace duckdb
