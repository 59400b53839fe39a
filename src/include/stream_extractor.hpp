#pragma once

#include "domain_validator.hpp"
#include "extractor_config.hpp"
#include "http_client.hpp"
#include "link_validator.hpp"
#include "page_fetcher.hpp"
#include "pattern_extractor.hpp"
#include "rate_limiter.hpp"
#include "stream_types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace duckdb {

// Episode page URL in, ranked direct stream links out. Expected failures are
// reported through ExtractionOutcome, never thrown.
class StreamExtractor {
public:
	// A null limiter gets a private one sized from config
	StreamExtractor(ExtractorConfig config, std::shared_ptr<HttpTransport> transport,
	                std::shared_ptr<RateLimiter> limiter = nullptr);

	ExtractionOutcome ExtractLinks(const std::string &raw_url, const std::string &requester_id);
	ExtractionOutcome Extract(const ExtractionRequest &request);

	// Abort in-flight work when *counter changes after an extraction starts (e.g. on SIGINT)
	void LinkInterruptCounter(const std::atomic<uint64_t> *counter) {
		interrupt_ = counter;
	}

	const ExtractorConfig &Config() const {
		return config_;
	}
	PageFetcher &Fetcher() {
		return fetcher_;
	}
	PatternExtractor &Patterns() {
		return patterns_;
	}

private:
	ExtractorConfig config_;
	std::shared_ptr<HttpTransport> transport_;
	std::shared_ptr<RateLimiter> limiter_;
	DomainValidator validator_;
	PageFetcher fetcher_;
	PatternExtractor patterns_;
	LinkValidator link_validator_;
	const std::atomic<uint64_t> *interrupt_ = nullptr;
};

} // namespace duckdb
