#pragma once

#include "stream_types.hpp"

#include <functional>
#include <string>
#include <vector>

namespace duckdb {

// Page handed to every extraction strategy
struct PageContent {
	const std::string &html;
	const std::string &page_url;
	int depth;
};

using ExtractionStrategy = std::function<std::vector<Candidate>(const PageContent &)>;

//===--------------------------------------------------------------------===//
// URL Heuristics
//===--------------------------------------------------------------------===//

// Last path segment ends in .mp4/.m4v/.m3u8/.mkv/.avi/.webm (query ignored)
bool HasStreamExtension(const std::string &url);

// Images, scripts, stylesheets, fonts, subtitles and the like
bool HasExcludedExtension(const std::string &url);

// Stream extension, ".m3u8" anywhere or an /hls/ segment, and not an excluded type
bool IsLikelyStreamUrl(const std::string &url);

// Weaker signal used for values of player-ish keys (file:, hls:, ...)
bool HasStreamKeyword(const std::string &url);

// Unescape, resolve against the page and keep only absolute http(s) URLs.
// Returns empty for javascript:, data:, blob:, about:, unparsable values and
// URLs pointing at local or private hosts.
std::string ResolveCandidateUrl(const std::string &page_url, const std::string &raw);

//===--------------------------------------------------------------------===//
// Strategies
//===--------------------------------------------------------------------===//

// <video/source/embed src>, stream-looking src/data-*/href attributes and
// absolute stream URLs anywhere in the text
std::vector<Candidate> ExtractDirectMarkup(const PageContent &page);

// og:video*, twitter:player:stream, <link rel=video_src> and <link type=video/*>
std::vector<Candidate> ExtractMetaTagLinks(const PageContent &page);

// String literals, JSON assignments and keyed values inside inline scripts
std::vector<Candidate> ExtractInlineScriptLinks(const PageContent &page);

// jwplayer().setup, DPlayer, Plyr, flowplayer and videojs().src configurations
std::vector<Candidate> ExtractPlayerConfigLinks(const PageContent &page);

// <iframe src|data-src>, emitted at depth + 1; blocked hosts are skipped
std::vector<Candidate> ExtractIframeLinks(const PageContent &page, const std::vector<std::string> &blocked_hosts);

//===--------------------------------------------------------------------===//
// PatternExtractor
//===--------------------------------------------------------------------===//

// Runs every registered strategy over a page, in registration order, and
// concatenates their results. A strategy never prevents the next one from running.
class PatternExtractor {
public:
	// Registers the default strategies: direct markup, meta tags, inline
	// scripts, player configs, iframes
	explicit PatternExtractor(std::vector<std::string> iframe_blocked_hosts = {});

	void AddStrategy(std::string name, ExtractionStrategy strategy);
	void ClearStrategies();
	size_t StrategyCount() const {
		return strategies_.size();
	}

	std::vector<Candidate> Extract(const std::string &html, const std::string &page_url, int depth) const;

private:
	struct NamedStrategy {
		std::string name;
		ExtractionStrategy fn;
	};

	std::vector<std::string> iframe_blocked_hosts_;
	std::vector<NamedStrategy> strategies_;
};

} // namespace duckdb
