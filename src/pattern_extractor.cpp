#include "pattern_extractor.hpp"
#include "link_parser.hpp"
#include "script_scanner.hpp"
#include "stream_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <iterator>
#include <set>

namespace duckdb {

static std::string ToLower(const std::string &str) {
	std::string result = str;
	std::transform(result.begin(), result.end(), result.begin(),
	               [](unsigned char c) { return std::tolower(c); });
	return result;
}

static std::string Trim(const std::string &str) {
	size_t start = 0;
	size_t end = str.length();
	while (start < end && std::isspace(static_cast<unsigned char>(str[start]))) {
		start++;
	}
	while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
		end--;
	}
	return str.substr(start, end - start);
}

static bool StartsWith(const std::string &str, const char *prefix) {
	return str.rfind(prefix, 0) == 0;
}

// Lowercase extension of the last path segment, query and fragment ignored
static std::string LastSegmentExtension(const std::string &url) {
	size_t cut = url.find_first_of("?#");
	std::string path = ToLower(cut == std::string::npos ? url : url.substr(0, cut));
	size_t scheme = path.find("://");
	if (scheme != std::string::npos) {
		size_t path_start = path.find('/', scheme + 3);
		path = path_start == std::string::npos ? "" : path.substr(path_start);
	}
	size_t slash = path.rfind('/');
	std::string segment = slash == std::string::npos ? path : path.substr(slash + 1);
	size_t dot = segment.rfind('.');
	if (dot == std::string::npos || dot + 1 >= segment.size()) {
		return "";
	}
	return segment.substr(dot + 1);
}

//===--------------------------------------------------------------------===//
// URL Heuristics
//===--------------------------------------------------------------------===//

bool HasStreamExtension(const std::string &url) {
	static const std::set<std::string> extensions = {"mp4", "m4v", "m3u8", "mkv", "avi", "webm"};
	return extensions.count(LastSegmentExtension(url)) > 0;
}

bool HasExcludedExtension(const std::string &url) {
	static const std::set<std::string> excluded = {
	    "js",   "css", "png", "jpg", "jpeg", "gif", "svg", "webp", "ico",  "bmp", "woff", "woff2",
	    "ttf",  "eot", "otf", "vtt", "srt",  "ass", "json", "xml", "html", "htm", "php",  "txt",
	    "pdf",  "zip", "rar", "mp3", "aac",  "wav"};
	return excluded.count(LastSegmentExtension(url)) > 0;
}

static bool LooksLikeUrlToken(const std::string &value) {
	if (value.empty() || value.size() > 4096) {
		return false;
	}
	for (char c : value) {
		if (std::isspace(static_cast<unsigned char>(c)) || c == '"' || c == '\'' || c == '`' || c == '<' ||
		    c == '>' || c == '{' || c == '}') {
			return false;
		}
	}
	return true;
}

bool IsLikelyStreamUrl(const std::string &url) {
	if (!LooksLikeUrlToken(url) || HasExcludedExtension(url)) {
		return false;
	}
	if (HasStreamExtension(url)) {
		return true;
	}
	std::string lower = ToLower(url);
	return lower.find(".m3u8") != std::string::npos || lower.find("/hls/") != std::string::npos;
}

bool HasStreamKeyword(const std::string &url) {
	if (IsLikelyStreamUrl(url)) {
		return true;
	}
	if (!LooksLikeUrlToken(url) || HasExcludedExtension(url)) {
		return false;
	}
	static const char *keywords[] = {"video", "stream", "playlist", "manifest", "hls", "media", "cdn"};
	std::string lower = ToLower(url);
	for (const char *keyword : keywords) {
		if (lower.find(keyword) != std::string::npos) {
			return true;
		}
	}
	return false;
}

std::string ResolveCandidateUrl(const std::string &page_url, const std::string &raw) {
	std::string value = Trim(LinkParser::UnescapeEmbeddedUrl(raw));
	if (value.empty() || !LooksLikeUrlToken(value)) {
		return "";
	}
	std::string lower = ToLower(value);
	if (StartsWith(lower, "javascript:") || StartsWith(lower, "data:") || StartsWith(lower, "blob:") ||
	    StartsWith(lower, "about:") || StartsWith(lower, "mailto:") || StartsWith(lower, "tel:")) {
		return "";
	}
	std::string resolved = LinkParser::ResolveUrl(page_url, value);
	ParsedUrl parsed = LinkParser::Parse(resolved);
	if (!parsed.valid || IsPrivateOrLocalHost(parsed.host)) {
		return "";
	}
	return resolved;
}

//===--------------------------------------------------------------------===//
// Shared scanning helpers
//===--------------------------------------------------------------------===//

namespace {

// Collects candidates for one strategy, dropping repeats within the strategy
class CandidateSink {
public:
	CandidateSink(const PageContent &page, DiscoveryMethod method) : page_(page), method_(method) {}

	void Add(const std::string &raw, const std::string &quality_hint = "", int depth_offset = 0) {
		AddAs(raw, method_, quality_hint, depth_offset);
	}

	void AddAs(const std::string &raw, DiscoveryMethod method, const std::string &quality_hint, int depth_offset) {
		std::string resolved = ResolveCandidateUrl(page_.page_url, raw);
		if (resolved.empty() || !seen_.insert(resolved).second) {
			return;
		}
		Candidate candidate;
		candidate.raw_url = resolved;
		candidate.source_page_url = page_.page_url;
		candidate.method = method;
		candidate.depth = page_.depth + depth_offset;
		candidate.quality_hint = quality_hint;
		candidates_.push_back(std::move(candidate));
	}

	std::vector<Candidate> Take() {
		return std::move(candidates_);
	}

private:
	const PageContent &page_;
	DiscoveryMethod method_;
	std::set<std::string> seen_;
	std::vector<Candidate> candidates_;
};

struct KeyedValue {
	std::string key;
	std::string value;
	size_t offset;
};

bool IsIdentifierChar(char c) {
	return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

// Read a quoted literal starting at text[pos] (the quote). Returns false if unterminated.
bool ReadQuoted(const std::string &text, size_t pos, std::string &out, size_t &end) {
	char quote = text[pos];
	out.clear();
	for (size_t i = pos + 1; i < text.size(); i++) {
		char c = text[i];
		if (c == '\\' && i + 1 < text.size()) {
			out += c;
			out += text[i + 1];
			i++;
			continue;
		}
		if (c == quote) {
			end = i + 1;
			return true;
		}
		if (c == '\n' && quote != '`') {
			return false;
		}
		out += c;
	}
	return false;
}

// key: "value", "key": 'value', key = "value" for any of the given keys
std::vector<KeyedValue> FindKeyedStringValues(const std::string &text, const std::vector<std::string> &keys) {
	std::vector<KeyedValue> values;
	for (const auto &key : keys) {
		size_t pos = 0;
		while ((pos = text.find(key, pos)) != std::string::npos) {
			size_t key_end = pos + key.size();
			bool left_ok = pos == 0 || !IsIdentifierChar(text[pos - 1]);
			bool right_ok = key_end >= text.size() || !IsIdentifierChar(text[key_end]);
			size_t start = pos;
			pos = key_end;
			if (!left_ok || !right_ok) {
				continue;
			}
			size_t i = key_end;
			if (i < text.size() && (text[i] == '"' || text[i] == '\'')) {
				i++;
			}
			while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
				i++;
			}
			if (i >= text.size() || (text[i] != ':' && text[i] != '=')) {
				continue;
			}
			i++;
			while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
				i++;
			}
			if (i >= text.size() || (text[i] != '"' && text[i] != '\'' && text[i] != '`')) {
				continue;
			}
			std::string value;
			size_t end = 0;
			if (ReadQuoted(text, i, value, end)) {
				values.push_back({key, value, start});
				pos = end;
			}
		}
	}
	std::sort(values.begin(), values.end(),
	          [](const KeyedValue &a, const KeyedValue &b) { return a.offset < b.offset; });
	return values;
}

// Balanced {...} / [...] starting at text[pos], skipping quoted strings.
// Unbalanced input yields everything up to the end.
std::string ExtractBalancedBlock(const std::string &text, size_t pos) {
	int depth = 0;
	char quote = 0;
	for (size_t i = pos; i < text.size(); i++) {
		char c = text[i];
		if (quote) {
			if (c == '\\') {
				i++;
			} else if (c == quote) {
				quote = 0;
			}
			continue;
		}
		if (c == '"' || c == '\'' || c == '`') {
			quote = c;
		} else if (c == '{' || c == '[') {
			depth++;
		} else if (c == '}' || c == ']') {
			depth--;
			if (depth == 0) {
				return text.substr(pos, i - pos + 1);
			}
		}
	}
	return text.substr(pos);
}

// label/quality/res in the innermost object around offset, e.g. {file: "...", label: "720p"}
std::string FindNearbyLabel(const std::string &block, size_t offset) {
	size_t open = block.rfind('{', offset);
	if (open == std::string::npos) {
		return "";
	}
	size_t close = block.find('}', offset);
	if (close == std::string::npos) {
		close = block.size();
	}
	std::string object = block.substr(open, close - open);
	if (object.find('{', 1) != std::string::npos) {
		return "";
	}
	auto labels = FindKeyedStringValues(object, {"label", "quality", "res", "resolution"});
	return labels.empty() ? "" : labels.front().value;
}

std::string JoinScripts(const std::string &html) {
	std::vector<std::string> scripts = CollectInlineScripts(html);
	if (scripts.empty()) {
		return html;
	}
	std::string joined;
	for (const auto &script : scripts) {
		joined += script;
		joined += '\n';
	}
	return joined;
}

} // namespace

//===--------------------------------------------------------------------===//
// Strategies
//===--------------------------------------------------------------------===//

// Absolute stream URLs anywhere in the text, including JS-escaped ones (https:\/\/...)
static void SweepAbsoluteUrls(const std::string &text, CandidateSink &sink) {
	size_t pos = 0;
	while ((pos = text.find("http", pos)) != std::string::npos) {
		size_t start = pos;
		pos += 4;
		if (start > 0 && IsIdentifierChar(text[start - 1])) {
			continue;
		}
		size_t i = start + 4;
		if (i < text.size() && (text[i] == 's' || text[i] == 'S')) {
			i++;
		}
		if (text.compare(i, 3, "://") != 0 && text.compare(i, 5, ":\\/\\/") != 0) {
			continue;
		}
		size_t end = i;
		while (end < text.size()) {
			char c = text[end];
			if (std::isspace(static_cast<unsigned char>(c)) || c == '"' || c == '\'' || c == '<' || c == '>' ||
			    c == '(' || c == ')' || c == '`' || c == '{' || c == '}' || c == '|' || c == '^') {
				break;
			}
			end++;
		}
		std::string url = text.substr(start, end - start);
		while (!url.empty() && (url.back() == '\\' || url.back() == '.' || url.back() == ',' || url.back() == ';')) {
			url.pop_back();
		}
		url = LinkParser::UnescapeEmbeddedUrl(url);
		if (IsLikelyStreamUrl(url)) {
			sink.Add(url);
		}
		pos = end;
	}
}

std::vector<Candidate> ExtractDirectMarkup(const PageContent &page) {
	static const std::set<std::string> media_tags = {"video", "source", "embed"};
	static const char *stream_attributes[] = {"src", "data-src", "data-video", "data-file", "file", "href"};

	CandidateSink sink(page, DiscoveryMethod::DIRECT);
	for (const auto &tag : LinkParser::FindTags(page.html, {})) {
		if (media_tags.count(tag.name)) {
			std::string src = LinkParser::ExtractAttribute(tag.text, "src");
			if (!src.empty() && !HasExcludedExtension(src)) {
				sink.Add(src, LinkParser::ExtractAttribute(tag.text, "label"));
			}
		}
		for (const char *attribute : stream_attributes) {
			std::string value = LinkParser::ExtractAttribute(tag.text, attribute);
			if (!value.empty() && IsLikelyStreamUrl(LinkParser::UnescapeEmbeddedUrl(value))) {
				sink.Add(value);
			}
		}
	}
	SweepAbsoluteUrls(page.html, sink);
	return sink.Take();
}

std::vector<Candidate> ExtractMetaTagLinks(const PageContent &page) {
	static const std::set<std::string> video_properties = {"og:video", "og:video:url", "og:video:secure_url",
	                                                        "twitter:player:stream"};
	CandidateSink sink(page, DiscoveryMethod::DIRECT);
	for (const auto &tag : LinkParser::FindTags(page.html, {"meta", "link"})) {
		if (tag.name == "meta") {
			std::string key = ToLower(LinkParser::ExtractAttribute(tag.text, "property"));
			if (key.empty()) {
				key = ToLower(LinkParser::ExtractAttribute(tag.text, "name"));
			}
			if (!video_properties.count(key)) {
				continue;
			}
			std::string content = LinkParser::ExtractAttribute(tag.text, "content");
			if (!content.empty() && !HasExcludedExtension(content)) {
				sink.Add(content);
			}
			continue;
		}
		std::string rel = ToLower(LinkParser::ExtractAttribute(tag.text, "rel"));
		std::string type = ToLower(LinkParser::ExtractAttribute(tag.text, "type"));
		bool video_link = rel == "video_src" || StartsWith(type, "video/") ||
		                  type == "application/x-mpegurl" || type == "application/vnd.apple.mpegurl";
		if (!video_link) {
			continue;
		}
		std::string href = LinkParser::ExtractAttribute(tag.text, "href");
		if (!href.empty() && !HasExcludedExtension(href)) {
			sink.Add(href);
		}
	}
	return sink.Take();
}

std::vector<Candidate> ExtractInlineScriptLinks(const PageContent &page) {
	static const std::vector<std::string> stream_keys = {"file", "src", "source", "hls", "url",
	                                                     "video", "stream", "playlist", "link"};
	CandidateSink sink(page, DiscoveryMethod::SCRIPT);

	for (const auto &raw_script : CollectInlineScripts(page.html)) {
		// JSON first so that sibling quality labels survive deduplication
		for (const auto &json : ExtractJsonValues(raw_script)) {
			auto hits = FindUrlsInJson(json, [](const std::string &value) {
				return IsLikelyStreamUrl(LinkParser::UnescapeEmbeddedUrl(value));
			});
			for (const auto &hit : hits) {
				sink.Add(hit.url, hit.quality_hint);
			}
		}

		std::string script = StripScriptComments(raw_script);
		for (const auto &keyed : FindKeyedStringValues(script, stream_keys)) {
			std::string value = LinkParser::UnescapeEmbeddedUrl(keyed.value);
			bool url_shaped = StartsWith(value, "http") || StartsWith(value, "//") || StartsWith(value, "/");
			if (url_shaped && HasStreamKeyword(value)) {
				sink.Add(value, FindNearbyLabel(script, keyed.offset));
			}
		}

		for (const auto &literal : ExtractStringLiterals(script)) {
			std::string value = LinkParser::UnescapeEmbeddedUrl(literal);
			if (IsLikelyStreamUrl(value)) {
				sink.Add(value);
			}
		}
	}
	return sink.Take();
}

// Source fields of one player configuration block
static void AddPlayerBlock(const std::string &block, CandidateSink &sink) {
	static const std::vector<std::string> source_keys = {"file", "src", "source", "url"};
	for (const auto &keyed : FindKeyedStringValues(block, source_keys)) {
		std::string value = LinkParser::UnescapeEmbeddedUrl(keyed.value);
		if (HasExcludedExtension(value) || StartsWith(value, "#")) {
			continue;
		}
		sink.Add(value, FindNearbyLabel(block, keyed.offset));
	}
}

std::vector<Candidate> ExtractPlayerConfigLinks(const PageContent &page) {
	// Player constructor and how far past it the config object may start
	struct PlayerCall {
		const char *marker;
		const char *then;  // Method that takes the config, or nullptr
	};
	static const PlayerCall calls[] = {
	    {"jwplayer(", ".setup("}, {"new dplayer(", nullptr}, {"new plyr(", nullptr},
	    {"flowplayer(", nullptr}, {"videojs(", nullptr},    {"videojs(", ".src("}};
	static const size_t MAX_CONFIG_DISTANCE = 300;

	CandidateSink sink(page, DiscoveryMethod::SCRIPT);
	std::string text = StripScriptComments(JoinScripts(page.html));
	std::string lower = ToLower(text);

	for (const auto &call : calls) {
		size_t pos = 0;
		while ((pos = lower.find(call.marker, pos)) != std::string::npos) {
			size_t args = pos + std::strlen(call.marker);
			pos = args;
			if (call.then) {
				size_t method = lower.find(call.then, args);
				if (method == std::string::npos || method - args > MAX_CONFIG_DISTANCE) {
					continue;
				}
				args = method + std::strlen(call.then);
				size_t first = args;
				while (first < text.size() && std::isspace(static_cast<unsigned char>(text[first]))) {
					first++;
				}
				// videojs(...).src("https://...")
				if (first < text.size() && (text[first] == '"' || text[first] == '\'')) {
					std::string value;
					size_t end = 0;
					if (ReadQuoted(text, first, value, end)) {
						sink.Add(value);
					}
					continue;
				}
			}
			size_t open = text.find_first_of("{[", args);
			if (open == std::string::npos || open - args > MAX_CONFIG_DISTANCE) {
				continue;
			}
			// The object must belong to this call, not to a later statement
			size_t statement_end = text.find(';', args);
			if (statement_end != std::string::npos && statement_end < open) {
				continue;
			}
			AddPlayerBlock(ExtractBalancedBlock(text, open), sink);
		}
	}
	return sink.Take();
}

std::vector<Candidate> ExtractIframeLinks(const PageContent &page, const std::vector<std::string> &blocked_hosts) {
	CandidateSink sink(page, DiscoveryMethod::IFRAME);
	for (const auto &tag : LinkParser::FindTags(page.html, {"iframe"})) {
		std::string src = Trim(LinkParser::ExtractAttribute(tag.text, "src"));
		if (src.empty() || ToLower(src) == "about:blank") {
			src = LinkParser::ExtractAttribute(tag.text, "data-src");
		}
		if (src.empty()) {
			src = LinkParser::ExtractAttribute(tag.text, "data-lazy-src");
		}
		std::string resolved = ResolveCandidateUrl(page.page_url, src);
		if (resolved.empty()) {
			continue;
		}
		std::string host = LinkParser::ExtractDomain(resolved);
		bool blocked = std::any_of(blocked_hosts.begin(), blocked_hosts.end(),
		                           [&](const std::string &domain) { return HostMatchesDomain(host, domain); });
		if (blocked) {
			spdlog::debug("Skipping iframe on blocked host: {}", resolved);
			continue;
		}
		if (IsLikelyStreamUrl(resolved)) {
			// Media embedded directly as the iframe document
			sink.AddAs(resolved, DiscoveryMethod::DIRECT, "", 0);
		} else {
			sink.Add(resolved, "", 1);
		}
	}
	return sink.Take();
}

//===--------------------------------------------------------------------===//
// PatternExtractor
//===--------------------------------------------------------------------===//

PatternExtractor::PatternExtractor(std::vector<std::string> iframe_blocked_hosts)
    : iframe_blocked_hosts_(std::move(iframe_blocked_hosts)) {
	AddStrategy("direct_markup", ExtractDirectMarkup);
	AddStrategy("meta_tags", ExtractMetaTagLinks);
	AddStrategy("inline_script", ExtractInlineScriptLinks);
	AddStrategy("player_config", ExtractPlayerConfigLinks);
	auto blocked = iframe_blocked_hosts_;
	AddStrategy("iframe", [blocked](const PageContent &page) { return ExtractIframeLinks(page, blocked); });
}

void PatternExtractor::AddStrategy(std::string name, ExtractionStrategy strategy) {
	strategies_.push_back({std::move(name), std::move(strategy)});
}

void PatternExtractor::ClearStrategies() {
	strategies_.clear();
}

std::vector<Candidate> PatternExtractor::Extract(const std::string &html, const std::string &page_url,
                                                 int depth) const {
	std::vector<Candidate> all;
	PageContent page {html, page_url, depth};
	for (const auto &strategy : strategies_) {
		std::vector<Candidate> found;
		try {
			found = strategy.fn(page);
		} catch (const std::exception &e) {
			spdlog::warn("Strategy {} failed on {}: {}", strategy.name, page_url, e.what());
			continue;
		}
		spdlog::debug("Strategy {} found {} candidates on {}", strategy.name, found.size(), page_url);
		all.insert(all.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
	}
	return all;
}

} // namespace duckdb
