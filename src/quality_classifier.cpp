#include "quality_classifier.hpp"
#include "link_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace duckdb {

static std::string ToLower(const std::string &str) {
	std::string result = str;
	std::transform(result.begin(), result.end(), result.begin(),
	               [](unsigned char c) { return std::tolower(c); });
	return result;
}

static bool IsAlnum(char c) {
	return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

// token occurs in text delimited by non-alphanumerics (or the string bounds)
static bool ContainsToken(const std::string &text, const char *token) {
	std::string needle(token);
	size_t pos = 0;
	while ((pos = text.find(needle, pos)) != std::string::npos) {
		size_t end = pos + needle.size();
		bool left_ok = pos == 0 || !IsAlnum(text[pos - 1]);
		bool right_ok = end >= text.size() || !IsAlnum(text[end]);
		if (left_ok && right_ok) {
			return true;
		}
		pos = end;
	}
	return false;
}

// Resolution tokens such as "1080p" may also be glued to a word ("video1080p")
static bool ContainsResolution(const std::string &text, const char *token) {
	std::string needle(token);
	size_t pos = 0;
	while ((pos = text.find(needle, pos)) != std::string::npos) {
		size_t end = pos + needle.size();
		bool left_ok = pos == 0 || !std::isdigit(static_cast<unsigned char>(text[pos - 1]));
		bool right_ok = end >= text.size() || !IsAlnum(text[end]);
		if (left_ok && right_ok) {
			return true;
		}
		pos = end;
	}
	return false;
}

// Highest quality named in one piece of a URL (lowercased)
static StreamQuality ScanTokens(const std::string &text) {
	if (text.empty()) {
		return StreamQuality::UNKNOWN;
	}
	if (ContainsResolution(text, "2160p") || ContainsToken(text, "4k") || ContainsToken(text, "uhd")) {
		return StreamQuality::Q4K;
	}
	if (ContainsResolution(text, "1080p") || ContainsToken(text, "fhd") || ContainsToken(text, "fullhd")) {
		return StreamQuality::Q1080P;
	}
	if (ContainsResolution(text, "720p")) {
		return StreamQuality::Q720P;
	}
	if (ContainsResolution(text, "480p")) {
		return StreamQuality::Q480P;
	}
	if (ContainsResolution(text, "360p")) {
		return StreamQuality::Q360P;
	}
	return StreamQuality::UNKNOWN;
}

StreamFormat DetectFormat(const std::string &url) {
	std::string filename = ToLower(LinkParser::ExtractFilename(url));
	size_t dot = filename.rfind('.');
	if (dot != std::string::npos) {
		std::string ext = filename.substr(dot + 1);
		if (ext == "mp4" || ext == "m4v") {
			return StreamFormat::MP4;
		}
		if (ext == "m3u8") {
			return StreamFormat::M3U8;
		}
		if (ext == "mkv") {
			return StreamFormat::MKV;
		}
		if (ext == "avi") {
			return StreamFormat::AVI;
		}
		if (ext == "webm") {
			return StreamFormat::WEBM;
		}
	}
	std::string lower = ToLower(url);
	if (lower.find(".m3u8") != std::string::npos) {
		return StreamFormat::M3U8;
	}
	std::string path = ToLower(LinkParser::ExtractPath(url));
	if (path.find("/hls/") != std::string::npos) {
		return StreamFormat::M3U8;
	}
	return StreamFormat::UNKNOWN;
}

StreamQuality DetectQuality(const std::string &url) {
	ParsedUrl parsed = LinkParser::Parse(url);
	if (!parsed.valid) {
		return ScanTokens(ToLower(url));
	}
	std::string filename = ToLower(LinkParser::ExtractFilename(url));
	StreamQuality quality = ScanTokens(filename);
	if (quality != StreamQuality::UNKNOWN) {
		return quality;
	}
	quality = ScanTokens(ToLower(parsed.path));
	if (quality != StreamQuality::UNKNOWN) {
		return quality;
	}
	return ScanTokens(ToLower(parsed.query));
}

StreamQuality ParseQualityLabel(const std::string &label) {
	std::string lower = ToLower(label);
	StreamQuality quality = ScanTokens(lower);
	if (quality != StreamQuality::UNKNOWN) {
		return quality;
	}
	// Bare heights ("720", "HD 1080")
	for (size_t i = 0; i < lower.size();) {
		if (!std::isdigit(static_cast<unsigned char>(lower[i]))) {
			i++;
			continue;
		}
		size_t j = i;
		while (j < lower.size() && std::isdigit(static_cast<unsigned char>(lower[j]))) {
			j++;
		}
		long height = std::strtol(lower.substr(i, j - i).c_str(), nullptr, 10);
		switch (height) {
		case 2160:
			return StreamQuality::Q4K;
		case 1080:
			return StreamQuality::Q1080P;
		case 720:
			return StreamQuality::Q720P;
		case 480:
			return StreamQuality::Q480P;
		case 360:
			return StreamQuality::Q360P;
		default:
			break;
		}
		i = j;
	}
	return StreamQuality::UNKNOWN;
}

StreamLink QualityClassifier::Classify(const Candidate &candidate) {
	StreamLink link;
	link.url = candidate.raw_url;
	link.format = DetectFormat(candidate.raw_url);
	link.quality = DetectQuality(candidate.raw_url);
	if (link.quality == StreamQuality::UNKNOWN && !candidate.quality_hint.empty()) {
		link.quality = ParseQualityLabel(candidate.quality_hint);
	}
	link.quality_rank = QualityRank(link.quality);
	link.method = candidate.method;
	link.depth = candidate.depth;
	link.source_page_url = candidate.source_page_url;
	return link;
}

} // namespace duckdb
