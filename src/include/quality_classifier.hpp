#pragma once

#include "stream_types.hpp"

#include <string>

namespace duckdb {

// Format from the last path segment extension; .m3u8 anywhere or an /hls/
// segment also mean M3U8
StreamFormat DetectFormat(const std::string &url);

// Quality token in the URL: filename first, then the rest of the path, then the query
StreamQuality DetectQuality(const std::string &url);

// Quality token in a free-form descriptor such as "1080p", "HD 720", "4K" or "720"
StreamQuality ParseQualityLabel(const std::string &label);

class QualityClassifier {
public:
	// The URL decides the quality; candidate.quality_hint is only used when the
	// URL carries no token
	static StreamLink Classify(const Candidate &candidate);
};

} // namespace duckdb
