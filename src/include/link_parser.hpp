#pragma once

#include <string>
#include <vector>

namespace duckdb {

struct ParsedUrl {
	std::string scheme;    // lowercase
	std::string host;      // lowercase, no port
	std::string port;      // empty if absent
	std::string path;      // "/" if absent
	std::string query;     // without '?'
	std::string fragment;  // without '#'
	bool valid = false;
};

// Raw start tag found in markup, e.g. <source src="..." type="...">
struct TagMatch {
	std::string name;  // lowercase tag name
	std::string text;  // full tag text from '<' to '>'
	size_t offset = 0;
};

class LinkParser {
public:
	// Split an absolute http(s) URL into its components
	static ParsedUrl Parse(const std::string &url);

	// Canonical form used for dedup and cycle detection: lowercase scheme/host,
	// default port and fragment dropped, empty path -> "/"
	static std::string NormalizeUrl(const std::string &url);

	// Resolve relative URL to absolute
	static std::string ResolveUrl(const std::string &base_url, const std::string &href);

	// Extract domain from URL (lowercase, without port)
	static std::string ExtractDomain(const std::string &url);

	// Extract path from URL (without query string and fragment)
	static std::string ExtractPath(const std::string &url);

	// Last non-empty path segment ("video.mp4" for /a/b/video.mp4)
	static std::string ExtractFilename(const std::string &url);

	// Find attribute value in a raw tag (handles ", ' and unquoted values)
	static std::string ExtractAttribute(const std::string &tag, const std::string &attr);

	// All start tags with one of the given (lowercase) names, or every start tag
	// when names is empty. Scanned textually so broken markup still yields matches
	static std::vector<TagMatch> FindTags(const std::string &html, const std::vector<std::string> &names);

	// Undo the escapes commonly found in URLs embedded in HTML/JS: &amp; \/ &
	static std::string UnescapeEmbeddedUrl(const std::string &value);
};

} // namespace duckdb
