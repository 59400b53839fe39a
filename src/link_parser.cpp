#include "link_parser.hpp"
#include <algorithm>
#include <cctype>
#include <set>

namespace duckdb {

// Helper: Convert string to lowercase
static std::string ToLower(const std::string &str) {
	std::string result = str;
	std::transform(result.begin(), result.end(), result.begin(),
	               [](unsigned char c) { return std::tolower(c); });
	return result;
}

// Helper: Trim whitespace
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

// Helper: href starts with "scheme:" (RFC 3986 scheme characters)
static bool HasScheme(const std::string &href) {
	if (href.empty() || !std::isalpha(static_cast<unsigned char>(href[0]))) {
		return false;
	}
	for (size_t i = 1; i < href.length(); i++) {
		unsigned char c = static_cast<unsigned char>(href[i]);
		if (c == ':') {
			return true;
		}
		if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
			return false;
		}
	}
	return false;
}

// Helper: Normalize path (resolve . and ..)
static std::string NormalizePath(const std::string &path) {
	std::vector<std::string> segments;
	size_t pos = 0;

	while (pos < path.length()) {
		size_t next = path.find('/', pos);
		if (next == std::string::npos) {
			next = path.length();
		}

		std::string segment = path.substr(pos, next - pos);

		if (segment == "..") {
			if (!segments.empty()) {
				segments.pop_back();
			}
		} else if (segment != "." && !segment.empty()) {
			segments.push_back(segment);
		}

		pos = next + 1;
	}

	std::string result = "/";
	for (size_t i = 0; i < segments.size(); i++) {
		result += segments[i];
		if (i < segments.size() - 1) {
			result += "/";
		}
	}

	// Preserve trailing slash if original had one
	if (path.length() > 1 && path.back() == '/' && result.back() != '/') {
		result += "/";
	}

	return result;
}

ParsedUrl LinkParser::Parse(const std::string &url) {
	ParsedUrl parsed;
	size_t proto_end = url.find("://");
	if (proto_end == std::string::npos || proto_end == 0) {
		return parsed;
	}
	parsed.scheme = ToLower(url.substr(0, proto_end));
	if (parsed.scheme != "http" && parsed.scheme != "https") {
		return parsed;
	}

	size_t authority_start = proto_end + 3;
	size_t authority_end = url.find_first_of("/?#", authority_start);
	if (authority_end == std::string::npos) {
		authority_end = url.length();
	}
	std::string authority = url.substr(authority_start, authority_end - authority_start);

	// Drop userinfo
	size_t at_pos = authority.rfind('@');
	if (at_pos != std::string::npos) {
		authority = authority.substr(at_pos + 1);
	}

	// Port (IPv6 literals keep their brackets)
	size_t port_pos = authority.rfind(':');
	size_t bracket = authority.rfind(']');
	if (port_pos != std::string::npos && (bracket == std::string::npos || port_pos > bracket)) {
		parsed.port = authority.substr(port_pos + 1);
		authority = authority.substr(0, port_pos);
		if (!std::all_of(parsed.port.begin(), parsed.port.end(),
		                 [](unsigned char c) { return std::isdigit(c); })) {
			return parsed;
		}
	}
	parsed.host = ToLower(authority);
	while (!parsed.host.empty() && parsed.host.back() == '.') {
		parsed.host.pop_back();
	}
	if (parsed.host.empty()) {
		return parsed;
	}

	std::string rest = url.substr(authority_end);
	size_t frag_pos = rest.find('#');
	if (frag_pos != std::string::npos) {
		parsed.fragment = rest.substr(frag_pos + 1);
		rest = rest.substr(0, frag_pos);
	}
	size_t query_pos = rest.find('?');
	if (query_pos != std::string::npos) {
		parsed.query = rest.substr(query_pos + 1);
		rest = rest.substr(0, query_pos);
	}
	parsed.path = rest.empty() ? "/" : rest;
	parsed.valid = true;
	return parsed;
}

std::string LinkParser::NormalizeUrl(const std::string &url) {
	ParsedUrl parsed = Parse(Trim(url));
	if (!parsed.valid) {
		return "";
	}
	std::string result = parsed.scheme + "://" + parsed.host;
	bool default_port = parsed.port.empty() ||
	                    (parsed.scheme == "http" && parsed.port == "80") ||
	                    (parsed.scheme == "https" && parsed.port == "443");
	if (!default_port) {
		result += ":" + parsed.port;
	}
	result += parsed.path;
	if (!parsed.query.empty()) {
		result += "?" + parsed.query;
	}
	return result;
}

std::string LinkParser::ExtractDomain(const std::string &url) {
	return Parse(url).host;
}

std::string LinkParser::ExtractPath(const std::string &url) {
	ParsedUrl parsed = Parse(url);
	return parsed.valid ? parsed.path : "/";
}

std::string LinkParser::ExtractFilename(const std::string &url) {
	std::string path = ExtractPath(url);
	while (!path.empty() && path.back() == '/') {
		path.pop_back();
	}
	size_t slash = path.rfind('/');
	return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string LinkParser::ResolveUrl(const std::string &base_url, const std::string &href) {
	if (href.empty()) {
		return "";
	}

	std::string trimmed_href = Trim(href);
	if (trimmed_href.empty()) {
		return "";
	}

	// Already absolute: a scheme before the first '/', '?' or '#'
	if (HasScheme(trimmed_href)) {
		return trimmed_href;
	}

	// Protocol-relative (//example.com/path)
	if (trimmed_href.length() >= 2 && trimmed_href[0] == '/' && trimmed_href[1] == '/') {
		size_t proto_end = base_url.find("://");
		if (proto_end != std::string::npos) {
			return base_url.substr(0, proto_end + 1) + trimmed_href;
		}
		return "https:" + trimmed_href;
	}

	// Extract base components
	size_t proto_end = base_url.find("://");
	if (proto_end == std::string::npos) {
		return "";
	}

	size_t domain_start = proto_end + 3;
	size_t path_start = base_url.find_first_of("/?#", domain_start);

	std::string base_origin = (path_start != std::string::npos)
	    ? base_url.substr(0, path_start)
	    : base_url;

	// Absolute path (/path)
	if (trimmed_href[0] == '/') {
		return base_origin + trimmed_href;
	}

	std::string base_path = (path_start != std::string::npos && base_url[path_start] == '/')
	    ? base_url.substr(path_start)
	    : "/";

	// Remove query string and fragment from base path
	size_t query_pos = base_path.find('?');
	if (query_pos != std::string::npos) {
		base_path = base_path.substr(0, query_pos);
	}
	size_t frag_pos = base_path.find('#');
	if (frag_pos != std::string::npos) {
		base_path = base_path.substr(0, frag_pos);
	}

	// Query only (?a=b)
	if (trimmed_href[0] == '?') {
		return base_origin + base_path + trimmed_href;
	}

	// Remove filename from base path (keep directory)
	size_t last_slash = base_path.rfind('/');
	if (last_slash != std::string::npos) {
		base_path = base_path.substr(0, last_slash + 1);
	}

	// Keep the query of the href out of path normalization
	std::string href_path = trimmed_href;
	std::string href_suffix;
	size_t suffix_pos = href_path.find_first_of("?#");
	if (suffix_pos != std::string::npos) {
		href_suffix = href_path.substr(suffix_pos);
		href_path = href_path.substr(0, suffix_pos);
	}

	std::string combined_path = base_path + href_path;
	return base_origin + NormalizePath(combined_path) + href_suffix;
}

std::string LinkParser::ExtractAttribute(const std::string &tag, const std::string &attr) {
	std::string wanted = ToLower(attr);
	size_t len = tag.length();
	auto is_space = [&](size_t i) { return std::isspace(static_cast<unsigned char>(tag[i])) != 0; };

	// Skip '<' and the tag name
	size_t pos = (len > 0 && tag[0] == '<') ? 1 : 0;
	while (pos < len && !is_space(pos) && tag[pos] != '>') {
		pos++;
	}

	// Walk attribute by attribute so quoted values are never searched for names
	while (pos < len) {
		while (pos < len && (is_space(pos) || tag[pos] == '/')) {
			pos++;
		}
		if (pos >= len || tag[pos] == '>') {
			break;
		}

		size_t name_start = pos;
		while (pos < len && !is_space(pos) && tag[pos] != '=' && tag[pos] != '>' && tag[pos] != '/') {
			pos++;
		}
		if (pos == name_start) {
			// Stray '=' or similar
			pos++;
			continue;
		}
		std::string name = ToLower(tag.substr(name_start, pos - name_start));

		size_t eq_pos = pos;
		while (eq_pos < len && is_space(eq_pos)) {
			eq_pos++;
		}
		if (eq_pos >= len || tag[eq_pos] != '=') {
			// Attribute without a value
			continue;
		}
		pos = eq_pos + 1;
		while (pos < len && is_space(pos)) {
			pos++;
		}

		std::string value;
		if (pos < len && (tag[pos] == '"' || tag[pos] == '\'')) {
			char quote = tag[pos];
			size_t value_end = tag.find(quote, pos + 1);
			if (value_end == std::string::npos) {
				// Unterminated: the value runs to the end of the partial tag
				value = Trim(tag.substr(pos + 1));
				pos = len;
			} else {
				value = Trim(tag.substr(pos + 1, value_end - pos - 1));
				pos = value_end + 1;
			}
		} else {
			size_t value_start = pos;
			while (pos < len && !is_space(pos) && tag[pos] != '>') {
				pos++;
			}
			value = tag.substr(value_start, pos - value_start);
		}

		if (name == wanted) {
			return value;
		}
	}

	return "";
}

std::vector<TagMatch> LinkParser::FindTags(const std::string &html, const std::vector<std::string> &names) {
	std::vector<TagMatch> tags;
	std::set<std::string> wanted(names.begin(), names.end());

	size_t pos = 0;
	while (pos < html.length()) {
		size_t tag_start = html.find('<', pos);
		if (tag_start == std::string::npos || tag_start + 1 >= html.length()) {
			break;
		}

		// Read tag name
		size_t name_end = tag_start + 1;
		while (name_end < html.length() &&
		       (std::isalnum(static_cast<unsigned char>(html[name_end])) || html[name_end] == '-')) {
			name_end++;
		}
		if (name_end == tag_start + 1) {
			pos = tag_start + 1;
			continue;
		}
		std::string name = ToLower(html.substr(tag_start + 1, name_end - tag_start - 1));
		if (!wanted.empty() && wanted.find(name) == wanted.end()) {
			pos = name_end;
			continue;
		}

		// Find closing >, skipping over quoted attribute values
		size_t tag_end = name_end;
		char quote = 0;
		while (tag_end < html.length()) {
			char c = html[tag_end];
			if (quote) {
				if (c == quote) quote = 0;
			} else if (c == '"' || c == '\'') {
				quote = c;
			} else if (c == '>') {
				break;
			}
			tag_end++;
		}
		if (tag_end >= html.length() && quote) {
			// Stray quote: fall back to the first '>'
			tag_end = html.find('>', name_end);
			if (tag_end == std::string::npos) {
				tag_end = html.length();
			}
		}
		if (tag_end >= html.length()) {
			// Unterminated tag: keep what we have so partial markup still yields attributes
			tags.push_back({name, html.substr(tag_start), tag_start});
			break;
		}

		tags.push_back({name, html.substr(tag_start, tag_end - tag_start + 1), tag_start});
		pos = tag_end + 1;
	}

	return tags;
}

std::string LinkParser::UnescapeEmbeddedUrl(const std::string &value) {
	std::string result;
	result.reserve(value.size());
	for (size_t i = 0; i < value.size(); i++) {
		char c = value[i];
		if (c == '\\' && i + 1 < value.size()) {
			char next = value[i + 1];
			if (next == '/') {
				result += '/';
				i++;
				continue;
			}
			if (next == 'u' && i + 5 < value.size()) {
				std::string hex = value.substr(i + 2, 4);
				if (std::all_of(hex.begin(), hex.end(), [](unsigned char h) { return std::isxdigit(h); })) {
					unsigned long code = std::stoul(hex, nullptr, 16);
					if (code < 0x80) {
						result += static_cast<char>(code);
						i += 5;
						continue;
					}
				}
			}
		}
		if (c == '&') {
			if (value.compare(i, 5, "&amp;") == 0) {
				result += '&';
				i += 4;
				continue;
			}
			if (value.compare(i, 6, "&#038;") == 0) {
				result += '&';
				i += 5;
				continue;
			}
		}
		result += c;
	}
	return result;
}

} // namespace duckdb
