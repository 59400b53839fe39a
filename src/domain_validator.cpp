#include "domain_validator.hpp"
#include "link_parser.hpp"
#include "stream_utils.hpp"

#include <algorithm>
#include <cctype>

namespace duckdb {

constexpr size_t DomainValidator::MIN_URL_LENGTH;
constexpr size_t DomainValidator::MAX_URL_LENGTH;

static int CountPathSegments(const std::string &path) {
	int count = 0;
	size_t pos = 0;
	while (pos < path.size()) {
		size_t next = path.find('/', pos);
		if (next == std::string::npos) {
			next = path.size();
		}
		if (next > pos) {
			count++;
		}
		pos = next + 1;
	}
	return count;
}

// Query keys a page could use to inject script into a player callback
static const char *const UNSAFE_QUERY_KEYS[] = {"callback", "jsonp",   "eval",    "exec",      "script",
                                                 "onload",   "onerror", "onclick", "javascript"};

static bool IsUnsafeQueryKey(const std::string &param) {
	std::string key = param.substr(0, param.find('='));
	std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return std::tolower(c); });
	for (auto unsafe : UNSAFE_QUERY_KEYS) {
		if (key == unsafe) {
			return true;
		}
	}
	return false;
}

static std::string StripUnsafeQueryParams(const std::string &url) {
	size_t query_pos = url.find('?');
	if (query_pos == std::string::npos) {
		return url;
	}
	std::string query = url.substr(query_pos + 1);
	std::string kept;
	size_t pos = 0;
	while (pos <= query.size()) {
		size_t amp = query.find('&', pos);
		if (amp == std::string::npos) {
			amp = query.size();
		}
		std::string param = query.substr(pos, amp - pos);
		if (!param.empty() && !IsUnsafeQueryKey(param)) {
			if (!kept.empty()) {
				kept += '&';
			}
			kept += param;
		}
		pos = amp + 1;
	}
	std::string result = url.substr(0, query_pos);
	if (!kept.empty()) {
		result += "?" + kept;
	}
	return result;
}

static UrlValidationResult Reject(UrlErrorType type, std::string message) {
	UrlValidationResult result;
	result.error = type;
	result.message = std::move(message);
	return result;
}

DomainValidator::DomainValidator(std::vector<std::string> allowed_domains, int min_path_segments)
    : allowed_domains_(std::move(allowed_domains)), min_path_segments_(min_path_segments) {
}

UrlValidationResult DomainValidator::CheckSyntax(const std::string &url) {
	std::string trimmed = url;
	while (!trimmed.empty() && std::isspace(static_cast<unsigned char>(trimmed.back()))) trimmed.pop_back();
	while (!trimmed.empty() && std::isspace(static_cast<unsigned char>(trimmed.front()))) trimmed.erase(trimmed.begin());

	if (trimmed.size() < MIN_URL_LENGTH || trimmed.size() > MAX_URL_LENGTH) {
		return Reject(UrlErrorType::MALFORMED_URL, "URL length out of range");
	}
	for (char c : trimmed) {
		unsigned char uc = static_cast<unsigned char>(c);
		if (std::iscntrl(uc) || std::isspace(uc) || c == '<' || c == '>' || c == '"') {
			return Reject(UrlErrorType::MALFORMED_URL, "URL contains illegal characters");
		}
	}

	ParsedUrl parsed = LinkParser::Parse(trimmed);
	if (!parsed.valid) {
		return Reject(UrlErrorType::MALFORMED_URL, "URL must be an absolute http(s) URL with a host");
	}
	if (parsed.host.find('.') == std::string::npos && parsed.host.front() != '[') {
		return Reject(UrlErrorType::MALFORMED_URL, "URL host is not a domain name: " + parsed.host);
	}
	if (IsPrivateOrLocalHost(parsed.host)) {
		return Reject(UrlErrorType::MALFORMED_URL, "URL points to a local or private address: " + parsed.host);
	}

	UrlValidationResult result;
	result.normalized_url = StripUnsafeQueryParams(LinkParser::NormalizeUrl(trimmed));
	result.host = parsed.host;
	return result;
}

UrlValidationResult DomainValidator::Validate(const std::string &url) const {
	UrlValidationResult result = CheckSyntax(url);
	if (!result.IsValid()) {
		return result;
	}

	bool allowed = std::any_of(allowed_domains_.begin(), allowed_domains_.end(),
	                           [&](const std::string &domain) { return HostMatchesDomain(result.host, domain); });
	if (!allowed) {
		return Reject(UrlErrorType::UNSUPPORTED_DOMAIN, "Unsupported site: " + result.host);
	}

	if (CountPathSegments(LinkParser::ExtractPath(result.normalized_url)) < min_path_segments_) {
		return Reject(UrlErrorType::HOMEPAGE_NOT_ALLOWED,
		              "Send the link of an episode page, not the site homepage");
	}

	return result;
}

bool DomainValidator::IsAllowedHost(const std::string &url) const {
	std::string host = LinkParser::ExtractDomain(url);
	if (host.empty()) {
		return false;
	}
	return std::any_of(allowed_domains_.begin(), allowed_domains_.end(),
	                   [&](const std::string &domain) { return HostMatchesDomain(host, domain); });
}

} // namespace duckdb
