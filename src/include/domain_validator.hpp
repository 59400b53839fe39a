#pragma once

#include "stream_types.hpp"

#include <string>
#include <vector>

namespace duckdb {

struct UrlValidationResult {
	std::string normalized_url;
	std::string host;
	UrlErrorType error = UrlErrorType::NONE;
	std::string message;

	bool IsValid() const {
		return error == UrlErrorType::NONE;
	}
};

// Checks episode page URLs against the configured site allow-list
class DomainValidator {
public:
	static constexpr size_t MIN_URL_LENGTH = 10;
	static constexpr size_t MAX_URL_LENGTH = 2000;

	explicit DomainValidator(std::vector<std::string> allowed_domains, int min_path_segments = 1);

	// Rejects malformed URLs, hosts outside the allow-list and site roots
	UrlValidationResult Validate(const std::string &url) const;

	// Host of url is an allow-listed domain or one of its subdomains
	bool IsAllowedHost(const std::string &url) const;

	// Syntactic checks only: absolute http(s), sane length, public host.
	// The normalized URL drops script hook parameters such as callback or onload.
	static UrlValidationResult CheckSyntax(const std::string &url);

private:
	std::vector<std::string> allowed_domains_;
	int min_path_segments_;
};

} // namespace duckdb
