#include "extractor_config.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace duckdb {

std::vector<std::string> ParseDomainList(const std::string &list) {
	std::vector<std::string> domains;
	std::istringstream stream(list);
	std::string item;
	while (std::getline(stream, item, ',')) {
		while (!item.empty() && std::isspace(static_cast<unsigned char>(item.back()))) item.pop_back();
		while (!item.empty() && std::isspace(static_cast<unsigned char>(item.front()))) item.erase(item.begin());
		std::transform(item.begin(), item.end(), item.begin(),
		               [](unsigned char c) { return std::tolower(c); });
		if (item.compare(0, 4, "www.") == 0) {
			item = item.substr(4);
		}
		while (!item.empty() && item.back() == '.') item.pop_back();
		if (item.empty()) {
			continue;
		}
		if (std::find(domains.begin(), domains.end(), item) == domains.end()) {
			domains.push_back(item);
		}
	}
	return domains;
}

ExtractorConfig DefaultExtractorConfig() {
	ExtractorConfig config;
	config.allowed_domains = ParseDomainList(DEFAULT_ALLOWED_DOMAINS);
	return config;
}

} // namespace duckdb
