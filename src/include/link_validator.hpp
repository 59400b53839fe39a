#pragma once

#include "http_client.hpp"
#include "stream_types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace duckdb {

class CancellationToken;

// Reachability probe for classified links: HEAD, or a 1 KiB ranged GET when
// the server refuses HEAD. A failed probe only leaves validated = false.
class LinkValidator {
public:
	LinkValidator(std::shared_ptr<HttpTransport> transport, std::string user_agent, int64_t timeout_ms,
	              int max_concurrent = 5);

	StreamLink Validate(const StreamLink &link, const CancellationToken *cancel = nullptr) const;

	// Probe every link in batches of max_concurrent. Links left unprobed when
	// the token stops are kept unvalidated; returns false in that case.
	bool ValidateAll(std::vector<StreamLink> &links, const CancellationToken *cancel = nullptr) const;

private:
	std::shared_ptr<HttpTransport> transport_;
	std::string user_agent_;
	int64_t timeout_ms_;
	int max_concurrent_;
};

} // namespace duckdb
