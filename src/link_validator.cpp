#include "link_validator.hpp"
#include "cancellation.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>

namespace duckdb {

static constexpr const char *PROBE_RANGE = "0-1023";

LinkValidator::LinkValidator(std::shared_ptr<HttpTransport> transport, std::string user_agent, int64_t timeout_ms,
                             int max_concurrent)
    : transport_(std::move(transport)), user_agent_(std::move(user_agent)), timeout_ms_(timeout_ms),
      max_concurrent_(std::max(max_concurrent, 1)) {
}

StreamLink LinkValidator::Validate(const StreamLink &link, const CancellationToken *cancel) const {
	StreamLink result = link;
	result.validated = false;

	int64_t timeout = timeout_ms_;
	if (cancel) {
		if (cancel->ShouldStop()) {
			return result;
		}
		int64_t remaining = cancel->RemainingMs();
		if (remaining >= 0) {
			timeout = std::min(timeout, remaining);
		}
	}
	if (timeout <= 0) {
		return result;
	}

	HttpRequestOptions options;
	options.method = HttpMethod::HEAD;
	options.user_agent = user_agent_;
	options.timeout_ms = timeout;
	options.browser_headers = false;
	options.cancel = cancel;

	HttpResponse response = transport_->Execute(link.url, options);
	bool ranged = false;
	if (response.status_code == 405 || response.status_code == 501) {
		spdlog::debug("HEAD refused ({}) for {}, probing with ranged GET", response.status_code, link.url);
		options.method = HttpMethod::GET;
		options.range = PROBE_RANGE;
		options.max_body_bytes = 1024;
		response = transport_->Execute(link.url, options);
		ranged = true;
	}

	result.validated = !response.timed_out && !response.cancelled && response.status_code >= 200 &&
	                   response.status_code < 400;
	if (!response.content_type.empty()) {
		result.content_type = response.content_type;
	}
	if (ranged && response.range_total >= 0) {
		result.content_length = response.range_total;
	} else if (!ranged && response.content_length >= 0) {
		result.content_length = response.content_length;
	} else if (ranged && response.status_code == 200 && response.content_length >= 0) {
		// Server ignored the Range header and sent the whole entity
		result.content_length = response.content_length;
	}

	spdlog::debug("Probe {} -> status {} validated={}", link.url, response.status_code, result.validated);
	return result;
}

bool LinkValidator::ValidateAll(std::vector<StreamLink> &links, const CancellationToken *cancel) const {
	size_t idx = 0;
	while (idx < links.size()) {
		if (cancel && cancel->ShouldStop()) {
			spdlog::warn("Validation budget exhausted, {} links left unprobed", links.size() - idx);
			return false;
		}

		// Launch batch of probes
		std::vector<std::pair<size_t, std::future<StreamLink>>> futures;
		for (int i = 0; i < max_concurrent_ && idx < links.size(); i++, idx++) {
			futures.emplace_back(idx, std::async(std::launch::async, [this, &links, idx, cancel]() {
				                     return Validate(links[idx], cancel);
			                     }));
		}

		// Collect results from this batch
		for (auto &entry : futures) {
			try {
				links[entry.first] = entry.second.get();
			} catch (const std::exception &e) {
				spdlog::warn("Probe failed for {}: {}", links[entry.first].url, e.what());
			}
		}
	}
	return true;
}

} // namespace duckdb
