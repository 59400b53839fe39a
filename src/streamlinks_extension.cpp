#define DUCKDB_EXTENSION_MAIN

#include "streamlinks_extension.hpp"
#include "stream_links_function.hpp"
#include "extractor_config.hpp"
#include "http_client.hpp"
#include "duckdb.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/main/extension/extension_loader.hpp"
#include "duckdb/main/config.hpp"

#include <spdlog/spdlog.h>

#include <csignal>
#include <atomic>

namespace duckdb {

static std::atomic<uint64_t> g_interrupt_generation {0};

// Store previous signal handler to chain to it
static std::sig_atomic_t g_signal_handler_installed = 0;
static void (*g_previous_sigint_handler)(int) = SIG_DFL;

const std::atomic<uint64_t> *StreamlinksInterruptCounter() {
	return &g_interrupt_generation;
}

// Signal handler for graceful shutdown
static void StreamlinksSignalHandler(int signum) {
	if (signum == SIGINT) {
		// Abort in-flight transfers and retry sleeps
		g_interrupt_generation.fetch_add(1);
		// Call previous handler if it was set
		if (g_previous_sigint_handler != SIG_DFL && g_previous_sigint_handler != SIG_IGN) {
			g_previous_sigint_handler(signum);
		}
	}
}

static void LoadInternal(ExtensionLoader &loader) {
	auto &db = loader.GetDatabaseInstance();
	auto &config = DBConfig::GetConfig(db);

	InitializeHttpClient();
	spdlog::set_level(spdlog::level::warn);

	config.AddExtensionOption("streamlinks_allowed_domains",
	                          "Comma separated streaming sites accepted as episode pages (subdomains included)",
	                          LogicalType::VARCHAR,
	                          Value(DEFAULT_ALLOWED_DOMAINS));

	config.AddExtensionOption("streamlinks_user_agent",
	                          "User agent string for page fetches and link probes",
	                          LogicalType::VARCHAR,
	                          Value(DEFAULT_BROWSER_USER_AGENT));

	config.AddExtensionOption("streamlinks_fetch_timeout_ms",
	                          "Timeout for one page fetch in milliseconds, retries included",
	                          LogicalType::BIGINT,
	                          Value::BIGINT(30000));

	config.AddExtensionOption("streamlinks_extraction_timeout_ms",
	                          "Overall budget of one stream_links call in milliseconds",
	                          LogicalType::BIGINT,
	                          Value::BIGINT(60000));

	config.AddExtensionOption("streamlinks_max_iframe_depth",
	                          "Deepest iframe level that is fetched (the episode page is level 0)",
	                          LogicalType::INTEGER,
	                          Value::INTEGER(2));

	config.AddExtensionOption("streamlinks_max_iframe_fetches",
	                          "Maximum concurrent iframe fetches and link probes",
	                          LogicalType::INTEGER,
	                          Value::INTEGER(5));

	config.AddExtensionOption("streamlinks_validate_links",
	                          "Probe each link with HEAD (or a 1 KiB ranged GET) before returning it",
	                          LogicalType::BOOLEAN,
	                          Value::BOOLEAN(true));

	config.AddExtensionOption("streamlinks_validation_timeout_ms",
	                          "Timeout of one link probe in milliseconds",
	                          LogicalType::BIGINT,
	                          Value::BIGINT(5000));

	config.AddExtensionOption("streamlinks_rate_limit_requests",
	                          "Extractions allowed per requester in one rate limit window",
	                          LogicalType::INTEGER,
	                          Value::INTEGER(5));

	config.AddExtensionOption("streamlinks_rate_limit_window_s",
	                          "Rate limit window length in seconds",
	                          LogicalType::INTEGER,
	                          Value::INTEGER(60));

	config.AddExtensionOption("streamlinks_max_links",
	                          "Maximum links returned per call (0 = unlimited)",
	                          LogicalType::INTEGER,
	                          Value::INTEGER(10));

	config.AddExtensionOption("streamlinks_log_level",
	                          "Log level: trace, debug, info, warn, error, critical or off",
	                          LogicalType::VARCHAR,
	                          Value("warn"));

	// Register stream_links() and stream_links_rate_limit() table functions
	RegisterStreamLinksFunction(loader);

	// Register stream_format() and stream_quality() scalar functions
	RegisterStreamScalarFunctions(loader);

	// Install signal handler for graceful shutdown (only once)
	if (!g_signal_handler_installed) {
		g_previous_sigint_handler = std::signal(SIGINT, StreamlinksSignalHandler);
		g_signal_handler_installed = 1;
	}
}

void StreamlinksExtension::Load(ExtensionLoader &loader) {
	LoadInternal(loader);
}

std::string StreamlinksExtension::Name() {
	return "streamlinks";
}

std::string StreamlinksExtension::Version() const {
#ifdef EXT_VERSION_STREAMLINKS
	return EXT_VERSION_STREAMLINKS;
#else
	return "";
#endif
}

} // namespace duckdb

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(streamlinks, loader) {
	duckdb::LoadInternal(loader);
}

}
