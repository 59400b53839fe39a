#pragma once

#include "duckdb.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {

// stream_links(url, ...) table function and stream_links_rate_limit(requester)
void RegisterStreamLinksFunction(ExtensionLoader &loader);

// stream_format(url) and stream_quality(url)
void RegisterStreamScalarFunctions(ExtensionLoader &loader);

} // namespace duckdb
