#pragma once

#include "duckdb.hpp"
#include <atomic>
#include <cstdint>

namespace duckdb {

class StreamlinksExtension : public Extension {
public:
	void Load(ExtensionLoader &loader) override;
	std::string Name() override;
	std::string Version() const override;
};

// Bumped by the SIGINT handler; each extraction compares it against the
// value seen when it started
const std::atomic<uint64_t> *StreamlinksInterruptCounter();

} // namespace duckdb
