#pragma once

#include <yyjson.h>

#include <string>

namespace duckdb {

// Owns a yyjson document parsed from script text; comments and trailing
// commas are accepted
class ScriptJson {
public:
	static constexpr yyjson_read_flag READ_FLAGS = YYJSON_READ_ALLOW_TRAILING_COMMAS | YYJSON_READ_ALLOW_COMMENTS;

	explicit ScriptJson(const std::string &text)
	    : doc_(text.empty() ? nullptr : yyjson_read(text.c_str(), text.size(), READ_FLAGS)) {
	}
	~ScriptJson() {
		if (doc_) {
			yyjson_doc_free(doc_);
		}
	}

	ScriptJson(const ScriptJson &) = delete;
	ScriptJson &operator=(const ScriptJson &) = delete;

	bool Valid() const {
		return doc_ != nullptr;
	}
	// nullptr when the text did not parse
	yyjson_val *Root() const {
		return doc_ ? yyjson_doc_get_root(doc_) : nullptr;
	}

private:
	yyjson_doc *doc_;
};

} // namespace duckdb
