#pragma once

#include <functional>
#include <string>
#include <vector>

namespace duckdb {

// String value found inside an embedded JSON structure
struct JsonUrlHit {
	std::string url;
	// Sibling "label" / "quality" / "res" / "resolution" of the same object, if any
	std::string quality_hint;
};

// Bodies of the inline <script> blocks of a page. Parsed with libxml2; falls
// back to a textual scan when the markup cannot be parsed.
std::vector<std::string> CollectInlineScripts(const std::string &html);

// Strip // and /* */ comments while preserving strings
std::string StripScriptComments(const std::string &script);

// JSON object/array starting at start_pos (after whitespace). Empty if the
// balanced text is not valid JSON.
std::string ExtractJsonValue(const std::string &content, size_t start_pos);

// JSON values of var/let/const/window.X assignments and of the first
// object argument of calls such as setup({...})
std::vector<std::string> ExtractJsonValues(const std::string &script);

// Walk a JSON document and return the string values accepted by the predicate
std::vector<JsonUrlHit> FindUrlsInJson(const std::string &json,
                                       const std::function<bool(const std::string &)> &accept);

// Contents of '...', "..." and `...` literals
std::vector<std::string> ExtractStringLiterals(const std::string &script);

} // namespace duckdb
