#include "script_scanner.hpp"
#include "script_json.hpp"
#include <libxml/HTMLparser.h>
#include <libxml/tree.h>

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace duckdb {

// RAII wrapper for xmlDoc
class ScriptDocGuard {
public:
	explicit ScriptDocGuard(xmlDocPtr doc) : doc_(doc) {}
	~ScriptDocGuard() {
		if (doc_) {
			xmlFreeDoc(doc_);
		}
	}
	ScriptDocGuard(const ScriptDocGuard &) = delete;
	ScriptDocGuard &operator=(const ScriptDocGuard &) = delete;

	xmlDocPtr get() const { return doc_; }
	operator bool() const { return doc_ != nullptr; }
private:
	xmlDocPtr doc_;
};

static std::string ToLower(const std::string &str) {
	std::string result = str;
	std::transform(result.begin(), result.end(), result.begin(),
	               [](unsigned char c) { return std::tolower(c); });
	return result;
}

// Templates and styles never carry player data
static bool IsScannableScriptType(const std::string &type) {
	if (type.empty()) {
		return true;
	}
	std::string lower = ToLower(type);
	return lower.find("template") == std::string::npos && lower.find("html") == std::string::npos &&
	       lower.find("css") == std::string::npos;
}

static void CollectScriptNodes(xmlNodePtr node, std::vector<std::string> &scripts) {
	for (xmlNodePtr cur = node; cur; cur = cur->next) {
		if (cur->type != XML_ELEMENT_NODE) {
			continue;
		}
		if (xmlStrcasecmp(cur->name, BAD_CAST "script") == 0) {
			std::string type_str;
			xmlChar *type = xmlGetProp(cur, BAD_CAST "type");
			if (type) {
				type_str = reinterpret_cast<char *>(type);
				xmlFree(type);
			}
			if (IsScannableScriptType(type_str)) {
				xmlChar *content = xmlNodeGetContent(cur);
				if (content) {
					std::string script_content(reinterpret_cast<char *>(content));
					xmlFree(content);
					if (!script_content.empty()) {
						scripts.push_back(std::move(script_content));
					}
				}
			}
		}
		if (cur->children) {
			CollectScriptNodes(cur->children, scripts);
		}
	}
}

// Textual <script>...</script> scan for markup libxml2 could not make sense of
static std::vector<std::string> CollectScriptsTextually(const std::string &html) {
	std::vector<std::string> scripts;
	std::string lower = ToLower(html);
	size_t pos = 0;
	while (pos < lower.size()) {
		size_t open = lower.find("<script", pos);
		if (open == std::string::npos) {
			break;
		}
		size_t open_end = lower.find('>', open);
		if (open_end == std::string::npos) {
			break;
		}
		size_t close = lower.find("</script", open_end + 1);
		size_t content_end = (close == std::string::npos) ? html.size() : close;
		std::string content = html.substr(open_end + 1, content_end - open_end - 1);
		if (!content.empty()) {
			scripts.push_back(std::move(content));
		}
		if (close == std::string::npos) {
			break;
		}
		pos = close + 8;
	}
	return scripts;
}

std::vector<std::string> CollectInlineScripts(const std::string &html) {
	std::vector<std::string> scripts;
	if (html.empty()) {
		return scripts;
	}

	// Parse HTML with libxml2
	ScriptDocGuard doc(htmlReadMemory(
		html.c_str(),
		static_cast<int>(html.size()),
		nullptr,
		"UTF-8",
		HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET
	));

	if (doc) {
		xmlNodePtr root = xmlDocGetRootElement(doc.get());
		if (root) {
			CollectScriptNodes(root, scripts);
		}
	}

	if (scripts.empty()) {
		scripts = CollectScriptsTextually(html);
	}
	return scripts;
}

std::string StripScriptComments(const std::string &script) {
	std::string result;
	result.reserve(script.size());

	size_t i = 0;
	while (i < script.size()) {
		// Check for string start
		if (script[i] == '"' || script[i] == '\'' || script[i] == '`') {
			char quote = script[i];
			result += script[i++];

			// Copy string content, handling escapes
			while (i < script.size()) {
				if (script[i] == '\\' && i + 1 < script.size()) {
					result += script[i++];
					result += script[i++];
				} else if (script[i] == quote) {
					result += script[i++];
					break;
				} else if (script[i] == '\n' && quote != '`') {
					// Unterminated literal (likely a regex or a stray quote)
					break;
				} else {
					result += script[i++];
				}
			}
			continue;
		}

		// Check for single-line comment; "://" inside bare text is not a comment
		if (i + 1 < script.size() && script[i] == '/' && script[i + 1] == '/' &&
		    (i == 0 || script[i - 1] != ':')) {
			// Skip until end of line
			while (i < script.size() && script[i] != '\n') {
				i++;
			}
			// Keep the newline for statement boundary detection
			if (i < script.size()) {
				result += '\n';
				i++;
			}
			continue;
		}

		// Check for multi-line comment
		if (i + 1 < script.size() && script[i] == '/' && script[i + 1] == '*') {
			i += 2;
			// Skip until */
			while (i + 1 < script.size() && !(script[i] == '*' && script[i + 1] == '/')) {
				i++;
			}
			i = std::min(i + 2, script.size());
			// Add space to preserve token boundaries
			result += ' ';
			continue;
		}

		result += script[i++];
	}

	return result;
}

std::string ExtractJsonValue(const std::string &content, size_t start_pos) {
	if (start_pos >= content.size()) {
		return "";
	}

	// Skip whitespace
	while (start_pos < content.size() && std::isspace(static_cast<unsigned char>(content[start_pos]))) {
		start_pos++;
	}

	if (start_pos >= content.size()) {
		return "";
	}

	char first_char = content[start_pos];

	// Only extract objects and arrays (not primitives)
	if (first_char != '{' && first_char != '[') {
		return "";
	}

	int depth = 1;
	bool in_string = false;
	bool escape_next = false;

	for (size_t i = start_pos + 1; i < content.size() && depth > 0; i++) {
		char c = content[i];

		if (escape_next) {
			escape_next = false;
			continue;
		}

		if (c == '\\' && in_string) {
			escape_next = true;
			continue;
		}

		if (c == '"') {
			in_string = !in_string;
			continue;
		}

		if (!in_string) {
			if (c == '{' || c == '[') {
				depth++;
			} else if (c == '}' || c == ']') {
				depth--;
				if (depth == 0) {
					std::string json = content.substr(start_pos, i - start_pos + 1);
					// Validate with yyjson
					return ScriptJson(json).Valid() ? json : "";
				}
			}
		}
	}

	return "";
}

// Check if character is valid for JS identifier
static bool IsIdentifierChar(char c) {
	return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

std::vector<std::string> ExtractJsonValues(const std::string &raw_script) {
	std::vector<std::string> values;
	// Strip comments first to avoid false positives from commented-out code
	std::string script = StripScriptComments(raw_script);

	for (size_t pos = 0; pos < script.size(); pos++) {
		char c = script[pos];
		size_t value_pos = std::string::npos;

		if (c == '=' && (pos + 1 >= script.size() || script[pos + 1] != '=') &&
		    (pos == 0 || (script[pos - 1] != '=' && script[pos - 1] != '!' &&
		                  script[pos - 1] != '<' && script[pos - 1] != '>'))) {
			// Assignment: require an identifier (or member expression) on the left
			size_t left = pos;
			while (left > 0 && std::isspace(static_cast<unsigned char>(script[left - 1]))) {
				left--;
			}
			if (left > 0 && (IsIdentifierChar(script[left - 1]) || script[left - 1] == ']')) {
				value_pos = pos + 1;
			}
		} else if (c == '(') {
			// Call with an object literal argument: setup({...}), new DPlayer({...})
			value_pos = pos + 1;
		} else if (c == ',') {
			// Second argument: new Plyr('#player', {...}), flowplayer('#p', {...})
			value_pos = pos + 1;
		}

		if (value_pos == std::string::npos) {
			continue;
		}
		size_t probe = value_pos;
		while (probe < script.size() && std::isspace(static_cast<unsigned char>(script[probe]))) {
			probe++;
		}
		if (probe >= script.size() || (script[probe] != '{' && script[probe] != '[')) {
			continue;
		}

		std::string json_value = ExtractJsonValue(script, probe);
		if (!json_value.empty()) {
			values.push_back(json_value);
			// Continue after the value; nested structures are walked later
			pos = probe + json_value.size() - 1;
		}
	}

	return values;
}

static std::string HintFromValue(yyjson_val *val) {
	if (!val) {
		return "";
	}
	if (yyjson_is_str(val)) {
		return yyjson_get_str(val);
	}
	if (yyjson_is_int(val)) {
		// Bare heights such as "res": 720
		return std::to_string(yyjson_get_int(val)) + "p";
	}
	return "";
}

static std::string FindSiblingHint(yyjson_val *obj) {
	static const char *hint_keys[] = {"label", "quality", "res", "resolution", "height"};
	for (const char *key : hint_keys) {
		std::string hint = HintFromValue(yyjson_obj_get(obj, key));
		if (!hint.empty()) {
			return hint;
		}
	}
	return "";
}

static void WalkJson(yyjson_val *val, const std::function<bool(const std::string &)> &accept,
                     std::vector<JsonUrlHit> &hits, int depth) {
	// Depth guard against adversarial nesting
	if (!val || depth > 64) {
		return;
	}
	if (yyjson_is_obj(val)) {
		std::string hint = FindSiblingHint(val);
		yyjson_obj_iter iter;
		yyjson_obj_iter_init(val, &iter);
		yyjson_val *key;
		while ((key = yyjson_obj_iter_next(&iter))) {
			yyjson_val *child = yyjson_obj_iter_get_val(key);
			if (yyjson_is_str(child)) {
				std::string value = yyjson_get_str(child);
				if (accept(value)) {
					hits.push_back({value, hint});
				}
			} else {
				WalkJson(child, accept, hits, depth + 1);
			}
		}
	} else if (yyjson_is_arr(val)) {
		size_t size = yyjson_arr_size(val);
		for (size_t i = 0; i < size; i++) {
			yyjson_val *child = yyjson_arr_get(val, i);
			if (yyjson_is_str(child)) {
				std::string value = yyjson_get_str(child);
				if (accept(value)) {
					hits.push_back({value, ""});
				}
			} else {
				WalkJson(child, accept, hits, depth + 1);
			}
		}
	}
}

std::vector<JsonUrlHit> FindUrlsInJson(const std::string &json,
                                       const std::function<bool(const std::string &)> &accept) {
	std::vector<JsonUrlHit> hits;
	ScriptJson doc(json);
	if (!doc.Valid()) {
		return hits;
	}
	WalkJson(doc.Root(), accept, hits, 0);
	return hits;
}

std::vector<std::string> ExtractStringLiterals(const std::string &script) {
	std::vector<std::string> literals;
	size_t i = 0;
	while (i < script.size()) {
		char c = script[i];
		if (c != '"' && c != '\'' && c != '`') {
			i++;
			continue;
		}
		char quote = c;
		std::string literal;
		size_t j = i + 1;
		bool closed = false;
		while (j < script.size()) {
			char d = script[j];
			if (d == '\\' && j + 1 < script.size()) {
				literal += d;
				literal += script[j + 1];
				j += 2;
				continue;
			}
			if (d == quote) {
				closed = true;
				break;
			}
			if (d == '\n' && quote != '`') {
				break;
			}
			literal += d;
			j++;
		}
		if (closed) {
			literals.push_back(std::move(literal));
			i = j + 1;
		} else {
			// Not a literal after all (apostrophe in text, regex); resync after the quote
			i++;
		}
	}
	return literals;
}

} // namespace duckdb
