// stream_links() table function - ranked direct stream URLs of an episode page
//
// Usage:
//   SELECT url, quality, validated
//   FROM stream_links('https://phimmoi.net/phim/ten-phim/tap-1/', requester := 'user-42')
//
//   SELECT * FROM stream_links('https://...', validate := false, max_depth := 1, timeout := 20)
//
// Settings (SET streamlinks_... = ...) provide the defaults; named parameters
// override them for one call. Errors surface as exceptions:
//   - invalid URL, rate limit          -> InvalidInputException
//   - fetch failure, timeout, no links -> IOException

#include "stream_links_function.hpp"
#include "streamlinks_extension.hpp"
#include "stream_extractor.hpp"
#include "quality_classifier.hpp"
#include "rate_limiter_registry.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/common/vector_operations/unary_executor.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/function/table_function.hpp"
#include "duckdb/main/client_context.hpp"
#include "duckdb/main/database.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace duckdb {

//===--------------------------------------------------------------------===//
// Settings
//===--------------------------------------------------------------------===//

static ExtractorConfig ReadExtractorSettings(ClientContext &context) {
    ExtractorConfig config = DefaultExtractorConfig();

    Value setting_value;
    if (context.TryGetCurrentSetting("streamlinks_allowed_domains", setting_value) && !setting_value.IsNull()) {
        config.allowed_domains = ParseDomainList(setting_value.ToString());
    }
    if (context.TryGetCurrentSetting("streamlinks_user_agent", setting_value) && !setting_value.IsNull()) {
        config.user_agent = setting_value.ToString();
    }
    if (context.TryGetCurrentSetting("streamlinks_fetch_timeout_ms", setting_value)) {
        config.fetch_timeout_ms = setting_value.GetValue<int64_t>();
    }
    if (context.TryGetCurrentSetting("streamlinks_extraction_timeout_ms", setting_value)) {
        config.extraction_timeout_ms = setting_value.GetValue<int64_t>();
    }
    if (context.TryGetCurrentSetting("streamlinks_max_iframe_depth", setting_value)) {
        config.max_iframe_depth = setting_value.GetValue<int32_t>();
    }
    if (context.TryGetCurrentSetting("streamlinks_max_iframe_fetches", setting_value)) {
        config.max_concurrent_iframes = setting_value.GetValue<int32_t>();
    }
    if (context.TryGetCurrentSetting("streamlinks_validate_links", setting_value)) {
        config.validate_links = setting_value.GetValue<bool>();
    }
    if (context.TryGetCurrentSetting("streamlinks_validation_timeout_ms", setting_value)) {
        config.validation_timeout_ms = setting_value.GetValue<int64_t>();
    }
    if (context.TryGetCurrentSetting("streamlinks_rate_limit_requests", setting_value)) {
        config.rate_limit_requests = setting_value.GetValue<int32_t>();
    }
    if (context.TryGetCurrentSetting("streamlinks_rate_limit_window_s", setting_value)) {
        config.rate_limit_window_seconds = setting_value.GetValue<int32_t>();
    }
    if (context.TryGetCurrentSetting("streamlinks_max_links", setting_value)) {
        config.max_links = setting_value.GetValue<int32_t>();
    }
    if (context.TryGetCurrentSetting("streamlinks_log_level", setting_value) && !setting_value.IsNull()) {
        spdlog::set_level(spdlog::level::from_str(StringUtil::Lower(setting_value.ToString())));
    }

    if (config.allowed_domains.empty()) {
        throw InvalidInputException("streamlinks_allowed_domains must name at least one domain");
    }
    if (config.max_iframe_depth < 0 || config.max_concurrent_iframes < 1) {
        throw InvalidInputException("streamlinks_max_iframe_depth must be >= 0 and "
                                    "streamlinks_max_iframe_fetches >= 1");
    }
    if (config.fetch_timeout_ms <= 0 || config.extraction_timeout_ms <= 0 || config.validation_timeout_ms <= 0) {
        throw InvalidInputException("streamlinks timeouts must be positive");
    }
    if (config.rate_limit_window_seconds <= 0) {
        throw InvalidInputException("streamlinks_rate_limit_window_s must be positive");
    }
    return config;
}

//===--------------------------------------------------------------------===//
// Bind Data
//===--------------------------------------------------------------------===//

struct StreamLinksBindData : public TableFunctionData {
    string url;
    string requester = "duckdb";
    ExtractorConfig config;
};

//===--------------------------------------------------------------------===//
// Global State
//===--------------------------------------------------------------------===//

struct StreamLinksGlobalState : public GlobalTableFunctionState {
    vector<StreamLink> links;
    bool partial = false;
    idx_t result_idx = 0;
    bool extracted = false;
};

//===--------------------------------------------------------------------===//
// Bind Function
//===--------------------------------------------------------------------===//

static unique_ptr<FunctionData> StreamLinksBind(ClientContext &context, TableFunctionBindInput &input,
                                                vector<LogicalType> &return_types, vector<string> &names) {
    auto bind_data = make_uniq<StreamLinksBindData>();

    // Read extension settings as defaults
    bind_data->config = ReadExtractorSettings(context);

    if (input.inputs[0].IsNull()) {
        throw InvalidInputException("stream_links: URL must not be NULL");
    }
    bind_data->url = StringValue::Get(input.inputs[0]);

    // Named parameters
    for (auto &kv : input.named_parameters) {
        if (kv.second.IsNull()) {
            continue;
        }
        if (kv.first == "requester") {
            bind_data->requester = StringValue::Get(kv.second);
        } else if (kv.first == "validate") {
            bind_data->config.validate_links = kv.second.GetValue<bool>();
        } else if (kv.first == "max_depth") {
            bind_data->config.max_iframe_depth = kv.second.GetValue<int>();
            if (bind_data->config.max_iframe_depth < 0) bind_data->config.max_iframe_depth = 0;
        } else if (kv.first == "timeout") {
            int seconds = kv.second.GetValue<int>();
            if (seconds <= 0) {
                throw InvalidInputException("stream_links: timeout must be a positive number of seconds");
            }
            bind_data->config.extraction_timeout_ms = static_cast<int64_t>(seconds) * 1000;
        } else if (kv.first == "max_links") {
            bind_data->config.max_links = std::max(kv.second.GetValue<int>(), 0);
        }
    }

    // Return columns
    return_types.push_back(LogicalType::VARCHAR);  // url
    return_types.push_back(LogicalType::VARCHAR);  // format
    return_types.push_back(LogicalType::VARCHAR);  // quality
    return_types.push_back(LogicalType::INTEGER);  // quality_rank
    return_types.push_back(LogicalType::BOOLEAN);  // validated
    return_types.push_back(LogicalType::VARCHAR);  // discovery_method
    return_types.push_back(LogicalType::INTEGER);  // depth
    return_types.push_back(LogicalType::VARCHAR);  // source_page
    return_types.push_back(LogicalType::VARCHAR);  // content_type
    return_types.push_back(LogicalType::BIGINT);   // content_length
    return_types.push_back(LogicalType::BOOLEAN);  // partial

    names.push_back("url");
    names.push_back("format");
    names.push_back("quality");
    names.push_back("quality_rank");
    names.push_back("validated");
    names.push_back("discovery_method");
    names.push_back("depth");
    names.push_back("source_page");
    names.push_back("content_type");
    names.push_back("content_length");
    names.push_back("partial");

    return std::move(bind_data);
}

static unique_ptr<GlobalTableFunctionState> StreamLinksInitGlobal(ClientContext &context,
                                                                  TableFunctionInitInput &input) {
    return make_uniq<StreamLinksGlobalState>();
}

//===--------------------------------------------------------------------===//
// Main Function
//===--------------------------------------------------------------------===//

static void ThrowExtractionError(const ExtractionOutcome &outcome) {
    string kind = ExtractionErrorToString(outcome.error);
    switch (outcome.error) {
    case ExtractionErrorType::INVALID_URL:
        throw InvalidInputException("stream_links: %s (%s): %s", kind, UrlErrorToString(outcome.url_error),
                                    outcome.message);
    case ExtractionErrorType::RATE_LIMITED:
        throw InvalidInputException("stream_links: %s: %s", kind, outcome.message);
    case ExtractionErrorType::FETCH_FAILED:
        throw IOException("stream_links: %s (%s, HTTP %d): %s", kind, FetchErrorToString(outcome.fetch_error),
                          outcome.http_status, outcome.message);
    default:
        throw IOException("stream_links: %s: %s", kind, outcome.message);
    }
}

static void StreamLinksFunction(ClientContext &context, TableFunctionInput &data, DataChunk &output) {
    auto &bind_data = data.bind_data->Cast<StreamLinksBindData>();
    auto &state = data.global_state->Cast<StreamLinksGlobalState>();

    // Run the extraction on first call
    if (!state.extracted) {
        state.extracted = true;
        auto &db = DatabaseInstance::GetDatabase(context);
        auto limiter = GetRateLimiter(db, bind_data.config.rate_limit_requests,
                                      bind_data.config.rate_limit_window_seconds);

        StreamExtractor extractor(bind_data.config, std::make_shared<CurlHttpTransport>(), limiter);
        extractor.LinkInterruptCounter(StreamlinksInterruptCounter());

        ExtractionOutcome outcome = extractor.ExtractLinks(bind_data.url, bind_data.requester);
        if (!outcome.Ok()) {
            ThrowExtractionError(outcome);
        }
        state.links = std::move(outcome.links);
        state.partial = outcome.partial;
    }

    idx_t count = 0;
    while (state.result_idx < state.links.size() && count < STANDARD_VECTOR_SIZE) {
        const auto &link = state.links[state.result_idx++];
        output.SetValue(0, count, Value(link.url));
        output.SetValue(1, count, Value(StreamFormatToString(link.format)));
        output.SetValue(2, count, Value(StreamQualityToString(link.quality)));
        output.SetValue(3, count, Value::INTEGER(link.quality_rank));
        output.SetValue(4, count, Value::BOOLEAN(link.validated));
        output.SetValue(5, count, Value(DiscoveryMethodToString(link.method)));
        output.SetValue(6, count, Value::INTEGER(link.depth));
        output.SetValue(7, count, Value(link.source_page_url));
        output.SetValue(8, count, link.content_type.empty() ? Value() : Value(link.content_type));
        output.SetValue(9, count, link.content_length < 0 ? Value() : Value::BIGINT(link.content_length));
        output.SetValue(10, count, Value::BOOLEAN(state.partial));
        count++;
    }
    output.SetCardinality(count);
}

//===--------------------------------------------------------------------===//
// stream_links_rate_limit(requester)
//===--------------------------------------------------------------------===//

struct RateLimitBindData : public TableFunctionData {
    string requester;
    int max_requests = 5;
    int window_seconds = 60;
};

struct RateLimitGlobalState : public GlobalTableFunctionState {
    bool done = false;
};

static unique_ptr<FunctionData> RateLimitBind(ClientContext &context, TableFunctionBindInput &input,
                                              vector<LogicalType> &return_types, vector<string> &names) {
    auto bind_data = make_uniq<RateLimitBindData>();
    auto config = ReadExtractorSettings(context);
    bind_data->max_requests = config.rate_limit_requests;
    bind_data->window_seconds = config.rate_limit_window_seconds;
    bind_data->requester = input.inputs[0].IsNull() ? "duckdb" : StringValue::Get(input.inputs[0]);

    return_types.push_back(LogicalType::VARCHAR);  // requester
    return_types.push_back(LogicalType::INTEGER);  // remaining
    return_types.push_back(LogicalType::BIGINT);   // reset_ms
    names.push_back("requester");
    names.push_back("remaining");
    names.push_back("reset_ms");
    return std::move(bind_data);
}

static unique_ptr<GlobalTableFunctionState> RateLimitInitGlobal(ClientContext &context,
                                                                TableFunctionInitInput &input) {
    return make_uniq<RateLimitGlobalState>();
}

static void RateLimitFunction(ClientContext &context, TableFunctionInput &data, DataChunk &output) {
    auto &bind_data = data.bind_data->Cast<RateLimitBindData>();
    auto &state = data.global_state->Cast<RateLimitGlobalState>();
    if (state.done) {
        output.SetCardinality(0);
        return;
    }
    state.done = true;

    auto limiter = GetRateLimiter(DatabaseInstance::GetDatabase(context), bind_data.max_requests,
                                  bind_data.window_seconds);
    output.SetValue(0, 0, Value(bind_data.requester));
    output.SetValue(1, 0, Value::INTEGER(limiter->Remaining(bind_data.requester)));
    output.SetValue(2, 0, Value::BIGINT(limiter->ResetTime(bind_data.requester).count()));
    output.SetCardinality(1);
}

//===--------------------------------------------------------------------===//
// Scalar helpers
//===--------------------------------------------------------------------===//

static void StreamFormatScalar(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, string_t>(args.data[0], result, args.size(), [&](string_t url) {
        return StringVector::AddString(result, StreamFormatToString(DetectFormat(url.GetString())));
    });
}

static void StreamQualityScalar(DataChunk &args, ExpressionState &state, Vector &result) {
    UnaryExecutor::Execute<string_t, string_t>(args.data[0], result, args.size(), [&](string_t url) {
        return StringVector::AddString(result, StreamQualityToString(DetectQuality(url.GetString())));
    });
}

//===--------------------------------------------------------------------===//
// Register Functions
//===--------------------------------------------------------------------===//

void RegisterStreamLinksFunction(ExtensionLoader &loader) {
    TableFunction func("stream_links", {LogicalType::VARCHAR}, StreamLinksFunction, StreamLinksBind,
                       StreamLinksInitGlobal);
    func.named_parameters["requester"] = LogicalType::VARCHAR;
    func.named_parameters["validate"] = LogicalType::BOOLEAN;
    func.named_parameters["max_depth"] = LogicalType::INTEGER;
    func.named_parameters["timeout"] = LogicalType::INTEGER;
    func.named_parameters["max_links"] = LogicalType::INTEGER;
    loader.RegisterFunction(func);

    TableFunction rate_func("stream_links_rate_limit", {LogicalType::VARCHAR}, RateLimitFunction, RateLimitBind,
                            RateLimitInitGlobal);
    loader.RegisterFunction(rate_func);
}

void RegisterStreamScalarFunctions(ExtensionLoader &loader) {
    loader.RegisterFunction(
        ScalarFunction("stream_format", {LogicalType::VARCHAR}, LogicalType::VARCHAR, StreamFormatScalar));
    loader.RegisterFunction(
        ScalarFunction("stream_quality", {LogicalType::VARCHAR}, LogicalType::VARCHAR, StreamQualityScalar));
}

} // namespace duckdb
