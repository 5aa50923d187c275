#include "mapreducer/config.hpp"
#include "mapreducer/exceptions.hpp"

#include <cmath>
#include <cstdlib>
#include <limits>

namespace mapreducer {

namespace {

const std::string& require(const ParameterMap& params, const std::string& key) {
    auto it = params.find(key);
    if (it == params.end() || it->second.empty()) {
        throw ConfigurationException(key + " is required but not provided");
    }
    return it->second;
}

double parse_number(const std::string& key, const std::string& value) {
    char* end = nullptr;
    double parsed = std::strtod(value.c_str(), &end);
    if (end == value.c_str() || *end != '\0' || !std::isfinite(parsed)) {
        throw ConfigurationException(key + " must be a number, got '" + value + "'");
    }
    return parsed;
}

// Whole number within TokenCount's range.
TokenCount to_count(const std::string& key, double v) {
    if (std::floor(v) != v) {
        throw ConfigurationException(key + " must be a whole number");
    }
    if (std::fabs(v) >= static_cast<double>(std::numeric_limits<TokenCount>::max())) {
        throw ConfigurationException(key + " is out of range");
    }
    return static_cast<TokenCount>(v);
}

TokenCount positive_count(const ParameterMap& params, const std::string& key) {
    double v = parse_number(key, require(params, key));
    if (v <= 0) {
        throw ConfigurationException(key + " is required and must be greater than 0");
    }
    return to_count(key, v);
}

Duration positive_seconds(const ParameterMap& params, const std::string& key) {
    double v = parse_number(key, require(params, key));
    if (v <= 0) {
        throw ConfigurationException(key + " is required and must be greater than 0");
    }
    std::chrono::duration<double> seconds(v);
    if (seconds >= std::chrono::duration<double>(Duration::max())) {
        throw ConfigurationException(key + " is out of range");
    }
    return std::chrono::duration_cast<Duration>(seconds);
}

} // anonymous namespace

void RunConfig::validate() const {
    if (tokens_per_minute <= 0) {
        throw ConfigurationException("tokens_per_minute must be greater than 0");
    }
    if (requests_per_minute == 0) {
        throw ConfigurationException("requests_per_minute must be greater than 0");
    }
    if (queue_concurrency == 0) {
        throw ConfigurationException("queue_concurrency must be greater than 0");
    }
    if (queue_interval <= Duration::zero()) {
        throw ConfigurationException("queue_interval must be greater than 0");
    }
    if (token_budget_window <= Duration::zero()) {
        throw ConfigurationException("token_budget_window must be greater than 0");
    }
    if (token_budget_timeout <= Duration::zero()) {
        throw ConfigurationException("token_budget_timeout must be greater than 0");
    }
    if (budget_poll_interval <= Duration::zero()) {
        throw ConfigurationException("budget_poll_interval must be greater than 0");
    }
    if (map_output_max_tokens <= 0) {
        throw ConfigurationException("map_output_max_tokens must be greater than 0");
    }
    if (reduce_output_max_tokens <= 0) {
        throw ConfigurationException("reduce_output_max_tokens must be greater than 0");
    }
    if (hierarchy_group_size < 1) {
        throw ConfigurationException("hierarchy_group_size must be at least 1");
    }
    if (!(temperature >= 0.0 && temperature <= 2.0)) {
        throw ConfigurationException("temperature must be between 0 and 2");
    }
    if (run_timeout < Duration::zero()) {
        throw ConfigurationException("run_timeout must not be negative");
    }
    if (retry.max_retries < 0) {
        throw ConfigurationException("retry.max_retries must not be negative");
    }
    if (retry.base_delay < Duration::zero() || retry.max_delay < retry.base_delay) {
        throw ConfigurationException("retry delays must satisfy 0 <= base_delay <= max_delay");
    }
    if (chunking.chunk_tokens <= 0) {
        throw ConfigurationException("chunking.chunk_tokens must be greater than 0");
    }
    if (chunking.chunk_overlap < 0 || chunking.chunk_overlap >= chunking.chunk_tokens) {
        throw ConfigurationException(
            "chunking.chunk_overlap must be >= 0 and smaller than chunk_tokens");
    }
}

EncodingId parse_encoding(const std::string& name) {
    if (name == "o200k") return EncodingId::O200k;
    if (name == "cl100k") return EncodingId::Cl100k;
    throw ConfigurationException("Unknown encoding model '" + name +
                                 "' (expected o200k or cl100k)");
}

RunConfig load_run_config(const ParameterMap& params) {
    RunConfig cfg;

    cfg.tokens_per_minute = positive_count(params, "TOKENS_PER_MINUTE");
    cfg.token_budget_timeout = positive_seconds(params, "TOKEN_BUDGET_TIMEOUT");
    cfg.requests_per_minute = static_cast<std::size_t>(positive_count(params, "REQUESTS_PER_MINUTE"));
    cfg.queue_interval = positive_seconds(params, "QUEUE_INTERVAL");
    cfg.queue_concurrency = static_cast<std::size_t>(positive_count(params, "QUEUE_CONCURRENCY"));
    cfg.token_budget_window = positive_seconds(params, "TOKEN_BUDGET_WINDOWS");
    cfg.map_output_max_tokens = positive_count(params, "MAP_OUT_MAX");
    cfg.reduce_output_max_tokens = positive_count(params, "REDUCE_OUT_MAX");
    cfg.hierarchy_group_size = static_cast<std::size_t>(positive_count(params, "HIERARCHY_GROUP_SIZE"));

    double temperature = parse_number("TEMPERATURE", require(params, "TEMPERATURE"));
    if (temperature < 0.0 || temperature > 2.0) {
        throw ConfigurationException("TEMPERATURE must be between 0 and 2");
    }
    cfg.temperature = temperature;

    // Chunking and encoding are optional; the defaults stand when absent.
    auto chunk_it = params.find("CHUNK_TOKENS");
    if (chunk_it != params.end()) {
        cfg.chunking.chunk_tokens = positive_count(params, "CHUNK_TOKENS");
    }
    auto overlap_it = params.find("CHUNK_OVERLAP");
    if (overlap_it != params.end()) {
        double overlap = parse_number("CHUNK_OVERLAP", overlap_it->second);
        if (overlap < 0) {
            throw ConfigurationException("CHUNK_OVERLAP must be greater than or equal to 0");
        }
        cfg.chunking.chunk_overlap = to_count("CHUNK_OVERLAP", overlap);
    }
    auto enc_it = params.find("ENCODING_MODEL");
    if (enc_it != params.end()) {
        cfg.encoding = parse_encoding(enc_it->second);
    }

    cfg.validate();
    return cfg;
}

} // namespace mapreducer
