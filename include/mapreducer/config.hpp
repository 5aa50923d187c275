#pragma once

#include "mapreducer/types.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>

namespace mapreducer {

// Retry/backoff settings
struct RetryConfig {
    // Retries after the first attempt (total attempts = max_retries + 1)
    int max_retries = 7;
    Duration base_delay = std::chrono::milliseconds(1000);
    Duration max_delay = std::chrono::milliseconds(8000);
};

// Segment source settings
struct ChunkingConfig {
    TokenCount chunk_tokens = 18000;
    TokenCount chunk_overlap = 500;
};

struct RunConfig {
    // Token budget (TPM) and its reset window
    TokenCount tokens_per_minute = 50000;
    Duration token_budget_window = std::chrono::seconds(60);

    // How long a single job may wait for budget before the run aborts
    Duration token_budget_timeout = std::chrono::seconds(180);

    // How often a waiting job re-checks the budget
    Duration budget_poll_interval = std::chrono::seconds(3);

    // Queue caps: concurrency and starts per interval (RPM)
    std::size_t queue_concurrency = 5;
    std::size_t requests_per_minute = 50;
    Duration queue_interval = std::chrono::seconds(60);

    // Output caps added to every estimate
    TokenCount map_output_max_tokens = 25000;
    TokenCount reduce_output_max_tokens = 35000;

    std::size_t hierarchy_group_size = 2;
    double temperature = 0.2;
    EncodingId encoding = EncodingId::O200k;

    // Whole-run deadline (zero = none)
    Duration run_timeout = Duration::zero();

    RetryConfig retry;
    ChunkingConfig chunking;

    // Throws ConfigurationException on the first invalid field.
    void validate() const;
};

// Named host parameters, values as strings (e.g. "TOKENS_PER_MINUTE" -> "50000")
using ParameterMap = std::unordered_map<std::string, std::string>;

// Builds a RunConfig from host parameters. Interval, window and timeout
// parameters are given in seconds. Missing required keys, unparseable values
// and out-of-range values throw ConfigurationException.
RunConfig load_run_config(const ParameterMap& params);

EncodingId parse_encoding(const std::string& name);

} // namespace mapreducer
