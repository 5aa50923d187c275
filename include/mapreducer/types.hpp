#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace mapreducer {

// Token quantities (integer units)
using TokenCount = std::int64_t;

// Position of a segment in the run input
using SegmentIndex = std::size_t;

// Time types
using Clock = std::chrono::steady_clock;
using Timestamp = Clock::time_point;
using Duration = Clock::duration;

// Injectable time source (tests drive window expiry with a fake clock)
using TimeSource = std::function<Timestamp()>;

// Run lifecycle
enum class RunState {
    Idle,
    Mapping,
    Reducing,
    Done,
    Failed
};

// Which half of a run an event or error belongs to
enum class Phase {
    Map,
    Reduce
};

// Classification of a failed attempt
enum class FailureKind {
    RateLimited,
    ServerError,
    Fatal
};

// Token encodings understood by the token counter
enum class EncodingId {
    O200k,
    Cl100k
};

// Ordered input unit produced by the segment source
struct Segment {
    std::string text;
    TokenCount approximate_token_count{0};
    SegmentIndex index{0};
};

// Usage reported by the provider; every field may be absent
struct Usage {
    std::optional<TokenCount> input_tokens;
    std::optional<TokenCount> output_tokens;
    std::optional<TokenCount> total_tokens;
};

struct InvokeOptions {
    TokenCount max_output_tokens{0};
    double temperature{0.0};
};

struct ModelResponse {
    std::string content;
    std::optional<Usage> usage;
};

// input+output when both are present, else total, else nothing.
inline std::optional<TokenCount> extract_total_tokens(const std::optional<Usage>& usage) {
    if (!usage.has_value()) return std::nullopt;
    if (usage->input_tokens.has_value() && usage->output_tokens.has_value()) {
        return *usage->input_tokens + *usage->output_tokens;
    }
    return usage->total_tokens;
}

inline const char* to_string(RunState s) {
    switch (s) {
        case RunState::Idle:     return "Idle";
        case RunState::Mapping:  return "Mapping";
        case RunState::Reducing: return "Reducing";
        case RunState::Done:     return "Done";
        case RunState::Failed:   return "Failed";
    }
    return "Unknown";
}

inline const char* to_string(Phase p) {
    switch (p) {
        case Phase::Map:    return "MAP";
        case Phase::Reduce: return "REDUCE";
    }
    return "Unknown";
}

inline const char* to_string(FailureKind k) {
    switch (k) {
        case FailureKind::RateLimited: return "RateLimited";
        case FailureKind::ServerError: return "ServerError";
        case FailureKind::Fatal:       return "Fatal";
    }
    return "Unknown";
}

inline const char* to_string(EncodingId e) {
    switch (e) {
        case EncodingId::O200k:  return "o200k";
        case EncodingId::Cl100k: return "cl100k";
    }
    return "Unknown";
}

} // namespace mapreducer
