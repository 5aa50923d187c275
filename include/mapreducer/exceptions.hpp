#pragma once

#include "mapreducer/types.hpp"
#include <optional>
#include <stdexcept>
#include <string>

namespace mapreducer {

class MapReducerException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Invalid or missing run parameters. Raised before any work starts.
class ConfigurationException : public MapReducerException {
public:
    using MapReducerException::MapReducerException;
};

// A single request whose estimate exceeds the whole token budget.
class ImpossibleEstimateException : public ConfigurationException {
public:
    ImpossibleEstimateException(Phase phase,
                                std::optional<SegmentIndex> segment,
                                TokenCount estimate,
                                TokenCount capacity)
        : ConfigurationException(
            std::string(to_string(phase)) + " operation token estimate (" +
            std::to_string(estimate) + ") exceeds TPM limit (" +
            std::to_string(capacity) + ")" +
            (segment.has_value() ? " for segment " + std::to_string(*segment + 1) : ""))
        , phase_(phase)
        , segment_(segment)
        , estimate_(estimate)
        , capacity_(capacity) {}

    Phase phase() const noexcept { return phase_; }
    std::optional<SegmentIndex> segment() const noexcept { return segment_; }
    TokenCount estimate() const noexcept { return estimate_; }
    TokenCount capacity() const noexcept { return capacity_; }

private:
    Phase phase_;
    std::optional<SegmentIndex> segment_;
    TokenCount estimate_;
    TokenCount capacity_;
};

class BudgetTimeoutException : public MapReducerException {
public:
    BudgetTimeoutException(Phase phase,
                           std::optional<SegmentIndex> segment,
                           TokenCount needed,
                           TokenCount remaining,
                           Duration timeout)
        : MapReducerException(
            "Token budget timeout after " +
            std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count()) +
            " ms in " + to_string(phase) + " phase" +
            (segment.has_value() ? " (segment " + std::to_string(*segment + 1) + ")" : "") +
            ": need " + std::to_string(needed) + ", have " + std::to_string(remaining))
        , phase_(phase)
        , segment_(segment)
        , needed_(needed)
        , remaining_(remaining)
        , timeout_(timeout) {}

    Phase phase() const noexcept { return phase_; }
    std::optional<SegmentIndex> segment() const noexcept { return segment_; }
    TokenCount needed() const noexcept { return needed_; }
    TokenCount remaining() const noexcept { return remaining_; }
    Duration timeout() const noexcept { return timeout_; }

private:
    Phase phase_;
    std::optional<SegmentIndex> segment_;
    TokenCount needed_;
    TokenCount remaining_;
    Duration timeout_;
};

// Failure reported by the remote model call.
class ProviderException : public MapReducerException {
public:
    ProviderException(int status, std::string message,
                      std::optional<double> retry_after_seconds = std::nullopt)
        : MapReducerException("Provider error " + std::to_string(status) + ": " + message)
        , status_(status)
        , retry_after_seconds_(retry_after_seconds) {}

    int status() const noexcept { return status_; }
    std::optional<double> retry_after_seconds() const noexcept { return retry_after_seconds_; }

private:
    int status_;
    std::optional<double> retry_after_seconds_;
};

class RetriesExhaustedException : public MapReducerException {
public:
    RetriesExhaustedException(int attempts, std::optional<int> last_status,
                              const std::string& last_message)
        : MapReducerException("Retries exhausted after " + std::to_string(attempts) +
                              " attempts: " + last_message)
        , attempts_(attempts)
        , last_status_(last_status) {}

    int attempts() const noexcept { return attempts_; }
    std::optional<int> last_status() const noexcept { return last_status_; }

private:
    int attempts_;
    std::optional<int> last_status_;
};

class EmptyResponseException : public MapReducerException {
public:
    using MapReducerException::MapReducerException;
};

class NoSegmentsSucceededException : public MapReducerException {
public:
    explicit NoSegmentsSucceededException(std::size_t total_segments)
        : MapReducerException("No segments succeeded in MAP phase (" +
                              std::to_string(total_segments) + " attempted)")
        , total_segments_(total_segments) {}

    std::size_t total_segments() const noexcept { return total_segments_; }

private:
    std::size_t total_segments_;
};

class ReduceFailureException : public MapReducerException {
public:
    ReduceFailureException(std::size_t round, std::size_t group, const std::string& reason)
        : MapReducerException("REDUCE failed in round " + std::to_string(round) +
                              ", group " + std::to_string(group + 1) + ": " + reason)
        , round_(round)
        , group_(group) {}

    std::size_t round() const noexcept { return round_; }
    std::size_t group() const noexcept { return group_; }

private:
    std::size_t round_;
    std::size_t group_;
};

class CancelledException : public MapReducerException {
public:
    CancelledException()
        : MapReducerException("Run cancelled") {}
    using MapReducerException::MapReducerException;
};

} // namespace mapreducer
