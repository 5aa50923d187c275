#pragma once

#include "mapreducer/types.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mapreducer {

enum class EventType {
    RunStarted,
    RunCompleted,
    RunFailed,
    RunCancelled,
    // Token budget
    BudgetWaiting,
    BudgetAdmitted,
    BudgetTimedOut,
    TokensRecorded,
    BudgetWindowReset,
    // Queue
    JobSubmitted,
    JobStarted,
    JobFinished,
    // Retry policy
    RetryScheduled,
    RetriesExhausted,
    // Map phase
    SegmentCompleted,
    SegmentSkipped,
    MapPhaseCompleted,
    // Reduce phase
    ReduceRoundStarted,
    ReduceGroupCompleted,
    ReduceRoundCompleted
};

struct MonitorEvent {
    EventType type;
    Timestamp timestamp;
    std::string message;

    std::optional<Phase> phase;
    std::optional<SegmentIndex> segment;
    std::optional<std::size_t> round;
    std::optional<std::size_t> group;

    // Token figures: amount requested/used, and what was left afterwards
    std::optional<TokenCount> tokens;
    std::optional<TokenCount> remaining;

    // Retry details
    std::optional<int> status;
    std::optional<int> attempt;
    std::optional<Duration> delay;

    // Item count (segments, groups, partials) where meaningful
    std::optional<std::size_t> count;
};

const char* to_string(EventType t);

// Abstract monitor interface
class Monitor {
public:
    virtual ~Monitor() = default;
    virtual void on_event(const MonitorEvent& event) = 0;
};

// Console logger
class ConsoleMonitor : public Monitor {
public:
    enum class Verbosity { Quiet, Normal, Verbose, Debug };

    explicit ConsoleMonitor(Verbosity v = Verbosity::Normal);

    void on_event(const MonitorEvent& event) override;

private:
    Verbosity verbosity_;
    mutable std::mutex output_mutex_;
};

// Metrics collector
class MetricsMonitor : public Monitor {
public:
    struct Metrics {
        std::uint64_t runs_started{0};
        std::uint64_t runs_completed{0};
        std::uint64_t runs_failed{0};
        std::uint64_t map_calls{0};
        std::uint64_t reduce_calls{0};
        std::uint64_t jobs_started{0};
        std::uint64_t retries{0};
        std::uint64_t retries_exhausted{0};
        std::uint64_t segments_skipped{0};
        std::uint64_t reduce_rounds{0};
        std::uint64_t budget_waits{0};
        std::uint64_t budget_timeouts{0};
        TokenCount tokens_recorded{0};
        double average_budget_wait_ms{0.0};
    };

    MetricsMonitor();

    void on_event(const MonitorEvent& event) override;

    Metrics get_metrics() const;
    void reset_metrics();

private:
    mutable std::mutex metrics_mutex_;
    Metrics metrics_;

    std::uint64_t admitted_after_wait_{0};
    double budget_wait_sum_ms_{0.0};
};

// Fan-out to multiple monitors
class CompositeMonitor : public Monitor {
public:
    void add_monitor(std::shared_ptr<Monitor> monitor);

    void on_event(const MonitorEvent& event) override;

private:
    std::vector<std::shared_ptr<Monitor>> monitors_;
};

// Stamps and forwards an event when a monitor is attached.
inline void emit(const std::shared_ptr<Monitor>& monitor, MonitorEvent event) {
    if (!monitor) return;
    event.timestamp = Clock::now();
    monitor->on_event(event);
}

} // namespace mapreducer
