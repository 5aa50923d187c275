#include "mapreducer/monitor.hpp"

#include <iostream>

namespace mapreducer {

const char* to_string(EventType t) {
    switch (t) {
        case EventType::RunStarted:           return "RunStarted";
        case EventType::RunCompleted:         return "RunCompleted";
        case EventType::RunFailed:            return "RunFailed";
        case EventType::RunCancelled:         return "RunCancelled";
        case EventType::BudgetWaiting:        return "BudgetWaiting";
        case EventType::BudgetAdmitted:       return "BudgetAdmitted";
        case EventType::BudgetTimedOut:       return "BudgetTimedOut";
        case EventType::TokensRecorded:       return "TokensRecorded";
        case EventType::BudgetWindowReset:    return "BudgetWindowReset";
        case EventType::JobSubmitted:         return "JobSubmitted";
        case EventType::JobStarted:           return "JobStarted";
        case EventType::JobFinished:          return "JobFinished";
        case EventType::RetryScheduled:       return "RetryScheduled";
        case EventType::RetriesExhausted:     return "RetriesExhausted";
        case EventType::SegmentCompleted:     return "SegmentCompleted";
        case EventType::SegmentSkipped:       return "SegmentSkipped";
        case EventType::MapPhaseCompleted:    return "MapPhaseCompleted";
        case EventType::ReduceRoundStarted:   return "ReduceRoundStarted";
        case EventType::ReduceGroupCompleted: return "ReduceGroupCompleted";
        case EventType::ReduceRoundCompleted: return "ReduceRoundCompleted";
    }
    return "Unknown";
}

namespace {

bool is_important_event(EventType t) {
    switch (t) {
        case EventType::RunStarted:
        case EventType::RunCompleted:
        case EventType::RunFailed:
        case EventType::RunCancelled:
        case EventType::BudgetTimedOut:
        case EventType::RetryScheduled:
        case EventType::RetriesExhausted:
        case EventType::SegmentSkipped:
        case EventType::MapPhaseCompleted:
        case EventType::ReduceRoundStarted:
            return true;
        default:
            return false;
    }
}

// Per-job chatter only shown at Debug
bool is_debug_event(EventType t) {
    switch (t) {
        case EventType::JobSubmitted:
        case EventType::JobStarted:
        case EventType::JobFinished:
        case EventType::BudgetWindowReset:
        case EventType::TokensRecorded:
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

// ========== ConsoleMonitor ==========

ConsoleMonitor::ConsoleMonitor(Verbosity v) : verbosity_(v) {}

void ConsoleMonitor::on_event(const MonitorEvent& event) {
    if (verbosity_ == Verbosity::Quiet) return;
    if (verbosity_ == Verbosity::Normal && !is_important_event(event.type)) return;
    if (verbosity_ == Verbosity::Verbose && is_debug_event(event.type)) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cout << "[MapReducer] " << to_string(event.type);

    if (event.phase.has_value()) {
        std::cout << " phase=" << to_string(event.phase.value());
    }
    if (event.segment.has_value()) {
        std::cout << " segment=" << (event.segment.value() + 1);
    }
    if (event.round.has_value()) {
        std::cout << " round=" << event.round.value();
    }
    if (event.group.has_value()) {
        std::cout << " group=" << (event.group.value() + 1);
    }
    if (event.tokens.has_value()) {
        std::cout << " tokens=" << event.tokens.value();
    }
    if (event.remaining.has_value()) {
        std::cout << " remaining=" << event.remaining.value();
    }
    if (event.status.has_value()) {
        std::cout << " status=" << event.status.value();
    }
    if (event.attempt.has_value()) {
        std::cout << " attempt=" << event.attempt.value();
    }
    if (event.delay.has_value()) {
        std::cout << " delay_ms="
                  << std::chrono::duration_cast<std::chrono::milliseconds>(event.delay.value()).count();
    }
    if (event.count.has_value()) {
        std::cout << " count=" << event.count.value();
    }

    if (!event.message.empty()) {
        std::cout << " | " << event.message;
    }

    std::cout << "\n";
}

// ========== MetricsMonitor ==========

MetricsMonitor::MetricsMonitor() = default;

void MetricsMonitor::on_event(const MonitorEvent& event) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);

    switch (event.type) {
        case EventType::RunStarted:
            metrics_.runs_started++;
            break;
        case EventType::RunCompleted:
            metrics_.runs_completed++;
            break;
        case EventType::RunFailed:
        case EventType::RunCancelled:
            metrics_.runs_failed++;
            break;
        case EventType::JobSubmitted:
            if (event.phase == Phase::Map) metrics_.map_calls++;
            if (event.phase == Phase::Reduce) metrics_.reduce_calls++;
            break;
        case EventType::JobStarted:
            metrics_.jobs_started++;
            break;
        case EventType::RetryScheduled:
            metrics_.retries++;
            break;
        case EventType::RetriesExhausted:
            metrics_.retries_exhausted++;
            break;
        case EventType::SegmentSkipped:
            metrics_.segments_skipped++;
            break;
        case EventType::ReduceRoundCompleted:
            metrics_.reduce_rounds++;
            break;
        case EventType::BudgetWaiting:
            metrics_.budget_waits++;
            break;
        case EventType::BudgetTimedOut:
            metrics_.budget_timeouts++;
            break;
        case EventType::TokensRecorded:
            metrics_.tokens_recorded += event.tokens.value_or(0);
            break;
        case EventType::BudgetAdmitted:
            if (event.delay.has_value()) {
                admitted_after_wait_++;
                budget_wait_sum_ms_ +=
                    std::chrono::duration<double, std::milli>(event.delay.value()).count();
                metrics_.average_budget_wait_ms =
                    budget_wait_sum_ms_ / static_cast<double>(admitted_after_wait_);
            }
            break;
        default:
            break;
    }
}

MetricsMonitor::Metrics MetricsMonitor::get_metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

void MetricsMonitor::reset_metrics() {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_ = Metrics{};
    admitted_after_wait_ = 0;
    budget_wait_sum_ms_ = 0.0;
}

// ========== CompositeMonitor ==========

void CompositeMonitor::add_monitor(std::shared_ptr<Monitor> monitor) {
    monitors_.push_back(std::move(monitor));
}

void CompositeMonitor::on_event(const MonitorEvent& event) {
    for (auto& m : monitors_) {
        m->on_event(event);
    }
}

} // namespace mapreducer
