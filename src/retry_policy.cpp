#include "mapreducer/retry_policy.hpp"

#include <algorithm>
#include <cmath>

namespace mapreducer {

RetryPolicy::RetryPolicy(RetryConfig config)
    : config_(std::move(config)) {}

FailureKind RetryPolicy::classify(int status) noexcept {
    if (status == 429) return FailureKind::RateLimited;
    if (status >= 500) return FailureKind::ServerError;
    return FailureKind::Fatal;
}

Duration RetryPolicy::backoff_delay(int attempt) const {
    if (attempt < 0) attempt = 0;
    // 2^31 * base overflows long before it matters; the cap wins anyway.
    if (attempt > 30) return config_.max_delay;
    auto scaled = config_.base_delay * (std::int64_t{1} << attempt);
    return std::min<Duration>(scaled, config_.max_delay);
}

Duration RetryPolicy::retry_delay(FailureKind kind, int attempt,
                                  std::optional<double> retry_after_seconds) const {
    if (kind == FailureKind::RateLimited && retry_after_seconds.has_value() &&
        std::isfinite(*retry_after_seconds) && *retry_after_seconds >= 0.0) {
        return std::chrono::duration_cast<Duration>(
            std::chrono::duration<double>(*retry_after_seconds));
    }
    return backoff_delay(attempt);
}

int RetryPolicy::max_attempts() const noexcept {
    return config_.max_retries + 1;
}

const RetryConfig& RetryPolicy::config() const noexcept {
    return config_;
}

void RetryPolicy::set_monitor(std::shared_ptr<Monitor> monitor) {
    monitor_ = std::move(monitor);
}

void RetryPolicy::report_retry(const MonitorEvent& context, FailureKind kind, int attempt,
                               int status, Duration delay) const {
    MonitorEvent event = context;
    event.type = EventType::RetryScheduled;
    event.message = std::string(to_string(kind)) + ", retry " + std::to_string(attempt) +
                    "/" + std::to_string(config_.max_retries);
    event.status = status;
    event.attempt = attempt;
    event.delay = delay;
    emit(monitor_, event);
}

void RetryPolicy::report_exhausted(const MonitorEvent& context, int attempts, int status,
                                   const std::string& message) const {
    MonitorEvent event = context;
    event.type = EventType::RetriesExhausted;
    event.message = message;
    event.status = status;
    event.attempt = attempts;
    emit(monitor_, event);
}

} // namespace mapreducer
