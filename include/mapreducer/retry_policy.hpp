#pragma once

#include "mapreducer/cancellation.hpp"
#include "mapreducer/config.hpp"
#include "mapreducer/exceptions.hpp"
#include "mapreducer/monitor.hpp"
#include "mapreducer/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <type_traits>

namespace mapreducer {

// Classified re-execution of a unit of work.
//
//   429  -> retry after the provider's retry-after hint, else exponential backoff
//   5xx  -> retry after exponential backoff
//   else -> propagate immediately
//
// Backoff for the n-th failed attempt is min(base * 2^n, max). Once
// max_retries retries have failed, RetriesExhaustedException is thrown.
class RetryPolicy {
public:
    explicit RetryPolicy(RetryConfig config = RetryConfig{});

    static FailureKind classify(int status) noexcept;

    Duration backoff_delay(int attempt) const;
    Duration retry_delay(FailureKind kind, int attempt,
                         std::optional<double> retry_after_seconds) const;

    int max_attempts() const noexcept;
    const RetryConfig& config() const noexcept;

    void set_monitor(std::shared_ptr<Monitor> monitor);

    // Runs fn until it succeeds, fails fatally or runs out of attempts.
    // `context` supplies phase/segment/round/group for emitted events.
    template <typename Fn>
    std::invoke_result_t<Fn&> execute(Fn&& fn,
                                      const CancellationToken& token = CancellationToken{},
                                      const MonitorEvent& context = MonitorEvent{}) const;

private:
    RetryConfig config_;
    std::shared_ptr<Monitor> monitor_;

    void report_retry(const MonitorEvent& context, FailureKind kind, int attempt,
                      int status, Duration delay) const;
    void report_exhausted(const MonitorEvent& context, int attempts, int status,
                          const std::string& message) const;
};

template <typename Fn>
std::invoke_result_t<Fn&> RetryPolicy::execute(Fn&& fn,
                                               const CancellationToken& token,
                                               const MonitorEvent& context) const {
    for (int attempt = 1;; ++attempt) {
        token.throw_if_cancelled();
        try {
            return fn();
        } catch (const ProviderException& e) {
            FailureKind kind = classify(e.status());
            if (kind == FailureKind::Fatal) {
                throw;
            }
            if (attempt >= max_attempts()) {
                report_exhausted(context, attempt, e.status(), e.what());
                throw RetriesExhaustedException(attempt, e.status(), e.what());
            }
            Duration delay = retry_delay(kind, attempt, e.retry_after_seconds());
            report_retry(context, kind, attempt, e.status(), delay);
            if (!token.sleep_for(delay)) {
                token.throw_if_cancelled();
            }
        }
    }
}

} // namespace mapreducer
