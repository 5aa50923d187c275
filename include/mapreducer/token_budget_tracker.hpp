#pragma once

#include "mapreducer/cancellation.hpp"
#include "mapreducer/monitor.hpp"
#include "mapreducer/types.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>

namespace mapreducer {

// Tokens-per-window ceiling over a fixed window that snaps back to zero once
// it has expired. Expiry is applied lazily by whichever call observes it.
// Every operation is serialized through one mutex.
//
// Calls in flight hold a reservation for their admitted estimate until they
// settle, so concurrent admissions cannot jointly exceed the capacity.
// Reservations survive a window reset; the usage they turn into lands in
// whichever window is current when the call completes.
class TokenBudgetTracker {
public:
    TokenBudgetTracker(TokenCount capacity_tokens,
                       Duration window_duration,
                       TimeSource now = &Clock::now);

    TokenBudgetTracker(const TokenBudgetTracker&) = delete;
    TokenBudgetTracker& operator=(const TokenBudgetTracker&) = delete;

    // True iff used + reserved + estimate <= capacity in the current window.
    bool can_use(TokenCount estimate);

    // Records usage. Never rejects and never clamps, so the window may end
    // up above capacity when actual usage exceeds the admitted estimate.
    void use(TokenCount amount);

    // max(0, capacity - used - reserved)
    TokenCount remaining();
    TokenCount used();
    TokenCount reserved();

    TokenCount capacity() const noexcept;
    Duration window_duration() const noexcept;

    // Blocks until can_use(estimate) holds. Wakes at every poll interval and
    // at window expiry. Returns false once `timeout` has elapsed without
    // admission; throws CancelledException if `token` is cancelled.
    bool wait_for(TokenCount estimate,
                  Duration timeout,
                  Duration poll_interval,
                  const CancellationToken& token);

    // wait_for() that also reserves `estimate` on admission. The caller
    // must settle the reservation with commit() or release().
    bool reserve(TokenCount estimate,
                 Duration timeout,
                 Duration poll_interval,
                 const CancellationToken& token);

    // Drops a reservation and records `actual` in one step.
    void commit(TokenCount reserved, TokenCount actual);

    // Drops a reservation without recording usage (the call failed).
    void release(TokenCount reserved);

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    const TokenCount capacity_;
    const Duration window_;
    TimeSource now_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    Timestamp window_start_;
    TokenCount used_{0};
    TokenCount reserved_{0};

    std::shared_ptr<Monitor> monitor_;

    // Caller must hold mutex_. Returns the usage that was discarded, if any.
    TokenCount reset_if_needed();
    bool fits(TokenCount estimate) const;
    bool admit(TokenCount estimate, Duration timeout, Duration poll_interval,
               const CancellationToken& token, bool hold);
};

// Owns one reservation. Releases it on destruction unless commit() or
// release() already settled it. Not thread-safe; one call owns it.
class TokenReservation {
public:
    TokenReservation(TokenBudgetTracker& tracker, TokenCount amount);
    ~TokenReservation();

    TokenReservation(const TokenReservation&) = delete;
    TokenReservation& operator=(const TokenReservation&) = delete;

    void commit(TokenCount actual);
    void release();

    TokenCount amount() const noexcept { return amount_; }
    bool settled() const noexcept { return settled_; }

private:
    TokenBudgetTracker& tracker_;
    TokenCount amount_;
    bool settled_{false};
};

} // namespace mapreducer
