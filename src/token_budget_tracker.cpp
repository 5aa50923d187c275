#include "mapreducer/token_budget_tracker.hpp"

#include <algorithm>
#include <stdexcept>

namespace mapreducer {

namespace {

MonitorEvent budget_event(EventType type, const char* message,
                          TokenCount tokens, TokenCount remaining) {
    MonitorEvent event;
    event.type = type;
    event.message = message;
    event.tokens = tokens;
    event.remaining = remaining;
    return event;
}

} // anonymous namespace

TokenBudgetTracker::TokenBudgetTracker(TokenCount capacity_tokens,
                                       Duration window_duration,
                                       TimeSource now)
    : capacity_(capacity_tokens)
    , window_(window_duration)
    , now_(std::move(now))
{
    if (capacity_ <= 0) {
        throw std::invalid_argument("TokenBudgetTracker capacity must be positive");
    }
    if (window_ <= Duration::zero()) {
        throw std::invalid_argument("TokenBudgetTracker window must be positive");
    }
    if (!now_) {
        now_ = &Clock::now;
    }
    window_start_ = now_();
}

bool TokenBudgetTracker::can_use(TokenCount estimate) {
    std::shared_ptr<Monitor> monitor;
    TokenCount discarded = 0;
    bool ok = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        monitor = monitor_;
        discarded = reset_if_needed();
        ok = fits(estimate);
    }
    if (discarded > 0) {
        cv_.notify_all();
        emit(monitor, budget_event(EventType::BudgetWindowReset, "Token window reset",
                                   discarded, capacity_));
    }
    return ok;
}

void TokenBudgetTracker::use(TokenCount amount) {
    std::shared_ptr<Monitor> monitor;
    TokenCount discarded = 0;
    TokenCount left = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        monitor = monitor_;
        discarded = reset_if_needed();
        used_ += amount;
        left = std::max<TokenCount>(0, capacity_ - used_ - reserved_);
    }
    // A reset observed here may let a waiter in.
    if (discarded > 0) {
        cv_.notify_all();
    }
    if (discarded > 0) {
        emit(monitor, budget_event(EventType::BudgetWindowReset, "Token window reset",
                                   discarded, capacity_));
    }
    emit(monitor, budget_event(EventType::TokensRecorded, "Tokens recorded", amount, left));
}

TokenCount TokenBudgetTracker::remaining() {
    std::lock_guard<std::mutex> lock(mutex_);
    reset_if_needed();
    return std::max<TokenCount>(0, capacity_ - used_ - reserved_);
}

TokenCount TokenBudgetTracker::used() {
    std::lock_guard<std::mutex> lock(mutex_);
    reset_if_needed();
    return used_;
}

TokenCount TokenBudgetTracker::reserved() {
    std::lock_guard<std::mutex> lock(mutex_);
    return reserved_;
}

TokenCount TokenBudgetTracker::capacity() const noexcept {
    return capacity_;
}

Duration TokenBudgetTracker::window_duration() const noexcept {
    return window_;
}

bool TokenBudgetTracker::wait_for(TokenCount estimate,
                                  Duration timeout,
                                  Duration poll_interval,
                                  const CancellationToken& token) {
    return admit(estimate, timeout, poll_interval, token, false);
}

bool TokenBudgetTracker::reserve(TokenCount estimate,
                                 Duration timeout,
                                 Duration poll_interval,
                                 const CancellationToken& token) {
    return admit(estimate, timeout, poll_interval, token, true);
}

void TokenBudgetTracker::commit(TokenCount reserved, TokenCount actual) {
    std::shared_ptr<Monitor> monitor;
    TokenCount discarded = 0;
    TokenCount left = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        monitor = monitor_;
        discarded = reset_if_needed();
        reserved_ = std::max<TokenCount>(0, reserved_ - reserved);
        used_ += actual;
        left = std::max<TokenCount>(0, capacity_ - used_ - reserved_);
    }
    // Actual usage below the estimate frees room for waiters.
    cv_.notify_all();
    if (discarded > 0) {
        emit(monitor, budget_event(EventType::BudgetWindowReset, "Token window reset",
                                   discarded, capacity_));
    }
    emit(monitor, budget_event(EventType::TokensRecorded, "Tokens recorded", actual, left));
}

void TokenBudgetTracker::release(TokenCount reserved) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reserved_ = std::max<TokenCount>(0, reserved_ - reserved);
    }
    cv_.notify_all();
}

bool TokenBudgetTracker::admit(TokenCount estimate,
                               Duration timeout,
                               Duration poll_interval,
                               const CancellationToken& token,
                               bool hold) {
    const auto started = Clock::now();
    const auto deadline = started + timeout;
    bool waited = false;
    TokenCount discarded = 0;

    std::unique_lock<std::mutex> lock(mutex_);
    auto monitor = monitor_;

    while (true) {
        discarded += reset_if_needed();
        if (fits(estimate)) {
            if (hold) {
                reserved_ += estimate;
            }
            TokenCount left = capacity_ - used_ - reserved_;
            lock.unlock();
            if (discarded > 0) {
                emit(monitor, budget_event(EventType::BudgetWindowReset, "Token window reset",
                                           discarded, capacity_));
            }
            auto admitted = budget_event(EventType::BudgetAdmitted, "Token budget available",
                                         estimate, left);
            if (waited) {
                admitted.delay = Clock::now() - started;
            }
            emit(monitor, admitted);
            return true;
        }

        auto now = Clock::now();
        if (now >= deadline) {
            return false;
        }
        if (token.is_cancelled()) {
            lock.unlock();
            token.throw_if_cancelled();
        }

        if (!waited) {
            waited = true;
            TokenCount left = std::max<TokenCount>(0, capacity_ - used_ - reserved_);
            lock.unlock();
            emit(monitor, budget_event(EventType::BudgetWaiting, "Waiting for token budget",
                                       estimate, left));
            lock.lock();
            continue;
        }

        // Sleep until the next poll, the window rollover, a settled
        // reservation or the deadline.
        auto wake = std::min(deadline, now + poll_interval);
        auto until_reset = (window_start_ + window_) - now_();
        if (until_reset > Duration::zero()) {
            wake = std::min(wake, now + until_reset);
        }
        token.wait_until(lock, cv_, wake, [this, estimate, &discarded] {
            discarded += reset_if_needed();
            return fits(estimate);
        });
    }
}

void TokenBudgetTracker::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor_ = std::move(monitor);
}

TokenCount TokenBudgetTracker::reset_if_needed() {
    auto now = now_();
    if (now - window_start_ >= window_) {
        TokenCount discarded = used_;
        used_ = 0;
        window_start_ = now;
        return discarded;
    }
    return 0;
}

bool TokenBudgetTracker::fits(TokenCount estimate) const {
    return used_ + reserved_ + estimate <= capacity_;
}

// ==================== TokenReservation ====================

TokenReservation::TokenReservation(TokenBudgetTracker& tracker, TokenCount amount)
    : tracker_(tracker)
    , amount_(amount) {}

TokenReservation::~TokenReservation() {
    release();
}

void TokenReservation::commit(TokenCount actual) {
    if (settled_) return;
    settled_ = true;
    tracker_.commit(amount_, actual);
}

void TokenReservation::release() {
    if (settled_) return;
    settled_ = true;
    tracker_.release(amount_);
}

} // namespace mapreducer
