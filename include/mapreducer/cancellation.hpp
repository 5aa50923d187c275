#pragma once

#include "mapreducer/types.hpp"

#include <algorithm>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>

namespace mapreducer {

// Upper bound on how long a waiter on a foreign condition variable goes
// without re-checking the cancellation flag.
constexpr Duration CANCELLATION_CHECK_INTERVAL = std::chrono::milliseconds(20);

// Shared run-level cancellation signal with an optional deadline.
// Copies refer to the same state; every suspension point of a run observes it.
class CancellationToken {
public:
    CancellationToken();

    void cancel();

    // True once cancel() was called or the deadline has passed.
    bool is_cancelled() const;

    void set_deadline(Timestamp deadline);
    std::optional<Timestamp> deadline() const;

    // Throws CancelledException if cancelled.
    void throw_if_cancelled() const;

    // Sleeps up to `d`, waking immediately on cancel(). Returns false if the
    // token is cancelled when the sleep ends.
    bool sleep_for(Duration d) const;

    // Blocks on `cv` until `pred` holds, `until` is reached or the token is
    // cancelled. `lock` must guard the state `pred` reads. Returns pred().
    template <typename Predicate>
    bool wait_until(std::unique_lock<std::mutex>& lock,
                    std::condition_variable& cv,
                    Timestamp until,
                    Predicate pred) const;

private:
    struct State {
        mutable std::mutex mutex;
        std::condition_variable cv;
        bool cancelled{false};
        std::optional<Timestamp> deadline;
    };
    std::shared_ptr<State> state_;
};

template <typename Predicate>
bool CancellationToken::wait_until(std::unique_lock<std::mutex>& lock,
                                   std::condition_variable& cv,
                                   Timestamp until,
                                   Predicate pred) const {
    while (!pred()) {
        auto now = Clock::now();
        if (is_cancelled() || now >= until) {
            return pred();
        }
        cv.wait_until(lock, std::min(until, now + CANCELLATION_CHECK_INTERVAL));
    }
    return true;
}

// Waits for a job result while honoring cancellation. On cancellation the
// job is abandoned (left to finish on its worker) and CancelledException is
// thrown; otherwise the future's value or exception is returned.
template <typename T>
T await_result(std::future<T>& fut, const CancellationToken& token) {
    while (fut.wait_for(CANCELLATION_CHECK_INTERVAL) != std::future_status::ready) {
        token.throw_if_cancelled();
    }
    return fut.get();
}

} // namespace mapreducer
