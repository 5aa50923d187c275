#include "mapreducer/cancellation.hpp"
#include "mapreducer/exceptions.hpp"

namespace mapreducer {

CancellationToken::CancellationToken()
    : state_(std::make_shared<State>()) {}

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled = true;
    }
    state_->cv.notify_all();
}

bool CancellationToken::is_cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->cancelled) return true;
    return state_->deadline.has_value() && Clock::now() >= state_->deadline.value();
}

void CancellationToken::set_deadline(Timestamp deadline) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->deadline = deadline;
    }
    state_->cv.notify_all();
}

std::optional<Timestamp> CancellationToken::deadline() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->deadline;
}

void CancellationToken::throw_if_cancelled() const {
    if (!is_cancelled()) return;
    if (deadline().has_value() && Clock::now() >= deadline().value()) {
        throw CancelledException("Run deadline exceeded");
    }
    throw CancelledException();
}

bool CancellationToken::sleep_for(Duration d) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    auto until = Clock::now() + d;
    if (state_->deadline.has_value()) {
        until = std::min(until, state_->deadline.value());
    }
    state_->cv.wait_until(lock, until, [this] { return state_->cancelled; });
    if (state_->cancelled) return false;
    return !(state_->deadline.has_value() && Clock::now() >= state_->deadline.value());
}

} // namespace mapreducer
