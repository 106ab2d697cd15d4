#include "Deadline.hpp"
#include <algorithm>

namespace GateResolve {

Deadline::Deadline(std::chrono::milliseconds budget)
    : at_(Clock::now() + budget), state_(std::make_shared<CancelState>()) {}

Deadline Deadline::Unlimited() {
    return Deadline(std::chrono::hours(24 * 365));
}

std::chrono::milliseconds Deadline::Remaining() const {
    if (Cancelled()) return std::chrono::milliseconds(0);
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(at_ - Clock::now());
    return std::max(left, std::chrono::milliseconds(0));
}

bool Deadline::Expired() const {
    return Cancelled() || Clock::now() >= at_;
}

void Deadline::Cancel() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled = true;
    }
    state_->cv.notify_all();
}

bool Deadline::Cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool Deadline::SleepFor(std::chrono::milliseconds d) const {
    auto wake = Clock::now() + d;
    bool cut_short = wake > at_;
    if (cut_short) wake = at_;
    std::unique_lock<std::mutex> lock(state_->mutex);
    bool cancelled = state_->cv.wait_until(lock, wake, [this] { return state_->cancelled; });
    return !cancelled && !cut_short;
}

std::chrono::milliseconds Deadline::Clamp(std::chrono::milliseconds per_call) const {
    return std::min(per_call, Remaining());
}

}
