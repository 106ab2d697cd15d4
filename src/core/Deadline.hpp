#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <condition_variable>

namespace GateResolve {

// Time budget of one resolution. Copies share the same cancellation state, so a
// deadline handed to a fetch or browser call can be cancelled from the owner.
class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    explicit Deadline(std::chrono::milliseconds budget);
    static Deadline Unlimited();

    Clock::time_point At() const { return at_; }
    std::chrono::milliseconds Remaining() const;
    bool Expired() const;

    void Cancel();
    bool Cancelled() const;

    // Sleeps for `d` or until the deadline passes or is cancelled.
    // Returns true only when the full duration elapsed.
    bool SleepFor(std::chrono::milliseconds d) const;

    // Per-call timeout clamped to what is left of the budget.
    std::chrono::milliseconds Clamp(std::chrono::milliseconds per_call) const;

private:
    struct CancelState {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
    };

    Clock::time_point at_;
    std::shared_ptr<CancelState> state_;
};

}
