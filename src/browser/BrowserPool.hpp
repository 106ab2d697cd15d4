#pragma once
#include <memory>
#include <mutex>
#include <condition_variable>
#include <deque>
#include <optional>
#include "../interfaces/IBrowserSession.hpp"

namespace GateResolve {

// Fixed-capacity pool of browser sessions. Sessions are launched lazily up to the capacity;
// callers beyond it wait for a release or for their deadline.
class BrowserPool {
public:
    // Exclusive use of one session. Returns it to the pool on destruction, or closes and
    // discards it when marked broken.
    class Lease {
    public:
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        ~Lease();

        IBrowserSession& Session() { return *session_; }
        void MarkBroken() { broken_ = true; }

    private:
        friend class BrowserPool;
        Lease(BrowserPool* pool, std::unique_ptr<IBrowserSession> session);
        void Return();

        BrowserPool* pool_ = nullptr;
        std::unique_ptr<IBrowserSession> session_;
        bool broken_ = false;
    };

    BrowserPool(size_t capacity, BrowserSessionFactory factory);
    ~BrowserPool();

    BrowserPool(const BrowserPool&) = delete;
    BrowserPool& operator=(const BrowserPool&) = delete;

    // nullopt when no session became free before the deadline (or it was cancelled).
    // Throws BrowserError when launching a new session fails.
    std::optional<Lease> Acquire(const Deadline& deadline);

    size_t Capacity() const { return capacity_; }
    size_t LiveSessions() const;
    size_t PeakSessions() const;

private:
    void Release(std::unique_ptr<IBrowserSession> session, bool broken);

    const size_t capacity_;
    BrowserSessionFactory factory_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::unique_ptr<IBrowserSession>> idle_;
    size_t live_ = 0;
    size_t peak_ = 0;
};

}
