#include "BrowserPool.hpp"
#include "../utils/Logger.hpp"
#include <algorithm>

namespace GateResolve {

BrowserPool::Lease::Lease(BrowserPool* pool, std::unique_ptr<IBrowserSession> session)
    : pool_(pool), session_(std::move(session)) {}

BrowserPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), session_(std::move(other.session_)), broken_(other.broken_) {
    other.pool_ = nullptr;
}

BrowserPool::Lease& BrowserPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        Return();
        pool_ = other.pool_;
        session_ = std::move(other.session_);
        broken_ = other.broken_;
        other.pool_ = nullptr;
    }
    return *this;
}

BrowserPool::Lease::~Lease() {
    Return();
}

void BrowserPool::Lease::Return() {
    if (pool_ && session_) pool_->Release(std::move(session_), broken_);
    pool_ = nullptr;
}

BrowserPool::BrowserPool(size_t capacity, BrowserSessionFactory factory)
    : capacity_(std::max<size_t>(capacity, 1)), factory_(std::move(factory)) {}

BrowserPool::~BrowserPool() {
    std::deque<std::unique_ptr<IBrowserSession>> idle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle.swap(idle_);
        live_ -= idle.size();
    }
    for (auto& session : idle) {
        try {
            session->Close();
        } catch (const BrowserError& e) {
            Logger::Log(LogLevel::Warn, std::string("Closing browser session failed: ") + e.what());
        }
    }
}

std::optional<BrowserPool::Lease> BrowserPool::Acquire(const Deadline& deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (!idle_.empty()) {
            auto session = std::move(idle_.front());
            idle_.pop_front();
            return Lease(this, std::move(session));
        }
        if (live_ < capacity_) break;
        if (deadline.Expired()) return std::nullopt;
        // Cancellation does not signal this condition variable; poll in short slices.
        cv_.wait_for(lock, std::min(deadline.Remaining(), std::chrono::milliseconds(100)));
    }

    ++live_;
    peak_ = std::max(peak_, live_);
    lock.unlock();

    std::unique_ptr<IBrowserSession> session;
    try {
        session = factory_();
    } catch (...) {
        lock.lock();
        --live_;
        cv_.notify_one();
        throw;
    }
    if (!session) {
        lock.lock();
        --live_;
        cv_.notify_one();
        throw BrowserError("browser session factory returned no session");
    }
    Logger::Log(LogLevel::Debug, "Launched browser session (" + std::to_string(LiveSessions()) + "/" + std::to_string(capacity_) + ")");
    return Lease(this, std::move(session));
}

void BrowserPool::Release(std::unique_ptr<IBrowserSession> session, bool broken) {
    if (broken) {
        try {
            session->Close();
        } catch (const BrowserError& e) {
            Logger::Log(LogLevel::Warn, std::string("Closing broken browser session failed: ") + e.what());
        }
        session.reset();
        std::lock_guard<std::mutex> lock(mutex_);
        --live_;
    } else {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_.push_back(std::move(session));
    }
    cv_.notify_one();
}

size_t BrowserPool::LiveSessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_;
}

size_t BrowserPool::PeakSessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
}

}
