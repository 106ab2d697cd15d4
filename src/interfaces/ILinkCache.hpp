#pragma once
#include <string>
#include <optional>
#include <chrono>
#include <stdexcept>
#include <cstdint>

namespace GateResolve {

struct CacheEntry {
    std::string fingerprint;
    std::string destination;
    std::string strategy;
    std::chrono::system_clock::time_point resolved_at;
    std::chrono::system_clock::time_point expires_at;
    uint64_t hit_count = 0;
};

enum class CacheErrorKind {
    BackendUnavailable
};

// Thrown by cache backends; the pipeline treats it as a miss on read and logs it on write.
class CacheError : public std::runtime_error {
public:
    explicit CacheError(const std::string& what, CacheErrorKind kind = CacheErrorKind::BackendUnavailable)
        : std::runtime_error(what), kind_(kind) {}
    CacheErrorKind Kind() const { return kind_; }
private:
    CacheErrorKind kind_;
};

class ILinkCache {
public:
    virtual ~ILinkCache() = default;
    // Never returns an expired entry. A hit increments the entry's hit counter.
    virtual std::optional<CacheEntry> Get(const std::string& fingerprint) = 0;
    // ttl of zero uses the cache default.
    virtual void Put(const std::string& fingerprint, const std::string& destination,
                     const std::string& strategy, std::chrono::seconds ttl = std::chrono::seconds(0)) = 0;
    virtual void Invalidate(const std::string& fingerprint) = 0;
};

}
