#pragma once
#include <string>
#include <optional>
#include <list>
#include <unordered_map>
#include <vector>
#include <memory>
#include <chrono>
#include <mutex>
#include "../interfaces/ILinkCache.hpp"

namespace GateResolve {
    // In-memory LRU split into independently locked shards, so lookups for
    // different fingerprints rarely contend on the same mutex.
    class LinkCache : public ILinkCache {
    public:
        LinkCache(size_t max_size, std::chrono::seconds default_ttl, size_t shard_count = 16);

        std::optional<CacheEntry> Get(const std::string& fingerprint) override;
        void Put(const std::string& fingerprint, const std::string& destination,
                 const std::string& strategy, std::chrono::seconds ttl = std::chrono::seconds(0)) override;
        void Invalidate(const std::string& fingerprint) override;

        // Removes expired entries; returns how many were dropped.
        size_t Sweep();
        size_t Size() const;

    private:
        struct Shard {
            std::list<CacheEntry> entries; // front = most recently used
            std::unordered_map<std::string, std::list<CacheEntry>::iterator> index;
            mutable std::mutex mutex;
        };

        Shard& ShardFor(const std::string& fingerprint) const;

        size_t max_per_shard_;
        std::chrono::seconds default_ttl_;
        std::vector<std::unique_ptr<Shard>> shards_;
    };
}
