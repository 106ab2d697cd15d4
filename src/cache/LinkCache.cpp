#include "LinkCache.hpp"
#include <functional>
#include <algorithm>

namespace GateResolve {

LinkCache::LinkCache(size_t max_size, std::chrono::seconds default_ttl, size_t shard_count)
    : default_ttl_(default_ttl) {
    if (shard_count == 0) shard_count = 1;
    if (max_size < shard_count) shard_count = max_size > 0 ? max_size : 1;
    max_per_shard_ = std::max<size_t>(1, max_size / shard_count);
    shards_.reserve(shard_count);
    for (size_t i = 0; i < shard_count; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

LinkCache::Shard& LinkCache::ShardFor(const std::string& fingerprint) const {
    return *shards_[std::hash<std::string>{}(fingerprint) % shards_.size()];
}

std::optional<CacheEntry> LinkCache::Get(const std::string& fingerprint) {
    Shard& shard = ShardFor(fingerprint);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.index.find(fingerprint);

    if (it == shard.index.end()) {
        return std::nullopt; // Not found
    }

    // Check for expiry
    if (std::chrono::system_clock::now() >= it->second->expires_at) {
        shard.entries.erase(it->second);
        shard.index.erase(it);
        return std::nullopt;
    }

    // Move the accessed element to the front of the list (most recently used)
    shard.entries.splice(shard.entries.begin(), shard.entries, it->second);
    ++it->second->hit_count;
    return *it->second;
}

void LinkCache::Put(const std::string& fingerprint, const std::string& destination,
                    const std::string& strategy, std::chrono::seconds ttl) {
    if (ttl.count() <= 0) ttl = default_ttl_;
    Shard& shard = ShardFor(fingerprint);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.index.find(fingerprint);

    // If entry already exists, remove it to update its position and value
    if (it != shard.index.end()) {
        shard.entries.erase(it->second);
        shard.index.erase(it);
    }

    // If the shard is full, remove the least recently used item
    if (shard.index.size() >= max_per_shard_ && !shard.entries.empty()) {
        shard.index.erase(shard.entries.back().fingerprint);
        shard.entries.pop_back();
    }

    auto now = std::chrono::system_clock::now();
    CacheEntry entry;
    entry.fingerprint = fingerprint;
    entry.destination = destination;
    entry.strategy = strategy;
    entry.resolved_at = now;
    entry.expires_at = now + ttl;
    entry.hit_count = 0;
    shard.entries.push_front(std::move(entry));
    shard.index[fingerprint] = shard.entries.begin();
}

void LinkCache::Invalidate(const std::string& fingerprint) {
    Shard& shard = ShardFor(fingerprint);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.index.find(fingerprint);
    if (it == shard.index.end()) return;
    shard.entries.erase(it->second);
    shard.index.erase(it);
}

size_t LinkCache::Sweep() {
    size_t removed = 0;
    auto now = std::chrono::system_clock::now();
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        for (auto it = shard->entries.begin(); it != shard->entries.end();) {
            if (now >= it->expires_at) {
                shard->index.erase(it->fingerprint);
                it = shard->entries.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    return removed;
}

size_t LinkCache::Size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        total += shard->index.size();
    }
    return total;
}

}
