#pragma once
#include <array>
#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>
#include "Resolution.hpp"
#include "../interfaces/IFetcher.hpp"
#include "../interfaces/ILinkCache.hpp"
#include "../interfaces/IStrategy.hpp"

namespace GateResolve {

struct PipelineStats {
    uint64_t total = 0;
    uint64_t successes = 0;
    uint64_t cache_hits = 0;
    uint64_t coalesced = 0;
    std::map<std::string, uint64_t> by_strategy;

    double SuccessRate() const { return total == 0 ? 0.0 : static_cast<double>(successes) / static_cast<double>(total); }
};

// Runs the ordered strategy chain for one source link: cache first, one initial fetch,
// then fallback-on-decline within the request's time budget. Concurrent requests for the
// same fingerprint share a single run.
class ResolutionPipeline {
public:
    struct Options {
        std::chrono::milliseconds fetch_timeout{30000};
        std::chrono::seconds cache_ttl{0};  // 0: cache default
    };

    ResolutionPipeline(IFetcher& fetcher, ILinkCache& cache,
                       std::vector<std::unique_ptr<IStrategy>> strategies, Options options);

    ResolutionPipeline(const ResolutionPipeline&) = delete;
    ResolutionPipeline& operator=(const ResolutionPipeline&) = delete;

    ResolutionResult Resolve(const ResolutionRequest& request);

    PipelineStats Stats() const;

private:
    static constexpr size_t kStrategyKinds = 10;

    std::optional<ResolutionResult> LookupCache(const std::string& fingerprint);
    void Store(const std::string& fingerprint, const ResolutionResult& result);
    ResolutionResult RunChain(const ResolutionRequest& request, const std::string& fingerprint, const Deadline& deadline);
    ResolutionResult AwaitLeader(std::shared_future<ResolutionResult> pending, const Deadline& deadline);
    void Count(const ResolutionResult& result);

    IFetcher& fetcher_;
    ILinkCache& cache_;
    std::vector<std::unique_ptr<IStrategy>> strategies_;
    Options options_;

    std::mutex inflight_mutex_;
    std::unordered_map<std::string, std::shared_future<ResolutionResult>> inflight_;

    std::atomic<uint64_t> total_{0};
    std::atomic<uint64_t> successes_{0};
    std::atomic<uint64_t> cache_hits_{0};
    std::atomic<uint64_t> coalesced_{0};
    std::array<std::atomic<uint64_t>, kStrategyKinds> by_strategy_{};
};

}
