#pragma once
#include "../interfaces/IStrategy.hpp"

namespace GateResolve {

// Anti-bot interstitials. Retries with browser-like headers and the cookies collected so far,
// backing off between attempts, then reads the link from the cleared page.
class CloudflareStrategy : public IStrategy {
public:
    CloudflareStrategy(int max_retries, std::chrono::milliseconds retry_delay, std::chrono::milliseconds fetch_timeout);

    StrategyKind Kind() const override { return StrategyKind::Cloudflare; }
    StrategyOutcome Attempt(const FetchResult& page, const StrategyContext& ctx) override;

    // cf-mitigated: challenge, or a 403/429/503 from Cloudflare whose body carries a challenge marker.
    static bool IsChallenge(const FetchResult& page);
    static HeaderMap BrowserHeaders();

private:
    int max_retries_;
    std::chrono::milliseconds retry_delay_;
    std::chrono::milliseconds fetch_timeout_;
};

}
