#pragma once
#include "../interfaces/IStrategy.hpp"

namespace GateResolve {

// Follows HTTP 3xx, meta refresh and script redirects hop by hop until a stable page
// on another host, within the hop ceiling.
class RedirectChainStrategy : public IStrategy {
public:
    explicit RedirectChainStrategy(std::chrono::milliseconds fetch_timeout);

    StrategyKind Kind() const override { return StrategyKind::RedirectChain; }
    bool NeedsPage() const override { return false; }
    StrategyOutcome Attempt(const FetchResult& page, const StrategyContext& ctx) override;

private:
    std::optional<std::string> NextHop(const FetchResult& response, const std::string& url) const;

    std::chrono::milliseconds fetch_timeout_;
};

}
