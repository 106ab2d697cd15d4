#pragma once
#include "../interfaces/IStrategy.hpp"

namespace GateResolve {

class UrlDecodeStrategy : public IStrategy {
public:
    StrategyKind Kind() const override { return StrategyKind::UrlDecode; }
    bool NeedsPage() const override { return false; }
    StrategyOutcome Attempt(const FetchResult& page, const StrategyContext& ctx) override;
};

}
