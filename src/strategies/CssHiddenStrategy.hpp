#pragma once
#include "../interfaces/IStrategy.hpp"

namespace GateResolve {

// Gate pages that hide the real link (or plant hidden decoys) with CSS. Only engages when at
// least one link is hidden; then picks the visible non-decoy link.
class CssHiddenStrategy : public IStrategy {
public:
    StrategyKind Kind() const override { return StrategyKind::CssHidden; }
    StrategyOutcome Attempt(const FetchResult& page, const StrategyContext& ctx) override;
};

}
