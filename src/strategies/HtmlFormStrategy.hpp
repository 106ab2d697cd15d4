#pragma once
#include "../interfaces/IStrategy.hpp"

namespace GateResolve {

// Reads the gate's submission form: a hidden field holding the destination, or the
// form target rebuilt from its action and fields.
class HtmlFormStrategy : public IStrategy {
public:
    StrategyKind Kind() const override { return StrategyKind::HtmlForm; }
    StrategyOutcome Attempt(const FetchResult& page, const StrategyContext& ctx) override;
};

}
