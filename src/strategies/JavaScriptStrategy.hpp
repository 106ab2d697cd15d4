#pragma once
#include "../interfaces/IStrategy.hpp"

namespace GateResolve {

// Statically reads inline scripts for the navigation they would perform.
class JavaScriptStrategy : public IStrategy {
public:
    StrategyKind Kind() const override { return StrategyKind::JavaScript; }
    StrategyOutcome Attempt(const FetchResult& page, const StrategyContext& ctx) override;
};

}
