#pragma once
#include <vector>
#include "../interfaces/IStrategy.hpp"

namespace GateResolve {

class BrowserPool;
class IBrowserSession;

// Last resort: renders the gate in a pooled headless browser, lets its scripts and timers run,
// clicks the usual reveal buttons and reads where the page ends up.
class BrowserAutomationStrategy : public IStrategy {
public:
    struct Options {
        std::chrono::milliseconds settle{8000};            // longest wait for network idle per step
        std::chrono::seconds max_countdown{15};
        std::chrono::milliseconds minimum_cost{3000};
        std::vector<std::string> click_selectors = {
            "#go-link", "#get-link", "a.get-link", "#btn-main", "#continue", "button#continue",
            "#link-btn", "#proceed", ".btn-download", "#download", "#skip", ".skip-btn"
        };
    };

    BrowserAutomationStrategy(BrowserPool& pool, Options options);

    StrategyKind Kind() const override { return StrategyKind::BrowserAutomation; }
    bool NeedsPage() const override { return false; }
    std::chrono::milliseconds MinimumCost() const override { return options_.minimum_cost; }
    StrategyOutcome Attempt(const FetchResult& page, const StrategyContext& ctx) override;

private:
    StrategyOutcome Drive(IBrowserSession& session, const StrategyContext& ctx);
    std::optional<std::string> LeftGate(IBrowserSession& session, const StrategyContext& ctx);

    BrowserPool& pool_;
    Options options_;
};

}
