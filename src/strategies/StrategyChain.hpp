#pragma once
#include <memory>
#include <vector>
#include "../interfaces/IStrategy.hpp"
#include "BrowserAutomationStrategy.hpp"

namespace GateResolve {

class BrowserPool;

struct StrategyChainOptions {
    std::chrono::milliseconds fetch_timeout{30000};
    std::chrono::seconds countdown_max_wait{15};
    int cloudflare_max_retries = 3;
    std::chrono::milliseconds cloudflare_retry_delay{2000};
    BrowserPool* browser_pool = nullptr;       // no browser strategy when null
    BrowserAutomationStrategy::Options browser;
};

// All strategies in their fixed priority order.
std::vector<std::unique_ptr<IStrategy>> BuildStrategyChain(const StrategyChainOptions& options);

}
