#include "StrategyChain.hpp"
#include "HtmlFormStrategy.hpp"
#include "CssHiddenStrategy.hpp"
#include "JavaScriptStrategy.hpp"
#include "CountdownStrategy.hpp"
#include "DynamicContentStrategy.hpp"
#include "CloudflareStrategy.hpp"
#include "RedirectChainStrategy.hpp"
#include "Base64DecodeStrategy.hpp"
#include "UrlDecodeStrategy.hpp"

namespace GateResolve {

std::vector<std::unique_ptr<IStrategy>> BuildStrategyChain(const StrategyChainOptions& options) {
    std::vector<std::unique_ptr<IStrategy>> chain;
    chain.push_back(std::make_unique<HtmlFormStrategy>());
    chain.push_back(std::make_unique<CssHiddenStrategy>());
    chain.push_back(std::make_unique<JavaScriptStrategy>());
    chain.push_back(std::make_unique<CountdownStrategy>(options.countdown_max_wait, options.fetch_timeout));
    chain.push_back(std::make_unique<DynamicContentStrategy>(options.fetch_timeout));
    chain.push_back(std::make_unique<CloudflareStrategy>(options.cloudflare_max_retries,
                                                         options.cloudflare_retry_delay,
                                                         options.fetch_timeout));
    chain.push_back(std::make_unique<RedirectChainStrategy>(options.fetch_timeout));
    chain.push_back(std::make_unique<Base64DecodeStrategy>());
    chain.push_back(std::make_unique<UrlDecodeStrategy>());
    if (options.browser_pool) {
        chain.push_back(std::make_unique<BrowserAutomationStrategy>(*options.browser_pool, options.browser));
    }
    return chain;
}

}
