#include "BrowserAutomationStrategy.hpp"
#include "StrategyUtil.hpp"
#include "../browser/BrowserPool.hpp"
#include "../parser/HtmlDocument.hpp"
#include "../utils/UrlUtil.hpp"
#include "../utils/Logger.hpp"
#include <cstdlib>

namespace GateResolve {

using namespace StrategyUtil;

namespace {

const char* kCountdownQuery =
    "(function(){var e=document.querySelector('[id*=countdown],[class*=countdown],[id*=timer],[class*=timer]');"
    "if(!e)return 0;var m=(e.textContent||'').match(/\\d+/);return m?parseInt(m[0],10):0;})()";

}

BrowserAutomationStrategy::BrowserAutomationStrategy(BrowserPool& pool, Options options)
    : pool_(pool), options_(std::move(options)) {}

std::optional<std::string> BrowserAutomationStrategy::LeftGate(IBrowserSession& session, const StrategyContext& ctx) {
    std::string location = session.CurrentLocation(ctx.deadline);
    if (!UrlUtil::IsHttpUrl(location) || UrlUtil::SameHost(location, ctx.source_url)) return std::nullopt;
    FetchResult rendered;
    rendered.final_url = ctx.source_url;
    return AcceptCandidate(location, rendered, ctx);
}

StrategyOutcome BrowserAutomationStrategy::Drive(IBrowserSession& session, const StrategyContext& ctx) {
    session.Navigate(ctx.source_url, ctx.deadline);
    session.WaitForIdle(options_.settle, ctx.deadline);
    if (auto url = LeftGate(session, ctx)) return Resolve(*url);

    long seconds = std::strtol(session.Evaluate(kCountdownQuery, ctx.deadline).c_str(), nullptr, 10);
    if (seconds > 0 && seconds <= options_.max_countdown.count()) {
        Logger::Log(LogLevel::Debug, "Browser waiting " + std::to_string(seconds) + "s for countdown");
        if (!ctx.deadline.SleepFor(std::chrono::seconds(seconds + 1))) {
            return Fail(StrategyErrorKind::BudgetExceeded, "budget ran out during countdown wait");
        }
        if (auto url = LeftGate(session, ctx)) return Resolve(*url);
    }

    for (const auto& selector : options_.click_selectors) {
        if (ctx.deadline.Expired()) return Fail(StrategyErrorKind::BudgetExceeded, "budget ran out while interacting");
        if (!session.Click(selector, ctx.deadline)) continue;
        session.WaitForIdle(options_.settle, ctx.deadline);
        if (auto url = LeftGate(session, ctx)) return Resolve(*url, 2);
    }

    // The link may have been revealed in place instead of navigated to.
    FetchResult rendered;
    rendered.final_url = session.CurrentLocation(ctx.deadline);
    rendered.body = session.Content(ctx.deadline);
    auto doc = HtmlDocument::Parse(rendered.body);
    if (!doc) return Fail(StrategyErrorKind::ParseFailed, "rendered page could not be parsed");
    for (const HtmlElement* a : doc->ByTag("a")) {
        if (!HasDownloadHint(a->Attr("id") + " " + a->Attr("class") + " " + a->text)) continue;
        auto url = AcceptCandidate(a->Attr("href"), rendered, ctx);
        if (url && !UrlUtil::SameHost(*url, ctx.source_url)) return Resolve(*url);
    }
    return Decline("rendered page revealed no destination");
}

StrategyOutcome BrowserAutomationStrategy::Attempt(const FetchResult&, const StrategyContext& ctx) {
    std::optional<BrowserPool::Lease> lease;
    try {
        lease = pool_.Acquire(ctx.deadline);
    } catch (const BrowserError& e) {
        return Fail(StrategyErrorKind::BrowserFailed, e.what());
    }
    if (!lease) return Fail(StrategyErrorKind::BudgetExceeded, "no browser session became free within the budget");

    try {
        StrategyOutcome outcome = Drive(lease->Session(), ctx);
        // A session cut off mid-wait may still be running the gate's scripts.
        if (std::holds_alternative<Failed>(outcome)) lease->MarkBroken();
        return outcome;
    } catch (const BrowserError& e) {
        lease->MarkBroken();
        Logger::Log(LogLevel::Warn, std::string("Browser session failed: ") + e.what());
        if (ctx.deadline.Expired()) return Fail(StrategyErrorKind::BudgetExceeded, e.what());
        return Fail(StrategyErrorKind::BrowserFailed, e.what());
    }
}

}
