#include "RedirectChainStrategy.hpp"
#include "StrategyUtil.hpp"
#include "../parser/HtmlDocument.hpp"
#include "../parser/ScriptScanner.hpp"
#include "../utils/UrlUtil.hpp"
#include "../utils/Logger.hpp"
#include <set>

namespace GateResolve {

using namespace StrategyUtil;

RedirectChainStrategy::RedirectChainStrategy(std::chrono::milliseconds fetch_timeout)
    : fetch_timeout_(fetch_timeout) {}

std::optional<std::string> RedirectChainStrategy::NextHop(const FetchResult& response, const std::string& url) const {
    if (response.status_code >= 300 && response.status_code < 400) {
        auto it = response.headers.find("Location");
        if (it != response.headers.end() && !it->second.empty()) return UrlUtil::ResolveAgainst(url, it->second);
        return std::nullopt;
    }
    if (response.body.empty()) return std::nullopt;

    auto doc = HtmlDocument::Parse(response.body);
    if (!doc) return std::nullopt;
    if (auto refresh = ScriptScanner::MetaRefreshTarget(*doc)) return UrlUtil::ResolveAgainst(url, *refresh);
    for (const auto& script : doc->ScriptTexts()) {
        auto targets = ScriptScanner::NavigationTargets(script);
        if (!targets.empty()) return UrlUtil::ResolveAgainst(url, targets.front());
    }
    return std::nullopt;
}

StrategyOutcome RedirectChainStrategy::Attempt(const FetchResult& page, const StrategyContext& ctx) {
    std::string current_url = BaseUrlOf(page, ctx);
    FetchResult current = page;
    bool have_response = page.status_code != 0;
    int hops = 0;
    std::set<std::string> visited = {UrlUtil::Fingerprint(ctx.source_url), UrlUtil::Fingerprint(current_url)};

    while (true) {
        if (!have_response) {
            FetchRequest req;
            req.url = current_url;
            req.follow_redirects = false;
            req.accept_error_status = true;
            req.timeout = ctx.deadline.Clamp(fetch_timeout_);
            FetchOutcome outcome = ctx.fetcher.Fetch(req, ctx.deadline);
            if (auto* error = std::get_if<FetchError>(&outcome)) return FailFromFetch(*error, ctx.deadline);
            current = std::get<FetchResult>(std::move(outcome));
            have_response = true;
        }

        auto next = NextHop(current, current_url);
        if (!next || !UrlUtil::IsHttpUrl(*next)) break;
        if (!visited.insert(UrlUtil::Fingerprint(*next)).second) return Decline("redirect loop at " + *next);
        if (++hops + page.redirect_count > ctx.max_redirect_hops) {
            return Decline("hop ceiling of " + std::to_string(ctx.max_redirect_hops) + " reached");
        }
        Logger::Log(LogLevel::Debug, "Redirect hop " + std::to_string(hops) + ": " + *next);
        current_url = *next;
        have_response = false;
    }

    if (hops == 0 && page.redirect_count == 0) return Decline("page is not a redirect");
    if (UrlUtil::SameHost(current_url, ctx.source_url)) return Decline("chain ended on the gate host");
    if (current.status_code >= 400) {
        Logger::Log(LogLevel::Debug, "Chain ended on status " + std::to_string(current.status_code) + " at " + current_url);
    }
    if (UrlUtil::Fingerprint(current_url) == UrlUtil::Fingerprint(ctx.source_url)) return Decline("chain returned to the source");
    return Resolve(current_url, hops);
}

}
