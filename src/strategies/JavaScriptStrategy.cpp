#include "JavaScriptStrategy.hpp"
#include "StrategyUtil.hpp"
#include "../parser/HtmlDocument.hpp"
#include "../parser/ScriptScanner.hpp"

namespace GateResolve {

using namespace StrategyUtil;

StrategyOutcome JavaScriptStrategy::Attempt(const FetchResult& page, const StrategyContext& ctx) {
    auto doc = HtmlDocument::Parse(page.body);
    if (!doc) return Fail(StrategyErrorKind::ParseFailed, "page could not be parsed");

    std::vector<std::string> scripts = doc->ScriptTexts();
    for (const auto& el : doc->Elements()) {
        std::string handler = el.Attr("onclick");
        if (!handler.empty()) scripts.push_back(std::move(handler));
    }
    if (scripts.empty()) return Decline("no inline scripts");

    auto first_accepted = [&](const std::vector<std::string>& raw) -> std::optional<std::string> {
        for (const auto& r : raw) {
            if (auto url = AcceptCandidate(r, page, ctx)) return url;
        }
        return std::nullopt;
    };

    for (const auto& s : scripts) {
        if (auto url = first_accepted(ScriptScanner::NavigationTargets(s))) return Resolve(*url);
    }
    if (auto url = first_accepted(ScriptScanner::IndirectNavigationTargets(scripts))) return Resolve(*url);
    for (const auto& s : scripts) {
        if (auto url = first_accepted(ScriptScanner::LinkVariables(s))) return Resolve(*url);
    }
    return Decline("no literal navigation target in scripts");
}

}
