#include "UrlDecodeStrategy.hpp"
#include "StrategyUtil.hpp"
#include "../utils/RegexScan.hpp"
#include "../utils/UrlUtil.hpp"
#include <regex>

namespace GateResolve {

using namespace StrategyUtil;

namespace {

// Undoes up to three layers of percent-encoding.
std::string FullyDecode(const std::string& raw) {
    std::string current = raw;
    for (int i = 0; i < 3; ++i) {
        std::string next = UrlUtil::PercentDecode(current, false);
        if (next == current) break;
        current = std::move(next);
    }
    return current;
}

bool StartsWithHttp(const std::string& s) {
    std::string lower = ToLower(s.substr(0, 8));
    return lower.rfind("http://", 0) == 0 || lower.rfind("https://", 0) == 0;
}

}

StrategyOutcome UrlDecodeStrategy::Attempt(const FetchResult& page, const StrategyContext& ctx) {
    std::vector<std::string> sources = {ctx.source_url};
    if (!page.final_url.empty() && page.final_url != ctx.source_url) sources.push_back(page.final_url);

    for (const auto& source : sources) {
        auto parsed = UrlUtil::ParseUrl(source);
        if (!parsed) continue;
        for (const auto& [key, value] : UrlUtil::ParseQuery(parsed->query)) {
            std::string decoded = FullyDecode(value);
            if (!StartsWithHttp(decoded) || !UrlUtil::IsHttpUrl(decoded)) continue;
            if (auto url = AcceptCandidate(decoded, page, ctx)) return Resolve(*url);
        }
    }

    static const std::regex param(R"((?:url|link|redirect|dest|target|goto)=([^&\s"'<>]+))", std::regex::icase);
    for (const auto& m : RegexScan::FindAll(page.body, param)) {
        const std::string& raw = m[1];
        std::string decoded = FullyDecode(raw);
        if (decoded == raw || !StartsWithHttp(decoded)) continue;
        if (auto url = AcceptCandidate(decoded, page, ctx)) return Resolve(*url);
    }
    return Decline("no percent-encoded destination");
}

}
