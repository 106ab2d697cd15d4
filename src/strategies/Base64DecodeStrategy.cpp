#include "Base64DecodeStrategy.hpp"
#include "StrategyUtil.hpp"
#include "../parser/HtmlDocument.hpp"
#include "../parser/ScriptScanner.hpp"
#include "../utils/Base64.hpp"
#include "../utils/UrlUtil.hpp"

namespace GateResolve {

using namespace StrategyUtil;

namespace {

bool Printable(const std::string& s) {
    for (unsigned char c : s) {
        if (c < 0x21 || c == 0x7f) return false;
    }
    return true;
}

void AddUrlCandidates(const std::string& url, std::vector<std::string>& out) {
    auto parsed = UrlUtil::ParseUrl(url);
    if (!parsed) return;
    for (const auto& [key, value] : UrlUtil::ParseQuery(parsed->query)) {
        out.push_back(UrlUtil::PercentDecode(value, false));
    }
    if (!parsed->fragment.empty()) {
        if (parsed->fragment.find('=') == std::string::npos || Base64::LooksEncoded(parsed->fragment)) {
            out.push_back(UrlUtil::PercentDecode(parsed->fragment, false));
        }
        for (const auto& [key, value] : UrlUtil::ParseQuery(parsed->fragment)) {
            out.push_back(UrlUtil::PercentDecode(value, false));
        }
    }
    auto slash = parsed->path.find_last_of('/');
    if (slash != std::string::npos && slash + 1 < parsed->path.size()) {
        out.push_back(UrlUtil::PercentDecode(parsed->path.substr(slash + 1), false));
    }
}

}

std::optional<std::string> Base64DecodeStrategy::DecodeUrl(const std::string& encoded) {
    std::string layer = encoded;
    for (int depth = 0; depth < 2; ++depth) {
        if (!Base64::LooksEncoded(layer)) return std::nullopt;
        auto decoded = Base64::Decode(layer);
        if (!decoded) return std::nullopt;
        auto b = decoded->find_first_not_of(" \t\r\n");
        auto e = decoded->find_last_not_of(" \t\r\n");
        if (b == std::string::npos) return std::nullopt;
        layer = decoded->substr(b, e - b + 1);
        std::string lower = ToLower(layer.substr(0, 8));
        if ((lower.rfind("http://", 0) == 0 || lower.rfind("https://", 0) == 0) && Printable(layer)) {
            return layer;
        }
    }
    return std::nullopt;
}

StrategyOutcome Base64DecodeStrategy::Attempt(const FetchResult& page, const StrategyContext& ctx) {
    std::vector<std::string> candidates;
    AddUrlCandidates(ctx.source_url, candidates);
    if (!page.final_url.empty() && page.final_url != ctx.source_url) AddUrlCandidates(page.final_url, candidates);

    if (!page.body.empty()) {
        if (auto doc = HtmlDocument::Parse(page.body)) {
            for (const auto& el : doc->Elements()) {
                for (const char* attr : {"data-url", "data-link", "data-href", "data-target", "data-u", "data-go"}) {
                    std::string v = el.Attr(attr);
                    if (!v.empty()) candidates.push_back(v);
                }
            }
        }
        for (auto& literal : ScriptScanner::AtobLiterals(page.body)) candidates.push_back(std::move(literal));
    }

    for (const auto& candidate : candidates) {
        auto decoded = DecodeUrl(candidate);
        if (!decoded || !UrlUtil::IsHttpUrl(*decoded)) continue;
        if (auto url = AcceptCandidate(*decoded, page, ctx)) return Resolve(*url);
    }
    return Decline("no base64-encoded destination");
}

}
