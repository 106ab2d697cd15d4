#include "CssHiddenStrategy.hpp"
#include "StrategyUtil.hpp"
#include "../parser/HtmlDocument.hpp"
#include "../utils/RegexScan.hpp"
#include "../utils/UrlUtil.hpp"
#include <regex>
#include <set>
#include <sstream>

namespace GateResolve {

using namespace StrategyUtil;

namespace {

struct HidingRules {
    std::set<std::string> classes;
    std::set<std::string> ids;
};

std::string Squash(const std::string& style) {
    std::string out;
    out.reserve(style.size());
    for (char c : style) {
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') out += c;
    }
    return ToLower(out);
}

bool DeclaresHidden(const std::string& style) {
    std::string s = Squash(style);
    if (s.find("display:none") != std::string::npos) return true;
    if (s.find("visibility:hidden") != std::string::npos) return true;
    auto pos = s.find("opacity:0");
    while (pos != std::string::npos) {
        size_t after = pos + 9;
        if (after >= s.size() || s[after] == ';' || s[after] == '!' || s[after] == '}') return true;
        pos = s.find("opacity:0", after);
    }
    return false;
}

std::vector<std::string> Tokens(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream in(s);
    std::string t;
    while (in >> t) out.push_back(ToLower(t));
    return out;
}

HidingRules CollectStyleRules(const HtmlDocument& doc) {
    static const std::regex rule(R"(([^{}]+)\{([^}]*)\})");
    static const std::regex class_sel(R"(^(?:[a-z0-9]*)\.([\w-]+)$)", std::regex::icase);
    static const std::regex id_sel(R"(^(?:[a-z0-9]*)#([\w-]+)$)", std::regex::icase);
    HidingRules rules;
    for (const HtmlElement* style : doc.ByTag("style")) {
        const std::string& css = style->text;
        for (const auto& m : RegexScan::FindAll(css, rule)) {
            if (!DeclaresHidden(m[2])) continue;
            std::stringstream selectors(m[1]);
            std::string sel;
            while (std::getline(selectors, sel, ',')) {
                auto b = sel.find_first_not_of(" \t\r\n");
                auto e = sel.find_last_not_of(" \t\r\n");
                if (b == std::string::npos) continue;
                sel = sel.substr(b, e - b + 1);
                std::smatch m;
                if (std::regex_match(sel, m, class_sel)) rules.classes.insert(ToLower(m[1].str()));
                else if (std::regex_match(sel, m, id_sel)) rules.ids.insert(ToLower(m[1].str()));
            }
        }
    }
    return rules;
}

bool HiddenItself(const HtmlElement& el, const HidingRules& rules) {
    static const std::set<std::string> kHidingClasses = {"hidden", "hide", "invisible", "d-none", "is-hidden"};
    if (el.Has("hidden")) return true;
    if (DeclaresHidden(el.Attr("style"))) return true;
    for (const auto& cls : Tokens(el.Attr("class"))) {
        if (kHidingClasses.count(cls) || rules.classes.count(cls)) return true;
    }
    std::string id = ToLower(el.Attr("id"));
    return !id.empty() && rules.ids.count(id) > 0;
}

bool IsHidden(const HtmlDocument& doc, const HtmlElement& el, const HidingRules& rules) {
    for (const HtmlElement* cur = &el; cur != nullptr; cur = doc.Parent(*cur)) {
        if (HiddenItself(*cur, rules)) return true;
    }
    return false;
}

bool IsDecoyToken(const std::string& t) {
    if (t == "ad" || t == "ads" || t.rfind("ad-", 0) == 0 || t.rfind("ads-", 0) == 0 || t.rfind("ad_", 0) == 0) return true;
    static const std::vector<const char*> kMarkers = {"advert", "sponsor", "promo", "banner", "popup", "popunder"};
    return ContainsAny(t, kMarkers);
}

bool IsDecoy(const HtmlElement& el) {
    for (const auto& t : Tokens(el.Attr("class"))) {
        if (IsDecoyToken(t)) return true;
    }
    std::string id = ToLower(el.Attr("id"));
    if (!id.empty() && IsDecoyToken(id)) return true;
    return ToLower(el.Attr("rel")).find("sponsored") != std::string::npos;
}

}

StrategyOutcome CssHiddenStrategy::Attempt(const FetchResult& page, const StrategyContext& ctx) {
    auto doc = HtmlDocument::Parse(page.body);
    if (!doc) return Fail(StrategyErrorKind::ParseFailed, "page could not be parsed");

    HidingRules rules = CollectStyleRules(*doc);
    std::vector<const HtmlElement*> visible;
    size_t hidden = 0;
    for (const HtmlElement* a : doc->ByTag("a")) {
        if (!a->Has("href")) continue;
        if (IsHidden(*doc, *a, rules)) ++hidden;
        else visible.push_back(a);
    }
    if (hidden == 0) return Decline("no CSS-hidden links on page");

    const std::string base = BaseUrlOf(page, ctx);
    std::optional<std::string> best;
    int best_score = 0;
    for (const HtmlElement* a : visible) {
        if (IsDecoy(*a)) continue;
        auto candidate = AcceptCandidate(a->Attr("href"), page, ctx);
        if (!candidate || UrlUtil::SameHost(*candidate, base)) continue;
        int score = HasDownloadHint(a->Attr("href") + " " + a->text + " " + a->Attr("class") + " " + a->Attr("id")) ? 2 : 1;
        if (score > best_score) {
            best = candidate;
            best_score = score;
        }
    }
    if (!best) return Decline("no visible link besides hidden decoys");
    return Resolve(*best);
}

}
