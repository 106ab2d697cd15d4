#include "HtmlFormStrategy.hpp"
#include "StrategyUtil.hpp"
#include "../parser/HtmlDocument.hpp"
#include "../utils/UrlUtil.hpp"

namespace GateResolve {

using namespace StrategyUtil;

namespace {

bool IsFieldTag(const std::string& tag) {
    return tag == "input" || tag == "select" || tag == "textarea";
}

std::string AppendQuery(const std::string& target, const std::vector<std::pair<std::string, std::string>>& fields) {
    if (fields.empty()) return target;
    std::string out = target;
    auto hash = out.find('#');
    std::string fragment;
    if (hash != std::string::npos) {
        fragment = out.substr(hash);
        out.erase(hash);
    }
    out += (out.find('?') == std::string::npos) ? '?' : '&';
    bool first = true;
    for (const auto& [name, value] : fields) {
        if (!first) out += '&';
        first = false;
        out += UrlUtil::PercentEncode(name) + "=" + UrlUtil::PercentEncode(value);
    }
    return out + fragment;
}

}

StrategyOutcome HtmlFormStrategy::Attempt(const FetchResult& page, const StrategyContext& ctx) {
    auto doc = HtmlDocument::Parse(page.body);
    if (!doc) return Fail(StrategyErrorKind::ParseFailed, "page could not be parsed");

    auto forms = doc->ByTag("form");
    if (forms.empty()) return Decline("no form on page");

    const std::string base = BaseUrlOf(page, ctx);
    for (const HtmlElement* form : forms) {
        std::vector<std::pair<std::string, std::string>> fields;
        for (const auto& el : doc->Elements()) {
            if (!IsFieldTag(el.tag) || !doc->IsInside(el, *form)) continue;
            std::string name = el.Attr("name");
            if (name.empty()) continue;
            std::string type = ToLower(el.Attr("type"));
            if (type == "submit" || type == "button" || type == "image" || type == "reset" || type == "file") continue;
            if ((type == "checkbox" || type == "radio") && !el.Has("checked")) continue;
            std::string value = el.Attr("value");

            // A hidden field carrying an absolute URL is the destination itself.
            if (type == "hidden" && UrlUtil::IsHttpUrl(value)) {
                if (auto dest = AcceptCandidate(value, page, ctx)) return Resolve(*dest);
            }
            fields.emplace_back(std::move(name), std::move(value));
        }

        std::string action = form->Attr("action");
        if (action.empty()) continue;
        auto target = AcceptCandidate(action, page, ctx);
        if (!target) continue;
        // Posting back to the gate host is another gate step, not a destination.
        if (UrlUtil::SameHost(*target, base) || UrlUtil::SameHost(*target, ctx.source_url)) continue;

        std::string method = ToLower(form->Attr("method"));
        if (method == "post") return Resolve(*target);
        return Resolve(AppendQuery(*target, fields));
    }
    return Decline("no form encodes a destination");
}

}
