#include "DynamicContentStrategy.hpp"
#include "StrategyUtil.hpp"
#include "../parser/HtmlDocument.hpp"
#include "../parser/ScriptScanner.hpp"
#include "../utils/UrlUtil.hpp"
#include "../utils/Logger.hpp"
#include <algorithm>

namespace GateResolve {

using namespace StrategyUtil;

namespace {

bool LooksLikeLinkEndpoint(const std::string& endpoint) {
    static const std::vector<const char*> kMarkers = {"/api/", "/get", "ajax", "link", "json", "/go"};
    return ContainsAny(ToLower(endpoint), kMarkers);
}

}

DynamicContentStrategy::DynamicContentStrategy(std::chrono::milliseconds fetch_timeout, size_t max_endpoints)
    : fetch_timeout_(fetch_timeout), max_endpoints_(max_endpoints) {}

std::optional<std::string> DynamicContentStrategy::FindLink(const nlohmann::json& j, int depth) {
    if (depth > 3) return std::nullopt;
    if (j.is_array()) {
        for (const auto& item : j) {
            if (auto found = FindLink(item, depth + 1)) return found;
        }
        return std::nullopt;
    }
    if (!j.is_object()) return std::nullopt;

    static const char* kKeys[] = {"url", "link", "download", "download_url", "file", "destination", "redirect", "href"};
    for (const char* key : kKeys) {
        auto it = j.find(key);
        if (it != j.end() && it->is_string()) {
            std::string value = it->get<std::string>();
            if (!value.empty()) return value;
        }
    }
    for (const char* nested : {"data", "result", "response"}) {
        auto it = j.find(nested);
        if (it != j.end()) {
            if (auto found = FindLink(*it, depth + 1)) return found;
        }
    }
    return std::nullopt;
}

StrategyOutcome DynamicContentStrategy::Attempt(const FetchResult& page, const StrategyContext& ctx) {
    auto doc = HtmlDocument::Parse(page.body);
    if (!doc) return Fail(StrategyErrorKind::ParseFailed, "page could not be parsed");

    const std::string base = BaseUrlOf(page, ctx);
    std::vector<std::string> endpoints;
    for (const auto& script : doc->ScriptTexts()) {
        for (const auto& e : ScriptScanner::SecondaryRequestEndpoints(script)) {
            if (!LooksLikeLinkEndpoint(e)) continue;
            std::string absolute = UrlUtil::ResolveAgainst(base, e);
            if (UrlUtil::IsHttpUrl(absolute)
                && std::find(endpoints.begin(), endpoints.end(), absolute) == endpoints.end()) {
                endpoints.push_back(absolute);
            }
        }
    }
    if (endpoints.empty()) return Decline("no secondary request endpoints in scripts");
    if (endpoints.size() > max_endpoints_) endpoints.resize(max_endpoints_);

    std::optional<StrategyOutcome> last_failure;
    bool any_response = false;
    for (const auto& endpoint : endpoints) {
        FetchRequest req;
        req.url = endpoint;
        req.timeout = ctx.deadline.Clamp(fetch_timeout_);
        req.headers["X-Requested-With"] = "XMLHttpRequest";
        req.headers["Accept"] = "application/json, text/plain, */*";
        req.headers["Referer"] = base;
        if (!page.cookies.empty()) req.headers["Cookie"] = CookieHeader(page.cookies);

        FetchOutcome outcome = ctx.fetcher.Fetch(req, ctx.deadline);
        if (auto* error = std::get_if<FetchError>(&outcome)) {
            StrategyOutcome failed = FailFromFetch(*error, ctx.deadline);
            if (std::get<Failed>(failed).kind == StrategyErrorKind::BudgetExceeded) return failed;
            Logger::Log(LogLevel::Debug, "Secondary request " + endpoint + " failed: " + Describe(*error));
            last_failure = std::move(failed);
            continue;
        }
        any_response = true;
        const auto& response = std::get<FetchResult>(outcome);

        auto json = nlohmann::json::parse(response.body, nullptr, false);
        if (!json.is_discarded() && !json.is_string()) {
            if (auto raw = FindLink(json)) {
                if (auto url = AcceptCandidate(*raw, page, ctx)) return Resolve(*url);
            }
            continue;
        }

        std::string body = json.is_string() ? json.get<std::string>() : response.body;
        auto b = body.find_first_not_of(" \t\r\n\"");
        auto e = body.find_last_not_of(" \t\r\n\"");
        if (b == std::string::npos) continue;
        body = body.substr(b, e - b + 1);
        if (body.find_first_of(" \t\r\n<") == std::string::npos && UrlUtil::IsHttpUrl(body)) {
            if (auto url = AcceptCandidate(body, page, ctx)) return Resolve(*url);
        }
    }

    if (!any_response && last_failure) return *last_failure;
    return Decline("secondary responses carried no destination");
}

}
