#include "CloudflareStrategy.hpp"
#include "StrategyUtil.hpp"
#include "../parser/HtmlDocument.hpp"
#include "../parser/ScriptScanner.hpp"
#include "../utils/UrlUtil.hpp"
#include "../utils/Logger.hpp"
#include <algorithm>

namespace GateResolve {

using namespace StrategyUtil;

namespace {

std::string HeaderValue(const FetchResult& page, const std::string& name) {
    auto it = page.headers.find(name);
    return it == page.headers.end() ? std::string() : ToLower(it->second);
}

bool LooksLikeDownloadLink(const std::string& url) {
    static const std::vector<const char*> kIndicators = {
        "download", "file", "/get", ".pdf", ".zip", ".rar", ".7z", ".mp4", ".mkv", ".apk", ".exe"
    };
    return ContainsAny(ToLower(url), kIndicators);
}

void MergeCookies(std::vector<std::string>& jar, const std::vector<std::string>& fresh) {
    for (const auto& cookie : fresh) {
        std::string name = cookie.substr(0, cookie.find('='));
        auto same = std::find_if(jar.begin(), jar.end(), [&name](const std::string& c) {
            return c.substr(0, c.find('=')) == name;
        });
        if (same != jar.end()) *same = cookie;
        else jar.push_back(cookie);
    }
}

}

CloudflareStrategy::CloudflareStrategy(int max_retries, std::chrono::milliseconds retry_delay, std::chrono::milliseconds fetch_timeout)
    : max_retries_(max_retries), retry_delay_(retry_delay), fetch_timeout_(fetch_timeout) {}

bool CloudflareStrategy::IsChallenge(const FetchResult& page) {
    if (HeaderValue(page, "cf-mitigated") == "challenge") return true;
    if (page.status_code != 403 && page.status_code != 429 && page.status_code != 503) return false;

    bool from_cloudflare = HeaderValue(page, "server").find("cloudflare") != std::string::npos
        || page.headers.count("cf-ray") > 0;
    if (!from_cloudflare) return false;

    static const std::vector<const char*> kMarkers = {
        "cf-browser-verification", "challenge-platform", "cf_chl_opt", "jschl-answer",
        "cf-challenge", "just a moment...", "checking your browser"
    };
    return ContainsAny(ToLower(page.body), kMarkers);
}

HeaderMap CloudflareStrategy::BrowserHeaders() {
    HeaderMap h;
    h["User-Agent"] = "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/124.0.0.0 Safari/537.36";
    h["Accept"] = "text/html,application/xhtml+xml,application/xml;q=0.9,image/avif,image/webp,*/*;q=0.8";
    h["Accept-Language"] = "en-US,en;q=0.9";
    h["Cache-Control"] = "max-age=0";
    h["Sec-Ch-Ua"] = "\"Chromium\";v=\"124\", \"Google Chrome\";v=\"124\", \"Not-A.Brand\";v=\"99\"";
    h["Sec-Ch-Ua-Mobile"] = "?0";
    h["Sec-Ch-Ua-Platform"] = "\"Windows\"";
    h["Sec-Fetch-Dest"] = "document";
    h["Sec-Fetch-Mode"] = "navigate";
    h["Sec-Fetch-Site"] = "none";
    h["Sec-Fetch-User"] = "?1";
    h["Upgrade-Insecure-Requests"] = "1";
    return h;
}

StrategyOutcome CloudflareStrategy::Attempt(const FetchResult& page, const StrategyContext& ctx) {
    if (!IsChallenge(page)) return Decline("no Cloudflare challenge");

    const std::string target = BaseUrlOf(page, ctx);
    std::vector<std::string> cookies = page.cookies;

    for (int attempt = 1; attempt <= max_retries_; ++attempt) {
        auto backoff = retry_delay_ * attempt;
        if (backoff + std::chrono::milliseconds(250) > ctx.deadline.Remaining()) {
            return Declined{"challenge backoff exceeds the remaining budget", true};
        }
        if (!ctx.deadline.SleepFor(backoff)) {
            return Fail(StrategyErrorKind::BudgetExceeded, "budget ran out during challenge backoff");
        }

        FetchRequest req;
        req.url = target;
        req.headers = BrowserHeaders();
        req.headers["Referer"] = target;
        if (!cookies.empty()) req.headers["Cookie"] = CookieHeader(cookies);
        req.timeout = ctx.deadline.Clamp(fetch_timeout_);
        req.accept_error_status = true;

        FetchOutcome outcome = ctx.fetcher.Fetch(req, ctx.deadline);
        if (auto* error = std::get_if<FetchError>(&outcome)) {
            StrategyOutcome failed = FailFromFetch(*error, ctx.deadline);
            if (std::get<Failed>(failed).kind == StrategyErrorKind::BudgetExceeded) return failed;
            Logger::Log(LogLevel::Debug, "Challenge retry " + std::to_string(attempt) + " failed: " + Describe(*error));
            continue;
        }
        const auto& cleared = std::get<FetchResult>(outcome);
        MergeCookies(cookies, cleared.cookies);
        if (IsChallenge(cleared)) continue;

        Logger::Log(LogLevel::Info, "Challenge cleared on attempt " + std::to_string(attempt) + " for " + target);
        if (!cleared.final_url.empty() && !UrlUtil::SameHost(cleared.final_url, target)) {
            if (auto url = AcceptCandidate(cleared.final_url, page, ctx)) return Resolve(*url);
        }

        auto doc = HtmlDocument::Parse(cleared.body);
        if (!doc) return Fail(StrategyErrorKind::ParseFailed, "cleared page could not be parsed");
        for (const HtmlElement* a : doc->ByTag("a")) {
            std::string href = a->Attr("href");
            if (!LooksLikeDownloadLink(href)) continue;
            if (auto url = AcceptCandidate(href, cleared, ctx)) return Resolve(*url);
        }
        for (const auto& script : doc->ScriptTexts()) {
            for (const auto& raw : ScriptScanner::AbsoluteUrls(script)) {
                if (!LooksLikeDownloadLink(raw)) continue;
                if (auto url = AcceptCandidate(raw, cleared, ctx)) return Resolve(*url);
            }
        }
        return Decline("challenge cleared but the page has no download link");
    }
    return Fail(StrategyErrorKind::ChallengeUnsolved,
                "still challenged after " + std::to_string(max_retries_) + " attempts");
}

}
