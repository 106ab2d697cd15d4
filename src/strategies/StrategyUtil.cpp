#include "StrategyUtil.hpp"
#include "../utils/UrlUtil.hpp"
#include <algorithm>

namespace GateResolve {

const char* DisplayName(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::HtmlForm: return "HTML Form Bypass";
        case StrategyKind::CssHidden: return "CSS Hidden-Element";
        case StrategyKind::JavaScript: return "JavaScript Execution";
        case StrategyKind::Countdown: return "Countdown Timer Bypass";
        case StrategyKind::DynamicContent: return "Dynamic Content";
        case StrategyKind::Cloudflare: return "Cloudflare Bypass";
        case StrategyKind::RedirectChain: return "Redirect Chain";
        case StrategyKind::Base64Decode: return "Base64 Decode";
        case StrategyKind::UrlDecode: return "URL Decode";
        case StrategyKind::BrowserAutomation: return "Browser Automation";
    }
    return "Unknown";
}

const char* IdOf(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::HtmlForm: return "html-form";
        case StrategyKind::CssHidden: return "css-hidden";
        case StrategyKind::JavaScript: return "javascript";
        case StrategyKind::Countdown: return "countdown";
        case StrategyKind::DynamicContent: return "dynamic-content";
        case StrategyKind::Cloudflare: return "cloudflare";
        case StrategyKind::RedirectChain: return "redirect-chain";
        case StrategyKind::Base64Decode: return "base64-decode";
        case StrategyKind::UrlDecode: return "url-decode";
        case StrategyKind::BrowserAutomation: return "browser-automation";
    }
    return "unknown";
}

std::optional<StrategyKind> ParseStrategyId(const std::string& id) {
    std::string normalized = StrategyUtil::ToLower(id);
    std::replace(normalized.begin(), normalized.end(), '_', '-');
    if (normalized == "countdown-timer") normalized = "countdown";
    static const StrategyKind kAll[] = {
        StrategyKind::HtmlForm, StrategyKind::CssHidden, StrategyKind::JavaScript, StrategyKind::Countdown,
        StrategyKind::DynamicContent, StrategyKind::Cloudflare, StrategyKind::RedirectChain,
        StrategyKind::Base64Decode, StrategyKind::UrlDecode, StrategyKind::BrowserAutomation
    };
    for (StrategyKind kind : kAll) {
        if (normalized == IdOf(kind)) return kind;
    }
    return std::nullopt;
}

const char* ToString(StrategyErrorKind kind) {
    switch (kind) {
        case StrategyErrorKind::ParseFailed: return "ParseFailed";
        case StrategyErrorKind::ChallengeUnsolved: return "ChallengeUnsolved";
        case StrategyErrorKind::BudgetExceeded: return "BudgetExceeded";
        case StrategyErrorKind::FetchFailed: return "FetchFailed";
        case StrategyErrorKind::BrowserFailed: return "BrowserFailed";
    }
    return "Unknown";
}

namespace StrategyUtil {

StrategyOutcome Resolve(const std::string& url, int hops) {
    return Resolved{url, hops};
}

StrategyOutcome Decline(const std::string& reason) {
    return Declined{reason, false};
}

StrategyOutcome Fail(StrategyErrorKind kind, const std::string& detail) {
    return Failed{kind, detail};
}

StrategyOutcome FailFromFetch(const FetchError& error, const Deadline& deadline) {
    if (error.kind == FetchErrorKind::Timeout && deadline.Expired()) {
        return Failed{StrategyErrorKind::BudgetExceeded, Describe(error)};
    }
    return Failed{StrategyErrorKind::FetchFailed, Describe(error)};
}

std::string CookieHeader(const std::vector<std::string>& cookies) {
    std::string out;
    for (const auto& c : cookies) {
        if (!out.empty()) out += "; ";
        out += c;
    }
    return out;
}

std::string BaseUrlOf(const FetchResult& page, const StrategyContext& ctx) {
    return page.final_url.empty() ? ctx.source_url : page.final_url;
}

static std::string Unescape(std::string s) {
    auto replace_all = [&s](const std::string& from, const std::string& to) {
        size_t pos = 0;
        while ((pos = s.find(from, pos)) != std::string::npos) {
            s.replace(pos, from.size(), to);
            pos += to.size();
        }
    };
    replace_all("\\/", "/");
    replace_all("&amp;", "&");
    replace_all("&#38;", "&");
    replace_all("\\u0026", "&");
    return s;
}

std::optional<std::string> AcceptCandidate(const std::string& raw, const FetchResult& page, const StrategyContext& ctx) {
    auto b = raw.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::nullopt;
    auto e = raw.find_last_not_of(" \t\r\n");
    std::string candidate = Unescape(raw.substr(b, e - b + 1));
    if (candidate.empty() || candidate[0] == '#') return std::nullopt;

    std::string absolute = UrlUtil::ResolveAgainst(BaseUrlOf(page, ctx), candidate);
    if (!UrlUtil::IsHttpUrl(absolute)) return std::nullopt;
    if (LooksLikeAsset(absolute) || IsExcludedHost(absolute)) return std::nullopt;

    std::string fp = UrlUtil::Fingerprint(absolute);
    if (fp == UrlUtil::Fingerprint(ctx.source_url)) return std::nullopt;
    if (!page.final_url.empty() && fp == UrlUtil::Fingerprint(page.final_url)) return std::nullopt;
    return absolute;
}

bool IsExcludedHost(const std::string& url) {
    static const char* kSuffixHosts[] = {
        "facebook.com", "twitter.com", "x.com", "instagram.com", "youtube.com",
        "googletagmanager.com", "google-analytics.com", "googlesyndication.com", "doubleclick.net",
        "schema.org", "w3.org", "cloudflare.com"
    };
    std::string host = UrlUtil::StripWww(UrlUtil::HostOf(url));
    if (host.empty()) return true;
    // google.com itself is search/consent noise; its subdomains (drive, docs) are real destinations.
    if (host == "google.com") return true;
    for (const char* h : kSuffixHosts) {
        std::string suffix = std::string(".") + h;
        if (host == h || (host.size() > suffix.size() && host.compare(host.size() - suffix.size(), suffix.size(), suffix) == 0)) {
            return true;
        }
    }
    return false;
}

bool LooksLikeAsset(const std::string& url) {
    static const char* kExtensions[] = {
        ".js", ".css", ".png", ".jpg", ".jpeg", ".gif", ".svg", ".ico", ".webp", ".woff", ".woff2", ".ttf", ".map"
    };
    auto parsed = UrlUtil::ParseUrl(url);
    if (!parsed) return false;
    std::string path = ToLower(parsed->path);
    for (const char* ext : kExtensions) {
        std::string e(ext);
        if (path.size() >= e.size() && path.compare(path.size() - e.size(), e.size(), e) == 0) return true;
    }
    return false;
}

bool HasDownloadHint(const std::string& text) {
    static const std::vector<const char*> kHints = {
        "download", "get-link", "get_link", "getlink", "get link", "go-link", "golink",
        "continue", "skip", "proceed", "unlock", "destination", "file"
    };
    return ContainsAny(ToLower(text), kHints);
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : static_cast<char>(c);
    });
    return s;
}

bool ContainsAny(const std::string& haystack_lower, const std::vector<const char*>& needles) {
    for (const char* n : needles) {
        if (haystack_lower.find(n) != std::string::npos) return true;
    }
    return false;
}

}
}
