#include "CountdownStrategy.hpp"
#include "StrategyUtil.hpp"
#include "../parser/HtmlDocument.hpp"
#include "../parser/ScriptScanner.hpp"
#include "../utils/RegexScan.hpp"
#include "../utils/UrlUtil.hpp"
#include "../utils/Logger.hpp"
#include <regex>

namespace GateResolve {

using namespace StrategyUtil;

namespace {

const std::vector<const char*> kTimerMarkers = {"countdown", "timer", "wait", "counter"};

// Seconds announced by the page: a timer element's digits, a data attribute, or a script counter.
std::optional<int> DetectTimer(const HtmlDocument& doc) {
    static const std::regex digits(R"((\d{1,3}))");
    static const std::regex seconds_text(R"((\d{1,3})\s*(?:s\b|sec|second))", std::regex::icase);

    bool found = false;
    std::optional<int> seconds;
    for (const auto& el : doc.Elements()) {
        if (el.tag == "script" || el.tag == "style") continue;
        std::string marker = ToLower(el.Attr("id") + " " + el.Attr("class"));
        if (!ContainsAny(marker, kTimerMarkers)) continue;
        found = true;
        for (const char* attr : {"data-seconds", "data-time", "data-countdown", "data-timer"}) {
            std::smatch m;
            std::string v = el.Attr(attr);
            if (!seconds && std::regex_search(v, m, digits)) seconds = std::stoi(m[1].str());
        }
        std::smatch m;
        if (!seconds && std::regex_search(el.text, m, digits)) seconds = std::stoi(m[1].str());
        if (seconds) break;
    }

    for (const auto& script : doc.ScriptTexts()) {
        if (!ScriptScanner::HasTimer(script)) continue;
        auto announced = ScriptScanner::AnnouncedSeconds(script);
        if (announced) {
            found = true;
            if (!seconds) seconds = announced;
        }
    }

    if (!found) return std::nullopt;
    if (!seconds) {
        for (const auto& el : doc.Elements()) {
            if (el.tag == "script" || el.tag == "style") continue;
            if (auto m = RegexScan::FindFirst(el.text, seconds_text)) {
                seconds = std::stoi((*m)[1]);
                break;
            }
        }
    }
    return seconds.value_or(5);
}

bool LooksLikeLinkAttribute(const std::string& raw) {
    std::string v = ToLower(raw);
    return v.rfind("http://", 0) == 0 || v.rfind("https://", 0) == 0 || v.rfind("//", 0) == 0 || v.rfind("/", 0) == 0;
}

}

CountdownStrategy::CountdownStrategy(std::chrono::seconds max_wait, std::chrono::milliseconds fetch_timeout)
    : max_wait_(max_wait), fetch_timeout_(fetch_timeout) {}

std::optional<std::string> CountdownStrategy::Revealed(const HtmlDocument& doc, const FetchResult& page, const StrategyContext& ctx) const {
    const std::string base = BaseUrlOf(page, ctx);
    auto offsite = [&](const std::string& raw) -> std::optional<std::string> {
        auto url = AcceptCandidate(raw, page, ctx);
        if (url && !UrlUtil::SameHost(*url, base) && !UrlUtil::SameHost(*url, ctx.source_url)) return url;
        return std::nullopt;
    };

    // Navigation performed by the timer callback, or a link element it fills in.
    for (const auto& script : doc.ScriptTexts()) {
        if (!ScriptScanner::HasTimer(script)) continue;
        for (const auto& raw : ScriptScanner::NavigationTargets(script)) {
            if (auto url = offsite(raw)) return url;
        }
        for (const auto& raw : ScriptScanner::HrefAssignments(script)) {
            if (auto url = offsite(raw)) return url;
        }
    }

    for (const auto& el : doc.Elements()) {
        for (const char* attr : {"data-href", "data-url", "data-link", "data-target"}) {
            std::string raw = el.Attr(attr);
            if (raw.empty() || !LooksLikeLinkAttribute(raw)) continue;
            if (auto url = offsite(raw)) return url;
        }
    }

    for (const HtmlElement* a : doc.ByTag("a")) {
        if (!HasDownloadHint(a->Attr("id") + " " + a->Attr("class") + " " + a->text)) continue;
        if (auto url = offsite(a->Attr("href"))) return url;
    }
    return std::nullopt;
}

StrategyOutcome CountdownStrategy::Attempt(const FetchResult& page, const StrategyContext& ctx) {
    auto doc = HtmlDocument::Parse(page.body);
    if (!doc) return Fail(StrategyErrorKind::ParseFailed, "page could not be parsed");

    auto seconds = DetectTimer(*doc);
    if (!seconds) return Decline("no countdown timer");

    if (auto url = Revealed(*doc, page, ctx)) return Resolve(*url);

    std::chrono::seconds wait(*seconds);
    if (wait > max_wait_) {
        return Decline("countdown of " + std::to_string(*seconds) + "s exceeds the wait cap");
    }
    if (wait + std::chrono::milliseconds(500) > ctx.deadline.Remaining()) {
        return Declined{"countdown of " + std::to_string(*seconds) + "s does not fit the remaining budget", true};
    }

    Logger::Log(LogLevel::Debug, "Waiting " + std::to_string(*seconds) + "s for countdown on " + BaseUrlOf(page, ctx));
    if (!ctx.deadline.SleepFor(wait)) {
        return Fail(StrategyErrorKind::BudgetExceeded, "budget ran out during countdown wait");
    }

    FetchRequest again;
    again.url = BaseUrlOf(page, ctx);
    again.timeout = ctx.deadline.Clamp(fetch_timeout_);
    again.headers["Referer"] = again.url;
    if (!page.cookies.empty()) again.headers["Cookie"] = CookieHeader(page.cookies);

    FetchOutcome outcome = ctx.fetcher.Fetch(again, ctx.deadline);
    if (auto* error = std::get_if<FetchError>(&outcome)) return FailFromFetch(*error, ctx.deadline);
    const auto& second = std::get<FetchResult>(outcome);

    // Some gates redirect server-side once the timer has run.
    if (!second.final_url.empty() && !UrlUtil::SameHost(second.final_url, again.url)) {
        if (auto url = AcceptCandidate(second.final_url, page, ctx)) return Resolve(*url, 1 + static_cast<int>(second.redirect_count));
    }

    auto second_doc = HtmlDocument::Parse(second.body);
    if (!second_doc) return Fail(StrategyErrorKind::ParseFailed, "page after countdown could not be parsed");
    if (auto url = Revealed(*second_doc, second, ctx)) return Resolve(*url);
    for (const auto& script : second_doc->ScriptTexts()) {
        for (const auto& raw : ScriptScanner::NavigationTargets(script)) {
            if (auto url = AcceptCandidate(raw, second, ctx)) return Resolve(*url);
        }
    }
    return Decline("countdown elapsed but no link was revealed");
}

}
