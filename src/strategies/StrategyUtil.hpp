#pragma once
#include <string>
#include <vector>
#include <optional>
#include "../interfaces/IStrategy.hpp"

namespace GateResolve {
namespace StrategyUtil {

StrategyOutcome Resolve(const std::string& url, int hops = 1);
StrategyOutcome Decline(const std::string& reason);
StrategyOutcome Fail(StrategyErrorKind kind, const std::string& detail);

// Maps a failed secondary fetch. A timeout after the budget ran out becomes BudgetExceeded,
// which the pipeline treats as fatal.
StrategyOutcome FailFromFetch(const FetchError& error, const Deadline& deadline);

// "a=1; b=2" from collected Set-Cookie pairs.
std::string CookieHeader(const std::vector<std::string>& cookies);

// Base URL for resolving relative links found on the page.
std::string BaseUrlOf(const FetchResult& page, const StrategyContext& ctx);

// Turns a raw href/literal into an absolute destination, or nullopt when it is not one:
// non-http schemes, static assets, social/ad hosts, and links back to the gate itself.
std::optional<std::string> AcceptCandidate(const std::string& raw, const FetchResult& page, const StrategyContext& ctx);

bool IsExcludedHost(const std::string& url);
bool LooksLikeAsset(const std::string& url);
// Words that mark the "real" link on gate pages (download, get-link, continue, ...).
bool HasDownloadHint(const std::string& text);

std::string ToLower(std::string s);
bool ContainsAny(const std::string& haystack_lower, const std::vector<const char*>& needles);

}
}
