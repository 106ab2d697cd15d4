#pragma once
#include <string>
#include <variant>
#include <optional>
#include <chrono>
#include "IFetcher.hpp"
#include "../core/Deadline.hpp"

namespace GateResolve {

// Fixed priority order: cheapest and most specific first.
enum class StrategyKind {
    HtmlForm,
    CssHidden,
    JavaScript,
    Countdown,
    DynamicContent,
    Cloudflare,
    RedirectChain,
    Base64Decode,
    UrlDecode,
    BrowserAutomation
};

const char* DisplayName(StrategyKind kind);
const char* IdOf(StrategyKind kind);
// Accepts "html-form" as well as "html_form".
std::optional<StrategyKind> ParseStrategyId(const std::string& id);

enum class StrategyErrorKind {
    ParseFailed,
    ChallengeUnsolved,
    BudgetExceeded,
    FetchFailed,
    BrowserFailed
};

const char* ToString(StrategyErrorKind kind);

struct Resolved {
    std::string next_url;
    int hops = 0;
};

struct Declined {
    std::string reason;
    bool budget_exceeded = false;
};

struct Failed {
    StrategyErrorKind kind = StrategyErrorKind::ParseFailed;
    std::string detail;
};

using StrategyOutcome = std::variant<Resolved, Declined, Failed>;

// What a strategy may use besides the initial page.
struct StrategyContext {
    std::string source_url;
    IFetcher& fetcher;
    const Deadline& deadline;
    int max_redirect_hops = 10;
};

class IStrategy {
public:
    virtual ~IStrategy() = default;
    virtual StrategyKind Kind() const = 0;
    virtual std::string Name() const { return DisplayName(Kind()); }
    // Strategies that only inspect the initial page decline when it could not be fetched.
    virtual bool NeedsPage() const { return true; }
    // Lower bound on how long an attempt takes; the pipeline skips the strategy if the budget is smaller.
    virtual std::chrono::milliseconds MinimumCost() const { return std::chrono::milliseconds(0); }
    virtual StrategyOutcome Attempt(const FetchResult& page, const StrategyContext& ctx) = 0;
};

}
