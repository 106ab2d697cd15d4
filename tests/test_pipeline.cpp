#include <catch2/catch_all.hpp>
#include <thread>
#include <vector>
#include "core/ResolutionPipeline.hpp"
#include "cache/LinkCache.hpp"
#include "browser/BrowserPool.hpp"
#include "strategies/StrategyChain.hpp"
#include "strategies/StrategyUtil.hpp"
#include "Fakes.hpp"

using namespace GateResolve;
using namespace std::chrono_literals;

namespace {

// Strategy whose behavior is supplied by the test.
class ScriptedStrategy : public IStrategy {
public:
    using Body = std::function<StrategyOutcome(const FetchResult&, const StrategyContext&)>;

    ScriptedStrategy(StrategyKind kind, Body body, std::chrono::milliseconds minimum_cost = 0ms)
        : kind_(kind), body_(std::move(body)), minimum_cost_(minimum_cost) {}

    StrategyKind Kind() const override { return kind_; }
    std::chrono::milliseconds MinimumCost() const override { return minimum_cost_; }
    StrategyOutcome Attempt(const FetchResult& page, const StrategyContext& ctx) override {
        ++calls;
        return body_(page, ctx);
    }

    std::atomic<int> calls{0};

private:
    StrategyKind kind_;
    Body body_;
    std::chrono::milliseconds minimum_cost_;
};

StrategyChainOptions FastChain() {
    StrategyChainOptions options;
    options.fetch_timeout = 2000ms;
    options.countdown_max_wait = 2s;
    options.cloudflare_retry_delay = 10ms;
    return options;
}

ResolutionRequest RequestFor(const std::string& url, std::chrono::milliseconds budget = 10000ms) {
    ResolutionRequest request;
    request.source_url = url;
    request.budget = budget;
    return request;
}

bool Attempted(const ResolutionResult& result, const std::string& strategy) {
    for (const auto& a : result.attempts) {
        if (a.strategy == strategy) return true;
    }
    return false;
}

const char* kFormPage =
    "<html><body><form action=\"/next\" method=\"post\">"
    "<input type=\"hidden\" name=\"dest\" value=\"https://real.example/file/1\"></form></body></html>";

}

TEST_CASE("Pipeline serves repeated links from the cache") {
    FakeFetcher fetcher;
    fetcher.Page("https://gate.example/f/1", kFormPage);
    LinkCache cache(100, std::chrono::hours(1));
    ResolutionPipeline pipeline(fetcher, cache, BuildStrategyChain(FastChain()), {});

    auto first = pipeline.Resolve(RequestFor("https://gate.example/f/1"));
    REQUIRE(first.Success());
    CHECK(*first.destination == "https://real.example/file/1");
    CHECK(*first.strategy == "HTML Form Bypass");
    CHECK_FALSE(first.from_cache);

    auto second = pipeline.Resolve(RequestFor("https://gate.example/f/1"));
    REQUIRE(second.Success());
    CHECK(second.from_cache);
    CHECK(*second.destination == *first.destination);
    CHECK(*second.strategy == *first.strategy);

    // Same fingerprint, different spelling.
    auto third = pipeline.Resolve(RequestFor("https://GATE.example/f/1/?utm_source=tw"));
    CHECK(third.from_cache);
    CHECK(fetcher.Calls() == 1);

    auto stats = pipeline.Stats();
    CHECK(stats.total == 3);
    CHECK(stats.successes == 3);
    CHECK(stats.cache_hits == 2);
    CHECK(stats.by_strategy["HTML Form Bypass"] == 1);
    CHECK(stats.SuccessRate() == Catch::Approx(1.0));
}

TEST_CASE("Pipeline runs concurrent requests for the same link once") {
    FakeFetcher fetcher;
    fetcher.Page("https://gate.example/f/2", kFormPage);
    fetcher.SetDelay(300ms);
    LinkCache cache(100, std::chrono::hours(1));
    ResolutionPipeline pipeline(fetcher, cache, BuildStrategyChain(FastChain()), {});

    std::vector<ResolutionResult> results(5);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&pipeline, &results, i]() {
            results[i] = pipeline.Resolve(RequestFor("https://gate.example/f/2"));
        });
    }
    for (auto& t : threads) t.join();

    CHECK(fetcher.CallsTo("https://gate.example/f/2") == 1);
    int shared = 0;
    for (const auto& r : results) {
        REQUIRE(r.Success());
        CHECK(*r.destination == "https://real.example/file/1");
        if (r.coalesced || r.from_cache) ++shared;
    }
    CHECK(shared == 4);
}

TEST_CASE("Pipeline lets a waiter give up when its own budget runs out") {
    FakeFetcher fetcher;
    fetcher.Page("https://gate.example/slow", "<html></html>");
    std::vector<std::unique_ptr<IStrategy>> chain;
    chain.push_back(std::make_unique<ScriptedStrategy>(StrategyKind::JavaScript,
        [](const FetchResult&, const StrategyContext&) -> StrategyOutcome {
            std::this_thread::sleep_for(1500ms);
            return StrategyUtil::Resolve("https://real.example/slow");
        }));
    LinkCache cache(100, std::chrono::hours(1));
    ResolutionPipeline pipeline(fetcher, cache, std::move(chain), {});

    ResolutionResult leader_result;
    std::thread leader([&]() { leader_result = pipeline.Resolve(RequestFor("https://gate.example/slow", 5000ms)); });
    std::this_thread::sleep_for(200ms);
    auto waiter = pipeline.Resolve(RequestFor("https://gate.example/slow", 300ms));
    leader.join();

    CHECK_FALSE(waiter.Success());
    CHECK(waiter.coalesced);
    REQUIRE(waiter.error.has_value());
    CHECK(*waiter.error == PipelineError::BudgetExhausted);
    CHECK(leader_result.Success());
}

TEST_CASE("Pipeline prefers base64 decoding over percent decoding") {
    FakeFetcher fetcher;
    const std::string source = "http://gate.example/x?redirect=aHR0cDovL3JlYWwuZXhhbXBsZS9hYmM=";
    fetcher.Page(source, "<html><body><p>Please wait</p></body></html>");
    LinkCache cache(100, std::chrono::hours(1));
    ResolutionPipeline pipeline(fetcher, cache, BuildStrategyChain(FastChain()), {});

    auto result = pipeline.Resolve(RequestFor(source));
    REQUIRE(result.Success());
    CHECK(*result.destination == "http://real.example/abc");
    CHECK(*result.strategy == "Base64 Decode");
    CHECK_FALSE(Attempted(result, "URL Decode"));
}

TEST_CASE("Pipeline counts redirects of the initial fetch as hops") {
    FakeFetcher fetcher;
    fetcher.Redirect("https://gate.example/r/1", "https://hop.example/2");
    fetcher.Redirect("https://hop.example/2", "https://real.example/end", 301);
    fetcher.Page("https://real.example/end", "<html><body>the file</body></html>");
    LinkCache cache(100, std::chrono::hours(1));
    ResolutionPipeline pipeline(fetcher, cache, BuildStrategyChain(FastChain()), {});

    auto result = pipeline.Resolve(RequestFor("https://gate.example/r/1"));
    REQUIRE(result.Success());
    CHECK(*result.destination == "https://real.example/end");
    CHECK(*result.strategy == "Redirect Chain");
    CHECK(result.hops == 2);

    auto requests = fetcher.Requests();
    REQUIRE_FALSE(requests.empty());
    CHECK(requests[0].accept_error_status);
    CHECK(requests[0].max_redirects == 10);
}

TEST_CASE("Pipeline stops when the budget runs out") {
    FakeFetcher fetcher;
    fetcher.Page("https://gate.example/b", "<html></html>");
    auto slow = [](const FetchResult&, const StrategyContext& ctx) -> StrategyOutcome {
        if (!ctx.deadline.SleepFor(1700ms)) {
            return StrategyUtil::Fail(StrategyErrorKind::BudgetExceeded, "budget ran out");
        }
        return StrategyUtil::Decline("nothing found");
    };
    std::vector<std::unique_ptr<IStrategy>> chain;
    chain.push_back(std::make_unique<ScriptedStrategy>(StrategyKind::HtmlForm, slow));
    chain.push_back(std::make_unique<ScriptedStrategy>(StrategyKind::CssHidden, slow));
    auto third = std::make_unique<ScriptedStrategy>(StrategyKind::JavaScript, slow);
    auto* third_ptr = third.get();
    chain.push_back(std::move(third));
    LinkCache cache(100, std::chrono::hours(1));
    ResolutionPipeline pipeline(fetcher, cache, std::move(chain), {});

    auto started = std::chrono::steady_clock::now();
    auto result = pipeline.Resolve(RequestFor("https://gate.example/b", 2000ms));
    auto took = std::chrono::steady_clock::now() - started;

    CHECK_FALSE(result.Success());
    REQUIRE(result.error.has_value());
    CHECK(*result.error == PipelineError::BudgetExhausted);
    CHECK(result.error_summary.find("time budget exhausted") == 0);
    CHECK(took >= 1900ms);
    CHECK(took < 3s);
    CHECK(third_ptr->calls == 0);
}

TEST_CASE("Pipeline skips strategies that cannot fit the remaining budget") {
    FakeFetcher fetcher;
    fetcher.Page("https://gate.example/c", "<html></html>");
    std::vector<std::unique_ptr<IStrategy>> chain;
    chain.push_back(std::make_unique<ScriptedStrategy>(StrategyKind::HtmlForm,
        [](const FetchResult&, const StrategyContext&) { return StrategyUtil::Decline("no form"); }));
    auto costly = std::make_unique<ScriptedStrategy>(StrategyKind::BrowserAutomation,
        [](const FetchResult&, const StrategyContext&) { return StrategyUtil::Resolve("https://real.example/b"); }, 5000ms);
    auto* costly_ptr = costly.get();
    chain.push_back(std::move(costly));
    LinkCache cache(100, std::chrono::hours(1));
    ResolutionPipeline pipeline(fetcher, cache, std::move(chain), {});

    auto result = pipeline.Resolve(RequestFor("https://gate.example/c", 1000ms));
    REQUIRE(result.error.has_value());
    CHECK(*result.error == PipelineError::BudgetExhausted);
    CHECK(costly_ptr->calls == 0);
    REQUIRE(result.attempts.size() == 2);
    CHECK(result.attempts[1].outcome == "skipped");
}

TEST_CASE("Pipeline honors the per-site strategy allowlist") {
    FakeFetcher fetcher;
    const std::string source = "https://gate.example/a?d=aHR0cDovL3JlYWwuZXhhbXBsZS9hYmM=";
    fetcher.Page(source, kFormPage);
    LinkCache cache(100, std::chrono::hours(1));
    ResolutionPipeline pipeline(fetcher, cache, BuildStrategyChain(FastChain()), {});

    auto request = RequestFor(source);
    request.enabled_strategies = std::set<StrategyKind>{StrategyKind::Base64Decode};
    auto result = pipeline.Resolve(request);
    REQUIRE(result.Success());
    CHECK(*result.strategy == "Base64 Decode");
    CHECK(result.attempts.size() == 1);
    CHECK_FALSE(Attempted(result, "HTML Form Bypass"));
}

TEST_CASE("Pipeline keeps working when the cache backend is down") {
    FakeFetcher fetcher;
    fetcher.Page("https://gate.example/f/3", kFormPage);
    UnavailableCache cache;
    ResolutionPipeline pipeline(fetcher, cache, BuildStrategyChain(FastChain()), {});

    auto first = pipeline.Resolve(RequestFor("https://gate.example/f/3"));
    auto second = pipeline.Resolve(RequestFor("https://gate.example/f/3"));
    CHECK(first.Success());
    CHECK(second.Success());
    CHECK_FALSE(second.from_cache);
    CHECK(fetcher.Calls() == 2);
    CHECK(cache.gets >= 2);
    CHECK(cache.puts == 2);
}

TEST_CASE("Pipeline rejects invalid links without fetching") {
    FakeFetcher fetcher;
    LinkCache cache(100, std::chrono::hours(1));
    ResolutionPipeline pipeline(fetcher, cache, BuildStrategyChain(FastChain()), {});

    for (const char* bad : {"ftp://files.example/a", "not a url", ""}) {
        auto result = pipeline.Resolve(RequestFor(bad));
        REQUIRE(result.error.has_value());
        CHECK(*result.error == PipelineError::InvalidUrl);
        CHECK(result.error_summary.find("invalid URL") == 0);
    }
    CHECK(fetcher.Calls() == 0);
}

TEST_CASE("Pipeline reports every declined strategy") {
    FakeFetcher fetcher;
    fetcher.Page("https://gate.example/plain", "<html><body><p>nothing to see</p></body></html>");
    LinkCache cache(100, std::chrono::hours(1));
    ResolutionPipeline pipeline(fetcher, cache, BuildStrategyChain(FastChain()), {});

    auto result = pipeline.Resolve(RequestFor("https://gate.example/plain"));
    CHECK_FALSE(result.Success());
    REQUIRE(result.error.has_value());
    CHECK(*result.error == PipelineError::AllStrategiesDeclined);
    CHECK(result.error_summary.find("could not resolve this link") == 0);
    CHECK(result.attempts.size() == 9);
    CHECK(pipeline.Stats().successes == 0);
}

TEST_CASE("Pipeline falls back to URL-only strategies when the page is unreachable") {
    FakeFetcher fetcher;
    const std::string source = "https://gate.example/dead?u=aHR0cDovL3JlYWwuZXhhbXBsZS9hYmM=";
    LinkCache cache(100, std::chrono::hours(1));
    ResolutionPipeline pipeline(fetcher, cache, BuildStrategyChain(FastChain()), {});

    auto result = pipeline.Resolve(RequestFor(source));
    REQUIRE(result.Success());
    CHECK(*result.strategy == "Base64 Decode");
    REQUIRE_FALSE(result.attempts.empty());
    CHECK(result.attempts[0].detail == "page unavailable");
}

TEST_CASE("Pipeline discards answers that point back at the source and survives throwing strategies") {
    FakeFetcher fetcher;
    fetcher.Page("https://gate.example/s", "<html></html>");
    std::vector<std::unique_ptr<IStrategy>> chain;
    chain.push_back(std::make_unique<ScriptedStrategy>(StrategyKind::HtmlForm,
        [](const FetchResult&, const StrategyContext&) { return StrategyUtil::Resolve("https://gate.example/s?utm_medium=x"); }));
    chain.push_back(std::make_unique<ScriptedStrategy>(StrategyKind::CssHidden,
        [](const FetchResult&, const StrategyContext&) -> StrategyOutcome { throw std::runtime_error("bad markup"); }));
    chain.push_back(std::make_unique<ScriptedStrategy>(StrategyKind::JavaScript,
        [](const FetchResult&, const StrategyContext&) { return StrategyUtil::Resolve("https://real.example/js"); }));
    LinkCache cache(100, std::chrono::hours(1));
    ResolutionPipeline pipeline(fetcher, cache, std::move(chain), {});

    auto result = pipeline.Resolve(RequestFor("https://gate.example/s"));
    REQUIRE(result.Success());
    CHECK(*result.destination == "https://real.example/js");
    REQUIRE(result.attempts.size() == 3);
    CHECK(result.attempts[0].outcome == "declined");
    CHECK(result.attempts[1].outcome == "failed");
    CHECK(result.attempts[1].detail.find("ParseFailed") == 0);
}

TEST_CASE("Pipeline hands interactive gates to the browser") {
    FakeFetcher fetcher;
    fetcher.Page("https://gate.example/i", "<html><body><button id=\"proceed\">Continue</button></body></html>");
    auto counters = std::make_shared<BrowserCounters>();
    BrowserScript script;
    script.clickable_selector = "#proceed";
    script.location_after_click = "https://real.example/interactive";
    BrowserPool pool(1, [script, counters]() -> std::unique_ptr<IBrowserSession> {
        return std::make_unique<FakeBrowserSession>(script, counters);
    });

    auto options = FastChain();
    options.browser_pool = &pool;
    options.browser.settle = 10ms;
    options.browser.minimum_cost = 100ms;
    LinkCache cache(100, std::chrono::hours(1));
    ResolutionPipeline pipeline(fetcher, cache, BuildStrategyChain(options), {});

    auto result = pipeline.Resolve(RequestFor("https://gate.example/i"));
    REQUIRE(result.Success());
    CHECK(*result.destination == "https://real.example/interactive");
    CHECK(*result.strategy == "Browser Automation");
    CHECK(result.attempts.size() == 10);
    CHECK(counters->created == 1);
}

TEST_CASE("Pipeline resolves a CSS-hidden gate past its decoys") {
    FakeFetcher fetcher;
    fetcher.Page("https://gate.example/css", R"(<html><head><style>.secret { display:none }</style></head><body>
        <a class="ads-top" href="https://ads.example/visible-decoy">Download</a>
        <a class="secret" href="https://decoy.example/hidden">Download</a>
        <a href="https://real.example/the-file">Download file</a>
    </body></html>)");
    LinkCache cache(100, std::chrono::hours(1));
    ResolutionPipeline pipeline(fetcher, cache, BuildStrategyChain(FastChain()), {});

    auto result = pipeline.Resolve(RequestFor("https://gate.example/css"));
    REQUIRE(result.Success());
    CHECK(*result.destination == "https://real.example/the-file");
    CHECK(*result.strategy == "CSS Hidden-Element");
    REQUIRE(result.attempts.size() == 2);
    CHECK(result.attempts[0].strategy == "HTML Form Bypass");
    CHECK(result.attempts[0].detail == "no form on page");
}
