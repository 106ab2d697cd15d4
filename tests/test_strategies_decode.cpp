#include <catch2/catch_all.hpp>
#include "strategies/Base64DecodeStrategy.hpp"
#include "strategies/UrlDecodeStrategy.hpp"
#include "Fakes.hpp"

using namespace GateResolve;
using namespace std::chrono_literals;

namespace {

StrategyOutcome Run(IStrategy& strategy, const std::string& source, const std::string& body = "") {
    FakeFetcher fetcher;
    Deadline deadline(5s);
    StrategyContext ctx{source, fetcher, deadline};
    FetchResult page;
    if (!body.empty()) {
        page.final_url = source;
        page.status_code = 200;
        page.body = body;
    }
    return strategy.Attempt(page, ctx);
}

std::string ResolvedUrl(const StrategyOutcome& outcome) {
    const auto* r = std::get_if<Resolved>(&outcome);
    return r ? r->next_url : std::string();
}

}

TEST_CASE("Base64 decodes a destination carried in a query parameter") {
    Base64DecodeStrategy base64;
    CHECK(ResolvedUrl(Run(base64, "http://gate.example/x?redirect=aHR0cDovL3JlYWwuZXhhbXBsZS9hYmM="))
          == "http://real.example/abc");
}

TEST_CASE("Base64 looks at path segments, fragments and nested layers") {
    Base64DecodeStrategy base64;
    CHECK(ResolvedUrl(Run(base64, "https://gate.example/go/aHR0cHM6Ly9yZWFsLmV4YW1wbGUvZmlsZQ"))
          == "https://real.example/file");
    CHECK(ResolvedUrl(Run(base64, "https://gate.example/r#aHR0cHM6Ly9yZWFsLmV4YW1wbGUvZmlsZQ=="))
          == "https://real.example/file");
    CHECK(ResolvedUrl(Run(base64, "https://gate.example/n?u=YUhSMGNITTZMeTl5WldGc0xtVjRZVzF3YkdVdmJnPT0="))
          == "https://real.example/n");
}

TEST_CASE("Base64 reads data attributes and atob calls from the page") {
    Base64DecodeStrategy base64;
    CHECK(ResolvedUrl(Run(base64, "https://gate.example/plain",
                          R"(<html><body><div data-url="aHR0cHM6Ly9yZWFsLmV4YW1wbGUvYXR0cg=="></div></body></html>)"))
          == "https://real.example/attr");
    CHECK(ResolvedUrl(Run(base64, "https://gate.example/page",
                          R"(<script>location.href = atob('aHR0cHM6Ly9yZWFsLmV4YW1wbGUvYXRvYg==');</script>)"))
          == "https://real.example/atob");
}

TEST_CASE("Base64 declines values that do not decode to a URL") {
    Base64DecodeStrategy base64;
    auto text = Run(base64, "https://gate.example/v?d=aGVsbG8gd29ybGQ=");
    REQUIRE(std::holds_alternative<Declined>(text));
    CHECK(std::get<Declined>(text).reason == "no base64-encoded destination");

    CHECK_FALSE(Base64DecodeStrategy::DecodeUrl("aGVsbG8gd29ybGQ=").has_value());
    CHECK_FALSE(Base64DecodeStrategy::DecodeUrl("short").has_value());
    CHECK(Base64DecodeStrategy::DecodeUrl("aHR0cDovL3JlYWwuZXhhbXBsZS9hYmM").value() == "http://real.example/abc");
}

TEST_CASE("UrlDecode takes percent-encoded destinations from the query") {
    UrlDecodeStrategy url_decode;
    CHECK(ResolvedUrl(Run(url_decode, "https://gate.example/out?url=https%3A%2F%2Freal.example%2Fpath%3Fa%3D1"))
          == "https://real.example/path?a=1");
    CHECK(ResolvedUrl(Run(url_decode, "https://gate.example/out?id=3&to=https%253A%252F%252Freal.example%252Fdouble"))
          == "https://real.example/double");
}

TEST_CASE("UrlDecode finds encoded parameters in the page body") {
    UrlDecodeStrategy url_decode;
    CHECK(ResolvedUrl(Run(url_decode, "https://gate.example/page",
                          R"(<a href="/go?target=https%3A%2F%2Freal.example%2Fbody">Continue</a>)"))
          == "https://real.example/body");

    auto unencoded = Run(url_decode, "https://gate.example/page", R"(<a href="/go?url=https://other.example/x">x</a>)");
    REQUIRE(std::holds_alternative<Declined>(unencoded));
    CHECK(std::get<Declined>(unencoded).reason == "no percent-encoded destination");
}

TEST_CASE("UrlDecode ignores parameters that are not URLs") {
    UrlDecodeStrategy url_decode;
    CHECK(std::holds_alternative<Declined>(Run(url_decode, "https://gate.example/out?q=hello%20world&page=2")));
}

TEST_CASE("Decoders handle pages with very long runs") {
    const std::string run(100000, 'a');
    UrlDecodeStrategy url_decode;
    CHECK(std::holds_alternative<Declined>(Run(url_decode, "https://gate.example/page", "url=" + run)));
    CHECK(ResolvedUrl(Run(url_decode, "https://gate.example/page",
                          "url=" + run + R"( <a href="/go?target=https%3A%2F%2Freal.example%2Fbody">Continue</a>)"))
          == "https://real.example/body");

    Base64DecodeStrategy base64;
    auto declined = Run(base64, "https://gate.example/page", "<script>atob('" + std::string(100000, 'A') + "')</script>");
    REQUIRE(std::holds_alternative<Declined>(declined));
    CHECK(std::get<Declined>(declined).reason == "no base64-encoded destination");
}
