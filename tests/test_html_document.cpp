#include <catch2/catch_all.hpp>
#include "parser/HtmlDocument.hpp"
#include "parser/ScriptScanner.hpp"

using namespace GateResolve;

TEST_CASE("HtmlDocument flattens elements in document order") {
    auto doc = HtmlDocument::Parse(R"(
        <html><head><title>Gate Page</title></head>
        <body>
          <div id="outer" class="Wrap"><a HREF="https://real.example/file">Get Link</a></div>
          <form action="/go" method="post"><input type="hidden" name="token" value="abc"></form>
        </body></html>)");
    REQUIRE(doc.has_value());
    CHECK(doc->Title() == "Gate Page");

    auto anchors = doc->ByTag("a");
    REQUIRE(anchors.size() == 1);
    CHECK(anchors[0]->Attr("href") == "https://real.example/file");
    CHECK(anchors[0]->text == "Get Link");
    CHECK(anchors[0]->Attr("missing").empty());

    const HtmlElement* parent = doc->Parent(*anchors[0]);
    REQUIRE(parent != nullptr);
    CHECK(parent->tag == "div");
    CHECK(parent->Attr("id") == "outer");

    auto inputs = doc->ByTag("input");
    REQUIRE(inputs.size() == 1);
    CHECK(inputs[0]->Has("name"));
    auto forms = doc->ByTag("form");
    REQUIRE(forms.size() == 1);
    CHECK(doc->IsInside(*inputs[0], *forms[0]));
    CHECK_FALSE(doc->IsInside(*anchors[0], *forms[0]));
    CHECK(doc->IsInside(*forms[0], *forms[0]));
}

TEST_CASE("HtmlDocument collects inline scripts") {
    auto doc = HtmlDocument::Parse(R"(<html><body>
        <script src="/app.js"></script>
        <script>var a = 1;</script>
        <script>window.location.href = "https://real.example/x";</script>
        </body></html>)");
    REQUIRE(doc.has_value());
    auto scripts = doc->ScriptTexts();
    REQUIRE(scripts.size() == 2);
    CHECK(scripts[1].find("real.example") != std::string::npos);
}

TEST_CASE("ScriptScanner finds navigation targets in source order") {
    std::string script = R"(
        setTimeout(function(){ window.open("https://b.example/2"); }, 1000);
        location.replace('https://c.example/3');
        document.location.href = "https://a.example/1";
    )";
    auto targets = ScriptScanner::NavigationTargets(script);
    REQUIRE(targets.size() == 3);
    CHECK(targets[0] == "https://b.example/2");
    CHECK(targets[1] == "https://c.example/3");
    CHECK(targets[2] == "https://a.example/1");
}

TEST_CASE("ScriptScanner resolves variables used for navigation") {
    std::vector<std::string> scripts = {
        R"(var finalUrl = "https://real.example/file";)",
        R"(function go(){ window.location.href = finalUrl; })"
    };
    auto indirect = ScriptScanner::IndirectNavigationTargets(scripts);
    REQUIRE(indirect.size() == 1);
    CHECK(indirect[0] == "https://real.example/file");

    auto vars = ScriptScanner::LinkVariables(R"(var counter = "https://x.example"; const downloadLink = 'https://y.example/f';)");
    REQUIRE(vars.size() == 1);
    CHECK(vars[0] == "https://y.example/f");
}

TEST_CASE("ScriptScanner extracts secondary request endpoints once each") {
    std::string script = R"(
        fetch('/api/link?id=9').then(r => r.json());
        $.ajax({ type: "POST", url: "/ajax/get", data: {} });
        $.getJSON("/api/link?id=9");
        xhr.open("GET", "/go/resolve");
    )";
    auto endpoints = ScriptScanner::SecondaryRequestEndpoints(script);
    REQUIRE(endpoints.size() == 3);
    CHECK(endpoints[0] == "/api/link?id=9");
    CHECK(endpoints[1] == "/ajax/get");
    CHECK(endpoints[2] == "/go/resolve");
}

TEST_CASE("ScriptScanner reads timers and encoded literals") {
    CHECK(ScriptScanner::HasTimer("setInterval(tick, 1000)"));
    CHECK_FALSE(ScriptScanner::HasTimer("var x = 1;"));

    auto counter = ScriptScanner::AnnouncedSeconds("var count = 7; setInterval(tick, 1000);");
    REQUIRE(counter.has_value());
    CHECK(*counter == 7);
    auto timeout = ScriptScanner::AnnouncedSeconds("setTimeout(function(){ go(); }, 3000);");
    REQUIRE(timeout.has_value());
    CHECK(*timeout == 3);
    CHECK_FALSE(ScriptScanner::AnnouncedSeconds("console.log(1)").has_value());

    auto literals = ScriptScanner::AtobLiterals(R"(location.href = atob("aHR0cHM6Ly9yZWFsLmV4YW1wbGUv");)");
    REQUIRE(literals.size() == 1);
    CHECK(literals[0] == "aHR0cHM6Ly9yZWFsLmV4YW1wbGUv");

    auto urls = ScriptScanner::AbsoluteUrls(R"({"u":"https:\/\/real.example\/f"} see http://other.example/x)");
    REQUIRE(urls.size() == 2);
    CHECK(urls[1] == "http://other.example/x");
}

TEST_CASE("ScriptScanner reads meta refresh targets") {
    auto doc = HtmlDocument::Parse(
        R"(<html><head><meta http-equiv="Refresh" content="0; URL='https://next.example/hop'"></head></html>)");
    REQUIRE(doc.has_value());
    auto target = ScriptScanner::MetaRefreshTarget(*doc);
    REQUIRE(target.has_value());
    CHECK(*target == "https://next.example/hop");

    auto plain = HtmlDocument::Parse("<html><head><meta name=\"viewport\" content=\"width=device-width\"></head></html>");
    REQUIRE(plain.has_value());
    CHECK_FALSE(ScriptScanner::MetaRefreshTarget(*plain).has_value());
}

TEST_CASE("ScriptScanner handles scripts with very long runs") {
    const std::string run(100000, 'x');

    CHECK_FALSE(ScriptScanner::AnnouncedSeconds("setTimeout(function(){" + run + "});").has_value());
    CHECK(ScriptScanner::AnnouncedSeconds("setTimeout(function(){" + run + "}); setTimeout(go, 3000);") == 3);

    CHECK(ScriptScanner::AtobLiterals("atob('" + std::string(100000, 'A') + "')").empty());
    CHECK(ScriptScanner::AtobLiterals("atob('" + std::string(100000, 'A') + "') atob('aHR0cA==')")
          == std::vector<std::string>{"aHR0cA=="});

    CHECK(ScriptScanner::AbsoluteUrls("https://x.example/" + run).empty());
    CHECK(ScriptScanner::AbsoluteUrls("https://x.example/" + run + " https://real.example/f")
          == std::vector<std::string>{"https://real.example/f"});

    CHECK(ScriptScanner::NavigationTargets("location.href = \"" + run + "\"; location.href = \"https://real.example/n\";")
          == std::vector<std::string>{"https://real.example/n"});
    CHECK(ScriptScanner::SecondaryRequestEndpoints("fetch('" + run + "')").empty());
}
