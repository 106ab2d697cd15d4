#include <catch2/catch_all.hpp>
#include <thread>
#include "cache/LinkCache.hpp"
#include "core/Deadline.hpp"
#include "utils/ThreadPool.hpp"
#include "utils/Logger.hpp"
#include "utils/RegexScan.hpp"

using namespace GateResolve;

TEST_CASE("LinkCache LRU eviction") {
    LinkCache cache(1, std::chrono::hours(1), 1);
    cache.Put("http://a/", "https://dest.example/a", "Base64 Decode");
    cache.Put("http://b/", "https://dest.example/b", "URL Decode"); // evicts a
    auto ga = cache.Get("http://a/");
    auto gb = cache.Get("http://b/");
    CHECK_FALSE(ga.has_value());
    REQUIRE(gb.has_value());
    CHECK(gb->destination == "https://dest.example/b");
    CHECK(gb->strategy == "URL Decode");
}

TEST_CASE("LinkCache keeps recently used entries") {
    LinkCache cache(2, std::chrono::hours(1), 1);
    cache.Put("a", "https://x.example/a", "s");
    cache.Put("b", "https://x.example/b", "s");
    REQUIRE(cache.Get("a").has_value()); // a becomes most recent
    cache.Put("c", "https://x.example/c", "s"); // evicts b
    CHECK(cache.Get("a").has_value());
    CHECK_FALSE(cache.Get("b").has_value());
    CHECK(cache.Get("c").has_value());
}

TEST_CASE("LinkCache counts hits and supports invalidation") {
    LinkCache cache(100, std::chrono::hours(1));
    cache.Put("fp", "https://x.example/file", "HTML Form Bypass");
    CHECK(cache.Get("fp")->hit_count == 1);
    CHECK(cache.Get("fp")->hit_count == 2);
    cache.Invalidate("fp");
    CHECK_FALSE(cache.Get("fp").has_value());
    cache.Invalidate("missing"); // no-op
}

TEST_CASE("LinkCache never returns expired entries") {
    LinkCache cache(100, std::chrono::hours(1));
    cache.Put("short", "https://x.example/1", "s", std::chrono::seconds(1));
    cache.Put("long", "https://x.example/2", "s");
    REQUIRE(cache.Get("short").has_value());
    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    CHECK_FALSE(cache.Get("short").has_value());
    CHECK(cache.Get("long").has_value());
}

TEST_CASE("LinkCache sweep removes expired entries across shards") {
    LinkCache cache(100, std::chrono::hours(1), 4);
    for (int i = 0; i < 8; ++i) {
        cache.Put("expiring-" + std::to_string(i), "https://x.example/" + std::to_string(i), "s", std::chrono::seconds(1));
    }
    cache.Put("kept", "https://x.example/kept", "s");
    CHECK(cache.Size() == 9);
    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    CHECK(cache.Sweep() == 8);
    CHECK(cache.Size() == 1);
}

TEST_CASE("LinkCache is safe under concurrent writers") {
    LinkCache cache(10000, std::chrono::hours(1), 8);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, t] {
            for (int i = 0; i < 200; ++i) {
                std::string key = std::to_string(t) + "-" + std::to_string(i);
                cache.Put(key, "https://x.example/" + key, "s");
                cache.Get(key);
            }
        });
    }
    for (auto& th : threads) th.join();
    CHECK(cache.Size() == 800);
}

TEST_CASE("Deadline sleep is cut short by cancellation") {
    Deadline deadline(std::chrono::seconds(10));
    std::thread canceller([deadline]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        deadline.Cancel();
    });
    auto start = std::chrono::steady_clock::now();
    bool completed = deadline.SleepFor(std::chrono::seconds(5));
    auto waited = std::chrono::steady_clock::now() - start;
    canceller.join();
    CHECK_FALSE(completed);
    CHECK(waited < std::chrono::seconds(2));
    CHECK(deadline.Cancelled());
    CHECK(deadline.Expired());
    CHECK(deadline.Remaining().count() == 0);
}

TEST_CASE("Deadline clamps per-call timeouts to the remaining budget") {
    Deadline deadline(std::chrono::milliseconds(200));
    CHECK(deadline.Clamp(std::chrono::seconds(30)) <= std::chrono::milliseconds(200));
    CHECK(deadline.Clamp(std::chrono::milliseconds(10)) == std::chrono::milliseconds(10));
    CHECK_FALSE(deadline.SleepFor(std::chrono::seconds(1)));
    CHECK(deadline.Expired());
}

TEST_CASE("ThreadPool runs tasks and returns results") {
    ThreadPool pool(3);
    std::vector<std::future<int>> results;
    for (int i = 0; i < 10; ++i) {
        results.push_back(pool.enqueue([i] { return i * i; }));
    }
    int sum = 0;
    for (auto& r : results) sum += r.get();
    CHECK(sum == 285);
}

TEST_CASE("Logger parses level names") {
    CHECK(Logger::FromString("DEBUG") == LogLevel::Debug);
    CHECK(Logger::FromString("warning") == LogLevel::Warn);
    CHECK(Logger::FromString("err") == LogLevel::Error);
    CHECK(Logger::FromString("unknown") == LogLevel::Info);
}

TEST_CASE("RegexScan finds matches on both sides of window edges exactly once") {
    std::string text(10000, 'x');
    for (size_t at : {size_t(10), size_t(2045), size_t(4094), size_t(9000)}) text.replace(at, 7, "id=123;");
    std::regex id(R"(id=(\d+);)");
    auto found = RegexScan::FindAll(text, id);
    REQUIRE(found.size() == 4);
    CHECK(found[0].position == 10);
    CHECK(found[1].position == 2045);
    CHECK(found[2].position == 4094);
    CHECK(found[3].position == 9000);
    CHECK(found[2][1] == "123");

    auto first = RegexScan::FindFirst(text, id);
    REQUIRE(first.has_value());
    CHECK(first->position == 10);
    CHECK_FALSE(RegexScan::FindFirst(text, std::regex("nothing")).has_value());
}

TEST_CASE("RegexScan skips runs too long to match and keeps going") {
    std::string text = "url=" + std::string(200000, 'a') + " url=ok";
    auto found = RegexScan::FindAll(text, std::regex(R"(url=([a-z]+))"));
    REQUIRE(found.size() == 1);
    CHECK(found[0][1] == "ok");
    CHECK(found[0].position == text.size() - 6);
}
