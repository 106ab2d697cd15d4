#include <catch2/catch_all.hpp>
#include <filesystem>
#include <fstream>
#include "config/Config.hpp"

using namespace GateResolve;

namespace {

std::filesystem::path TempConfigPath(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / "gate_resolve_tests";
    std::filesystem::create_directories(dir);
    auto path = dir / name;
    std::filesystem::remove(path);
    std::filesystem::remove(path.string() + ".bak");
    return path;
}

nlohmann::json ReadJson(const std::filesystem::path& path) {
    std::ifstream in(path);
    return nlohmann::json::parse(in);
}

}

TEST_CASE("Config default file loads back to the defaults") {
    auto path = TempConfigPath("default.json");
    Config c;
    c.CreateDefault(path.string());
    REQUIRE(std::filesystem::exists(path));

    Config loaded;
    loaded.sites.clear();
    loaded.Load(path.string());
    CHECK(loaded.resolution_budget_ms == 60000);
    CHECK(loaded.premium_budget_ms == 120000);
    CHECK(loaded.cache_ttl_minutes == 1440);
    CHECK(loaded.browser_pool_size == 2);
    CHECK(loaded.sites.size() == c.sites.size());
    CHECK(loaded.sites.count("ouo.io") == 1);
    // Nothing was missing, so no backup was written.
    CHECK_FALSE(std::filesystem::exists(path.string() + ".bak"));
}

TEST_CASE("Config keeps user values and writes back missing keys") {
    auto path = TempConfigPath("partial.json");
    {
        std::ofstream out(path);
        out << R"({"resolution_budget_ms": 15000, "log_level": "debug", "custom_key": true,
                  "sites": {"gate.example": ["base64-decode"]}})";
    }

    Config c;
    c.Load(path.string());
    CHECK(c.resolution_budget_ms == 15000);
    CHECK(c.log_level == "debug");
    CHECK(c.cloudflare_max_retries == 3);
    REQUIRE(c.sites.size() == 1);
    CHECK(c.sites["gate.example"] == std::vector<std::string>{"base64-decode"});

    auto written = ReadJson(path);
    CHECK(written["resolution_budget_ms"] == 15000);
    CHECK(written.contains("cloudflare_retry_delay_ms"));
    CHECK(written.contains("browser_executable"));
    CHECK(written["custom_key"] == true);
    CHECK(std::filesystem::exists(path.string() + ".bak"));
}

TEST_CASE("Config rejects malformed files") {
    auto broken = TempConfigPath("broken.json");
    {
        std::ofstream out(broken);
        out << "{ not json";
    }
    Config c;
    CHECK_THROWS_AS(c.Load(broken.string()), std::runtime_error);

    auto wrong_type = TempConfigPath("wrong_type.json");
    {
        std::ofstream out(wrong_type);
        out << R"({"resolution_budget_ms": "soon"})";
    }
    CHECK_THROWS_AS(c.Load(wrong_type.string()), std::runtime_error);

    auto array = TempConfigPath("array.json");
    {
        std::ofstream out(array);
        out << "[1, 2]";
    }
    CHECK_THROWS_AS(c.Load(array.string()), std::runtime_error);

    CHECK_THROWS_AS(c.Load(TempConfigPath("missing.json").string()), std::runtime_error);
}
