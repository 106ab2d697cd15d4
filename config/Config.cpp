#include "Config.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <filesystem>
#include "../src/core/SiteRegistry.hpp"
#include "../src/utils/Logger.hpp"

namespace GateResolve {

Config::Config() {
    for (const auto& domain : SiteRegistry::DefaultDomains()) sites[domain] = {};
}

nlohmann::json Config::ToJson() const {
    nlohmann::json data;
    data["cache_ttl_minutes"] = cache_ttl_minutes;
    data["cache_max_size"] = cache_max_size;
    data["cache_shards"] = cache_shards;
    data["http_timeout_ms"] = http_timeout_ms;
    data["http_max_redirects"] = http_max_redirects;
    data["http_user_agent"] = http_user_agent;
    data["max_body_bytes"] = max_body_bytes;
    data["resolution_budget_ms"] = resolution_budget_ms;
    data["premium_budget_ms"] = premium_budget_ms;
    data["max_redirect_hops"] = max_redirect_hops;
    data["countdown_max_wait_seconds"] = countdown_max_wait_seconds;
    data["cloudflare_max_retries"] = cloudflare_max_retries;
    data["cloudflare_retry_delay_ms"] = cloudflare_retry_delay_ms;
    data["browser_enabled"] = browser_enabled;
    data["browser_executable"] = browser_executable;
    data["browser_pool_size"] = browser_pool_size;
    data["browser_settle_ms"] = browser_settle_ms;
    data["browser_launch_timeout_ms"] = browser_launch_timeout_ms;
    data["max_concurrency"] = max_concurrency;
    data["log_level"] = log_level;
    data["sites"] = sites;
    return data;
}

void Config::Load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in config file " + path + ": " + e.what());
    }
    if (!data.is_object()) {
        throw std::runtime_error("Config file must contain a JSON object: " + path);
    }

    try {
        cache_ttl_minutes = data.value("cache_ttl_minutes", cache_ttl_minutes);
        cache_max_size = data.value("cache_max_size", cache_max_size);
        cache_shards = data.value("cache_shards", cache_shards);
        http_timeout_ms = data.value("http_timeout_ms", http_timeout_ms);
        http_max_redirects = data.value("http_max_redirects", http_max_redirects);
        http_user_agent = data.value("http_user_agent", http_user_agent);
        max_body_bytes = data.value("max_body_bytes", max_body_bytes);
        resolution_budget_ms = data.value("resolution_budget_ms", resolution_budget_ms);
        premium_budget_ms = data.value("premium_budget_ms", premium_budget_ms);
        max_redirect_hops = data.value("max_redirect_hops", max_redirect_hops);
        countdown_max_wait_seconds = data.value("countdown_max_wait_seconds", countdown_max_wait_seconds);
        cloudflare_max_retries = data.value("cloudflare_max_retries", cloudflare_max_retries);
        cloudflare_retry_delay_ms = data.value("cloudflare_retry_delay_ms", cloudflare_retry_delay_ms);
        browser_enabled = data.value("browser_enabled", browser_enabled);
        browser_executable = data.value("browser_executable", browser_executable);
        browser_pool_size = data.value("browser_pool_size", browser_pool_size);
        browser_settle_ms = data.value("browser_settle_ms", browser_settle_ms);
        browser_launch_timeout_ms = data.value("browser_launch_timeout_ms", browser_launch_timeout_ms);
        max_concurrency = data.value("max_concurrency", max_concurrency);
        log_level = data.value("log_level", log_level);
    } catch (const nlohmann::json::type_error& e) {
        throw std::runtime_error("Wrong value type in config file " + path + ": " + e.what());
    }

    // Load site allowlists
    if (data.contains("sites") && data["sites"].is_object()) {
        sites.clear();
        for (const auto& [domain, ids] : data["sites"].items()) {
            auto& list = sites[domain];
            if (!ids.is_array()) continue;
            for (const auto& v : ids) {
                if (v.is_string()) list.push_back(v.get<std::string>());
            }
        }
    }

    // Write back missing keys so existing config.json reflects newly added options.
    // This is non-destructive: preserves unknown keys and only appends missing ones.
    bool changed = false;
    for (const auto& [key, value] : ToJson().items()) {
        if (!data.contains(key)) { data[key] = value; changed = true; }
    }

    if (changed) {
        std::filesystem::path p(path);
        std::filesystem::path bak = p;
        bak += ".bak";
        std::error_code ec;
        std::filesystem::copy_file(p, bak, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            Logger::Log(LogLevel::Warn, "Could not back up " + path + ": " + ec.message());
            return;
        }

        std::ofstream o(path, std::ios::trunc);
        o << std::setw(4) << data << std::endl;
        if (!o.good()) {
            Logger::Log(LogLevel::Warn, "Could not add missing keys to " + path);
        } else {
            Logger::Log(LogLevel::Info, "Added missing keys to " + path + " (backup at " + bak.string() + ")");
        }
    }
}

void Config::CreateDefault(const std::string& path_str) {
    std::filesystem::path path(path_str);

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    nlohmann::json data = Config().ToJson();

    std::ofstream o(path);
    if (!o.is_open()) {
        throw std::runtime_error("Could not open config file for writing: " + path_str);
    }
    o << std::setw(4) << data << std::endl;
    if (!o.good()) {
        throw std::runtime_error("Failed to write to config file: " + path_str);
    }
}

}
