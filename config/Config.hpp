#pragma once
#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>

namespace GateResolve {
    struct Config {
        int cache_ttl_minutes = 1440;
        size_t cache_max_size = 10000;
        size_t cache_shards = 16;
        long http_timeout_ms = 30000;
        long http_max_redirects = 10;
        std::string http_user_agent = "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/124.0.0.0 Safari/537.36";
        size_t max_body_bytes = 8388608; // 8MB
        long resolution_budget_ms = 60000;
        long premium_budget_ms = 120000;
        int max_redirect_hops = 10;
        int countdown_max_wait_seconds = 15;
        int cloudflare_max_retries = 3;
        long cloudflare_retry_delay_ms = 2000;
        bool browser_enabled = true;
        std::string browser_executable = "chromium";
        size_t browser_pool_size = 2;
        long browser_settle_ms = 8000;
        long browser_launch_timeout_ms = 15000;
        int max_concurrency = 0; // 0: hardware threads
        std::string log_level = "info";
        // domain -> strategy ids; an empty list allows every strategy
        std::map<std::string, std::vector<std::string>> sites;

        Config();

        static Config& GetInstance() {
            static Config instance;
            return instance;
        }

        void Load(const std::string& path);
        void CreateDefault(const std::string& path);
        nlohmann::json ToJson() const;
    };
}
