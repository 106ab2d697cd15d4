#include <iostream>
#include <cstdlib>
#include <curl/curl.h>
#include <filesystem>
#include <future>
#include <memory>
#include <thread>
#include <algorithm>
#include <nlohmann/json.hpp>
#include "../config/Config.hpp"
#include "browser/BrowserPool.hpp"
#include "browser/ChromeSession.hpp"
#include "cache/LinkCache.hpp"
#include "core/ResolutionPipeline.hpp"
#include "core/SiteRegistry.hpp"
#include "network/HttpFetcher.hpp"
#include "strategies/StrategyChain.hpp"
#include "utils/Logger.hpp"
#include "utils/ThreadPool.hpp"
#include "utils/UrlUtil.hpp"

namespace {

void PrintUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--config PATH] [--premium] [URL...]\n"
              << "Resolves ad-gate short links to their destinations. Without URL arguments,\n"
              << "URLs are read from standard input. One JSON object per URL is written to stdout.\n";
}

nlohmann::json ToJson(const std::string& source, const GateResolve::ResolutionResult& result) {
    nlohmann::json out;
    out["success"] = result.Success();
    out["source"] = source;
    out["url"] = result.destination ? nlohmann::json(*result.destination) : nlohmann::json(nullptr);
    out["method"] = result.strategy ? nlohmann::json(*result.strategy) : nlohmann::json(nullptr);
    out["hops"] = result.hops;
    out["time_taken"] = static_cast<double>(result.elapsed.count()) / 1000.0;
    out["from_cache"] = result.from_cache;
    out["coalesced"] = result.coalesced;
    if (result.error) {
        out["error"] = GateResolve::ToString(*result.error);
        out["details"] = result.error_summary;
    } else {
        out["error"] = nullptr;
    }
    return out;
}

}

int main(int argc, char* argv[]) {
    if (argc == 0 || argv[0] == nullptr) {
        GateResolve::Logger::Log(GateResolve::LogLevel::Error, "Cannot determine executable path.");
        return 1;
    }
    std::filesystem::path exe_path(argv[0]);
    std::filesystem::path exe_dir = exe_path.parent_path();
    std::filesystem::path config_path = exe_dir / "config" / "config.json";

    bool premium = false;
    std::vector<std::string> urls;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--premium") {
            premium = true;
        } else if (arg == "-h" || arg == "--help") {
            PrintUsage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            PrintUsage(argv[0]);
            return 2;
        } else {
            urls.push_back(arg);
        }
    }
    const std::string config_path_str = config_path.string();

    // Initialize global resources
    curl_global_init(CURL_GLOBAL_ALL);

    // Load Config
    try {
        GateResolve::Config::GetInstance().Load(config_path_str);
    } catch (const std::runtime_error& e) {
        std::string error_message = e.what();
        if (error_message.find("Could not open config file") != std::string::npos) {
            GateResolve::Logger::Log(GateResolve::LogLevel::Warn, "config.json not found. Creating a default one at: " + config_path_str);
            try {
                GateResolve::Config::GetInstance().CreateDefault(config_path_str);
                GateResolve::Logger::Log(GateResolve::LogLevel::Info, "Default config.json created. Please review it and run again.");
                curl_global_cleanup();
                return 0;
            } catch (const std::exception& create_e) {
                GateResolve::Logger::Log(GateResolve::LogLevel::Error, "Failed to create default config: " + std::string(create_e.what()));
                curl_global_cleanup();
                return 1;
            }
        } else {
            GateResolve::Logger::Log(GateResolve::LogLevel::Error, "Failed to load config: " + error_message);
            curl_global_cleanup();
            return 1;
        }
    }
    const auto& config = GateResolve::Config::GetInstance();
    GateResolve::Logger::Init(exe_dir.string(), GateResolve::Logger::FromString(config.log_level));
    GateResolve::Logger::Log(GateResolve::LogLevel::Info, "Configuration loaded from: " + config_path_str);

    // Determine thread pool size
    const unsigned int hardware_cores = std::max(1u, std::thread::hardware_concurrency());
    unsigned int worker_threads = 0;
    if (config.max_concurrency == 0) {
        worker_threads = hardware_cores;
    } else if (config.max_concurrency < 0) {
        GateResolve::Logger::Log(GateResolve::LogLevel::Error, "Configured max_concurrency (" + std::to_string(config.max_concurrency) + ") is invalid.");
        curl_global_cleanup();
        return 1;
    } else {
        worker_threads = static_cast<unsigned int>(config.max_concurrency);
    }

    if (urls.empty()) {
        std::string line;
        while (std::getline(std::cin, line)) {
            for (auto& u : GateResolve::UrlUtil::ExtractUrls(line)) urls.push_back(std::move(u));
        }
    }
    if (urls.empty()) {
        GateResolve::Logger::Log(GateResolve::LogLevel::Warn, "No URLs to resolve.");
        PrintUsage(argv[0]);
        curl_global_cleanup();
        return 2;
    }

    int failures = 0;
    {
        // Setup Core Components
        GateResolve::HttpFetcher::Options fetch_options;
        fetch_options.user_agent = config.http_user_agent;
        fetch_options.max_redirects = config.http_max_redirects;
        fetch_options.max_body_bytes = config.max_body_bytes;
        fetch_options.default_timeout = std::chrono::milliseconds(config.http_timeout_ms);
        GateResolve::HttpFetcher fetcher(fetch_options);

        GateResolve::LinkCache cache(config.cache_max_size, std::chrono::minutes(config.cache_ttl_minutes), config.cache_shards);

        std::unique_ptr<GateResolve::BrowserPool> browser_pool;
        if (config.browser_enabled) {
            GateResolve::ChromeOptions chrome;
            chrome.executable = config.browser_executable;
            chrome.launch_timeout = std::chrono::milliseconds(config.browser_launch_timeout_ms);
            chrome.user_agent = config.http_user_agent;
            browser_pool = std::make_unique<GateResolve::BrowserPool>(config.browser_pool_size, [chrome]() {
                return std::make_unique<GateResolve::ChromeSession>(chrome);
            });
        }

        GateResolve::StrategyChainOptions chain_options;
        chain_options.fetch_timeout = std::chrono::milliseconds(config.http_timeout_ms);
        chain_options.countdown_max_wait = std::chrono::seconds(config.countdown_max_wait_seconds);
        chain_options.cloudflare_max_retries = config.cloudflare_max_retries;
        chain_options.cloudflare_retry_delay = std::chrono::milliseconds(config.cloudflare_retry_delay_ms);
        chain_options.browser_pool = browser_pool.get();
        chain_options.browser.settle = std::chrono::milliseconds(config.browser_settle_ms);
        chain_options.browser.max_countdown = std::chrono::seconds(config.countdown_max_wait_seconds);

        GateResolve::ResolutionPipeline::Options pipeline_options;
        pipeline_options.fetch_timeout = std::chrono::milliseconds(config.http_timeout_ms);
        GateResolve::ResolutionPipeline pipeline(fetcher, cache, GateResolve::BuildStrategyChain(chain_options), pipeline_options);

        GateResolve::SiteRegistry registry;
        for (const auto& [domain, ids] : config.sites) registry.Register(domain, ids);

        const auto budget = std::chrono::milliseconds(premium ? config.premium_budget_ms : config.resolution_budget_ms);
        GateResolve::Logger::Log(GateResolve::LogLevel::Info, "Resolving " + std::to_string(urls.size()) + " link(s) on "
            + std::to_string(worker_threads) + " worker(s), budget " + std::to_string(budget.count()) + "ms");

        GateResolve::ThreadPool thread_pool(worker_threads);
        std::vector<std::future<GateResolve::ResolutionResult>> pending;
        for (const auto& url : urls) {
            GateResolve::ResolutionRequest request;
            request.source_url = url;
            request.budget = budget;
            request.max_redirect_hops = config.max_redirect_hops;
            request.enabled_strategies = registry.AllowedFor(url);
            if (!registry.IsKnown(url)) {
                GateResolve::Logger::Log(GateResolve::LogLevel::Debug, "No site entry for " + url + ", running every strategy");
            }
            pending.push_back(thread_pool.enqueue([&pipeline, request]() {
                return pipeline.Resolve(request);
            }));
        }

        for (size_t i = 0; i < pending.size(); ++i) {
            try {
                GateResolve::ResolutionResult result = pending[i].get();
                if (!result.Success()) ++failures;
                std::cout << ToJson(urls[i], result).dump() << std::endl;
            } catch (const std::exception& e) {
                ++failures;
                GateResolve::Logger::Log(GateResolve::LogLevel::Error, "Resolution of " + urls[i] + " threw: " + e.what());
                nlohmann::json out = {{"success", false}, {"source", urls[i]}, {"url", nullptr}, {"error", e.what()}};
                std::cout << out.dump() << std::endl;
            }
        }

        auto stats = pipeline.Stats();
        GateResolve::Logger::Log(GateResolve::LogLevel::Info, "Statistics: total " + std::to_string(stats.total)
            + ", resolved " + std::to_string(stats.successes) + ", cache hits " + std::to_string(stats.cache_hits)
            + ", coalesced " + std::to_string(stats.coalesced) + ", success rate "
            + std::to_string(static_cast<int>(stats.SuccessRate() * 100.0)) + "%");
        for (const auto& [name, count] : stats.by_strategy) {
            GateResolve::Logger::Log(GateResolve::LogLevel::Info, "  " + name + ": " + std::to_string(count));
        }
    }

    // Cleanup global resources
    curl_global_cleanup();
    return failures == 0 ? 0 : 1;
}
