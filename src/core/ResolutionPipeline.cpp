#include "ResolutionPipeline.hpp"
#include "../utils/UrlUtil.hpp"
#include "../utils/Logger.hpp"

namespace GateResolve {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds Since(Clock::time_point started) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
}

std::string Summarize(const std::string& headline, const std::string& fetch_note, const std::vector<StrategyAttempt>& attempts) {
    std::string out = headline;
    if (!fetch_note.empty()) out += "; initial fetch failed: " + fetch_note;
    for (const auto& a : attempts) {
        out += "; " + a.strategy + " " + a.outcome;
        if (!a.detail.empty()) out += " (" + a.detail + ")";
    }
    return out;
}

}

const char* ToString(PipelineError error) {
    switch (error) {
        case PipelineError::AllStrategiesDeclined: return "AllStrategiesDeclined";
        case PipelineError::BudgetExhausted: return "BudgetExhausted";
        case PipelineError::InvalidUrl: return "InvalidUrl";
    }
    return "Unknown";
}

ResolutionPipeline::ResolutionPipeline(IFetcher& fetcher, ILinkCache& cache,
                                       std::vector<std::unique_ptr<IStrategy>> strategies, Options options)
    : fetcher_(fetcher), cache_(cache), strategies_(std::move(strategies)), options_(options) {}

std::optional<ResolutionResult> ResolutionPipeline::LookupCache(const std::string& fingerprint) {
    std::optional<CacheEntry> entry;
    try {
        entry = cache_.Get(fingerprint);
    } catch (const CacheError& e) {
        Logger::Log(LogLevel::Warn, std::string("Cache read failed, treating as miss: ") + e.what());
        return std::nullopt;
    }
    if (!entry) return std::nullopt;

    ResolutionResult result;
    result.destination = entry->destination;
    result.strategy = entry->strategy;
    result.from_cache = true;
    return result;
}

void ResolutionPipeline::Store(const std::string& fingerprint, const ResolutionResult& result) {
    try {
        cache_.Put(fingerprint, *result.destination, result.strategy.value_or(""), options_.cache_ttl);
    } catch (const CacheError& e) {
        Logger::Log(LogLevel::Warn, std::string("Cache write failed for ") + fingerprint + ": " + e.what());
    }
}

void ResolutionPipeline::Count(const ResolutionResult& result) {
    if (result.Success()) ++successes_;
    if (result.from_cache) ++cache_hits_;
    if (result.coalesced) ++coalesced_;
}

ResolutionResult ResolutionPipeline::Resolve(const ResolutionRequest& request) {
    const auto started = Clock::now();
    ++total_;
    Deadline deadline(request.budget);

    if (auto problem = UrlUtil::ValidateUrl(request.source_url)) {
        Logger::Log(LogLevel::Warn, "Rejected source URL " + request.source_url + ": " + *problem);
        ResolutionResult result;
        result.error = PipelineError::InvalidUrl;
        result.error_summary = "invalid URL: " + *problem;
        result.elapsed = Since(started);
        return result;
    }

    const std::string fingerprint = UrlUtil::Fingerprint(request.source_url);

    if (auto hit = LookupCache(fingerprint)) {
        Logger::Log(LogLevel::Info, "Cache hit for " + request.source_url + " -> " + *hit->destination);
        hit->elapsed = Since(started);
        Count(*hit);
        return *hit;
    }

    std::promise<ResolutionResult> promise;
    std::shared_future<ResolutionResult> pending;
    bool leader = false;
    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        auto it = inflight_.find(fingerprint);
        if (it != inflight_.end()) {
            pending = it->second;
        } else {
            pending = promise.get_future().share();
            inflight_.emplace(fingerprint, pending);
            leader = true;
        }
    }

    if (!leader) {
        Logger::Log(LogLevel::Debug, "Joining in-flight resolution of " + request.source_url);
        ResolutionResult result = AwaitLeader(pending, deadline);
        result.elapsed = Since(started);
        Count(result);
        return result;
    }

    ResolutionResult result;
    try {
        // A previous leader may have stored its result between our cache miss and taking the slot.
        if (auto hit = LookupCache(fingerprint)) result = std::move(*hit);
        else result = RunChain(request, fingerprint, deadline);
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(inflight_mutex_);
            inflight_.erase(fingerprint);
        }
        promise.set_exception(std::current_exception());
        throw;
    }

    if (result.Success() && !result.from_cache) Store(fingerprint, result);
    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        inflight_.erase(fingerprint);
    }
    promise.set_value(result);

    result.elapsed = Since(started);
    Count(result);
    if (result.Success()) {
        Logger::Log(LogLevel::Info, "Resolved " + request.source_url + " -> " + *result.destination + " via "
            + result.strategy.value_or("?") + " in " + std::to_string(result.elapsed.count()) + "ms");
    } else {
        Logger::Log(LogLevel::Info, "Could not resolve " + request.source_url + ": " + result.error_summary);
    }
    return result;
}

ResolutionResult ResolutionPipeline::AwaitLeader(std::shared_future<ResolutionResult> pending, const Deadline& deadline) {
    if (pending.wait_until(deadline.At()) != std::future_status::ready) {
        ResolutionResult result;
        result.coalesced = true;
        result.error = PipelineError::BudgetExhausted;
        result.error_summary = "time budget exhausted while waiting for a concurrent resolution of the same link";
        return result;
    }
    ResolutionResult result = pending.get();
    result.coalesced = true;
    return result;
}

ResolutionResult ResolutionPipeline::RunChain(const ResolutionRequest& request, const std::string& fingerprint, const Deadline& deadline) {
    ResolutionResult result;

    FetchRequest initial;
    initial.url = request.source_url;
    initial.accept_error_status = true;
    initial.max_redirects = request.max_redirect_hops;
    initial.timeout = deadline.Clamp(options_.fetch_timeout);

    FetchResult page;
    page.final_url = request.source_url;
    bool page_available = false;
    std::string fetch_note;

    FetchOutcome fetched = fetcher_.Fetch(initial, deadline);
    if (auto* error = std::get_if<FetchError>(&fetched)) {
        fetch_note = Describe(*error);
        if (deadline.Expired()) {
            result.error = PipelineError::BudgetExhausted;
            result.error_summary = Summarize("time budget exhausted", fetch_note, result.attempts);
            return result;
        }
        Logger::Log(LogLevel::Warn, "Initial fetch of " + request.source_url + " failed: " + fetch_note);
    } else {
        page = std::get<FetchResult>(std::move(fetched));
        page_available = true;
        Logger::Log(LogLevel::Debug, "Fetched " + request.source_url + " (" + std::to_string(page.status_code) + ", "
            + std::to_string(page.body.size()) + " bytes, final " + page.final_url + ")");
    }

    StrategyContext ctx{request.source_url, fetcher_, deadline, request.max_redirect_hops};
    bool budget_skipped = false;

    for (auto& strategy : strategies_) {
        if (request.enabled_strategies && request.enabled_strategies->count(strategy->Kind()) == 0) continue;

        if (deadline.Expired()) {
            result.error = PipelineError::BudgetExhausted;
            result.error_summary = Summarize("time budget exhausted", fetch_note, result.attempts);
            return result;
        }

        StrategyAttempt attempt;
        attempt.strategy = strategy->Name();

        if (strategy->NeedsPage() && !page_available) {
            attempt.outcome = "declined";
            attempt.detail = "page unavailable";
            result.attempts.push_back(std::move(attempt));
            continue;
        }
        if (strategy->MinimumCost() > deadline.Remaining()) {
            attempt.outcome = "skipped";
            attempt.detail = "needs " + std::to_string(strategy->MinimumCost().count()) + "ms, "
                + std::to_string(deadline.Remaining().count()) + "ms left";
            budget_skipped = true;
            Logger::Log(LogLevel::Debug, strategy->Name() + " skipped: " + attempt.detail);
            result.attempts.push_back(std::move(attempt));
            continue;
        }

        const auto started = Clock::now();
        StrategyOutcome outcome = Declined{};
        try {
            outcome = strategy->Attempt(page, ctx);
        } catch (const std::exception& e) {
            outcome = Failed{StrategyErrorKind::ParseFailed, std::string("unexpected exception: ") + e.what()};
        }
        attempt.elapsed = Since(started);

        if (auto* resolved = std::get_if<Resolved>(&outcome)) {
            if (!UrlUtil::IsHttpUrl(resolved->next_url) || UrlUtil::Fingerprint(resolved->next_url) == fingerprint) {
                attempt.outcome = "declined";
                attempt.detail = "returned the source link or a non-http URL";
                Logger::Log(LogLevel::Debug, strategy->Name() + " returned an unusable URL: " + resolved->next_url);
                result.attempts.push_back(std::move(attempt));
                continue;
            }
            attempt.outcome = "resolved";
            attempt.detail = resolved->next_url;
            result.attempts.push_back(std::move(attempt));
            result.destination = resolved->next_url;
            result.strategy = strategy->Name();
            result.hops = static_cast<int>(page.redirect_count) + resolved->hops;
            by_strategy_[static_cast<size_t>(strategy->Kind())]++;
            return result;
        }

        if (auto* declined = std::get_if<Declined>(&outcome)) {
            attempt.outcome = declined->budget_exceeded ? "skipped" : "declined";
            attempt.detail = declined->reason;
            if (declined->budget_exceeded) budget_skipped = true;
            Logger::Log(LogLevel::Debug, strategy->Name() + " declined: " + declined->reason);
            result.attempts.push_back(std::move(attempt));
            continue;
        }

        const auto& failed = std::get<Failed>(outcome);
        attempt.outcome = "failed";
        attempt.detail = std::string(ToString(failed.kind)) + ": " + failed.detail;
        Logger::Log(LogLevel::Warn, strategy->Name() + " failed on " + request.source_url + ": " + attempt.detail);
        result.attempts.push_back(std::move(attempt));
        if (failed.kind == StrategyErrorKind::BudgetExceeded) {
            result.error = PipelineError::BudgetExhausted;
            result.error_summary = Summarize("time budget exhausted", fetch_note, result.attempts);
            return result;
        }
    }

    if (budget_skipped) {
        result.error = PipelineError::BudgetExhausted;
        result.error_summary = Summarize("time budget exhausted", fetch_note, result.attempts);
    } else {
        result.error = PipelineError::AllStrategiesDeclined;
        result.error_summary = Summarize("could not resolve this link", fetch_note, result.attempts);
    }
    return result;
}

PipelineStats ResolutionPipeline::Stats() const {
    PipelineStats stats;
    stats.total = total_.load();
    stats.successes = successes_.load();
    stats.cache_hits = cache_hits_.load();
    stats.coalesced = coalesced_.load();
    for (size_t i = 0; i < kStrategyKinds; ++i) {
        uint64_t n = by_strategy_[i].load();
        if (n > 0) stats.by_strategy[DisplayName(static_cast<StrategyKind>(i))] = n;
    }
    return stats;
}

}
