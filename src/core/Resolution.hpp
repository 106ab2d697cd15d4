#pragma once
#include <string>
#include <vector>
#include <set>
#include <optional>
#include <chrono>
#include "../interfaces/IStrategy.hpp"

namespace GateResolve {

struct ResolutionRequest {
    std::string source_url;
    std::chrono::milliseconds budget{60000};
    int max_redirect_hops = 10;
    // Per-domain allowlist from the site registry; nullopt runs every strategy.
    std::optional<std::set<StrategyKind>> enabled_strategies;
};

enum class PipelineError {
    AllStrategiesDeclined,
    BudgetExhausted,
    InvalidUrl
};

const char* ToString(PipelineError error);

struct StrategyAttempt {
    std::string strategy;
    std::string outcome;        // resolved, declined, failed, skipped
    std::string detail;
    std::chrono::milliseconds elapsed{0};
};

struct ResolutionResult {
    std::optional<std::string> destination;
    std::optional<std::string> strategy;
    int hops = 0;
    std::chrono::milliseconds elapsed{0};
    bool from_cache = false;
    bool coalesced = false;
    std::optional<PipelineError> error;
    std::string error_summary;
    std::vector<StrategyAttempt> attempts;

    bool Success() const { return destination.has_value(); }
};

}
