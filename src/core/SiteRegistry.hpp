#pragma once
#include <string>
#include <vector>
#include <set>
#include <optional>
#include <unordered_map>
#include "../interfaces/IStrategy.hpp"

namespace GateResolve {

// Known gate domains and the strategies worth running on each.
class SiteRegistry {
public:
    static const std::vector<std::string>& DefaultDomains();
    static SiteRegistry WithDefaults();

    // An empty id list allows every strategy. Unknown ids are ignored with a warning.
    void Register(const std::string& domain, const std::vector<std::string>& strategy_ids);

    // Allowlist for the URL's host or its closest registered parent domain.
    // nullopt: unknown host or no restriction, so every strategy runs.
    std::optional<std::set<StrategyKind>> AllowedFor(const std::string& url) const;
    bool IsKnown(const std::string& url) const;
    size_t Size() const { return sites_.size(); }

private:
    const std::optional<std::set<StrategyKind>>* Find(const std::string& url) const;

    std::unordered_map<std::string, std::optional<std::set<StrategyKind>>> sites_;
};

}
