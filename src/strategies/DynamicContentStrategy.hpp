#pragma once
#include "../interfaces/IStrategy.hpp"
#include <nlohmann/json.hpp>

namespace GateResolve {

// Pages that load the destination with a secondary XHR/fetch call: finds the endpoint in
// the scripts, calls it the way the page would and reads the link out of the response.
class DynamicContentStrategy : public IStrategy {
public:
    explicit DynamicContentStrategy(std::chrono::milliseconds fetch_timeout, size_t max_endpoints = 4);

    StrategyKind Kind() const override { return StrategyKind::DynamicContent; }
    StrategyOutcome Attempt(const FetchResult& page, const StrategyContext& ctx) override;

    // First link-like string in a JSON response (url, link, download, ... including nested "data").
    static std::optional<std::string> FindLink(const nlohmann::json& j, int depth = 0);

private:
    std::chrono::milliseconds fetch_timeout_;
    size_t max_endpoints_;
};

}
