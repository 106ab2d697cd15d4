#pragma once
#include "../interfaces/IStrategy.hpp"

namespace GateResolve {

// Destinations carried base64-encoded in the URL itself or in page attributes and atob() calls.
class Base64DecodeStrategy : public IStrategy {
public:
    StrategyKind Kind() const override { return StrategyKind::Base64Decode; }
    bool NeedsPage() const override { return false; }
    StrategyOutcome Attempt(const FetchResult& page, const StrategyContext& ctx) override;

    // Decodes up to two nested layers and returns the first layer that is an absolute http(s) URL.
    static std::optional<std::string> DecodeUrl(const std::string& encoded);
};

}
