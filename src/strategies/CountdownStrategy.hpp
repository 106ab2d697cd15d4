#pragma once
#include "../interfaces/IStrategy.hpp"

namespace GateResolve {

class HtmlDocument;

// Gate pages that reveal the link after a timer. Reads the revealed link out of the page
// when it is already there; otherwise honors the wait (up to a cap) and fetches the page again.
class CountdownStrategy : public IStrategy {
public:
    CountdownStrategy(std::chrono::seconds max_wait, std::chrono::milliseconds fetch_timeout);

    StrategyKind Kind() const override { return StrategyKind::Countdown; }
    StrategyOutcome Attempt(const FetchResult& page, const StrategyContext& ctx) override;

private:
    std::optional<std::string> Revealed(const HtmlDocument& doc, const FetchResult& page, const StrategyContext& ctx) const;

    std::chrono::seconds max_wait_;
    std::chrono::milliseconds fetch_timeout_;
};

}
