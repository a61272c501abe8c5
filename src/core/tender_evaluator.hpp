#pragma once

#include <optional>
#include <string>
#include <vector>
#include "types.hpp"
#include "event_pusher.hpp"
#include "hedge_executor.hpp"
#include "risk_limiter.hpp"
#include "unwind_controller.hpp"
#include "../data/market_snapshot.hpp"
#include "../exchange/exchange_interface.hpp"
#include "../utils/config_types.hpp"

namespace etfarb {

struct TenderDecision {
    long long tender_id = 0;
    std::optional<double> profit; // per share, nullopt when depth was short
    bool profitable = false;
    bool risk_approved = false;
    bool liquidated = false;
    bool accepted = false;
    bool hedged = false;
    std::string reason;
};

// Accept/reject for block offers. Acceptance is final; the basket hedge (and
// the currency hedge when configured) follows whatever the limiter thinks.
class TenderEvaluator {
public:
    TenderEvaluator(ExchangeInterface* exchange, RiskLimiter* limiter, HedgeExecutor* hedger,
                    UnwindController* unwind, EventPusher* events, const TenderConfig& config);

    // Per-share profit in the basket currency for taking the offer and
    // offsetting it in the basket. nullopt when a book is too thin.
    std::optional<double> expected_profit(const TenderOffer& offer, const MarketSnapshot& snapshot) const;

    // Evaluates offers in order; each acceptance is folded into the working
    // position the next offer is checked against.
    std::vector<TenderDecision> process(const MarketSnapshot& snapshot,
                                        const std::vector<TenderOffer>& offers);

    // Volume-weighted price of taking quantity from the ladder, best first.
    static std::optional<double> walk_book(const std::vector<BookLevel>& levels, long long quantity);

    // Composite leg plus the offsetting basket legs.
    static std::vector<Leg> package_for(const TenderOffer& offer);

private:
    TenderDecision evaluate(const TenderOffer& offer, MarketSnapshot& working);
    bool hedge_tender(const TenderOffer& offer, const MarketSnapshot& snapshot);

    ExchangeInterface* exchange_;
    RiskLimiter* limiter_;
    HedgeExecutor* hedger_;
    UnwindController* unwind_;
    EventPusher* events_;
    TenderConfig config_;
};

} // namespace etfarb
