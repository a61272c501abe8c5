#pragma once

#include <string>
#include <vector>
#include "types.hpp"
#include "edge_calculator.hpp"
#include "event_pusher.hpp"
#include "hedge_executor.hpp"
#include "order_router.hpp"
#include "risk_limiter.hpp"
#include "sizing_policy.hpp"
#include "../data/market_snapshot.hpp"
#include "../utils/config_types.hpp"

namespace etfarb {

enum class ArbitrageState {
    IDLE,
    EVALUATE,
    RISK_CHECK,
    EXECUTE_LEGS,
    HEDGE_CURRENCY
};

std::string to_string(ArbitrageState state);

struct ArbitrageResult {
    ArbitrageDirection direction = ArbitrageDirection::NONE;
    EdgeSet edges;
    double edge = 0.0;
    long long quantity = 0;
    bool risk_approved = false;
    bool legs_ok = false;
    bool hedge_ok = false;
    std::vector<ArbitrageState> trace;

    bool executed() const { return risk_approved && quantity > 0; }
};

// One pass of the basket/composite arbitrage per call:
// IDLE -> EVALUATE -> RISK_CHECK -> EXECUTE_LEGS -> HEDGE_CURRENCY -> IDLE,
// dropping back to IDLE when no size qualifies or the limiter denies.
// Legs are not rolled back; a failed leg is left for the guard and rebalancer.
class ArbitrageExecutor {
public:
    ArbitrageExecutor(OrderRouter* router, RiskLimiter* limiter, const SizingPolicy* sizing,
                      HedgeExecutor* hedger, EventPusher* events, const ArbitrageConfig& config);

    ArbitrageResult run(const MarketSnapshot& snapshot);

    ArbitrageState get_state() const { return state_; }

    static std::vector<Leg> legs_for(ArbitrageDirection direction, long long quantity);

private:
    void transition(ArbitrageResult& result, ArbitrageState next);
    bool execute_legs(const std::vector<Leg>& legs);
    bool hedge_currency(const ArbitrageResult& result, const MarketSnapshot& snapshot);

    OrderRouter* router_;
    RiskLimiter* limiter_;
    const SizingPolicy* sizing_;
    HedgeExecutor* hedger_;
    EventPusher* events_;
    ArbitrageConfig config_;
    ArbitrageState state_;
};

} // namespace etfarb
