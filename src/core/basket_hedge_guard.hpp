#pragma once

#include "types.hpp"
#include "hedge_executor.hpp"
#include "risk_limiter.hpp"
#include "../data/market_snapshot.hpp"
#include "../utils/config_types.hpp"

namespace etfarb {

// First check of every cycle: each basket leg should mirror the composite
// position. Gaps wider than the threshold are closed through the hedger.
class BasketHedgeGuard {
public:
    BasketHedgeGuard(HedgeExecutor* hedger, RiskLimiter* limiter,
                     const GuardConfig& config, long long max_order_size);

    // Returns the number of hedges issued.
    int check(const MarketSnapshot& snapshot);

private:
    HedgeExecutor* hedger_;
    RiskLimiter* limiter_;
    GuardConfig config_;
    long long max_order_size_;
};

} // namespace etfarb
