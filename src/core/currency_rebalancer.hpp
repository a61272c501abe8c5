#pragma once

#include "types.hpp"
#include "event_pusher.hpp"
#include "order_router.hpp"
#include "../data/market_snapshot.hpp"
#include "../utils/config_types.hpp"

namespace etfarb {

struct RebalanceResult {
    bool attempted = false;
    double target = 0.0;
    double actual = 0.0;
    double drift = 0.0;
    OrderSide side = OrderSide::BUY;
    long long quantity = 0;
    bool ok = false;
};

// Keeps the currency position at -(composite position * composite mid).
// Drift inside the tolerance band is left alone.
class CurrencyRebalancer {
public:
    CurrencyRebalancer(OrderRouter* router, EventPusher* events, const CurrencyConfig& config);

    RebalanceResult rebalance(const MarketSnapshot& snapshot);

private:
    OrderRouter* router_;
    EventPusher* events_;
    CurrencyConfig config_;
};

} // namespace etfarb
