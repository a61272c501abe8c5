#include "basket_hedge_guard.hpp"
#include <algorithm>
#include <cstdlib>
#include "../utils/logger.hpp"

namespace etfarb {

BasketHedgeGuard::BasketHedgeGuard(HedgeExecutor* hedger, RiskLimiter* limiter,
                                   const GuardConfig& config, long long max_order_size)
    : hedger_(hedger), limiter_(limiter), config_(config), max_order_size_(max_order_size) {}

int BasketHedgeGuard::check(const MarketSnapshot& snapshot) {
    if (!config_.enabled || !snapshot.positions_ok) {
        return 0;
    }

    long long target = -snapshot.position(Instrument::RITC);
    PositionMap positions = snapshot.positions;
    int hedges = 0;

    for (Instrument component : {Instrument::BULL, Instrument::BEAR}) {
        long long gap = target - position_of(positions, component);
        if (std::llabs(gap) <= config_.component_threshold) {
            continue;
        }
        OrderSide side = gap > 0 ? OrderSide::BUY : OrderSide::SELL;
        long long quantity = std::min(std::llabs(gap), max_order_size_);

        if (!limiter_->allows(positions, component, side, quantity)) {
            ETFARB_LOG_DEBUG("Basket guard: {} {} {} denied by limits",
                             to_string(side), quantity, to_string(component));
            continue;
        }
        ETFARB_LOG_WARN("Basket guard: {} off target by {}, hedging {} {}",
                        to_string(component), gap, to_string(side), quantity);
        ++hedges;
        if (hedger_->hedge(component, side, quantity)) {
            positions = apply_legs(positions, {Leg{component, side, quantity}});
        }
    }
    return hedges;
}

} // namespace etfarb
