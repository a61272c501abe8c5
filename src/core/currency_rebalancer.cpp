#include "currency_rebalancer.hpp"
#include <cmath>
#include "../utils/logger.hpp"

namespace etfarb {

CurrencyRebalancer::CurrencyRebalancer(OrderRouter* router, EventPusher* events,
                                       const CurrencyConfig& config)
    : router_(router), events_(events), config_(config) {}

RebalanceResult CurrencyRebalancer::rebalance(const MarketSnapshot& snapshot) {
    RebalanceResult result;
    if (!config_.enabled || !snapshot.positions_ok) {
        return result;
    }

    auto composite_mid = snapshot.quote(Instrument::RITC).mid();
    if (!composite_mid) {
        ETFARB_LOG_DEBUG("Currency rebalance skipped: no composite mid");
        return result;
    }

    result.target = -(static_cast<double>(snapshot.position(Instrument::RITC)) * *composite_mid);
    result.actual = static_cast<double>(snapshot.position(Instrument::USD));
    result.drift = result.target - result.actual;
    if (std::fabs(result.drift) <= config_.drift_tolerance) {
        return result;
    }

    result.attempted = true;
    result.side = result.drift > 0 ? OrderSide::BUY : OrderSide::SELL;
    result.quantity = std::llround(std::fabs(result.drift));

    OrderIntent order;
    order.instrument = Instrument::USD;
    order.side = result.side;
    order.quantity = result.quantity;
    order.type = OrderType::MARKET;
    result.ok = router_->submit_chunked(order).all_accepted();

    utils::TradingLogger::log_currency_rebalance(result.target, result.actual, result.drift,
                                                 to_string(result.side));
    if (events_) {
        events_->push_event(CurrencyRebalancedEvent{result.target, result.actual, result.drift,
                                                    result.side, result.quantity, result.ok});
    }
    return result;
}

} // namespace etfarb
