#include "arbitrage_executor.hpp"
#include <cmath>
#include "../utils/logger.hpp"

namespace etfarb {

std::string to_string(ArbitrageState state) {
    switch (state) {
        case ArbitrageState::IDLE: return "IDLE";
        case ArbitrageState::EVALUATE: return "EVALUATE";
        case ArbitrageState::RISK_CHECK: return "RISK_CHECK";
        case ArbitrageState::EXECUTE_LEGS: return "EXECUTE_LEGS";
        case ArbitrageState::HEDGE_CURRENCY: return "HEDGE_CURRENCY";
    }
    return "IDLE";
}

ArbitrageExecutor::ArbitrageExecutor(OrderRouter* router, RiskLimiter* limiter,
                                     const SizingPolicy* sizing, HedgeExecutor* hedger,
                                     EventPusher* events, const ArbitrageConfig& config)
    : router_(router)
    , limiter_(limiter)
    , sizing_(sizing)
    , hedger_(hedger)
    , events_(events)
    , config_(config)
    , state_(ArbitrageState::IDLE) {}

std::vector<Leg> ArbitrageExecutor::legs_for(ArbitrageDirection direction, long long quantity) {
    if (direction == ArbitrageDirection::NONE || quantity <= 0) {
        return {};
    }
    OrderSide composite_side = direction == ArbitrageDirection::COMPOSITE_CHEAP
                                   ? OrderSide::BUY : OrderSide::SELL;
    OrderSide basket_side = opposite(composite_side);
    return {
        Leg{Instrument::RITC, composite_side, quantity},
        Leg{Instrument::BULL, basket_side, quantity},
        Leg{Instrument::BEAR, basket_side, quantity}
    };
}

void ArbitrageExecutor::transition(ArbitrageResult& result, ArbitrageState next) {
    state_ = next;
    result.trace.push_back(next);
}

ArbitrageResult ArbitrageExecutor::run(const MarketSnapshot& snapshot) {
    ArbitrageResult result;
    result.trace.push_back(state_);

    transition(result, ArbitrageState::EVALUATE);
    result.edges = EdgeCalculator::compute(snapshot);
    result.direction = result.edges.select(config_.min_edge);
    if (result.direction != ArbitrageDirection::NONE) {
        result.edge = result.edges.edge(result.direction);
        result.quantity = sizing_->quantity_for(result.edge);
    }
    if (result.direction == ArbitrageDirection::NONE || result.quantity <= 0) {
        transition(result, ArbitrageState::IDLE);
        return result;
    }

    transition(result, ArbitrageState::RISK_CHECK);
    if (!snapshot.positions_ok) {
        ETFARB_LOG_DEBUG("Arbitrage skipped: positions unavailable");
        transition(result, ArbitrageState::IDLE);
        return result;
    }
    std::vector<Leg> legs = legs_for(result.direction, result.quantity);
    RiskAssessment assessment = limiter_->evaluate(snapshot.positions, legs, &snapshot);
    if (!assessment.is_approved) {
        utils::TradingLogger::log_risk_deny("arbitrage " + to_string(result.direction),
                                            assessment.projected.gross, assessment.projected.net);
        transition(result, ArbitrageState::IDLE);
        return result;
    }
    result.risk_approved = true;

    transition(result, ArbitrageState::EXECUTE_LEGS);
    result.legs_ok = execute_legs(legs);

    transition(result, ArbitrageState::HEDGE_CURRENCY);
    result.hedge_ok = hedge_currency(result, snapshot);

    utils::TradingLogger::log_arbitrage_executed(to_string(result.direction), result.edge,
                                                 result.quantity, result.legs_ok, result.hedge_ok);
    if (events_) {
        events_->push_event(ArbitrageExecutedEvent{result.direction, result.edge, result.quantity,
                                                   result.legs_ok, result.hedge_ok});
    }

    transition(result, ArbitrageState::IDLE);
    return result;
}

bool ArbitrageExecutor::execute_legs(const std::vector<Leg>& legs) {
    bool all_ok = true;
    for (const auto& leg : legs) {
        OrderIntent order;
        order.instrument = leg.instrument;
        order.side = leg.side;
        order.quantity = leg.quantity;
        order.type = OrderType::MARKET;
        if (!router_->submit_chunked(order).all_accepted()) {
            ETFARB_LOG_WARN("Arbitrage leg {} {} {} not fully placed; left to next cycle",
                            to_string(leg.side), leg.quantity, to_string(leg.instrument));
            all_ok = false;
        }
    }
    return all_ok;
}

bool ArbitrageExecutor::hedge_currency(const ArbitrageResult& result, const MarketSnapshot& snapshot) {
    // Buying the composite takes on currency-denominated inventory: sell the
    // currency against it, and buy it back when the composite is sold.
    Quote composite = snapshot.quote(Instrument::RITC);
    bool bought = result.direction == ArbitrageDirection::COMPOSITE_CHEAP;
    double price = bought ? composite.ask : composite.bid;
    OrderSide side = bought ? OrderSide::SELL : OrderSide::BUY;

    long long notional = std::llround(static_cast<double>(result.quantity) * price);
    return hedger_->hedge_passive(Instrument::USD, side, notional, snapshot.quote(Instrument::USD));
}

} // namespace etfarb
