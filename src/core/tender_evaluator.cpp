#include "tender_evaluator.hpp"
#include <algorithm>
#include <cmath>
#include "../utils/logger.hpp"

namespace etfarb {

TenderEvaluator::TenderEvaluator(ExchangeInterface* exchange, RiskLimiter* limiter,
                                 HedgeExecutor* hedger, UnwindController* unwind,
                                 EventPusher* events, const TenderConfig& config)
    : exchange_(exchange)
    , limiter_(limiter)
    , hedger_(hedger)
    , unwind_(unwind)
    , events_(events)
    , config_(config) {}

std::optional<double> TenderEvaluator::walk_book(const std::vector<BookLevel>& levels, long long quantity) {
    if (quantity <= 0) {
        return std::nullopt;
    }
    long long remaining = quantity;
    double cost = 0.0;
    for (const auto& level : levels) {
        long long take = std::min(remaining, level.quantity);
        if (take <= 0) {
            continue;
        }
        cost += static_cast<double>(take) * level.price;
        remaining -= take;
        if (remaining == 0) {
            return cost / static_cast<double>(quantity);
        }
    }
    return std::nullopt;
}

std::vector<Leg> TenderEvaluator::package_for(const TenderOffer& offer) {
    OrderSide basket_side = opposite(offer.side);
    return {
        Leg{Instrument::RITC, offer.side, offer.quantity},
        Leg{Instrument::BULL, basket_side, offer.quantity},
        Leg{Instrument::BEAR, basket_side, offer.quantity}
    };
}

std::optional<double> TenderEvaluator::expected_profit(const TenderOffer& offer,
                                                       const MarketSnapshot& snapshot) const {
    Quote currency = snapshot.quote(Instrument::USD);
    bool buying = offer.side == OrderSide::BUY;

    double synthetic = 0.0;
    if (config_.depth_weighted) {
        // Buying the composite means selling the basket into its bids.
        for (Instrument component : {Instrument::BULL, Instrument::BEAR}) {
            OrderBook ladder = snapshot.book(component);
            auto average = walk_book(buying ? ladder.bids : ladder.asks, offer.quantity);
            if (!average) {
                return std::nullopt;
            }
            synthetic += *average;
        }
    } else {
        Quote bull = snapshot.quote(Instrument::BULL);
        Quote bear = snapshot.quote(Instrument::BEAR);
        synthetic = buying ? bull.bid + bear.bid : bull.ask + bear.ask;
    }

    if (buying) {
        return synthetic - offer.price * currency.ask;
    }
    return offer.price * currency.bid - synthetic;
}

std::vector<TenderDecision> TenderEvaluator::process(const MarketSnapshot& snapshot,
                                                     const std::vector<TenderOffer>& offers) {
    std::vector<TenderDecision> decisions;
    if (offers.empty()) {
        return decisions;
    }
    MarketSnapshot working = snapshot;
    for (const auto& offer : offers) {
        decisions.push_back(evaluate(offer, working));
    }
    return decisions;
}

TenderDecision TenderEvaluator::evaluate(const TenderOffer& offer, MarketSnapshot& working) {
    TenderDecision decision;
    decision.tender_id = offer.id;

    if (unwind_ && unwind_->is_unwinding()) {
        decision.reason = "unwinding";
        return decision;
    }
    if (offer.quantity <= 0) {
        decision.reason = "empty offer";
        return decision;
    }

    decision.profit = expected_profit(offer, working);
    if (!decision.profit) {
        decision.reason = "insufficient depth";
        return decision;
    }
    decision.profitable = *decision.profit > config_.margin;
    if (!decision.profitable) {
        decision.reason = "below margin";
        return decision;
    }
    if (!working.positions_ok) {
        decision.reason = "positions unavailable";
        return decision;
    }

    std::vector<Leg> package = package_for(offer);
    RiskAssessment assessment = limiter_->evaluate(working.positions, package, &working);

    if (!assessment.is_approved && config_.allow_liquidation && unwind_ &&
        *decision.profit > config_.liquidation_margin) {
        // Nothing is sold unless the tender fits once the book is flat.
        PositionMap flat = apply_legs(working.positions, UnwindController::liquidation_legs(working.positions));
        RiskAssessment after_flatten = limiter_->evaluate(flat, package, &working);
        if (after_flatten.is_approved) {
            ETFARB_LOG_INFO("Tender {} blocked by limits with profit {:.4f}; flattening for headroom",
                            offer.id, *decision.profit);
            working.positions = unwind_->flatten(working);
            decision.liquidated = true;
            assessment = limiter_->evaluate(working.positions, package, &working);
        }
    }

    if (!assessment.is_approved) {
        utils::TradingLogger::log_risk_deny("tender " + std::to_string(offer.id),
                                            assessment.projected.gross, assessment.projected.net);
        decision.reason = "risk limits";
        return decision;
    }
    decision.risk_approved = true;

    try {
        decision.accepted = exchange_->accept_tender(offer.id);
    } catch (const std::exception& e) {
        ETFARB_LOG_WARN("Tender {} acceptance failed: {}", offer.id, e.what());
        decision.accepted = false;
    }
    if (!decision.accepted) {
        decision.reason = "venue refused";
        return decision;
    }

    utils::TradingLogger::log_tender_accepted(offer.id, to_string(offer.side), offer.price,
                                              offer.quantity, *decision.profit);

    // From here on the hedge is owed regardless of limits.
    decision.hedged = hedge_tender(offer, working);
    working.positions = apply_legs(working.positions, package);

    if (events_) {
        events_->push_event(TenderAcceptedEvent{offer, *decision.profit, decision.liquidated, decision.hedged});
    }
    decision.reason = decision.hedged ? "accepted" : "accepted, hedge incomplete";
    return decision;
}

bool TenderEvaluator::hedge_tender(const TenderOffer& offer, const MarketSnapshot& snapshot) {
    OrderSide basket_side = opposite(offer.side);
    bool ok = true;
    for (Instrument component : {Instrument::BULL, Instrument::BEAR}) {
        if (!hedger_->hedge_passive(component, basket_side, offer.quantity, snapshot.quote(component))) {
            ok = false;
        }
    }
    if (config_.hedge_currency) {
        // Same direction as the arbitrage currency hedge: sell the currency
        // against composite inventory bought, buy it back against a sale.
        OrderSide currency_side = offer.side == OrderSide::BUY ? OrderSide::SELL : OrderSide::BUY;
        long long notional = std::llround(static_cast<double>(offer.quantity) * offer.price);
        if (!hedger_->hedge_passive(Instrument::USD, currency_side, notional,
                                    snapshot.quote(Instrument::USD))) {
            ok = false;
        }
    }
    return ok;
}

} // namespace etfarb
