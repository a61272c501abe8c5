#include "unwind_controller.hpp"
#include <algorithm>
#include <cstdlib>
#include "../utils/logger.hpp"

namespace etfarb {

std::string to_string(UnwindState state) {
    return state == UnwindState::NORMAL ? "NORMAL" : "UNWINDING";
}

UnwindController::UnwindController(OrderRouter* router, EventPusher* events,
                                   const UnwindConfig& config, const LimitsConfig& limits)
    : router_(router)
    , events_(events)
    , config_(config)
    , limits_(limits)
    , state_(UnwindState::NORMAL) {}

double UnwindController::trigger_line() const {
    return config_.trigger * static_cast<double>(limits_.gross_ceiling);
}

UnwindState UnwindController::update(long long gross) {
    double line = trigger_line();
    double level = static_cast<double>(gross);

    if (state_ == UnwindState::NORMAL && level > line) {
        state_ = UnwindState::UNWINDING;
        utils::TradingLogger::log_unwind_transition(true, gross, line);
        if (events_) {
            events_->push_event(UnwindEngagedEvent{gross, line});
        }
    } else if (state_ == UnwindState::UNWINDING && level < line) {
        state_ = UnwindState::NORMAL;
        utils::TradingLogger::log_unwind_transition(false, gross, line);
        if (events_) {
            events_->push_event(UnwindReleasedEvent{gross, line});
        }
    }
    return state_;
}

std::vector<OrderIntent> UnwindController::plan(const MarketSnapshot& snapshot) const {
    std::vector<OrderIntent> orders;
    bool aggressive = std::llabs(snapshot.position(Instrument::RITC)) > config_.aggressive_threshold;

    // Composite first so the package unwinds before standalone basket trims.
    const Instrument order_of_play[] = {Instrument::RITC, Instrument::BULL, Instrument::BEAR};
    for (Instrument instrument : order_of_play) {
        long long position = snapshot.position(instrument);
        if (std::llabs(position) < config_.min_position) {
            continue;
        }

        OrderIntent order;
        order.instrument = instrument;
        order.side = position > 0 ? OrderSide::SELL : OrderSide::BUY;
        order.quantity = std::min(config_.chunk_size, std::llabs(position));

        if (aggressive) {
            order.type = OrderType::MARKET;
        } else {
            Quote quote = snapshot.quote(instrument);
            if (!quote.is_two_sided()) {
                continue;
            }
            order.type = OrderType::LIMIT;
            if (order.side == OrderSide::SELL) {
                double price = quote.ask - config_.passive_offset;
                order.price = price > quote.bid ? price : quote.ask;
            } else {
                double price = quote.bid + config_.passive_offset;
                order.price = price < quote.ask ? price : quote.bid;
            }
        }
        orders.push_back(order);
    }
    return orders;
}

int UnwindController::submit_plan(const std::vector<OrderIntent>& orders, PositionMap* projected) {
    int accepted = 0;
    for (const auto& order : orders) {
        if (!router_->submit(order)) {
            continue;
        }
        ++accepted;
        if (projected) {
            *projected = apply_legs(*projected, {Leg{order.instrument, order.side, order.quantity}});
        }
    }
    return accepted;
}

int UnwindController::step(const MarketSnapshot& snapshot) {
    if (!is_unwinding() || !snapshot.positions_ok) {
        return 0;
    }
    auto orders = plan(snapshot);
    if (orders.empty()) {
        return 0;
    }
    ETFARB_LOG_INFO("Unwind step: {} orders, RITC {} BULL {} BEAR {}", orders.size(),
                    snapshot.position(Instrument::RITC), snapshot.position(Instrument::BULL),
                    snapshot.position(Instrument::BEAR));
    // Replace rather than stack: last cycle's resting orders could otherwise
    // fill together with this cycle's and carry the leg through zero.
    for (const auto& order : orders) {
        router_->cancel_resting(order.instrument);
    }
    return submit_plan(orders, nullptr);
}

std::vector<Leg> UnwindController::liquidation_legs(const PositionMap& positions) {
    std::vector<Leg> legs;
    for (Instrument instrument : {Instrument::RITC, Instrument::BULL, Instrument::BEAR}) {
        long long position = position_of(positions, instrument);
        if (position == 0) {
            continue;
        }
        legs.push_back(Leg{instrument, position > 0 ? OrderSide::SELL : OrderSide::BUY, std::llabs(position)});
    }
    return legs;
}

PositionMap UnwindController::flatten(const MarketSnapshot& snapshot) {
    PositionMap projected = snapshot.positions;
    if (!snapshot.positions_ok) {
        return projected;
    }

    int sent = 0;
    int accepted = 0;
    for (const auto& leg : liquidation_legs(snapshot.positions)) {
        OrderIntent order;
        order.instrument = leg.instrument;
        order.side = leg.side;
        order.quantity = leg.quantity;
        order.type = OrderType::MARKET;

        RouteResult result = router_->submit_chunked(order);
        sent += result.orders_sent;
        accepted += result.orders_accepted;
        if (result.quantity_accepted > 0) {
            projected = apply_legs(projected, {Leg{leg.instrument, leg.side, result.quantity_accepted}});
        }
    }
    ETFARB_LOG_INFO("Flatten for headroom: {}/{} orders accepted, projected gross {}",
                    accepted, sent, compute_exposure(projected).gross);
    return projected;
}

} // namespace etfarb
