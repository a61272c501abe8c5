#include "hedge_executor.hpp"
#include <algorithm>
#include <cmath>
#include "../utils/logger.hpp"

namespace etfarb {

std::chrono::milliseconds RetryPolicy::backoff_after(int attempt) const {
    double scaled = static_cast<double>(initial_backoff.count()) *
                    std::pow(multiplier, std::max(0, attempt - 1));
    double capped = std::min(scaled, static_cast<double>(max_backoff.count()));
    return std::chrono::milliseconds(static_cast<long long>(capped));
}

RetryPolicy RetryPolicy::from_config(const HedgeConfig& config) {
    RetryPolicy policy;
    policy.max_attempts = config.max_attempts;
    policy.initial_backoff = std::chrono::milliseconds(config.initial_backoff_ms);
    policy.multiplier = config.backoff_multiplier;
    policy.max_backoff = std::chrono::milliseconds(config.max_backoff_ms);
    return policy;
}

HedgeExecutor::HedgeExecutor(OrderRouter* router, Clock* clock, EventPusher* events,
                             const HedgeConfig& config)
    : router_(router)
    , clock_(clock)
    , events_(events)
    , policy_(RetryPolicy::from_config(config))
    , passive_(config.passive)
    , exhausted_count_(0)
    , last_attempts_(0) {}

bool HedgeExecutor::hedge(Instrument instrument, OrderSide side, long long quantity) {
    if (quantity <= 0) {
        return true;
    }
    bool all_ok = true;
    for (long long chunk : OrderRouter::split(quantity, router_->max_order_size(instrument))) {
        if (!hedge_chunk(instrument, side, chunk)) {
            all_ok = false;
        }
    }
    return all_ok;
}

bool HedgeExecutor::hedge_passive(Instrument instrument, OrderSide side, long long quantity,
                                  const Quote& quote) {
    if (!passive_ || !quote.is_two_sided()) {
        return hedge(instrument, side, quantity);
    }
    if (quantity <= 0) {
        return true;
    }

    bool all_ok = true;
    double touch = side == OrderSide::BUY ? quote.ask : quote.bid;
    for (long long chunk : OrderRouter::split(quantity, router_->max_order_size(instrument))) {
        OrderIntent order;
        order.instrument = instrument;
        order.side = side;
        order.quantity = chunk;
        order.type = OrderType::LIMIT;
        order.price = touch;
        if (router_->submit(order)) {
            continue;
        }
        ETFARB_LOG_WARN("Passive hedge placement failed for {} {} {}, falling back to market",
                        to_string(side), chunk, to_string(instrument));
        if (!hedge_chunk(instrument, side, chunk)) {
            all_ok = false;
        }
    }
    return all_ok;
}

bool HedgeExecutor::hedge_chunk(Instrument instrument, OrderSide side, long long quantity) {
    OrderIntent order;
    order.instrument = instrument;
    order.side = side;
    order.quantity = quantity;
    order.type = OrderType::MARKET;

    for (int attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
        last_attempts_ = attempt;
        if (router_->submit(order)) {
            if (attempt > 1) {
                ETFARB_LOG_INFO("Hedge {} {} {} filled on attempt {}",
                                to_string(side), quantity, to_string(instrument), attempt);
            }
            return true;
        }
        if (attempt < policy_.max_attempts) {
            auto wait = policy_.backoff_after(attempt);
            ETFARB_LOG_WARN("Hedge {} {} {} failed, retry {}/{} in {} ms",
                            to_string(side), quantity, to_string(instrument),
                            attempt, policy_.max_attempts, wait.count());
            clock_->sleep_for(wait);
        }
    }

    ++exhausted_count_;
    utils::TradingLogger::log_hedge_exhausted(to_string(instrument), to_string(side),
                                              quantity, policy_.max_attempts);
    if (events_) {
        events_->push_event(HedgeExhaustedEvent{instrument, side, quantity, policy_.max_attempts});
    }
    return false;
}

} // namespace etfarb
