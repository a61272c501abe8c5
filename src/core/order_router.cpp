#include "order_router.hpp"
#include "../utils/logger.hpp"

namespace etfarb {

OrderRouter::OrderRouter(ExchangeInterface* exchange, const SizingConfig& sizing)
    : exchange_(exchange), sizing_(sizing), orders_sent_(0), orders_rejected_(0) {}

long long OrderRouter::max_order_size(Instrument instrument) const {
    return is_currency(instrument) ? sizing_.max_currency_order_size : sizing_.max_order_size;
}

std::vector<long long> OrderRouter::split(long long total, long long ceiling) {
    std::vector<long long> chunks;
    if (total <= 0 || ceiling <= 0) {
        return chunks;
    }
    while (total > 0) {
        long long chunk = total < ceiling ? total : ceiling;
        chunks.push_back(chunk);
        total -= chunk;
    }
    return chunks;
}

bool OrderRouter::submit(const OrderIntent& order) {
    const std::string instrument = to_string(order.instrument);
    const std::string side = to_string(order.side);

    if (order.quantity <= 0) {
        ETFARB_LOG_DEBUG("Dropping {} {} order with quantity {}", side, instrument, order.quantity);
        return false;
    }
    if (order.quantity > max_order_size(order.instrument)) {
        utils::TradingLogger::log_order_rejected(instrument, side, order.quantity, "above per-order ceiling");
        ++orders_rejected_;
        return false;
    }
    if (order.type == OrderType::LIMIT && !order.price) {
        utils::TradingLogger::log_order_rejected(instrument, side, order.quantity, "limit order without price");
        ++orders_rejected_;
        return false;
    }

    ++orders_sent_;
    bool accepted = false;
    try {
        accepted = exchange_->submit_order(order);
    } catch (const std::exception& e) {
        ++orders_rejected_;
        utils::TradingLogger::log_order_rejected(instrument, side, order.quantity, e.what());
        return false;
    }

    if (!accepted) {
        ++orders_rejected_;
        utils::TradingLogger::log_order_rejected(instrument, side, order.quantity, "venue declined");
        return false;
    }

    utils::TradingLogger::log_order_submitted(instrument, side, to_string(order.type),
                                              order.quantity, order.price.value_or(0.0));
    return true;
}

RouteResult OrderRouter::submit_chunked(const OrderIntent& order) {
    RouteResult result;
    for (long long chunk : split(order.quantity, max_order_size(order.instrument))) {
        OrderIntent piece = order;
        piece.quantity = chunk;
        ++result.orders_sent;
        if (submit(piece)) {
            ++result.orders_accepted;
            result.quantity_accepted += chunk;
        }
    }
    return result;
}

bool OrderRouter::cancel_resting(Instrument instrument) {
    try {
        return exchange_->cancel_open_orders(instrument);
    } catch (const std::exception& e) {
        ETFARB_LOG_WARN("Cancel on {} failed: {}", to_string(instrument), e.what());
        return false;
    }
}

} // namespace etfarb
