#pragma once

#include <vector>
#include "types.hpp"
#include "../exchange/exchange_interface.hpp"
#include "../utils/config_types.hpp"

namespace etfarb {

struct RouteResult {
    int orders_sent = 0;
    int orders_accepted = 0;
    long long quantity_accepted = 0;

    bool all_accepted() const { return orders_sent > 0 && orders_sent == orders_accepted; }
};

// Single write path to the venue. Converts transport failures into a
// rejected submission and splits totals above the per-order ceiling.
class OrderRouter {
public:
    OrderRouter(ExchangeInterface* exchange, const SizingConfig& sizing);

    // One order, quantity must not exceed max_order_size(). False on venue
    // rejection, transport failure or a non-positive quantity.
    bool submit(const OrderIntent& order);

    // Sequential orders of at most max_order_size() each; a failed chunk
    // does not stop the rest.
    RouteResult submit_chunked(const OrderIntent& order);

    // Pulls resting orders on the instrument. False on refusal or transport failure.
    bool cancel_resting(Instrument instrument);

    long long max_order_size(Instrument instrument) const;

    static std::vector<long long> split(long long total, long long ceiling);

    long long get_orders_sent() const { return orders_sent_; }
    long long get_orders_rejected() const { return orders_rejected_; }

private:
    ExchangeInterface* exchange_;
    SizingConfig sizing_;
    long long orders_sent_;
    long long orders_rejected_;
};

} // namespace etfarb
