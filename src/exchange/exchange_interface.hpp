#pragma once

#include <string>
#include <vector>
#include "../core/types.hpp"

namespace etfarb {

// Boundary to the venue. Implementations may throw NetworkException for
// transport failures and ExchangeException for malformed payloads; a false
// return from a mutating call is a venue rejection.
class ExchangeInterface {
public:
    virtual ~ExchangeInterface() = default;

    virtual std::string get_name() const = 0;
    virtual TickStatus get_status() = 0;
    virtual OrderBook get_book(Instrument instrument) = 0;
    virtual PositionMap get_positions() = 0;
    virtual std::vector<TenderOffer> get_open_tenders() = 0;
    virtual bool submit_order(const OrderIntent& order) = 0;
    virtual bool accept_tender(long long tender_id) = 0;
    // Pulls every resting order on one instrument.
    virtual bool cancel_open_orders(Instrument instrument) = 0;
};

} // namespace etfarb
