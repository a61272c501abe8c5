#pragma once

#include <vector>
#include "market_snapshot.hpp"
#include "../exchange/exchange_interface.hpp"

namespace etfarb {

// Read side of the venue. Never throws: transport or payload failures read
// as missing data (sentinel quotes, empty books, a STOPPED case).
class MarketDataGateway {
public:
    explicit MarketDataGateway(ExchangeInterface* exchange);

    Quote quote(Instrument instrument);
    OrderBook book(Instrument instrument);
    TickStatus tick_status();
    std::vector<TenderOffer> open_tenders();

    // Status plus the book and top of book of every instrument.
    MarketSnapshot capture();

    long long get_failed_reads() const { return failed_reads_; }

private:
    ExchangeInterface* exchange_;
    long long failed_reads_;
};

} // namespace etfarb
