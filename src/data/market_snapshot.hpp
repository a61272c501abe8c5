#pragma once

#include <unordered_map>
#include "../core/types.hpp"

namespace etfarb {

// Everything one loop iteration knows about the venue. Built fresh each
// iteration and passed by reference; nothing in it outlives the iteration.
struct MarketSnapshot {
    TickStatus status;
    std::unordered_map<Instrument, OrderBook> books;
    std::unordered_map<Instrument, Quote> quotes;
    PositionMap positions;
    bool positions_ok = false;

    Quote quote(Instrument instrument) const {
        auto it = quotes.find(instrument);
        return it == quotes.end() ? Quote{} : it->second;
    }

    // Empty ladder when the instrument was not captured.
    OrderBook book(Instrument instrument) const {
        auto it = books.find(instrument);
        if (it == books.end()) {
            OrderBook empty;
            empty.instrument = instrument;
            return empty;
        }
        return it->second;
    }

    long long position(Instrument instrument) const {
        return position_of(positions, instrument);
    }

    ExposureSnapshot exposure() const {
        return compute_exposure(positions);
    }
};

} // namespace etfarb
