#pragma once

#include "types.hpp"
#include "../data/market_snapshot.hpp"

namespace etfarb {

// Both arbitrage edges for one set of quotes, in the basket currency.
struct EdgeSet {
    double synthetic_sell = 0.0;     // bid(BULL) + bid(BEAR)
    double synthetic_buy = 0.0;      // ask(BULL) + ask(BEAR)
    double composite_ask_base = 0.0; // ask(RITC) * ask(USD)
    double composite_bid_base = 0.0; // bid(RITC) * bid(USD)
    double composite_cheap = 0.0;    // buy composite, sell basket
    double composite_rich = 0.0;     // sell composite, buy basket

    // Direction whose edge exceeds the threshold. The cheap side is
    // preferred when both qualify so one cycle never trades against itself.
    ArbitrageDirection select(double threshold) const;

    double edge(ArbitrageDirection direction) const;
};

class EdgeCalculator {
public:
    static EdgeSet compute(const Quote& component_a, const Quote& component_b,
                           const Quote& composite, const Quote& currency);

    static EdgeSet compute(const MarketSnapshot& snapshot);
};

} // namespace etfarb
