#include "edge_calculator.hpp"

namespace etfarb {

ArbitrageDirection EdgeSet::select(double threshold) const {
    if (composite_cheap > threshold) {
        return ArbitrageDirection::COMPOSITE_CHEAP;
    }
    if (composite_rich > threshold) {
        return ArbitrageDirection::COMPOSITE_RICH;
    }
    return ArbitrageDirection::NONE;
}

double EdgeSet::edge(ArbitrageDirection direction) const {
    switch (direction) {
        case ArbitrageDirection::COMPOSITE_CHEAP: return composite_cheap;
        case ArbitrageDirection::COMPOSITE_RICH: return composite_rich;
        case ArbitrageDirection::NONE: break;
    }
    return 0.0;
}

EdgeSet EdgeCalculator::compute(const Quote& component_a, const Quote& component_b,
                                const Quote& composite, const Quote& currency) {
    EdgeSet edges;
    edges.synthetic_sell = component_a.bid + component_b.bid;
    edges.synthetic_buy = component_a.ask + component_b.ask;
    edges.composite_ask_base = composite.ask * currency.ask;
    edges.composite_bid_base = composite.bid * currency.bid;
    edges.composite_cheap = edges.synthetic_sell - edges.composite_ask_base;
    edges.composite_rich = edges.composite_bid_base - edges.synthetic_buy;
    return edges;
}

EdgeSet EdgeCalculator::compute(const MarketSnapshot& snapshot) {
    return compute(snapshot.quote(Instrument::BULL), snapshot.quote(Instrument::BEAR),
                   snapshot.quote(Instrument::RITC), snapshot.quote(Instrument::USD));
}

} // namespace etfarb
