#pragma once

#include <array>
#include <limits>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace etfarb {

enum class Instrument {
    BULL,
    BEAR,
    RITC,
    USD
};

// Iteration order for ledgers and snapshots.
constexpr std::array<Instrument, 4> kAllInstruments = {
    Instrument::BULL, Instrument::BEAR, Instrument::RITC, Instrument::USD
};

constexpr std::array<Instrument, 3> kShareInstruments = {
    Instrument::BULL, Instrument::BEAR, Instrument::RITC
};

enum class OrderSide {
    BUY,
    SELL
};

enum class OrderType {
    MARKET,
    LIMIT
};

enum class CaseStatus {
    ACTIVE,
    PAUSED,
    STOPPED
};

// Sentinels for a missing side of the book. A bid of zero and an infinite
// ask make every edge computed against them unprofitable.
constexpr double kNoBid = 0.0;
constexpr double kNoAsk = std::numeric_limits<double>::infinity();

struct Quote {
    double bid = kNoBid;
    double ask = kNoAsk;

    bool has_bid() const { return bid > 0.0; }
    bool has_ask() const { return ask < kNoAsk; }
    bool is_two_sided() const { return has_bid() && has_ask(); }

    // Midpoint, or nullopt when either side is missing.
    std::optional<double> mid() const {
        if (!is_two_sided()) {
            return std::nullopt;
        }
        return (bid + ask) / 2.0;
    }

    double spread() const { return is_two_sided() ? ask - bid : 0.0; }
};

struct BookLevel {
    double price = 0.0;
    long long quantity = 0;
};

struct OrderBook {
    Instrument instrument = Instrument::BULL;
    std::vector<BookLevel> bids; // best first
    std::vector<BookLevel> asks; // best first

    Quote top() const {
        Quote quote;
        if (!bids.empty()) quote.bid = bids.front().price;
        if (!asks.empty()) quote.ask = asks.front().price;
        return quote;
    }
};

struct TickStatus {
    int tick = 0;
    CaseStatus status = CaseStatus::STOPPED;
};

// Signed share counts per instrument plus venue cash balances.
struct PositionMap {
    std::unordered_map<Instrument, long long> shares;
    std::unordered_map<std::string, double> cash;
};

struct ExposureSnapshot {
    long long gross = 0;
    long long net = 0;
};

struct TenderOffer {
    long long id = 0;
    OrderSide side = OrderSide::BUY; // action we take on the composite if accepted
    double price = 0.0;
    long long quantity = 0;
};

struct OrderIntent {
    Instrument instrument = Instrument::BULL;
    OrderSide side = OrderSide::BUY;
    long long quantity = 0;
    OrderType type = OrderType::MARKET;
    std::optional<double> price;
};

// One leg of a multi-leg projection for the risk limiter.
struct Leg {
    Instrument instrument;
    OrderSide side;
    long long quantity;
};

enum class ArbitrageDirection {
    NONE,
    COMPOSITE_CHEAP, // buy composite, sell basket
    COMPOSITE_RICH   // sell composite, buy basket
};

inline int risk_multiplier(Instrument instrument) {
    return instrument == Instrument::RITC ? 2 : 1;
}

inline bool is_currency(Instrument instrument) {
    return instrument == Instrument::USD;
}

inline OrderSide opposite(OrderSide side) {
    return side == OrderSide::BUY ? OrderSide::SELL : OrderSide::BUY;
}

inline long long signed_quantity(OrderSide side, long long quantity) {
    return side == OrderSide::BUY ? quantity : -quantity;
}

// Zero for instruments the map does not carry.
long long position_of(const PositionMap& positions, Instrument instrument);

// Multiplier-weighted gross and net over the share instruments.
ExposureSnapshot compute_exposure(const PositionMap& positions);

// Applies each leg as if fully filled.
PositionMap apply_legs(const PositionMap& positions, const std::vector<Leg>& legs);

std::string to_string(Instrument instrument);
std::string to_string(OrderSide side);
std::string to_string(OrderType type);
std::string to_string(CaseStatus status);
std::string to_string(ArbitrageDirection direction);

std::optional<Instrument> instrument_from_string(const std::string& ticker);
std::optional<OrderSide> side_from_string(const std::string& action);
CaseStatus status_from_string(const std::string& status);

} // namespace etfarb
