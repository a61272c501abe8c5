#include "types.hpp"
#include <cstdlib>

namespace etfarb {

std::string to_string(Instrument instrument) {
    switch (instrument) {
        case Instrument::BULL: return "BULL";
        case Instrument::BEAR: return "BEAR";
        case Instrument::RITC: return "RITC";
        case Instrument::USD: return "USD";
    }
    return "UNKNOWN";
}

std::string to_string(OrderSide side) {
    return side == OrderSide::BUY ? "BUY" : "SELL";
}

std::string to_string(OrderType type) {
    return type == OrderType::MARKET ? "MARKET" : "LIMIT";
}

std::string to_string(CaseStatus status) {
    switch (status) {
        case CaseStatus::ACTIVE: return "ACTIVE";
        case CaseStatus::PAUSED: return "PAUSED";
        case CaseStatus::STOPPED: return "STOPPED";
    }
    return "STOPPED";
}

std::string to_string(ArbitrageDirection direction) {
    switch (direction) {
        case ArbitrageDirection::NONE: return "NONE";
        case ArbitrageDirection::COMPOSITE_CHEAP: return "COMPOSITE_CHEAP";
        case ArbitrageDirection::COMPOSITE_RICH: return "COMPOSITE_RICH";
    }
    return "NONE";
}

std::optional<Instrument> instrument_from_string(const std::string& ticker) {
    if (ticker == "BULL") return Instrument::BULL;
    if (ticker == "BEAR") return Instrument::BEAR;
    if (ticker == "RITC") return Instrument::RITC;
    if (ticker == "USD") return Instrument::USD;
    return std::nullopt;
}

std::optional<OrderSide> side_from_string(const std::string& action) {
    if (action == "BUY") return OrderSide::BUY;
    if (action == "SELL") return OrderSide::SELL;
    return std::nullopt;
}

CaseStatus status_from_string(const std::string& status) {
    if (status == "ACTIVE") return CaseStatus::ACTIVE;
    if (status == "PAUSED") return CaseStatus::PAUSED;
    return CaseStatus::STOPPED;
}

long long position_of(const PositionMap& positions, Instrument instrument) {
    auto it = positions.shares.find(instrument);
    return it == positions.shares.end() ? 0 : it->second;
}

ExposureSnapshot compute_exposure(const PositionMap& positions) {
    ExposureSnapshot exposure;
    for (Instrument instrument : kShareInstruments) {
        long long weighted = position_of(positions, instrument) * risk_multiplier(instrument);
        exposure.gross += std::llabs(weighted);
        exposure.net += weighted;
    }
    return exposure;
}

PositionMap apply_legs(const PositionMap& positions, const std::vector<Leg>& legs) {
    PositionMap projected = positions;
    for (const auto& leg : legs) {
        projected.shares[leg.instrument] = position_of(projected, leg.instrument) +
                                           signed_quantity(leg.side, leg.quantity);
    }
    return projected;
}

} // namespace etfarb
