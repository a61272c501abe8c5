#pragma once

#include "types.hpp"
#include <string>
#include <variant>

namespace etfarb {

enum class ConverterAction {
    CREATE, // basket -> composite
    REDEEM  // composite -> basket
};

// Hedge retries ran out; the position is exposed.
struct HedgeExhaustedEvent {
    Instrument instrument;
    OrderSide side;
    long long quantity;
    int attempts;
};

struct UnwindEngagedEvent {
    long long gross;
    double trigger_line;
};

struct UnwindReleasedEvent {
    long long gross;
    double trigger_line;
};

struct TenderAcceptedEvent {
    TenderOffer offer;
    double profit_per_share;
    bool liquidated_first;
    bool hedged;
};

struct ArbitrageExecutedEvent {
    ArbitrageDirection direction;
    double edge;
    long long quantity;
    bool legs_ok;
    bool hedge_ok;
};

struct CurrencyRebalancedEvent {
    double target;
    double actual;
    double drift;
    OrderSide side;
    long long quantity;
    bool ok;
};

struct ConverterAdviceEvent {
    ConverterAction action;
    long long position;
    double composite_spread;
    double basket_spread;
    double fee_per_share;
};

using Event = std::variant<HedgeExhaustedEvent, UnwindEngagedEvent, UnwindReleasedEvent,
                           TenderAcceptedEvent, ArbitrageExecutedEvent,
                           CurrencyRebalancedEvent, ConverterAdviceEvent>;

std::string event_name(const Event& event);
std::string to_string(ConverterAction action);

} // namespace etfarb
