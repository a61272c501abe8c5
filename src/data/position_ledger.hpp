#pragma once

#include "../core/types.hpp"
#include "../exchange/exchange_interface.hpp"

namespace etfarb {

struct LedgerReading {
    PositionMap positions; // every instrument present, zero when untracked
    bool ok = false;
};

// Positions are read from the venue on every call and never cached.
class PositionLedger {
public:
    explicit PositionLedger(ExchangeInterface* exchange);

    LedgerReading read();

private:
    ExchangeInterface* exchange_;
};

} // namespace etfarb
