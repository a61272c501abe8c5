#include "position_ledger.hpp"
#include "../utils/logger.hpp"

namespace etfarb {

PositionLedger::PositionLedger(ExchangeInterface* exchange)
    : exchange_(exchange) {}

LedgerReading PositionLedger::read() {
    LedgerReading reading;
    try {
        reading.positions = exchange_->get_positions();
        reading.ok = true;
    } catch (const std::exception& e) {
        ETFARB_LOG_WARN("Position read failed, exposure decisions suspended this cycle: {}", e.what());
        reading.positions = PositionMap{};
    }
    for (Instrument instrument : kAllInstruments) {
        reading.positions.shares.emplace(instrument, 0);
    }
    return reading;
}

} // namespace etfarb
