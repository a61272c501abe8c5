#include "market_data_gateway.hpp"
#include "../utils/logger.hpp"

namespace etfarb {

MarketDataGateway::MarketDataGateway(ExchangeInterface* exchange)
    : exchange_(exchange), failed_reads_(0) {}

Quote MarketDataGateway::quote(Instrument instrument) {
    return book(instrument).top();
}

OrderBook MarketDataGateway::book(Instrument instrument) {
    try {
        return exchange_->get_book(instrument);
    } catch (const std::exception& e) {
        ++failed_reads_;
        ETFARB_LOG_WARN("Book read failed for {}: {}", to_string(instrument), e.what());
    }
    OrderBook empty;
    empty.instrument = instrument;
    return empty;
}

TickStatus MarketDataGateway::tick_status() {
    try {
        return exchange_->get_status();
    } catch (const std::exception& e) {
        ++failed_reads_;
        ETFARB_LOG_WARN("Case status read failed: {}", e.what());
    }
    return TickStatus{0, CaseStatus::STOPPED};
}

std::vector<TenderOffer> MarketDataGateway::open_tenders() {
    try {
        return exchange_->get_open_tenders();
    } catch (const std::exception& e) {
        ++failed_reads_;
        ETFARB_LOG_WARN("Tender read failed: {}", e.what());
    }
    return {};
}

MarketSnapshot MarketDataGateway::capture() {
    MarketSnapshot snapshot;
    snapshot.status = tick_status();
    if (snapshot.status.status != CaseStatus::ACTIVE) {
        return snapshot;
    }
    for (Instrument instrument : kAllInstruments) {
        OrderBook ladder = book(instrument);
        snapshot.quotes[instrument] = ladder.top();
        snapshot.books[instrument] = std::move(ladder);
    }
    return snapshot;
}

} // namespace etfarb
