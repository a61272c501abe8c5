#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "data/market_data_gateway.hpp"
#include "data/position_ledger.hpp"
#include "exchange/exchange_exception.hpp"
#include "network/network_exception.hpp"
#include "mocks/mock_exchange.hpp"

using namespace etfarb;
using etfarb::testing::MockExchange;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

namespace {

OrderBook two_sided(Instrument instrument, double bid, double ask) {
    OrderBook book;
    book.instrument = instrument;
    book.bids = {BookLevel{bid, 500}};
    book.asks = {BookLevel{ask, 500}};
    return book;
}

} // namespace

TEST(MarketDataGatewayTest, FailedBookReadsAsSentinelQuote) {
    MockExchange exchange;
    MarketDataGateway gateway(&exchange);
    EXPECT_CALL(exchange, get_book(Instrument::BULL)).WillOnce(Throw(TimeoutException("book")));

    Quote quote = gateway.quote(Instrument::BULL);
    EXPECT_EQ(quote.bid, kNoBid);
    EXPECT_EQ(quote.ask, kNoAsk);
    EXPECT_EQ(gateway.get_failed_reads(), 1);
}

TEST(MarketDataGatewayTest, MalformedPayloadReadsAsEmptyBook) {
    MockExchange exchange;
    MarketDataGateway gateway(&exchange);
    EXPECT_CALL(exchange, get_book(Instrument::RITC)).WillOnce(Throw(MalformedResponseException("bids")));

    OrderBook book = gateway.book(Instrument::RITC);
    EXPECT_EQ(book.instrument, Instrument::RITC);
    EXPECT_TRUE(book.bids.empty());
    EXPECT_TRUE(book.asks.empty());
}

TEST(MarketDataGatewayTest, StatusFailureReadsAsStopped) {
    MockExchange exchange;
    MarketDataGateway gateway(&exchange);
    EXPECT_CALL(exchange, get_status()).WillOnce(Throw(ConnectionException("refused")));
    EXPECT_CALL(exchange, get_book(_)).Times(0);

    MarketSnapshot snapshot = gateway.capture();
    EXPECT_EQ(snapshot.status.status, CaseStatus::STOPPED);
    EXPECT_TRUE(snapshot.quotes.empty());
}

TEST(MarketDataGatewayTest, ActiveCaptureReadsEveryInstrument) {
    MockExchange exchange;
    MarketDataGateway gateway(&exchange);
    EXPECT_CALL(exchange, get_status()).WillOnce(Return(TickStatus{42, CaseStatus::ACTIVE}));
    EXPECT_CALL(exchange, get_book(Instrument::BULL)).WillOnce(Return(two_sided(Instrument::BULL, 10.00, 10.02)));
    EXPECT_CALL(exchange, get_book(Instrument::BEAR)).WillOnce(Return(two_sided(Instrument::BEAR, 9.50, 9.52)));
    EXPECT_CALL(exchange, get_book(Instrument::RITC)).WillOnce(Throw(TimeoutException("RITC")));
    EXPECT_CALL(exchange, get_book(Instrument::USD)).WillOnce(Return(two_sided(Instrument::USD, 1.349, 1.351)));

    MarketSnapshot snapshot = gateway.capture();
    EXPECT_EQ(snapshot.status.tick, 42);
    EXPECT_DOUBLE_EQ(snapshot.quote(Instrument::BULL).bid, 10.00);
    EXPECT_DOUBLE_EQ(snapshot.quote(Instrument::USD).ask, 1.351);
    EXPECT_FALSE(snapshot.quote(Instrument::RITC).has_bid());
    EXPECT_FALSE(snapshot.quote(Instrument::RITC).has_ask());
    EXPECT_FALSE(snapshot.positions_ok);
}

TEST(MarketDataGatewayTest, TenderFailureReadsAsNoOffers) {
    MockExchange exchange;
    MarketDataGateway gateway(&exchange);
    EXPECT_CALL(exchange, get_open_tenders()).WillOnce(Throw(HttpStatusException(500, "/tenders")));
    EXPECT_TRUE(gateway.open_tenders().empty());
}

TEST(PositionLedgerTest, FillsUntrackedInstrumentsWithZero) {
    MockExchange exchange;
    PositionLedger ledger(&exchange);
    PositionMap venue;
    venue.shares[Instrument::RITC] = 1200;
    venue.cash["CAD"] = 1000000.0;
    EXPECT_CALL(exchange, get_positions()).WillOnce(Return(venue));

    LedgerReading reading = ledger.read();
    EXPECT_TRUE(reading.ok);
    EXPECT_EQ(reading.positions.shares.size(), kAllInstruments.size());
    EXPECT_EQ(position_of(reading.positions, Instrument::RITC), 1200);
    EXPECT_EQ(position_of(reading.positions, Instrument::BULL), 0);
    EXPECT_DOUBLE_EQ(reading.positions.cash.at("CAD"), 1000000.0);
}

TEST(PositionLedgerTest, FailedReadIsFlaggedNotThrown) {
    MockExchange exchange;
    PositionLedger ledger(&exchange);
    EXPECT_CALL(exchange, get_positions()).WillOnce(Throw(TimeoutException("securities")));

    LedgerReading reading = ledger.read();
    EXPECT_FALSE(reading.ok);
    EXPECT_EQ(compute_exposure(reading.positions).gross, 0);
}
