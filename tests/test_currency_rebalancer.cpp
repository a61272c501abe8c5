#include <gtest/gtest.h>
#include "core/currency_rebalancer.hpp"
#include "mocks/mock_event_pusher.hpp"
#include "mocks/sim_exchange.hpp"
#include "mocks/snapshot_builder.hpp"

using namespace etfarb;
using etfarb::testing::RecordingEventPusher;
using etfarb::testing::SimExchange;
using etfarb::testing::SnapshotBuilder;

class CurrencyRebalancerTest : public ::testing::Test {
protected:
    void SetUp() override {
        build();
    }

    void build() {
        router = std::make_unique<OrderRouter>(&exchange, sizing);
        rebalancer = std::make_unique<CurrencyRebalancer>(router.get(), &events, currency);
    }

    static SnapshotBuilder composite_at_twenty() {
        SnapshotBuilder builder;
        builder.quote(Instrument::RITC, 19.5, 20.5).quote(Instrument::USD, 1.349, 1.351);
        return builder;
    }

    SimExchange exchange;
    RecordingEventPusher events;
    SizingConfig sizing;
    CurrencyConfig currency;
    std::unique_ptr<OrderRouter> router;
    std::unique_ptr<CurrencyRebalancer> rebalancer;
};

TEST_F(CurrencyRebalancerTest, LongCompositeIsOffsetBySellingCurrency) {
    MarketSnapshot snapshot = composite_at_twenty().position(Instrument::RITC, 12000).build();

    RebalanceResult result = rebalancer->rebalance(snapshot);
    EXPECT_TRUE(result.attempted);
    EXPECT_TRUE(result.ok);
    EXPECT_DOUBLE_EQ(result.target, -240000.0);
    EXPECT_DOUBLE_EQ(result.drift, -240000.0);
    EXPECT_EQ(result.side, OrderSide::SELL);
    EXPECT_EQ(result.quantity, 240000);

    ASSERT_EQ(exchange.orders.size(), 1u);
    EXPECT_EQ(exchange.orders[0].instrument, Instrument::USD);
    EXPECT_EQ(exchange.orders[0].side, OrderSide::SELL);
    EXPECT_EQ(exchange.orders[0].quantity, 240000);
    EXPECT_EQ(exchange.orders[0].type, OrderType::MARKET);
    EXPECT_EQ(events.count<CurrencyRebalancedEvent>(), 1);
}

TEST_F(CurrencyRebalancerTest, CorrectionIsChunkedByCurrencyCeiling) {
    sizing.max_currency_order_size = 100000;
    build();
    MarketSnapshot snapshot = composite_at_twenty().position(Instrument::RITC, 12000).build();

    RebalanceResult result = rebalancer->rebalance(snapshot);
    EXPECT_TRUE(result.ok);
    ASSERT_EQ(exchange.orders.size(), 3u);
    EXPECT_EQ(exchange.orders[0].quantity, 100000);
    EXPECT_EQ(exchange.orders[1].quantity, 100000);
    EXPECT_EQ(exchange.orders[2].quantity, 40000);
    EXPECT_EQ(exchange.position(Instrument::USD), -240000);
}

TEST_F(CurrencyRebalancerTest, DriftInsideToleranceIsLeftAlone) {
    MarketSnapshot snapshot = composite_at_twenty()
        .position(Instrument::RITC, 12000)
        .position(Instrument::USD, -238000)
        .build();

    RebalanceResult result = rebalancer->rebalance(snapshot);
    EXPECT_FALSE(result.attempted);
    EXPECT_DOUBLE_EQ(result.drift, -2000.0);
    EXPECT_TRUE(exchange.orders.empty());
}

TEST_F(CurrencyRebalancerTest, ShortCompositeBuysCurrencyBack) {
    MarketSnapshot snapshot = composite_at_twenty().position(Instrument::RITC, -1000).build();

    RebalanceResult result = rebalancer->rebalance(snapshot);
    EXPECT_EQ(result.side, OrderSide::BUY);
    EXPECT_EQ(result.quantity, 20000);
    EXPECT_EQ(exchange.position(Instrument::USD), 20000);
}

TEST_F(CurrencyRebalancerTest, SkipsWithoutCompositeMidOrPositions) {
    MarketSnapshot no_mid = SnapshotBuilder().position(Instrument::RITC, 12000).build();
    EXPECT_FALSE(rebalancer->rebalance(no_mid).attempted);

    MarketSnapshot unknown = composite_at_twenty().position(Instrument::RITC, 12000).positions_unavailable().build();
    EXPECT_FALSE(rebalancer->rebalance(unknown).attempted);

    currency.enabled = false;
    build();
    EXPECT_FALSE(rebalancer->rebalance(composite_at_twenty().position(Instrument::RITC, 12000).build()).attempted);
    EXPECT_TRUE(exchange.orders.empty());
}

TEST_F(CurrencyRebalancerTest, RejectedCorrectionIsReported) {
    exchange.rejected_instruments.insert(Instrument::USD);
    RebalanceResult result = rebalancer->rebalance(composite_at_twenty().position(Instrument::RITC, 12000).build());
    EXPECT_TRUE(result.attempted);
    EXPECT_FALSE(result.ok);
    ASSERT_EQ(events.count<CurrencyRebalancedEvent>(), 1);
    EXPECT_FALSE(events.last<CurrencyRebalancedEvent>()->ok);
}
