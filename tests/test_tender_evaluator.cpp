#include <gtest/gtest.h>
#include "core/tender_evaluator.hpp"
#include "mocks/fake_clock.hpp"
#include "mocks/mock_event_pusher.hpp"
#include "mocks/sim_exchange.hpp"
#include "mocks/snapshot_builder.hpp"

using namespace etfarb;
using etfarb::testing::FakeClock;
using etfarb::testing::RecordingEventPusher;
using etfarb::testing::SimExchange;
using etfarb::testing::SnapshotBuilder;

class TenderEvaluatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        build();
    }

    void build() {
        router = std::make_unique<OrderRouter>(&exchange, config.sizing);
        limiter = std::make_unique<RiskLimiter>(config.limits);
        hedger = std::make_unique<HedgeExecutor>(router.get(), &clock, &events, config.hedge);
        unwind = std::make_unique<UnwindController>(router.get(), &events, config.unwind, config.limits);
        evaluator = std::make_unique<TenderEvaluator>(&exchange, limiter.get(), hedger.get(),
                                                      unwind.get(), &events, config.tender);
    }

    static SnapshotBuilder market() {
        SnapshotBuilder builder;
        builder.quote(Instrument::BULL, 9.78, 9.80)
               .quote(Instrument::BEAR, 9.78, 9.80)
               .quote(Instrument::RITC, 14.00, 14.05)
               .quote(Instrument::USD, 1.349, 1.351);
        return builder;
    }

    static TenderOffer offer(long long id, OrderSide side, double price, long long quantity) {
        TenderOffer tender;
        tender.id = id;
        tender.side = side;
        tender.price = price;
        tender.quantity = quantity;
        return tender;
    }

    EngineConfig config;
    SimExchange exchange;
    FakeClock clock;
    RecordingEventPusher events;
    std::unique_ptr<OrderRouter> router;
    std::unique_ptr<RiskLimiter> limiter;
    std::unique_ptr<HedgeExecutor> hedger;
    std::unique_ptr<UnwindController> unwind;
    std::unique_ptr<TenderEvaluator> evaluator;
};

TEST_F(TenderEvaluatorTest, SellingCompositeAgainstBasketAsks) {
    TenderOffer tender = offer(7, OrderSide::SELL, 19.00, 2000);
    auto profit = evaluator->expected_profit(tender, market().build());
    ASSERT_TRUE(profit.has_value());
    EXPECT_NEAR(*profit, 19.00 * 1.349 - 19.60, 1e-6);
    EXPECT_NEAR(*profit, 6.031, 1e-6);
}

TEST_F(TenderEvaluatorTest, ProfitableTenderIsAcceptedAndHedged) {
    TenderOffer tender = offer(7, OrderSide::SELL, 19.00, 2000);
    exchange.add_tender(tender);

    auto decisions = evaluator->process(market().build(), {tender});
    ASSERT_EQ(decisions.size(), 1u);
    const TenderDecision& decision = decisions[0];
    EXPECT_TRUE(decision.profitable);
    EXPECT_TRUE(decision.risk_approved);
    EXPECT_TRUE(decision.accepted);
    EXPECT_TRUE(decision.hedged);
    EXPECT_EQ(decision.reason, "accepted");

    EXPECT_EQ(exchange.accepted_tenders, (std::vector<long long>{7}));
    EXPECT_EQ(exchange.position(Instrument::RITC), -2000);
    EXPECT_EQ(exchange.position(Instrument::BULL), 2000);
    EXPECT_EQ(exchange.position(Instrument::BEAR), 2000);
    EXPECT_EQ(exchange.position(Instrument::USD), 38000);

    ASSERT_EQ(events.count<TenderAcceptedEvent>(), 1);
    EXPECT_NEAR(events.last<TenderAcceptedEvent>()->profit_per_share, 6.031, 1e-6);
}

TEST_F(TenderEvaluatorTest, MarginComparisonIsStrict) {
    TenderOffer tender = offer(8, OrderSide::SELL, 19.00, 2000);
    exchange.add_tender(tender);
    config.tender.margin = *evaluator->expected_profit(tender, market().build());
    build();

    auto decisions = evaluator->process(market().build(), {tender});
    EXPECT_FALSE(decisions[0].profitable);
    EXPECT_EQ(decisions[0].reason, "below margin");
    EXPECT_TRUE(exchange.accepted_tenders.empty());
}

TEST_F(TenderEvaluatorTest, DepthWalkAveragesAcrossLevels) {
    OrderBook bull;
    bull.instrument = Instrument::BULL;
    bull.bids = {BookLevel{10.00, 1000}, BookLevel{9.90, 1000}, BookLevel{9.50, 5000}};
    bull.asks = {BookLevel{10.02, 1000}};
    MarketSnapshot snapshot = market().book(bull).build();

    EXPECT_NEAR(*TenderEvaluator::walk_book(bull.bids, 2000), 9.95, 1e-9);
    EXPECT_NEAR(*TenderEvaluator::walk_book(bull.bids, 500), 10.00, 1e-9);

    TenderOffer tender = offer(9, OrderSide::BUY, 14.00, 2000);
    auto profit = evaluator->expected_profit(tender, snapshot);
    ASSERT_TRUE(profit.has_value());
    EXPECT_NEAR(*profit, 9.95 + 9.78 - 14.00 * 1.351, 1e-9);
}

TEST_F(TenderEvaluatorTest, ThinBookIsSkipped) {
    OrderBook bear;
    bear.instrument = Instrument::BEAR;
    bear.bids = {BookLevel{9.50, 300}};
    bear.asks = {BookLevel{9.52, 300}};
    MarketSnapshot snapshot = market().book(bear).build();

    EXPECT_FALSE(TenderEvaluator::walk_book(bear.bids, 301).has_value());

    TenderOffer tender = offer(10, OrderSide::BUY, 10.00, 1000);
    exchange.add_tender(tender);
    auto decisions = evaluator->process(snapshot, {tender});
    EXPECT_FALSE(decisions[0].profit.has_value());
    EXPECT_EQ(decisions[0].reason, "insufficient depth");
    EXPECT_TRUE(exchange.accepted_tenders.empty());
}

TEST_F(TenderEvaluatorTest, TopOfBookPricingWhenDepthWeightingIsOff) {
    config.tender.depth_weighted = false;
    build();
    OrderBook bear;
    bear.instrument = Instrument::BEAR;
    bear.bids = {BookLevel{9.50, 1}};
    bear.asks = {BookLevel{9.80, 1}};

    auto profit = evaluator->expected_profit(offer(11, OrderSide::BUY, 14.00, 5000), market().book(bear).build());
    ASSERT_TRUE(profit.has_value());
    EXPECT_NEAR(*profit, 9.78 + 9.50 - 14.00 * 1.351, 1e-9);
}

TEST_F(TenderEvaluatorTest, BuyingCompositeSellsBasketAndCurrency) {
    TenderOffer tender = offer(12, OrderSide::BUY, 14.00, 1000);
    exchange.add_tender(tender);

    auto decisions = evaluator->process(market().build(), {tender});
    ASSERT_TRUE(decisions[0].accepted);
    EXPECT_EQ(exchange.position(Instrument::RITC), 1000);
    EXPECT_EQ(exchange.position(Instrument::BULL), -1000);
    EXPECT_EQ(exchange.position(Instrument::BEAR), -1000);
    EXPECT_EQ(exchange.position(Instrument::USD), -14000);
}

TEST_F(TenderEvaluatorTest, NoOffersWhileUnwinding) {
    unwind->update(260000);
    ASSERT_TRUE(unwind->is_unwinding());
    TenderOffer tender = offer(13, OrderSide::SELL, 19.00, 2000);
    exchange.add_tender(tender);

    auto decisions = evaluator->process(market().build(), {tender});
    EXPECT_EQ(decisions[0].reason, "unwinding");
    EXPECT_TRUE(exchange.orders.empty());
    EXPECT_TRUE(exchange.accepted_tenders.empty());
}

TEST_F(TenderEvaluatorTest, LimiterDenialRejectsWithoutLiquidation) {
    config.limits.gross_ceiling = 10000;
    config.limits.net_ceiling = 10000;
    build();
    MarketSnapshot snapshot = market()
        .position(Instrument::RITC, 2500)
        .position(Instrument::BULL, -2500)
        .position(Instrument::BEAR, -2500)
        .build();
    TenderOffer tender = offer(14, OrderSide::BUY, 14.00, 1000);
    exchange.add_tender(tender);

    auto decisions = evaluator->process(snapshot, {tender});
    EXPECT_TRUE(decisions[0].profitable);
    EXPECT_FALSE(decisions[0].risk_approved);
    EXPECT_EQ(decisions[0].reason, "risk limits");
    EXPECT_TRUE(exchange.orders.empty());
}

TEST_F(TenderEvaluatorTest, LiquidatesForHeadroomAboveStricterMargin) {
    config.limits.gross_ceiling = 10000;
    config.limits.net_ceiling = 10000;
    config.tender.allow_liquidation = true;
    config.tender.liquidation_margin = 0.30;
    config.unwind.chunk_size = 2000;
    build();
    exchange.set_position(Instrument::RITC, 2500);
    exchange.set_position(Instrument::BULL, -2500);
    exchange.set_position(Instrument::BEAR, -2500);
    MarketSnapshot snapshot = market()
        .position(Instrument::RITC, 2500)
        .position(Instrument::BULL, -2500)
        .position(Instrument::BEAR, -2500)
        .build();
    TenderOffer tender = offer(15, OrderSide::BUY, 14.00, 1000);
    exchange.add_tender(tender);

    auto decisions = evaluator->process(snapshot, {tender});
    ASSERT_TRUE(decisions[0].accepted);
    EXPECT_TRUE(decisions[0].liquidated);
    EXPECT_EQ(exchange.position(Instrument::RITC), 1000);
    EXPECT_EQ(exchange.position(Instrument::BULL), -1000);
    EXPECT_EQ(exchange.position(Instrument::BEAR), -1000);
    ASSERT_EQ(events.count<TenderAcceptedEvent>(), 1);
    EXPECT_TRUE(events.last<TenderAcceptedEvent>()->liquidated_first);
}

TEST_F(TenderEvaluatorTest, LiquidationClosesBooksLargerThanOneOrder) {
    config.limits.gross_ceiling = 40000;
    config.limits.net_ceiling = 40000;
    config.sizing.max_order_size = 4000;
    config.tender.allow_liquidation = true;
    config.tender.liquidation_margin = 0.30;
    build();
    exchange.set_position(Instrument::RITC, 10000);
    exchange.set_position(Instrument::BULL, -10000);
    exchange.set_position(Instrument::BEAR, -10000);
    MarketSnapshot snapshot = market()
        .position(Instrument::RITC, 10000)
        .position(Instrument::BULL, -10000)
        .position(Instrument::BEAR, -10000)
        .build();
    TenderOffer tender = offer(19, OrderSide::BUY, 14.00, 5000);
    exchange.add_tender(tender);

    auto decisions = evaluator->process(snapshot, {tender});
    ASSERT_TRUE(decisions[0].accepted);
    EXPECT_TRUE(decisions[0].liquidated);
    EXPECT_EQ(exchange.orders_for(Instrument::RITC).size(), 3u);
    EXPECT_EQ(exchange.position(Instrument::RITC), 5000);
    EXPECT_EQ(exchange.position(Instrument::BULL), -5000);
    EXPECT_EQ(exchange.position(Instrument::BEAR), -5000);
}

TEST_F(TenderEvaluatorTest, NoLiquidationWhenFlatBookStillCannotTakeTender) {
    config.limits.gross_ceiling = 40000;
    config.limits.net_ceiling = 40000;
    config.tender.allow_liquidation = true;
    config.tender.liquidation_margin = 0.30;
    build();
    MarketSnapshot snapshot = market()
        .position(Instrument::RITC, 10000)
        .position(Instrument::BULL, -10000)
        .position(Instrument::BEAR, -10000)
        .build();
    TenderOffer tender = offer(20, OrderSide::BUY, 14.00, 12000);
    exchange.add_tender(tender);

    auto decisions = evaluator->process(snapshot, {tender});
    EXPECT_FALSE(decisions[0].liquidated);
    EXPECT_FALSE(decisions[0].accepted);
    EXPECT_EQ(decisions[0].reason, "risk limits");
    EXPECT_TRUE(exchange.orders.empty());
}

TEST_F(TenderEvaluatorTest, LaterOffersSeeEarlierAcceptances) {
    config.limits.gross_ceiling = 10000;
    config.limits.net_ceiling = 10000;
    build();
    TenderOffer first = offer(16, OrderSide::BUY, 14.00, 2000);
    TenderOffer second = offer(17, OrderSide::BUY, 14.00, 2000);
    exchange.add_tender(first);
    exchange.add_tender(second);

    auto decisions = evaluator->process(market().build(), {first, second});
    ASSERT_EQ(decisions.size(), 2u);
    EXPECT_TRUE(decisions[0].accepted);
    EXPECT_FALSE(decisions[1].accepted);
    EXPECT_EQ(decisions[1].reason, "risk limits");
}

TEST_F(TenderEvaluatorTest, VenueRefusalLeavesNoHedge) {
    TenderOffer tender = offer(18, OrderSide::SELL, 19.00, 2000);

    auto decisions = evaluator->process(market().build(), {tender});
    EXPECT_TRUE(decisions[0].risk_approved);
    EXPECT_FALSE(decisions[0].accepted);
    EXPECT_EQ(decisions[0].reason, "venue refused");
    EXPECT_TRUE(exchange.orders.empty());
}

TEST_F(TenderEvaluatorTest, PackageMirrorsBasketAgainstComposite) {
    auto legs = TenderEvaluator::package_for(offer(1, OrderSide::SELL, 19.0, 300));
    ASSERT_EQ(legs.size(), 3u);
    EXPECT_EQ(legs[0].instrument, Instrument::RITC);
    EXPECT_EQ(legs[0].side, OrderSide::SELL);
    EXPECT_EQ(legs[1].side, OrderSide::BUY);
    EXPECT_EQ(legs[2].side, OrderSide::BUY);
    EXPECT_EQ(legs[2].quantity, 300);
}
