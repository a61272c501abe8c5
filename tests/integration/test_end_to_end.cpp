#include <gtest/gtest.h>
#include <memory>

#include "core/event_bus.hpp"
#include "core/scheduler_loop.hpp"
#include "mocks/fake_clock.hpp"
#include "mocks/mock_event_pusher.hpp"
#include "mocks/sim_exchange.hpp"

using etfarb::testing::FakeClock;
using etfarb::testing::RecordingEventPusher;
using etfarb::testing::SimExchange;

namespace etfarb {
namespace integration {

class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        exchange.set_quote(Instrument::BULL, 10.00, 10.02);
        exchange.set_quote(Instrument::BEAR, 9.50, 9.52);
        exchange.set_quote(Instrument::USD, 1.349, 1.351);
        event_bus.add_sink(&recorder);
        event_bus.add_sink(&log_sink);
    }

    void wire() {
        gateway = std::make_unique<MarketDataGateway>(&exchange);
        ledger = std::make_unique<PositionLedger>(&exchange);
        router = std::make_unique<OrderRouter>(&exchange, config.sizing);
        limiter = std::make_unique<RiskLimiter>(config.limits);
        sizing = std::make_unique<SizingPolicy>(config.sizing.tiers);
        hedger = std::make_unique<HedgeExecutor>(router.get(), &clock, &event_bus, config.hedge);
        arbitrage = std::make_unique<ArbitrageExecutor>(router.get(), limiter.get(), sizing.get(),
                                                        hedger.get(), &event_bus, config.arbitrage);
        unwind = std::make_unique<UnwindController>(router.get(), &event_bus, config.unwind, config.limits);
        tenders = std::make_unique<TenderEvaluator>(&exchange, limiter.get(), hedger.get(), unwind.get(),
                                                    &event_bus, config.tender);
        rebalancer = std::make_unique<CurrencyRebalancer>(router.get(), &event_bus, config.currency);
        guard = std::make_unique<BasketHedgeGuard>(hedger.get(), limiter.get(), config.guard,
                                                   config.sizing.max_order_size);
        converter = std::make_unique<ConverterAdvisor>(&event_bus, config.converter, config.limits);

        SchedulerStages stages;
        stages.gateway = gateway.get();
        stages.ledger = ledger.get();
        stages.guard = guard.get();
        stages.tenders = tenders.get();
        stages.arbitrage = arbitrage.get();
        stages.rebalancer = rebalancer.get();
        stages.unwind = unwind.get();
        stages.converter = converter.get();
        scheduler = std::make_unique<SchedulerLoop>(stages, &clock, config);
    }

    EngineConfig config;
    SimExchange exchange;
    FakeClock clock;
    EventBus event_bus;
    RecordingEventPusher recorder;
    LoggingEventSink log_sink;

    std::unique_ptr<MarketDataGateway> gateway;
    std::unique_ptr<PositionLedger> ledger;
    std::unique_ptr<OrderRouter> router;
    std::unique_ptr<RiskLimiter> limiter;
    std::unique_ptr<SizingPolicy> sizing;
    std::unique_ptr<HedgeExecutor> hedger;
    std::unique_ptr<ArbitrageExecutor> arbitrage;
    std::unique_ptr<UnwindController> unwind;
    std::unique_ptr<TenderEvaluator> tenders;
    std::unique_ptr<CurrencyRebalancer> rebalancer;
    std::unique_ptr<BasketHedgeGuard> guard;
    std::unique_ptr<ConverterAdvisor> converter;
    std::unique_ptr<SchedulerLoop> scheduler;
};

TEST_F(EndToEndTest, TradesCheapCompositeUntilCaseStops) {
    exchange.set_quote(Instrument::RITC, 14.20, 14.22);
    exchange.stop_after_tick = 3;
    wire();

    scheduler->run();

    EXPECT_FALSE(scheduler->is_running());
    EXPECT_EQ(scheduler->get_iterations(), 3);
    EXPECT_EQ(exchange.position(Instrument::RITC), 6000);
    EXPECT_EQ(exchange.position(Instrument::BULL), -6000);
    EXPECT_EQ(exchange.position(Instrument::BEAR), -6000);
    EXPECT_EQ(exchange.position(Instrument::USD), -3 * 28440);
    EXPECT_EQ(recorder.count<ArbitrageExecutedEvent>(), 3);
    EXPECT_EQ(recorder.count<CurrencyRebalancedEvent>(), 0);
    EXPECT_EQ(clock.sleeps.size(), 3u);
    EXPECT_EQ(clock.sleeps.front().count(), config.scheduler.interval_ms);
}

TEST_F(EndToEndTest, CrowdedBookUnwindsInsteadOfTrading) {
    exchange.set_quote(Instrument::RITC, 14.20, 14.22);
    exchange.set_position(Instrument::RITC, 100000);
    exchange.set_position(Instrument::BULL, -100000);
    exchange.set_position(Instrument::BEAR, -100000);
    TenderOffer offer;
    offer.id = 5;
    offer.side = OrderSide::SELL;
    offer.price = 19.00;
    offer.quantity = 1000;
    exchange.add_tender(offer);
    wire();

    IterationReport report = scheduler->run_once();

    EXPECT_EQ(report.unwind_state, UnwindState::UNWINDING);
    EXPECT_EQ(report.tenders_accepted, 0);
    EXPECT_FALSE(report.arbitrage_executed);
    EXPECT_EQ(report.unwind_orders, 3);
    EXPECT_TRUE(exchange.accepted_tenders.empty());
    EXPECT_EQ(exchange.position(Instrument::RITC), 99000);
    EXPECT_EQ(exchange.position(Instrument::BULL), -99000);
    EXPECT_EQ(recorder.count<UnwindEngagedEvent>(), 1);
}

TEST_F(EndToEndTest, AcceptedTenderIsHedgedWithinTheIteration) {
    exchange.set_quote(Instrument::RITC, 14.40, 14.46);
    exchange.set_quote(Instrument::BULL, 9.78, 9.80);
    exchange.set_quote(Instrument::BEAR, 9.78, 9.80);
    TenderOffer offer;
    offer.id = 21;
    offer.side = OrderSide::SELL;
    offer.price = 19.00;
    offer.quantity = 2000;
    exchange.add_tender(offer);
    wire();

    IterationReport report = scheduler->run_once();

    EXPECT_EQ(report.tenders_accepted, 1);
    EXPECT_EQ(report.guard_hedges, 0);
    EXPECT_EQ(exchange.position(Instrument::RITC), -2000);
    EXPECT_EQ(exchange.position(Instrument::BULL), 2000);
    EXPECT_EQ(exchange.position(Instrument::BEAR), 2000);
    EXPECT_EQ(recorder.count<TenderAcceptedEvent>(), 1);
}

TEST_F(EndToEndTest, UnreadablePositionsSuspendExposureDecisions) {
    exchange.set_quote(Instrument::RITC, 14.20, 14.22);
    exchange.fail_positions = true;
    wire();

    IterationReport report = scheduler->run_once();

    EXPECT_EQ(report.status.status, CaseStatus::ACTIVE);
    EXPECT_FALSE(report.positions_ok);
    EXPECT_FALSE(report.arbitrage_executed);
    EXPECT_FALSE(report.currency_rebalanced);
    EXPECT_EQ(report.stage_failures, 0);
    EXPECT_TRUE(exchange.orders.empty());
}

TEST_F(EndToEndTest, UnreachableVenueEndsTheLoop) {
    exchange.fail_status = true;
    wire();

    scheduler->run();

    EXPECT_EQ(scheduler->get_iterations(), 0);
    EXPECT_TRUE(exchange.orders.empty());
}

TEST_F(EndToEndTest, PausedCaseDoesNothing) {
    exchange.set_quote(Instrument::RITC, 14.20, 14.22);
    exchange.case_status = CaseStatus::PAUSED;
    wire();

    IterationReport report = scheduler->run_once();

    EXPECT_EQ(report.status.status, CaseStatus::PAUSED);
    EXPECT_EQ(scheduler->get_iterations(), 0);
    EXPECT_TRUE(exchange.orders.empty());
}

TEST_F(EndToEndTest, StopBeforeRunSkipsIterations) {
    exchange.set_quote(Instrument::RITC, 14.20, 14.22);
    wire();

    scheduler->stop();
    scheduler->run();

    EXPECT_EQ(exchange.status_reads, 0);
    EXPECT_TRUE(exchange.orders.empty());
}

} // namespace integration
} // namespace etfarb
