#pragma once

#include <atomic>
#include "arbitrage_executor.hpp"
#include "basket_hedge_guard.hpp"
#include "converter_advisor.hpp"
#include "currency_rebalancer.hpp"
#include "tender_evaluator.hpp"
#include "unwind_controller.hpp"
#include "../data/market_data_gateway.hpp"
#include "../data/position_ledger.hpp"
#include "../utils/clock.hpp"
#include "../utils/config_types.hpp"

namespace etfarb {

// Non-owning handles to every stage the loop drives. A null stage is skipped.
struct SchedulerStages {
    MarketDataGateway* gateway = nullptr;
    PositionLedger* ledger = nullptr;
    BasketHedgeGuard* guard = nullptr;
    TenderEvaluator* tenders = nullptr;
    ArbitrageExecutor* arbitrage = nullptr;
    CurrencyRebalancer* rebalancer = nullptr;
    UnwindController* unwind = nullptr;
    ConverterAdvisor* converter = nullptr;
};

struct IterationReport {
    TickStatus status;
    bool positions_ok = false;
    UnwindState unwind_state = UnwindState::NORMAL;
    int guard_hedges = 0;
    int tenders_accepted = 0;
    bool arbitrage_executed = false;
    bool currency_rebalanced = false;
    int unwind_orders = 0;
    bool converter_advised = false;
    int stage_failures = 0;
};

// Single cooperative control loop. Each iteration refreshes the snapshot and
// runs the stages in fixed priority order; positions are re-read after any
// stage that traded so the next decision sees the hedge it depends on.
class SchedulerLoop {
public:
    SchedulerLoop(const SchedulerStages& stages, Clock* clock, const EngineConfig& config);

    // Blocks until the case leaves ACTIVE or stop() is called. The running
    // iteration always completes.
    void run();

    // Safe to call from a signal handler.
    void stop();

    IterationReport run_once();

    bool is_running() const { return running_.load(); }
    long long get_iterations() const { return iterations_.load(); }

private:
    void refresh_positions(MarketSnapshot& snapshot);

    template<typename Stage>
    void guarded(const char* name, IterationReport& report, Stage&& stage);

    SchedulerStages stages_;
    Clock* clock_;
    EngineConfig config_;
    std::atomic<bool> running_;
    std::atomic<bool> stop_requested_;
    std::atomic<long long> iterations_;
};

} // namespace etfarb
