#include "scheduler_loop.hpp"
#include "../utils/logger.hpp"

namespace etfarb {

SchedulerLoop::SchedulerLoop(const SchedulerStages& stages, Clock* clock, const EngineConfig& config)
    : stages_(stages)
    , clock_(clock)
    , config_(config)
    , running_(false)
    , stop_requested_(false)
    , iterations_(0) {}

void SchedulerLoop::stop() {
    stop_requested_.store(true);
}

template<typename Stage>
void SchedulerLoop::guarded(const char* name, IterationReport& report, Stage&& stage) {
    try {
        stage();
    } catch (const std::exception& e) {
        ++report.stage_failures;
        ETFARB_LOG_ERROR("Stage {} failed this cycle: {}", name, e.what());
    }
}

void SchedulerLoop::refresh_positions(MarketSnapshot& snapshot) {
    if (!stages_.ledger) {
        return;
    }
    LedgerReading reading = stages_.ledger->read();
    snapshot.positions = reading.positions;
    snapshot.positions_ok = reading.ok;
}

void SchedulerLoop::run() {
    running_.store(true);
    ETFARB_LOG_INFO("Scheduler started (interval {} ms)", config_.scheduler.interval_ms);

    while (!stop_requested_.load()) {
        IterationReport report = run_once();
        if (report.status.status != CaseStatus::ACTIVE) {
            if (config_.scheduler.exit_when_inactive || report.status.status == CaseStatus::STOPPED) {
                ETFARB_LOG_INFO("Case is {} at tick {}, leaving control loop",
                                to_string(report.status.status), report.status.tick);
                break;
            }
            clock_->sleep_for(std::chrono::milliseconds(config_.scheduler.idle_interval_ms));
            continue;
        }
        clock_->sleep_for(std::chrono::milliseconds(config_.scheduler.interval_ms));
    }

    running_.store(false);
    ETFARB_LOG_INFO("Scheduler stopped after {} iterations", iterations_.load());
}

IterationReport SchedulerLoop::run_once() {
    IterationReport report;
    ETFARB_SCOPED_TIMER("scheduler iteration");

    MarketSnapshot snapshot = stages_.gateway->capture();
    report.status = snapshot.status;
    if (snapshot.status.status != CaseStatus::ACTIVE) {
        return report;
    }
    iterations_.fetch_add(1);

    refresh_positions(snapshot);
    report.positions_ok = snapshot.positions_ok;

    const bool unwind_enabled = stages_.unwind && config_.unwind.enabled;
    if (unwind_enabled && snapshot.positions_ok) {
        report.unwind_state = stages_.unwind->update(snapshot.exposure().gross);
    }
    const bool suspended = unwind_enabled && stages_.unwind->is_unwinding();

    if (stages_.guard) {
        guarded("basket_guard", report, [&]() {
            report.guard_hedges = stages_.guard->check(snapshot);
            if (report.guard_hedges > 0) {
                refresh_positions(snapshot);
            }
        });
    }

    if (stages_.tenders && config_.tender.enabled && !suspended) {
        guarded("tenders", report, [&]() {
            auto offers = stages_.gateway->open_tenders();
            for (const auto& decision : stages_.tenders->process(snapshot, offers)) {
                if (decision.accepted) {
                    ++report.tenders_accepted;
                }
                ETFARB_LOG_DEBUG("Tender {}: {}", decision.tender_id, decision.reason);
            }
            if (report.tenders_accepted > 0) {
                refresh_positions(snapshot);
            }
        });
    }

    if (stages_.arbitrage && config_.arbitrage.enabled && !suspended) {
        guarded("arbitrage", report, [&]() {
            ArbitrageResult result = stages_.arbitrage->run(snapshot);
            report.arbitrage_executed = result.executed();
            if (report.arbitrage_executed) {
                refresh_positions(snapshot);
            }
        });
    }

    if (stages_.rebalancer) {
        guarded("currency_rebalance", report, [&]() {
            RebalanceResult result = stages_.rebalancer->rebalance(snapshot);
            report.currency_rebalanced = result.attempted;
            if (result.attempted) {
                refresh_positions(snapshot);
            }
        });
    }

    if (unwind_enabled) {
        guarded("unwind", report, [&]() {
            if (snapshot.positions_ok) {
                report.unwind_state = stages_.unwind->update(snapshot.exposure().gross);
            }
            report.unwind_orders = stages_.unwind->step(snapshot);
        });
    }

    if (stages_.converter) {
        guarded("converter_advice", report, [&]() {
            report.converter_advised = stages_.converter->check(snapshot).has_value();
        });
    }

    return report;
}

} // namespace etfarb
