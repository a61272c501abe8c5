#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include "utils/config_manager.hpp"
#include "utils/logger.hpp"
#include "utils/clock.hpp"
#include "core/exceptions.hpp"
#include "core/event_bus.hpp"
#include "core/order_router.hpp"
#include "core/risk_limiter.hpp"
#include "core/sizing_policy.hpp"
#include "core/hedge_executor.hpp"
#include "core/arbitrage_executor.hpp"
#include "core/unwind_controller.hpp"
#include "core/tender_evaluator.hpp"
#include "core/currency_rebalancer.hpp"
#include "core/basket_hedge_guard.hpp"
#include "core/converter_advisor.hpp"
#include "core/scheduler_loop.hpp"
#include "data/market_data_gateway.hpp"
#include "data/position_ledger.hpp"
#include "exchange/rit_exchange.hpp"
#include "network/rest_client.hpp"

namespace {
etfarb::SchedulerLoop* scheduler_ptr = nullptr;
}

// Signal handler for graceful shutdown
void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        if (scheduler_ptr) {
            scheduler_ptr->stop();
        }
    }
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::string config_path = argc > 1 ? argv[1] : "config/settings.json";

    etfarb::ConfigManager config_manager;
    try {
        if (!config_manager.load(config_path)) {
            std::cerr << "Failed to load configuration from " << config_path << ". Exiting." << std::endl;
            return 1;
        }
    } catch (const etfarb::ConfigurationError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    const etfarb::EngineConfig& config = config_manager.get_config();

    const auto& logging = config.logging;
    etfarb::utils::Logger::initialize(logging.file_path,
                                      etfarb::utils::log_level_from_string(logging.level),
                                      static_cast<size_t>(logging.max_file_size_mb) * 1024 * 1024,
                                      static_cast<size_t>(logging.max_backup_files),
                                      logging.console_output);
    ETFARB_LOG_INFO("Starting {} v{} against {}", config.app.name, config.app.version,
                    config.exchange.base_url);

    if (!etfarb::RestClient::GlobalInit()) {
        ETFARB_LOG_CRITICAL("Failed to initialize HTTP transport. Exiting.");
        etfarb::utils::Logger::shutdown();
        return 1;
    }

    int exit_code = 0;
    try {
        auto exchange = std::make_unique<etfarb::RitExchange>(config.exchange);
        auto gateway = std::make_unique<etfarb::MarketDataGateway>(exchange.get());
        auto ledger = std::make_unique<etfarb::PositionLedger>(exchange.get());
        auto router = std::make_unique<etfarb::OrderRouter>(exchange.get(), config.sizing);
        auto limiter = std::make_unique<etfarb::RiskLimiter>(config.limits);
        auto sizing = std::make_unique<etfarb::SizingPolicy>(config.sizing.tiers);
        auto clock = std::make_unique<etfarb::SystemClock>();

        auto event_bus = std::make_unique<etfarb::EventBus>();
        auto log_sink = std::make_unique<etfarb::LoggingEventSink>();
        event_bus->add_sink(log_sink.get());

        auto hedger = std::make_unique<etfarb::HedgeExecutor>(router.get(), clock.get(), event_bus.get(),
                                                              config.hedge);
        auto arbitrage = std::make_unique<etfarb::ArbitrageExecutor>(router.get(), limiter.get(), sizing.get(),
                                                                     hedger.get(), event_bus.get(), config.arbitrage);
        auto unwind = std::make_unique<etfarb::UnwindController>(router.get(), event_bus.get(),
                                                                 config.unwind, config.limits);
        auto tenders = std::make_unique<etfarb::TenderEvaluator>(exchange.get(), limiter.get(), hedger.get(),
                                                                 unwind.get(), event_bus.get(), config.tender);
        auto rebalancer = std::make_unique<etfarb::CurrencyRebalancer>(router.get(), event_bus.get(),
                                                                       config.currency);
        std::unique_ptr<etfarb::BasketHedgeGuard> guard;
        if (config.guard.enabled) {
            guard = std::make_unique<etfarb::BasketHedgeGuard>(hedger.get(), limiter.get(), config.guard,
                                                               config.sizing.max_order_size);
        }
        auto converter = std::make_unique<etfarb::ConverterAdvisor>(event_bus.get(), config.converter,
                                                                    config.limits);

        etfarb::SchedulerStages stages;
        stages.gateway = gateway.get();
        stages.ledger = ledger.get();
        stages.guard = guard.get();
        stages.tenders = tenders.get();
        stages.arbitrage = arbitrage.get();
        stages.rebalancer = rebalancer.get();
        stages.unwind = unwind.get();
        stages.converter = converter.get();

        etfarb::SchedulerLoop scheduler(stages, clock.get(), config);
        scheduler_ptr = &scheduler;
        scheduler.run();
        scheduler_ptr = nullptr;

        ETFARB_LOG_INFO("Session summary: {} iterations, {} orders sent, {} rejected, "
                        "{} risk denials, {} exhausted hedges, {} events",
                        scheduler.get_iterations(), router->get_orders_sent(),
                        router->get_orders_rejected(), limiter->get_denied_count(),
                        hedger->get_exhausted_count(), event_bus->get_published_count());
        exchange->log_statistics();
    } catch (const std::exception& e) {
        ETFARB_LOG_CRITICAL("Fatal error: {}", e.what());
        exit_code = 1;
    }

    etfarb::RestClient::GlobalCleanup();
    ETFARB_LOG_INFO("Shutdown complete.");
    etfarb::utils::Logger::shutdown();
    return exit_code;
}
