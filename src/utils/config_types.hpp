#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace etfarb {

std::string get_env_var(const std::string& key);

struct AppConfig {
    std::string name = "etf-arb-engine";
    std::string version = "1.0.0";
    bool debug = false;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(AppConfig, name, version, debug)

struct ExchangeConfig {
    std::string name = "rit";
    std::string base_url = "http://localhost:9999/v1";
    std::string api_key;
    int timeout_ms = 2000;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ExchangeConfig, name, base_url, api_key, timeout_ms)

// Share exposure ceilings, composite weighted by its risk multiplier.
struct LimitsConfig {
    long long gross_ceiling = 300000;
    long long net_ceiling = 200000;
    bool enable_cash_check = false;
    double cash_ceiling = 10000000.0;
    double net_cash_ceiling = 5000000.0;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(LimitsConfig, gross_ceiling, net_ceiling, enable_cash_check, cash_ceiling, net_cash_ceiling)

struct SizingTier {
    double threshold = 0.0;
    long long quantity = 0;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(SizingTier, threshold, quantity)

struct SizingConfig {
    std::vector<SizingTier> tiers = {
        {0.40, 5000},
        {0.20, 2000},
        {0.10, 1000},
        {0.05, 500}
    };
    long long max_order_size = 10000;
    long long max_currency_order_size = 2500000;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(SizingConfig, tiers, max_order_size, max_currency_order_size)

struct ArbitrageConfig {
    bool enabled = true;
    double min_edge = 0.05;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ArbitrageConfig, enabled, min_edge)

struct TenderConfig {
    bool enabled = true;
    double margin = 0.15;
    bool depth_weighted = true;
    bool allow_liquidation = false;
    double liquidation_margin = 0.30;
    bool hedge_currency = true;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(TenderConfig, enabled, margin, depth_weighted, allow_liquidation, liquidation_margin, hedge_currency)

struct HedgeConfig {
    int max_attempts = 5;
    int initial_backoff_ms = 50;
    double backoff_multiplier = 2.0;
    int max_backoff_ms = 1000;
    bool passive = false;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(HedgeConfig, max_attempts, initial_backoff_ms, backoff_multiplier, max_backoff_ms, passive)

struct CurrencyConfig {
    bool enabled = true;
    double drift_tolerance = 2000.0;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(CurrencyConfig, enabled, drift_tolerance)

struct UnwindConfig {
    bool enabled = true;
    double trigger = 0.85;
    long long chunk_size = 1000;
    long long min_position = 500;
    long long aggressive_threshold = 5000;
    double passive_offset = 0.01;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(UnwindConfig, enabled, trigger, chunk_size, min_position, aggressive_threshold, passive_offset)

struct GuardConfig {
    bool enabled = true;
    long long component_threshold = 1500;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(GuardConfig, enabled, component_threshold)

struct ConverterConfig {
    bool enabled = true;
    long long block_size = 10000;
    double block_fee = 1500.0; // in composite currency
    double near_fraction = 0.8;
    double spread_ratio = 1.5;
    double gross_alert_fraction = 0.9;
    int check_every_ticks = 5;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ConverterConfig, enabled, block_size, block_fee, near_fraction, spread_ratio, gross_alert_fraction, check_every_ticks)

struct SchedulerConfig {
    int interval_ms = 250;
    int idle_interval_ms = 1000;
    bool exit_when_inactive = true;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(SchedulerConfig, interval_ms, idle_interval_ms, exit_when_inactive)

struct LoggingConfig {
    std::string level = "info";
    std::string file_path = "logs/etfarb.log";
    int max_file_size_mb = 10;
    int max_backup_files = 3;
    bool console_output = true;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(LoggingConfig, level, file_path, max_file_size_mb, max_backup_files, console_output)

// Every tunable of the engine. One instance is loaded at startup and shared
// by reference with each component.
struct EngineConfig {
    AppConfig app;
    ExchangeConfig exchange;
    LimitsConfig limits;
    SizingConfig sizing;
    ArbitrageConfig arbitrage;
    TenderConfig tender;
    HedgeConfig hedge;
    CurrencyConfig currency;
    UnwindConfig unwind;
    GuardConfig guard;
    ConverterConfig converter;
    SchedulerConfig scheduler;
    LoggingConfig logging;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(EngineConfig, app, exchange, limits, sizing, arbitrage, tender, hedge, currency, unwind, guard, converter, scheduler, logging)

} // namespace etfarb
