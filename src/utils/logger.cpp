#include "logger.hpp"

#include <filesystem>
#include <iostream>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace etfarb {
namespace utils {

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;

LogLevel log_level_from_string(const std::string& level) {
    if (level == "TRACE" || level == "trace") return LogLevel::TRACE;
    if (level == "DEBUG" || level == "debug") return LogLevel::DEBUG;
    if (level == "WARN" || level == "warn" || level == "WARNING") return LogLevel::WARN;
    if (level == "ERROR" || level == "error") return LogLevel::ERROR;
    if (level == "CRITICAL" || level == "critical") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

void Logger::initialize(const std::string& log_file_path, LogLevel level,
                        size_t max_file_size, size_t max_files, bool console_output) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (console_output) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(to_spdlog_level(level));
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
            sinks.push_back(console_sink);
        }

        if (!log_file_path.empty()) {
            std::filesystem::path log_path(log_file_path);
            if (log_path.has_parent_path()) {
                std::filesystem::create_directories(log_path.parent_path());
            }
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file_path, max_file_size, max_files);
            file_sink->set_level(to_spdlog_level(level));
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }

        logger_ = std::make_shared<spdlog::logger>("etfarb", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(level));

        spdlog::set_default_logger(logger_);

        // Hedge faults must hit disk immediately.
        logger_->flush_on(spdlog::level::warn);
        spdlog::flush_every(std::chrono::seconds(3));

        Logger::info("Logger initialized");
    } catch (const std::exception& e) {
        std::cerr << "Logger initialization failed: " << e.what() << std::endl;
        throw;
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::shutdown();
        logger_ = nullptr;
    }
}

void Logger::trace(const std::string& msg) {
    if (logger_) logger_->trace(msg);
}

void Logger::debug(const std::string& msg) {
    if (logger_) logger_->debug(msg);
}

void Logger::info(const std::string& msg) {
    if (logger_) logger_->info(msg);
}

void Logger::warn(const std::string& msg) {
    if (logger_) logger_->warn(msg);
}

void Logger::error(const std::string& msg) {
    if (logger_) logger_->error(msg);
}

void Logger::critical(const std::string& msg) {
    if (logger_) logger_->critical(msg);
}

spdlog::level::level_enum Logger::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

void TradingLogger::log_order_submitted(const std::string& instrument, const std::string& side,
                                        const std::string& type, long long quantity, double price) {
    Logger::info("ORDER_SUBMITTED | Instrument: {} | Side: {} | Type: {} | Qty: {} | Price: {:.4f}",
                 instrument, side, type, quantity, price);
}

void TradingLogger::log_order_rejected(const std::string& instrument, const std::string& side,
                                       long long quantity, const std::string& reason) {
    Logger::warn("ORDER_REJECTED | Instrument: {} | Side: {} | Qty: {} | Reason: {}",
                 instrument, side, quantity, reason);
}

void TradingLogger::log_arbitrage_executed(const std::string& direction, double edge,
                                           long long quantity, bool legs_ok, bool hedge_ok) {
    Logger::info("ARBITRAGE_EXECUTED | Direction: {} | Edge: {:.4f} | Qty: {} | Legs: {} | Hedge: {}",
                 direction, edge, quantity, legs_ok ? "OK" : "PARTIAL", hedge_ok ? "OK" : "FAILED");
}

void TradingLogger::log_tender_accepted(long long tender_id, const std::string& side,
                                        double price, long long quantity, double profit) {
    Logger::info("TENDER_ACCEPTED | TenderID: {} | Side: {} | Price: {:.4f} | Qty: {} | Profit/share: {:.4f}",
                 tender_id, side, price, quantity, profit);
}

void TradingLogger::log_currency_rebalance(double target, double actual, double drift,
                                           const std::string& side) {
    Logger::info("CURRENCY_REBALANCE | Target: {:.0f} | Actual: {:.0f} | Drift: {:.0f} | Side: {}",
                 target, actual, drift, side);
}

void TradingLogger::log_unwind_transition(bool engaged, long long gross, double line) {
    if (engaged) {
        Logger::warn("UNWIND_ENGAGED | Gross: {} | Line: {:.0f}", gross, line);
    } else {
        Logger::info("UNWIND_RELEASED | Gross: {} | Line: {:.0f}", gross, line);
    }
}

void TradingLogger::log_risk_deny(const std::string& context, long long projected_gross,
                                  long long projected_net) {
    Logger::debug("RISK_DENY | Context: {} | ProjGross: {} | ProjNet: {}",
                  context, projected_gross, projected_net);
}

void TradingLogger::log_hedge_exhausted(const std::string& instrument, const std::string& side,
                                        long long quantity, int attempts) {
    Logger::critical("HEDGE_EXHAUSTED | Instrument: {} | Side: {} | Qty: {} | Attempts: {} | NAKED EXPOSURE",
                     instrument, side, quantity, attempts);
}

void TradingLogger::log_converter_advice(const std::string& action, long long position,
                                         double fee_per_share) {
    Logger::warn("CONVERTER_ADVICE | Action: {} | Position: {} | Fee/share: {:.4f}",
                 action, position, fee_per_share);
}

ScopedTimer::ScopedTimer(const std::string& operation_name)
    : operation_name_(operation_name), start_time_(std::chrono::steady_clock::now()) {
}

ScopedTimer::~ScopedTimer() {
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_time_);
    Logger::trace("TIMER | Operation: {} | Duration: {} us", operation_name_, duration.count());
}

} // namespace utils
} // namespace etfarb
