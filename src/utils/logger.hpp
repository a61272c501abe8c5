#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace etfarb {
namespace utils {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5
};

LogLevel log_level_from_string(const std::string& level);

class Logger {
public:
    static void initialize(const std::string& log_file_path = "logs/etfarb.log",
                           LogLevel level = LogLevel::INFO,
                           size_t max_file_size = 1024 * 1024 * 10,  // 10MB
                           size_t max_files = 3,
                           bool console_output = true);

    static void shutdown();

    template<typename... Args>
    static void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->trace(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->critical(fmt, std::forward<Args>(args)...);
        }
    }

    // Convenience methods for single string logging
    static void trace(const std::string& msg);
    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    static void critical(const std::string& msg);

private:
    static std::shared_ptr<spdlog::logger> logger_;

    static spdlog::level::level_enum to_spdlog_level(LogLevel level);
};

// Pipe-delimited event lines for the trading audit trail. Every line starts
// with a fixed tag so operators can grep a session for one kind of event.
class TradingLogger {
public:
    static void log_order_submitted(const std::string& instrument, const std::string& side,
                                    const std::string& type, long long quantity, double price);

    static void log_order_rejected(const std::string& instrument, const std::string& side,
                                   long long quantity, const std::string& reason);

    static void log_arbitrage_executed(const std::string& direction, double edge,
                                       long long quantity, bool legs_ok, bool hedge_ok);

    static void log_tender_accepted(long long tender_id, const std::string& side,
                                    double price, long long quantity, double profit);

    static void log_currency_rebalance(double target, double actual, double drift,
                                       const std::string& side);

    static void log_unwind_transition(bool engaged, long long gross, double line);

    static void log_risk_deny(const std::string& context, long long projected_gross,
                              long long projected_net);

    // Naked exposure. Logged at critical level, distinct from routine failures.
    static void log_hedge_exhausted(const std::string& instrument, const std::string& side,
                                    long long quantity, int attempts);

    static void log_converter_advice(const std::string& action, long long position,
                                     double fee_per_share);
};

// RAII logging scope for per-iteration timing
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& operation_name);
    ~ScopedTimer();

private:
    std::string operation_name_;
    std::chrono::steady_clock::time_point start_time_;
};

#define ETFARB_LOG_TRACE(...) etfarb::utils::Logger::trace(__VA_ARGS__)
#define ETFARB_LOG_DEBUG(...) etfarb::utils::Logger::debug(__VA_ARGS__)
#define ETFARB_LOG_INFO(...) etfarb::utils::Logger::info(__VA_ARGS__)
#define ETFARB_LOG_WARN(...) etfarb::utils::Logger::warn(__VA_ARGS__)
#define ETFARB_LOG_ERROR(...) etfarb::utils::Logger::error(__VA_ARGS__)
#define ETFARB_LOG_CRITICAL(...) etfarb::utils::Logger::critical(__VA_ARGS__)

#define ETFARB_SCOPED_TIMER(name) etfarb::utils::ScopedTimer timer(name)

} // namespace utils
} // namespace etfarb
