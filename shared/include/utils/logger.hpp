#pragma once

#include <string>
#include <memory>
#include <chrono>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace atx {
namespace utils {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5
};

LogLevel parse_log_level(const std::string& level);

class Logger {
public:
    static void initialize(const std::string& log_file_path = "logs/atx.log",
                          LogLevel level = LogLevel::INFO,
                          size_t max_file_size = 1024 * 1024 * 10,  // 10MB
                          size_t max_files = 3);

    static void shutdown();

    // Messages logged before initialize() are dropped
    template<typename... Args>
    static void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = std::atomic_load(&logger_)) {
            logger->trace(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = std::atomic_load(&logger_)) {
            logger->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = std::atomic_load(&logger_)) {
            logger->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = std::atomic_load(&logger_)) {
            logger->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = std::atomic_load(&logger_)) {
            logger->error(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = std::atomic_load(&logger_)) {
            logger->critical(fmt, std::forward<Args>(args)...);
        }
    }

    // Convenience methods for single string logging
    static void trace(const std::string& msg);
    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    static void critical(const std::string& msg);

    static void set_level(LogLevel level);
    static LogLevel get_level();
    static bool is_enabled(LogLevel level);
    static bool is_initialized();

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static LogLevel current_level_;

    static spdlog::level::level_enum to_spdlog_level(LogLevel level);
};

// Structured logging for arbitrage events
class TradingLogger {
public:
    static void log_opportunity(const std::string& symbol,
                                const std::string& buy_exchange,
                                const std::string& sell_exchange,
                                double buy_price, double sell_price,
                                double net_spread_percent, double expected_profit);

    static void log_leg_submitted(const std::string& trade_id, const std::string& exchange,
                                  const std::string& symbol, const std::string& side,
                                  const std::string& order_id, double quantity, double price);

    static void log_leg_finished(const std::string& trade_id, const std::string& exchange,
                                 const std::string& order_id, const std::string& status,
                                 double filled_quantity, double avg_price);

    static void log_trade_result(const std::string& trade_id, const std::string& symbol,
                                 const std::string& status, double net_pnl, double total_fees,
                                 long long duration_ms);

    static void log_partial_failure(const std::string& trade_id, const std::string& symbol,
                                    const std::string& exchange, double held_quantity,
                                    const std::string& reason);

    static void log_emergency(const std::string& reason, const std::string& action,
                              const std::string& message);

    static void log_rebalance(const std::string& asset, const std::string& urgency,
                              double deviation_percent);

    static void log_state_change(const std::string& from, const std::string& to,
                                 const std::string& message);
};

// RAII logging scope for performance measurement
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& operation_name);
    ~ScopedTimer();

private:
    std::string operation_name_;
    std::chrono::steady_clock::time_point start_time_;
};

// Macros for convenient logging
#define ATX_LOG_TRACE(...) atx::utils::Logger::trace(__VA_ARGS__)
#define ATX_LOG_DEBUG(...) atx::utils::Logger::debug(__VA_ARGS__)
#define ATX_LOG_INFO(...) atx::utils::Logger::info(__VA_ARGS__)
#define ATX_LOG_WARN(...) atx::utils::Logger::warn(__VA_ARGS__)
#define ATX_LOG_ERROR(...) atx::utils::Logger::error(__VA_ARGS__)
#define ATX_LOG_CRITICAL(...) atx::utils::Logger::critical(__VA_ARGS__)

#define ATX_SCOPED_TIMER(name) atx::utils::ScopedTimer atx_scoped_timer_(name)

} // namespace utils
} // namespace atx
