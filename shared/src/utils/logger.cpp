#include "utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <vector>

namespace atx {
namespace utils {

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;
LogLevel Logger::current_level_ = LogLevel::INFO;

LogLevel parse_log_level(const std::string& level) {
    std::string upper(level);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return LogLevel::TRACE;
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "CRITICAL") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

void Logger::initialize(const std::string& log_file_path, LogLevel level,
                       size_t max_file_size, size_t max_files) {
    try {
        std::filesystem::path log_path(log_file_path);
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(to_spdlog_level(level));
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file_path, max_file_size, max_files);
        file_sink->set_level(to_spdlog_level(level));
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        auto logger = std::make_shared<spdlog::logger>("atx", sinks.begin(), sinks.end());
        logger->set_level(to_spdlog_level(level));
        logger->flush_on(spdlog::level::warn);

        // Re-initialisation replaces the previous registration
        spdlog::drop("atx");
        spdlog::register_logger(logger);
        spdlog::set_default_logger(logger);
        spdlog::flush_every(std::chrono::seconds(3));

        current_level_ = level;
        std::atomic_store(&logger_, logger);

        Logger::info("Logger initialized, writing to {}", log_file_path);
    } catch (const std::exception& e) {
        std::cerr << "Logger initialization failed: " << e.what() << std::endl;
        throw;
    }
}

void Logger::shutdown() {
    auto logger = std::atomic_exchange(&logger_, std::shared_ptr<spdlog::logger>());
    if (logger) {
        logger->flush();
        spdlog::shutdown();
    }
}

void Logger::trace(const std::string& msg) {
    if (auto logger = std::atomic_load(&logger_)) logger->trace(msg);
}

void Logger::debug(const std::string& msg) {
    if (auto logger = std::atomic_load(&logger_)) logger->debug(msg);
}

void Logger::info(const std::string& msg) {
    if (auto logger = std::atomic_load(&logger_)) logger->info(msg);
}

void Logger::warn(const std::string& msg) {
    if (auto logger = std::atomic_load(&logger_)) logger->warn(msg);
}

void Logger::error(const std::string& msg) {
    if (auto logger = std::atomic_load(&logger_)) logger->error(msg);
}

void Logger::critical(const std::string& msg) {
    if (auto logger = std::atomic_load(&logger_)) logger->critical(msg);
}

void Logger::set_level(LogLevel level) {
    current_level_ = level;
    if (auto logger = std::atomic_load(&logger_)) {
        logger->set_level(to_spdlog_level(level));
        for (auto& sink : logger->sinks()) {
            sink->set_level(to_spdlog_level(level));
        }
    }
}

LogLevel Logger::get_level() {
    return current_level_;
}

bool Logger::is_enabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(current_level_);
}

bool Logger::is_initialized() {
    return std::atomic_load(&logger_) != nullptr;
}

spdlog::level::level_enum Logger::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        default: return spdlog::level::info;
    }
}

// TradingLogger implementation
void TradingLogger::log_opportunity(const std::string& symbol,
                                    const std::string& buy_exchange,
                                    const std::string& sell_exchange,
                                    double buy_price, double sell_price,
                                    double net_spread_percent, double expected_profit) {
    Logger::info("OPPORTUNITY | Symbol: {} | Buy: {}@{} | Sell: {}@{} | NetSpread: {:.4f}% | Profit: {:.6f}",
                 symbol, buy_exchange, buy_price, sell_exchange, sell_price,
                 net_spread_percent, expected_profit);
}

void TradingLogger::log_leg_submitted(const std::string& trade_id, const std::string& exchange,
                                      const std::string& symbol, const std::string& side,
                                      const std::string& order_id, double quantity, double price) {
    Logger::info("LEG_SUBMITTED | TradeID: {} | Exchange: {} | Symbol: {} | Side: {} | OrderID: {} | Qty: {} | Price: {}",
                 trade_id, exchange, symbol, side, order_id, quantity, price);
}

void TradingLogger::log_leg_finished(const std::string& trade_id, const std::string& exchange,
                                     const std::string& order_id, const std::string& status,
                                     double filled_quantity, double avg_price) {
    Logger::info("LEG_FINISHED | TradeID: {} | Exchange: {} | OrderID: {} | Status: {} | FilledQty: {} | AvgPrice: {}",
                 trade_id, exchange, order_id, status, filled_quantity, avg_price);
}

void TradingLogger::log_trade_result(const std::string& trade_id, const std::string& symbol,
                                     const std::string& status, double net_pnl, double total_fees,
                                     long long duration_ms) {
    Logger::info("TRADE_RESULT | TradeID: {} | Symbol: {} | Status: {} | NetPnL: {:.6f} | Fees: {:.6f} | Duration: {}ms",
                 trade_id, symbol, status, net_pnl, total_fees, duration_ms);
}

void TradingLogger::log_partial_failure(const std::string& trade_id, const std::string& symbol,
                                        const std::string& exchange, double held_quantity,
                                        const std::string& reason) {
    Logger::critical("PARTIAL_FAILURE | TradeID: {} | Symbol: {} | HeldOn: {} | HeldQty: {} | Reason: {}",
                     trade_id, symbol, exchange, held_quantity, reason);
}

void TradingLogger::log_emergency(const std::string& reason, const std::string& action,
                                  const std::string& message) {
    Logger::critical("EMERGENCY | Reason: {} | Action: {} | {}", reason, action, message);
}

void TradingLogger::log_rebalance(const std::string& asset, const std::string& urgency,
                                  double deviation_percent) {
    Logger::warn("REBALANCE | Asset: {} | Urgency: {} | Deviation: {:.2f}%",
                 asset, urgency, deviation_percent);
}

void TradingLogger::log_state_change(const std::string& from, const std::string& to,
                                     const std::string& message) {
    Logger::info("ENGINE_STATE | {} -> {} | {}", from, to, message);
}

ScopedTimer::ScopedTimer(const std::string& operation_name)
    : operation_name_(operation_name), start_time_(std::chrono::steady_clock::now()) {
}

ScopedTimer::~ScopedTimer() {
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_time_);
    Logger::debug("TIMER | Operation: {} | Duration: {} us", operation_name_, duration.count());
}

} // namespace utils
} // namespace atx
