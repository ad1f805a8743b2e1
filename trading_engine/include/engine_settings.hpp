#pragma once

#include "config/config_manager.hpp"
#include "trading_strategy.hpp"
#include "types/common_types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace atx {
namespace trading_engine {

// "engine" configuration section
struct EngineConfig {
    int polling_interval_ms;
    int detection_window_ms;          // both legs must be refreshed within this window
    int max_ticker_age_ms;
    int ticker_timeout_ms;            // per exchange call
    int balance_refresh_interval_ms;
    int order_poll_interval_ms;
    int shutdown_grace_timeout_ms;
    int execution_workers;
    int io_threads;
    int order_book_depth;
    size_t history_capacity;
    std::string quote_currency;
    bool dry_run;                     // detect and publish only

    EngineConfig()
        : polling_interval_ms(1000), detection_window_ms(2000), max_ticker_age_ms(5000),
          ticker_timeout_ms(3000), balance_refresh_interval_ms(10000), order_poll_interval_ms(200),
          shutdown_grace_timeout_ms(15000), execution_workers(4), io_threads(8),
          order_book_depth(10), history_capacity(1000), quote_currency("USDT"), dry_run(false) {}
};

void to_json(nlohmann::json& j, const EngineConfig& config);
void from_json(const nlohmann::json& j, EngineConfig& config);

// Everything the engine needs for one run, resolved from ConfigManager
struct EngineSettings {
    EngineConfig engine;
    types::ExchangeConfig exchange_a;
    types::ExchangeConfig exchange_b;
    types::RiskConfig risk;
    TradingStrategy strategy;
    std::vector<types::TradingPair> pairs;

    static EngineSettings from_config(const config::ConfigManager& config);
    void apply_to(config::ConfigManager& config) const;

    std::vector<std::string> validate() const;
};

} // namespace trading_engine
} // namespace atx
