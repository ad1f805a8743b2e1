#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace atx {
namespace trading_engine {

struct EntryRules {
    double min_spread_percent;
    double max_spread_percent;        // wider spreads are treated as bad quotes
    double min_volume_24h;            // quote currency, both legs
    int spread_confirmation_seconds;
    int required_confirmations;       // 1 or less disables confirmation
    bool check_momentum;
    int momentum_period_minutes;
    bool avoid_high_volatility;
    double max_volatility_percent;
    bool check_orderbook_depth;
    double min_orderbook_depth;       // quote value within orderbook_levels
    int orderbook_levels;

    EntryRules()
        : min_spread_percent(0.15), max_spread_percent(5.0), min_volume_24h(100000.0),
          spread_confirmation_seconds(3), required_confirmations(2),
          check_momentum(false), momentum_period_minutes(5),
          avoid_high_volatility(false), max_volatility_percent(2.0),
          check_orderbook_depth(false), min_orderbook_depth(10000.0), orderbook_levels(5) {}
};

struct ExitRules {
    double take_profit_percent;
    double stop_loss_percent;
    bool use_trailing_stop;
    double trailing_stop_activation_percent;
    double trailing_stop_distance_percent;
    int max_hold_time_minutes;

    ExitRules()
        : take_profit_percent(0.5), stop_loss_percent(0.3), use_trailing_stop(false),
          trailing_stop_activation_percent(0.3), trailing_stop_distance_percent(0.1),
          max_hold_time_minutes(30) {}
};

struct RiskRules {
    double max_position_size;             // quote currency per trade
    double max_balance_percent_per_trade;
    double max_daily_loss;
    int max_consecutive_losses;
    int pause_after_losses_minutes;
    int max_open_positions;
    int max_trades_per_hour;
    int min_seconds_between_trades;
    bool enable_drawdown_protection;
    double max_drawdown_percent;

    RiskRules()
        : max_position_size(1000.0), max_balance_percent_per_trade(10.0), max_daily_loss(100.0),
          max_consecutive_losses(3), pause_after_losses_minutes(30), max_open_positions(3),
          max_trades_per_hour(10), min_seconds_between_trades(30),
          enable_drawdown_protection(true), max_drawdown_percent(5.0) {}
};

struct AdvancedRules {
    bool use_slippage_protection;
    double max_slippage_percent;
    bool use_limit_orders;
    double limit_order_offset_percent;
    int order_timeout_seconds;
    bool retry_failed_orders;
    int max_retries;
    bool split_large_orders;
    double max_single_order_size;         // quote currency
    bool enable_fee_optimization;
    bool prefer_lower_fee_exchange;

    AdvancedRules()
        : use_slippage_protection(true), max_slippage_percent(0.1), use_limit_orders(true),
          limit_order_offset_percent(0.02), order_timeout_seconds(10), retry_failed_orders(true),
          max_retries(2), split_large_orders(false), max_single_order_size(500.0),
          enable_fee_optimization(true), prefer_lower_fee_exchange(true) {}
};

struct TradingStrategy {
    std::string name;
    std::string version;
    std::string description;
    EntryRules entry;
    ExitRules exit;
    RiskRules risk;
    AdvancedRules advanced;

    TradingStrategy() : name("default"), version("1.0") {}

    // Empty when the bundle is usable
    std::vector<std::string> validate() const;

    // Slippage allowance used by the detector, 0 when protection is off
    double slippage_allowance_percent() const {
        return advanced.use_slippage_protection ? advanced.max_slippage_percent : 0.0;
    }
};

void to_json(nlohmann::json& j, const EntryRules& rules);
void from_json(const nlohmann::json& j, EntryRules& rules);
void to_json(nlohmann::json& j, const ExitRules& rules);
void from_json(const nlohmann::json& j, ExitRules& rules);
void to_json(nlohmann::json& j, const RiskRules& rules);
void from_json(const nlohmann::json& j, RiskRules& rules);
void to_json(nlohmann::json& j, const AdvancedRules& rules);
void from_json(const nlohmann::json& j, AdvancedRules& rules);
void to_json(nlohmann::json& j, const TradingStrategy& strategy);
void from_json(const nlohmann::json& j, TradingStrategy& strategy);

} // namespace trading_engine
} // namespace atx
