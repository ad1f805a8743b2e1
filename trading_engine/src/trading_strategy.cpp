#include "trading_strategy.hpp"

namespace atx {
namespace trading_engine {

std::vector<std::string> TradingStrategy::validate() const {
    std::vector<std::string> errors;

    if (name.empty()) {
        errors.push_back("strategy name is empty");
    }
    if (entry.min_spread_percent < 0.0) {
        errors.push_back("entry.min_spread_percent must not be negative");
    }
    if (entry.max_spread_percent <= entry.min_spread_percent) {
        errors.push_back("entry.max_spread_percent must exceed entry.min_spread_percent");
    }
    if (entry.min_volume_24h < 0.0) {
        errors.push_back("entry.min_volume_24h must not be negative");
    }
    if (entry.spread_confirmation_seconds < 0 || entry.required_confirmations < 0) {
        errors.push_back("entry confirmation settings must not be negative");
    }
    if (entry.check_orderbook_depth && entry.orderbook_levels <= 0) {
        errors.push_back("entry.orderbook_levels must be positive");
    }
    if (exit.take_profit_percent <= 0.0 || exit.stop_loss_percent <= 0.0) {
        errors.push_back("exit take profit and stop loss must be positive");
    }
    if (risk.max_position_size <= 0.0) {
        errors.push_back("risk.max_position_size must be positive");
    }
    if (risk.max_balance_percent_per_trade <= 0.0 || risk.max_balance_percent_per_trade > 100.0) {
        errors.push_back("risk.max_balance_percent_per_trade must be in (0, 100]");
    }
    if (risk.max_consecutive_losses <= 0) {
        errors.push_back("risk.max_consecutive_losses must be positive");
    }
    if (risk.max_open_positions <= 0) {
        errors.push_back("risk.max_open_positions must be positive");
    }
    if (risk.max_drawdown_percent <= 0.0 || risk.max_drawdown_percent > 100.0) {
        errors.push_back("risk.max_drawdown_percent must be in (0, 100]");
    }
    if (advanced.max_slippage_percent < 0.0) {
        errors.push_back("advanced.max_slippage_percent must not be negative");
    }
    if (advanced.order_timeout_seconds <= 0) {
        errors.push_back("advanced.order_timeout_seconds must be positive");
    }
    if (advanced.max_retries < 0) {
        errors.push_back("advanced.max_retries must not be negative");
    }
    if (advanced.split_large_orders && advanced.max_single_order_size <= 0.0) {
        errors.push_back("advanced.max_single_order_size must be positive");
    }

    return errors;
}

void to_json(nlohmann::json& j, const EntryRules& rules) {
    j = nlohmann::json{
        {"min_spread_percent", rules.min_spread_percent},
        {"max_spread_percent", rules.max_spread_percent},
        {"min_volume_24h", rules.min_volume_24h},
        {"spread_confirmation_seconds", rules.spread_confirmation_seconds},
        {"required_confirmations", rules.required_confirmations},
        {"check_momentum", rules.check_momentum},
        {"momentum_period_minutes", rules.momentum_period_minutes},
        {"avoid_high_volatility", rules.avoid_high_volatility},
        {"max_volatility_percent", rules.max_volatility_percent},
        {"check_orderbook_depth", rules.check_orderbook_depth},
        {"min_orderbook_depth", rules.min_orderbook_depth},
        {"orderbook_levels", rules.orderbook_levels}
    };
}

void from_json(const nlohmann::json& j, EntryRules& rules) {
    EntryRules defaults;
    rules.min_spread_percent = j.value("min_spread_percent", defaults.min_spread_percent);
    rules.max_spread_percent = j.value("max_spread_percent", defaults.max_spread_percent);
    rules.min_volume_24h = j.value("min_volume_24h", defaults.min_volume_24h);
    rules.spread_confirmation_seconds = j.value("spread_confirmation_seconds", defaults.spread_confirmation_seconds);
    rules.required_confirmations = j.value("required_confirmations", defaults.required_confirmations);
    rules.check_momentum = j.value("check_momentum", defaults.check_momentum);
    rules.momentum_period_minutes = j.value("momentum_period_minutes", defaults.momentum_period_minutes);
    rules.avoid_high_volatility = j.value("avoid_high_volatility", defaults.avoid_high_volatility);
    rules.max_volatility_percent = j.value("max_volatility_percent", defaults.max_volatility_percent);
    rules.check_orderbook_depth = j.value("check_orderbook_depth", defaults.check_orderbook_depth);
    rules.min_orderbook_depth = j.value("min_orderbook_depth", defaults.min_orderbook_depth);
    rules.orderbook_levels = j.value("orderbook_levels", defaults.orderbook_levels);
}

void to_json(nlohmann::json& j, const ExitRules& rules) {
    j = nlohmann::json{
        {"take_profit_percent", rules.take_profit_percent},
        {"stop_loss_percent", rules.stop_loss_percent},
        {"use_trailing_stop", rules.use_trailing_stop},
        {"trailing_stop_activation_percent", rules.trailing_stop_activation_percent},
        {"trailing_stop_distance_percent", rules.trailing_stop_distance_percent},
        {"max_hold_time_minutes", rules.max_hold_time_minutes}
    };
}

void from_json(const nlohmann::json& j, ExitRules& rules) {
    ExitRules defaults;
    rules.take_profit_percent = j.value("take_profit_percent", defaults.take_profit_percent);
    rules.stop_loss_percent = j.value("stop_loss_percent", defaults.stop_loss_percent);
    rules.use_trailing_stop = j.value("use_trailing_stop", defaults.use_trailing_stop);
    rules.trailing_stop_activation_percent =
        j.value("trailing_stop_activation_percent", defaults.trailing_stop_activation_percent);
    rules.trailing_stop_distance_percent =
        j.value("trailing_stop_distance_percent", defaults.trailing_stop_distance_percent);
    rules.max_hold_time_minutes = j.value("max_hold_time_minutes", defaults.max_hold_time_minutes);
}

void to_json(nlohmann::json& j, const RiskRules& rules) {
    j = nlohmann::json{
        {"max_position_size", rules.max_position_size},
        {"max_balance_percent_per_trade", rules.max_balance_percent_per_trade},
        {"max_daily_loss", rules.max_daily_loss},
        {"max_consecutive_losses", rules.max_consecutive_losses},
        {"pause_after_losses_minutes", rules.pause_after_losses_minutes},
        {"max_open_positions", rules.max_open_positions},
        {"max_trades_per_hour", rules.max_trades_per_hour},
        {"min_seconds_between_trades", rules.min_seconds_between_trades},
        {"enable_drawdown_protection", rules.enable_drawdown_protection},
        {"max_drawdown_percent", rules.max_drawdown_percent}
    };
}

void from_json(const nlohmann::json& j, RiskRules& rules) {
    RiskRules defaults;
    rules.max_position_size = j.value("max_position_size", defaults.max_position_size);
    rules.max_balance_percent_per_trade =
        j.value("max_balance_percent_per_trade", defaults.max_balance_percent_per_trade);
    rules.max_daily_loss = j.value("max_daily_loss", defaults.max_daily_loss);
    rules.max_consecutive_losses = j.value("max_consecutive_losses", defaults.max_consecutive_losses);
    rules.pause_after_losses_minutes = j.value("pause_after_losses_minutes", defaults.pause_after_losses_minutes);
    rules.max_open_positions = j.value("max_open_positions", defaults.max_open_positions);
    rules.max_trades_per_hour = j.value("max_trades_per_hour", defaults.max_trades_per_hour);
    rules.min_seconds_between_trades = j.value("min_seconds_between_trades", defaults.min_seconds_between_trades);
    rules.enable_drawdown_protection = j.value("enable_drawdown_protection", defaults.enable_drawdown_protection);
    rules.max_drawdown_percent = j.value("max_drawdown_percent", defaults.max_drawdown_percent);
}

void to_json(nlohmann::json& j, const AdvancedRules& rules) {
    j = nlohmann::json{
        {"use_slippage_protection", rules.use_slippage_protection},
        {"max_slippage_percent", rules.max_slippage_percent},
        {"use_limit_orders", rules.use_limit_orders},
        {"limit_order_offset_percent", rules.limit_order_offset_percent},
        {"order_timeout_seconds", rules.order_timeout_seconds},
        {"retry_failed_orders", rules.retry_failed_orders},
        {"max_retries", rules.max_retries},
        {"split_large_orders", rules.split_large_orders},
        {"max_single_order_size", rules.max_single_order_size},
        {"enable_fee_optimization", rules.enable_fee_optimization},
        {"prefer_lower_fee_exchange", rules.prefer_lower_fee_exchange}
    };
}

void from_json(const nlohmann::json& j, AdvancedRules& rules) {
    AdvancedRules defaults;
    rules.use_slippage_protection = j.value("use_slippage_protection", defaults.use_slippage_protection);
    rules.max_slippage_percent = j.value("max_slippage_percent", defaults.max_slippage_percent);
    rules.use_limit_orders = j.value("use_limit_orders", defaults.use_limit_orders);
    rules.limit_order_offset_percent = j.value("limit_order_offset_percent", defaults.limit_order_offset_percent);
    rules.order_timeout_seconds = j.value("order_timeout_seconds", defaults.order_timeout_seconds);
    rules.retry_failed_orders = j.value("retry_failed_orders", defaults.retry_failed_orders);
    rules.max_retries = j.value("max_retries", defaults.max_retries);
    rules.split_large_orders = j.value("split_large_orders", defaults.split_large_orders);
    rules.max_single_order_size = j.value("max_single_order_size", defaults.max_single_order_size);
    rules.enable_fee_optimization = j.value("enable_fee_optimization", defaults.enable_fee_optimization);
    rules.prefer_lower_fee_exchange = j.value("prefer_lower_fee_exchange", defaults.prefer_lower_fee_exchange);
}

void to_json(nlohmann::json& j, const TradingStrategy& strategy) {
    j = nlohmann::json{
        {"name", strategy.name},
        {"version", strategy.version},
        {"description", strategy.description},
        {"entry", strategy.entry},
        {"exit", strategy.exit},
        {"risk", strategy.risk},
        {"advanced", strategy.advanced}
    };
}

void from_json(const nlohmann::json& j, TradingStrategy& strategy) {
    TradingStrategy defaults;
    strategy.name = j.value("name", defaults.name);
    strategy.version = j.value("version", defaults.version);
    strategy.description = j.value("description", defaults.description);
    strategy.entry = j.value("entry", EntryRules());
    strategy.exit = j.value("exit", ExitRules());
    strategy.risk = j.value("risk", RiskRules());
    strategy.advanced = j.value("advanced", AdvancedRules());
}

} // namespace trading_engine
} // namespace atx
