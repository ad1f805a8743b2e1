#include "engine_settings.hpp"

namespace atx {
namespace trading_engine {

void to_json(nlohmann::json& j, const EngineConfig& config) {
    j = nlohmann::json{
        {"polling_interval_ms", config.polling_interval_ms},
        {"detection_window_ms", config.detection_window_ms},
        {"max_ticker_age_ms", config.max_ticker_age_ms},
        {"ticker_timeout_ms", config.ticker_timeout_ms},
        {"balance_refresh_interval_ms", config.balance_refresh_interval_ms},
        {"order_poll_interval_ms", config.order_poll_interval_ms},
        {"shutdown_grace_timeout_ms", config.shutdown_grace_timeout_ms},
        {"execution_workers", config.execution_workers},
        {"io_threads", config.io_threads},
        {"order_book_depth", config.order_book_depth},
        {"history_capacity", config.history_capacity},
        {"quote_currency", config.quote_currency},
        {"dry_run", config.dry_run}
    };
}

void from_json(const nlohmann::json& j, EngineConfig& config) {
    EngineConfig defaults;
    config.polling_interval_ms = j.value("polling_interval_ms", defaults.polling_interval_ms);
    config.detection_window_ms = j.value("detection_window_ms", defaults.detection_window_ms);
    config.max_ticker_age_ms = j.value("max_ticker_age_ms", defaults.max_ticker_age_ms);
    config.ticker_timeout_ms = j.value("ticker_timeout_ms", defaults.ticker_timeout_ms);
    config.balance_refresh_interval_ms = j.value("balance_refresh_interval_ms", defaults.balance_refresh_interval_ms);
    config.order_poll_interval_ms = j.value("order_poll_interval_ms", defaults.order_poll_interval_ms);
    config.shutdown_grace_timeout_ms = j.value("shutdown_grace_timeout_ms", defaults.shutdown_grace_timeout_ms);
    config.execution_workers = j.value("execution_workers", defaults.execution_workers);
    config.io_threads = j.value("io_threads", defaults.io_threads);
    config.order_book_depth = j.value("order_book_depth", defaults.order_book_depth);
    config.history_capacity = j.value("history_capacity", defaults.history_capacity);
    config.quote_currency = j.value("quote_currency", defaults.quote_currency);
    config.dry_run = j.value("dry_run", defaults.dry_run);
}

EngineSettings EngineSettings::from_config(const config::ConfigManager& config) {
    EngineSettings settings;

    auto engine_section = config.get_section("engine");
    if (engine_section.is_object()) {
        settings.engine = engine_section.get<EngineConfig>();
    }

    auto strategy_section = config.get_section("strategy");
    if (strategy_section.is_object()) {
        settings.strategy = strategy_section.get<TradingStrategy>();
    }

    settings.exchange_a = config.get_exchange_config("a");
    settings.exchange_b = config.get_exchange_config("b");
    settings.risk = config.get_risk_config();
    settings.pairs = config.get_trading_pairs();
    return settings;
}

void EngineSettings::apply_to(config::ConfigManager& config) const {
    config.set_section("engine", engine);
    config.set_section("strategy", strategy);
    config.set_exchange_config("a", exchange_a);
    config.set_exchange_config("b", exchange_b);
    config.set_risk_config(risk);
    config.set_trading_pairs(pairs);
}

std::vector<std::string> EngineSettings::validate() const {
    std::vector<std::string> errors = strategy.validate();

    if (exchange_a.name.empty() || exchange_b.name.empty()) {
        errors.push_back("both exchange legs must be named");
    } else if (exchange_a.name == exchange_b.name) {
        errors.push_back("exchange legs must be distinct");
    }
    if (engine.polling_interval_ms <= 0) {
        errors.push_back("engine.polling_interval_ms must be positive");
    }
    if (engine.detection_window_ms <= 0 || engine.max_ticker_age_ms <= 0) {
        errors.push_back("engine staleness windows must be positive");
    }
    if (engine.ticker_timeout_ms <= 0) {
        errors.push_back("engine.ticker_timeout_ms must be positive");
    }
    if (engine.execution_workers <= 0 || engine.io_threads <= 0) {
        errors.push_back("engine thread counts must be positive");
    }
    if (engine.history_capacity == 0) {
        errors.push_back("engine.history_capacity must be positive");
    }
    for (const auto& pair : pairs) {
        if (!pair.has_distinct_legs()) {
            errors.push_back("trading pair " + pair.symbol + " needs two distinct exchanges");
        }
    }

    return errors;
}

} // namespace trading_engine
} // namespace atx
