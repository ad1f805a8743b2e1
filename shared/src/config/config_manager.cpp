#include "config/config_manager.hpp"
#include <cstdlib>
#include <fstream>
#include <set>

namespace atx {
namespace types {

void to_json(nlohmann::json& j, const ExchangeConfig& config) {
    j = nlohmann::json{
        {"name", config.name},
        {"api_key", config.api_key},
        {"secret_key", config.secret_key},
        {"taker_fee_percent", config.taker_fee_percent},
        {"maker_fee_percent", config.maker_fee_percent},
        {"timeout_ms", config.timeout_ms},
        {"sandbox_mode", config.sandbox_mode},
        {"parameters", config.parameters}
    };
}

void from_json(const nlohmann::json& j, ExchangeConfig& config) {
    ExchangeConfig defaults;
    config.name = j.value("name", defaults.name);
    config.api_key = j.value("api_key", defaults.api_key);
    config.secret_key = j.value("secret_key", defaults.secret_key);
    config.taker_fee_percent = j.value("taker_fee_percent", defaults.taker_fee_percent);
    config.maker_fee_percent = j.value("maker_fee_percent", defaults.maker_fee_percent);
    config.timeout_ms = j.value("timeout_ms", defaults.timeout_ms);
    config.sandbox_mode = j.value("sandbox_mode", defaults.sandbox_mode);
    config.parameters = j.value("parameters", defaults.parameters);
}

void to_json(nlohmann::json& j, const RiskConfig& config) {
    j = nlohmann::json{
        {"rapid_loss_min_trades", config.rapid_loss_min_trades},
        {"rapid_loss_window_seconds", config.rapid_loss_window_seconds},
        {"rapid_loss_threshold_percent", config.rapid_loss_threshold_percent},
        {"critical_imbalance_threshold", config.critical_imbalance_threshold},
        {"rebalance_threshold_percent", config.rebalance_threshold_percent},
        {"imbalance_min_value", config.imbalance_min_value}
    };
}

void from_json(const nlohmann::json& j, RiskConfig& config) {
    RiskConfig defaults;
    config.rapid_loss_min_trades = j.value("rapid_loss_min_trades", defaults.rapid_loss_min_trades);
    config.rapid_loss_window_seconds = j.value("rapid_loss_window_seconds", defaults.rapid_loss_window_seconds);
    config.rapid_loss_threshold_percent = j.value("rapid_loss_threshold_percent", defaults.rapid_loss_threshold_percent);
    config.critical_imbalance_threshold = j.value("critical_imbalance_threshold", defaults.critical_imbalance_threshold);
    config.rebalance_threshold_percent = j.value("rebalance_threshold_percent", defaults.rebalance_threshold_percent);
    config.imbalance_min_value = j.value("imbalance_min_value", defaults.imbalance_min_value);
}

void to_json(nlohmann::json& j, const TradingPair& pair) {
    j = nlohmann::json{
        {"symbol", pair.symbol},
        {"base_currency", pair.base_currency},
        {"quote_currency", pair.quote_currency},
        {"exchange_a", pair.exchange_a},
        {"exchange_b", pair.exchange_b},
        {"symbol_a", pair.symbol_a},
        {"symbol_b", pair.symbol_b},
        {"trade_amount", pair.trade_amount},
        {"quantity_precision", pair.quantity_precision},
        {"min_order_size", pair.min_order_size},
        {"enabled", pair.enabled}
    };
}

void from_json(const nlohmann::json& j, TradingPair& pair) {
    pair = TradingPair::from_symbol(j.value("symbol", std::string()),
                                    j.value("exchange_a", std::string()),
                                    j.value("exchange_b", std::string()));
    pair.base_currency = j.value("base_currency", pair.base_currency);
    pair.quote_currency = j.value("quote_currency", pair.quote_currency);
    pair.symbol_a = j.value("symbol_a", pair.symbol_a);
    pair.symbol_b = j.value("symbol_b", pair.symbol_b);
    pair.trade_amount = j.value("trade_amount", pair.trade_amount);
    pair.quantity_precision = j.value("quantity_precision", pair.quantity_precision);
    pair.min_order_size = j.value("min_order_size", pair.min_order_size);
    pair.enabled = j.value("enabled", pair.enabled);
}

} // namespace types

namespace config {

namespace {

// env var -> dotted config key
const std::unordered_map<std::string, std::string> ENV_VAR_MAPPINGS = {
    {"ATX_EXCHANGE_A_API_KEY", "exchanges.a.api_key"},
    {"ATX_EXCHANGE_A_SECRET_KEY", "exchanges.a.secret_key"},
    {"ATX_EXCHANGE_B_API_KEY", "exchanges.b.api_key"},
    {"ATX_EXCHANGE_B_SECRET_KEY", "exchanges.b.secret_key"},
    {"ATX_LOG_LEVEL", "monitoring.log_level"},
    {"ATX_LOG_FILE", "monitoring.log_file_path"}
};

} // namespace

ConfigManager::ConfigManager() : config_json_(nlohmann::json::object()) {}

ConfigManager::~ConfigManager() = default;

ConfigManager::ConfigManager(const ConfigManager& other) {
    std::lock_guard<std::mutex> lock(other.config_mutex_);
    config_json_ = other.config_json_;
    config_file_path_ = other.config_file_path_;
}

ConfigManager& ConfigManager::operator=(const ConfigManager& other) {
    if (this != &other) {
        std::scoped_lock lock(config_mutex_, other.config_mutex_);
        config_json_ = other.config_json_;
        config_file_path_ = other.config_file_path_;
    }
    return *this;
}

bool ConfigManager::load_config(const std::string& config_file_path) {
    std::ifstream file(config_file_path);
    if (!file.is_open()) {
        utils::Logger::error("Cannot open config file: {}", config_file_path);
        return false;
    }

    try {
        nlohmann::json parsed = nlohmann::json::parse(file);
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            config_json_ = std::move(parsed);
            config_file_path_ = config_file_path;
        }
        utils::Logger::info("Loaded configuration from {}", config_file_path);
        return true;
    } catch (const nlohmann::json::exception& e) {
        utils::Logger::error("Failed to parse config file {}: {}", config_file_path, e.what());
        return false;
    }
}

bool ConfigManager::load_from_string(const std::string& json_text) {
    try {
        nlohmann::json parsed = nlohmann::json::parse(json_text);
        if (!parsed.is_object()) {
            utils::Logger::error("Configuration root must be a JSON object");
            return false;
        }
        std::lock_guard<std::mutex> lock(config_mutex_);
        config_json_ = std::move(parsed);
        return true;
    } catch (const nlohmann::json::exception& e) {
        utils::Logger::error("Failed to parse configuration: {}", e.what());
        return false;
    }
}

bool ConfigManager::save_config(const std::string& config_file_path) const {
    std::ofstream file(config_file_path);
    if (!file.is_open()) {
        utils::Logger::error("Cannot write config file: {}", config_file_path);
        return false;
    }

    std::lock_guard<std::mutex> lock(config_mutex_);
    file << config_json_.dump(4);
    return file.good();
}

bool ConfigManager::reload_config() {
    std::string path;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        path = config_file_path_;
    }

    if (path.empty()) {
        utils::Logger::warn("No config file loaded, nothing to reload");
        return false;
    }

    if (!load_config(path)) {
        return false;
    }

    std::vector<std::string> sections;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        for (const auto& [section, callback] : change_callbacks_) {
            sections.push_back(section);
        }
    }
    for (const auto& section : sections) {
        notify_config_change(section);
    }
    return true;
}

types::ExchangeConfig ConfigManager::get_exchange_config(const std::string& role) const {
    auto section = get_section("exchanges." + role);
    if (section.is_null()) {
        return types::ExchangeConfig{};
    }
    return section.get<types::ExchangeConfig>();
}

void ConfigManager::set_exchange_config(const std::string& role, const types::ExchangeConfig& config) {
    set_section("exchanges." + role, nlohmann::json(config));
}

types::RiskConfig ConfigManager::get_risk_config() const {
    auto section = get_section("risk");
    if (section.is_null()) {
        return types::RiskConfig{};
    }
    return section.get<types::RiskConfig>();
}

void ConfigManager::set_risk_config(const types::RiskConfig& config) {
    set_section("risk", nlohmann::json(config));
}

std::vector<types::TradingPair> ConfigManager::get_trading_pairs() const {
    std::vector<types::TradingPair> pairs;
    auto section = get_section("trading_pairs");
    if (!section.is_array()) {
        return pairs;
    }

    auto default_a = get_value<std::string>("exchanges.a.name", "");
    auto default_b = get_value<std::string>("exchanges.b.name", "");

    for (const auto& entry : section) {
        auto pair = entry.get<types::TradingPair>();
        if (pair.exchange_a.empty()) {
            pair.exchange_a = default_a;
        }
        if (pair.exchange_b.empty()) {
            pair.exchange_b = default_b;
        }
        pairs.push_back(pair);
    }
    return pairs;
}

void ConfigManager::set_trading_pairs(const std::vector<types::TradingPair>& pairs) {
    set_section("trading_pairs", nlohmann::json(pairs));
}

MonitoringConfig ConfigManager::get_monitoring_config() const {
    MonitoringConfig config;
    config.log_level = get_value<std::string>("monitoring.log_level", config.log_level);
    config.log_file_path = get_value<std::string>("monitoring.log_file_path", config.log_file_path);
    config.log_max_file_size = get_value<size_t>("monitoring.log_max_file_size", config.log_max_file_size);
    config.log_max_files = get_value<size_t>("monitoring.log_max_files", config.log_max_files);
    return config;
}

void ConfigManager::set_monitoring_config(const MonitoringConfig& config) {
    set_section("monitoring", nlohmann::json{
        {"log_level", config.log_level},
        {"log_file_path", config.log_file_path},
        {"log_max_file_size", config.log_max_file_size},
        {"log_max_files", config.log_max_files}
    });
}

nlohmann::json ConfigManager::get_section(const std::string& key) const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    const nlohmann::json* node = find_node(key);
    return node != nullptr ? *node : nlohmann::json();
}

void ConfigManager::set_section(const std::string& key, const nlohmann::json& value) {
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        ensure_node(key) = value;
    }
    notify_config_change(split_key(key).front());
}

bool ConfigManager::has_value(const std::string& key) const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return find_node(key) != nullptr;
}

std::string ConfigManager::get_env_var(const std::string& var_name, const std::string& default_value) const {
    const char* value = std::getenv(var_name.c_str());
    return value ? std::string(value) : default_value;
}

void ConfigManager::load_env_overrides() {
    for (const auto& [env_var, key] : ENV_VAR_MAPPINGS) {
        std::string value = get_env_var(env_var);
        if (!value.empty()) {
            set_value<std::string>(key, value);
            utils::Logger::info("Config key {} overridden from environment", key);
        }
    }
}

bool ConfigManager::validate_config() const {
    return get_validation_errors().empty();
}

std::vector<std::string> ConfigManager::get_validation_errors() const {
    std::vector<std::string> errors;

    auto exchange_a = get_exchange_config("a");
    auto exchange_b = get_exchange_config("b");
    if (exchange_a.name.empty()) {
        errors.push_back("exchanges.a.name is required");
    }
    if (exchange_b.name.empty()) {
        errors.push_back("exchanges.b.name is required");
    }
    if (!exchange_a.name.empty() && exchange_a.name == exchange_b.name) {
        errors.push_back("exchanges.a and exchanges.b must name different exchanges");
    }
    for (const auto* exchange : {&exchange_a, &exchange_b}) {
        if (exchange->taker_fee_percent < 0.0 || exchange->maker_fee_percent < 0.0) {
            errors.push_back("fee percentages for " + exchange->name + " must not be negative");
        }
        if (exchange->timeout_ms <= 0) {
            errors.push_back("timeout_ms for " + exchange->name + " must be positive");
        }
    }

    std::set<std::string> symbols;
    for (const auto& pair : get_trading_pairs()) {
        if (pair.symbol.empty() || pair.quote_currency.empty()) {
            errors.push_back("trading pair symbols must have the form BASE/QUOTE");
            continue;
        }
        if (!pair.has_distinct_legs()) {
            errors.push_back("trading pair " + pair.symbol + " needs two distinct exchanges");
        }
        if (pair.trade_amount <= 0.0) {
            errors.push_back("trading pair " + pair.symbol + " needs a positive trade_amount");
        }
        if (!symbols.insert(pair.symbol).second) {
            errors.push_back("trading pair " + pair.symbol + " is listed twice");
        }
    }

    if (get_value<int>("engine.polling_interval_ms", 1000) <= 0) {
        errors.push_back("engine.polling_interval_ms must be positive");
    }

    return errors;
}

void ConfigManager::register_change_callback(const std::string& section, ConfigChangeCallback callback) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    change_callbacks_[section] = std::move(callback);
}

void ConfigManager::unregister_change_callback(const std::string& section) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    change_callbacks_.erase(section);
}

std::string ConfigManager::dump_config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    nlohmann::json redacted = config_json_;
    if (redacted.contains("exchanges") && redacted["exchanges"].is_object()) {
        for (auto& [role, exchange] : redacted["exchanges"].items()) {
            if (exchange.is_object()) {
                if (exchange.contains("api_key")) exchange["api_key"] = "***";
                if (exchange.contains("secret_key")) exchange["secret_key"] = "***";
            }
        }
    }
    return redacted.dump(2);
}

std::vector<std::string> ConfigManager::split_key(const std::string& key) {
    std::vector<std::string> keys;
    std::stringstream ss(key);
    std::string item;
    while (std::getline(ss, item, '.')) {
        keys.push_back(item);
    }
    if (keys.empty()) {
        keys.push_back(key);
    }
    return keys;
}

const nlohmann::json* ConfigManager::find_node(const std::string& key) const {
    const nlohmann::json* current = &config_json_;
    for (const auto& k : split_key(key)) {
        if (!current->is_object() || !current->contains(k)) {
            return nullptr;
        }
        current = &(*current)[k];
    }
    return current;
}

nlohmann::json& ConfigManager::ensure_node(const std::string& key) {
    nlohmann::json* current = &config_json_;
    for (const auto& k : split_key(key)) {
        if (!current->is_object()) {
            *current = nlohmann::json::object();
        }
        current = &(*current)[k];
    }
    return *current;
}

void ConfigManager::notify_config_change(const std::string& section) {
    ConfigChangeCallback callback;
    nlohmann::json value;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        auto it = change_callbacks_.find(section);
        if (it == change_callbacks_.end()) {
            return;
        }
        callback = it->second;
        if (config_json_.contains(section)) {
            value = config_json_[section];
        }
    }
    callback(section, value);
}

} // namespace config
} // namespace atx
