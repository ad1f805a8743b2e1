#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <mutex>
#include <functional>
#include <sstream>
#include <nlohmann/json.hpp>
#include "types/common_types.hpp"
#include "utils/logger.hpp"

namespace atx {
namespace types {

void to_json(nlohmann::json& j, const ExchangeConfig& config);
void from_json(const nlohmann::json& j, ExchangeConfig& config);

void to_json(nlohmann::json& j, const RiskConfig& config);
void from_json(const nlohmann::json& j, RiskConfig& config);

void to_json(nlohmann::json& j, const TradingPair& pair);
void from_json(const nlohmann::json& j, TradingPair& pair);

} // namespace types

namespace config {

struct MonitoringConfig {
    std::string log_level;
    std::string log_file_path;
    size_t log_max_file_size;
    size_t log_max_files;

    MonitoringConfig() : log_level("INFO"), log_file_path("logs/atx.log"),
                        log_max_file_size(10 * 1024 * 1024), log_max_files(5) {}
};

class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    ConfigManager(const ConfigManager& other);
    ConfigManager& operator=(const ConfigManager& other);

    bool load_config(const std::string& config_file_path);
    bool load_from_string(const std::string& json_text);
    bool save_config(const std::string& config_file_path) const;
    bool reload_config();

    // Exchange legs are configured under "exchanges.a" and "exchanges.b"
    types::ExchangeConfig get_exchange_config(const std::string& role) const;
    void set_exchange_config(const std::string& role, const types::ExchangeConfig& config);

    types::RiskConfig get_risk_config() const;
    void set_risk_config(const types::RiskConfig& config);

    std::vector<types::TradingPair> get_trading_pairs() const;
    void set_trading_pairs(const std::vector<types::TradingPair>& pairs);

    MonitoringConfig get_monitoring_config() const;
    void set_monitoring_config(const MonitoringConfig& config);

    // Raw subtree, null when absent
    nlohmann::json get_section(const std::string& key) const;
    void set_section(const std::string& key, const nlohmann::json& value);

    template<typename T>
    T get_value(const std::string& key, const T& default_value = T{}) const;

    template<typename T>
    void set_value(const std::string& key, const T& value);

    bool has_value(const std::string& key) const;

    // ATX_* environment variables override secrets and the log level
    std::string get_env_var(const std::string& var_name, const std::string& default_value = "") const;
    void load_env_overrides();

    bool validate_config() const;
    std::vector<std::string> get_validation_errors() const;

    using ConfigChangeCallback = std::function<void(const std::string& section, const nlohmann::json& new_value)>;
    void register_change_callback(const std::string& section, ConfigChangeCallback callback);
    void unregister_change_callback(const std::string& section);

    std::string dump_config() const;
    const std::string& get_config_file_path() const { return config_file_path_; }

private:
    mutable std::mutex config_mutex_;
    nlohmann::json config_json_;
    std::string config_file_path_;
    std::unordered_map<std::string, ConfigChangeCallback> change_callbacks_;

    static std::vector<std::string> split_key(const std::string& key);
    const nlohmann::json* find_node(const std::string& key) const;
    nlohmann::json& ensure_node(const std::string& key);
    void notify_config_change(const std::string& section);
};

// Template implementation
template<typename T>
T ConfigManager::get_value(const std::string& key, const T& default_value) const {
    std::lock_guard<std::mutex> lock(config_mutex_);

    const nlohmann::json* node = find_node(key);
    if (node == nullptr || node->is_null()) {
        return default_value;
    }

    try {
        return node->get<T>();
    } catch (const nlohmann::json::exception& e) {
        utils::Logger::warn("Config key '{}' has unexpected type: {}", key, e.what());
        return default_value;
    }
}

template<typename T>
void ConfigManager::set_value(const std::string& key, const T& value) {
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        ensure_node(key) = value;
    }
    notify_config_change(split_key(key).front());
}

} // namespace config
} // namespace atx
