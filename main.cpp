#include <iostream>
#include <csignal>
#include <thread>
#include <chrono>
#include <atomic>
#include <memory>

#include "config/config_manager.hpp"
#include "engine_controller.hpp"
#include "exchange/paper_exchange_client.hpp"
#include "utils/cancellation.hpp"
#include "utils/logger.hpp"

using namespace atx;

namespace {

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int) {
    g_shutdown_requested.store(true);
}

} // namespace

// Paper trading host: runs the engine against in-memory exchanges seeded from
// the "paper" config section.
class ATXPaperRunner {
private:
    config::ConfigManager config_;
    std::shared_ptr<exchange::PaperExchangeClientFactory> factory_;
    std::unique_ptr<trading_engine::EngineController> engine_;
    utils::CancellationSource cancellation_;

public:
    bool initialize(const std::string& config_path) {
        if (!config_.load_config(config_path)) {
            std::cerr << "Failed to load configuration from " << config_path << std::endl;
            return false;
        }
        config_.load_env_overrides();

        auto monitoring = config_.get_monitoring_config();
        utils::Logger::initialize(monitoring.log_file_path, utils::parse_log_level(monitoring.log_level),
                                  monitoring.log_max_file_size, monitoring.log_max_files);
        utils::Logger::info("=== ATX Arbitrage Engine (paper) Starting ===");

        if (!config_.validate_config()) {
            for (const auto& error : config_.get_validation_errors()) {
                utils::Logger::error("Config: {}", error);
            }
            return false;
        }

        auto settings = trading_engine::EngineSettings::from_config(config_);

        exchange::PaperExchangeSettings paper;
        paper.price_volatility_percent = config_.get_value<double>("paper.price_volatility_percent", 0.02);
        paper.fill_delay_ms = config_.get_value<int>("paper.fill_delay_ms", 50);
        paper.fill_ratio = config_.get_value<double>("paper.fill_ratio", 1.0);
        paper.seed = config_.get_value<unsigned int>("paper.seed", 42);

        factory_ = std::make_shared<exchange::PaperExchangeClientFactory>(
            std::vector<types::ExchangeConfig>{settings.exchange_a, settings.exchange_b}, paper);
        seed_exchange(settings.exchange_a.name);
        seed_exchange(settings.exchange_b.name);

        engine_ = std::make_unique<trading_engine::EngineController>(settings, factory_);
        subscribe_events();

        utils::Logger::info("Engine initialized with {} trading pairs", settings.pairs.size());
        return true;
    }

    int run() {
        auto status = engine_->start(cancellation_.token());
        if (status != trading_engine::EngineStatus::RUNNING) {
            utils::Logger::error("Engine failed to start: {}", engine_->get_last_error());
            return 1;
        }

        while (!g_shutdown_requested.load()) {
            status = engine_->get_status();
            if (status == trading_engine::EngineStatus::STOPPED ||
                status == trading_engine::EngineStatus::ERROR) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        utils::Logger::info("Shutting down...");
        cancellation_.cancel();
        status = engine_->stop();

        auto stats = engine_->get_today_stats();
        utils::Logger::info("Session {}: {} trades, {} completed, net PnL {:.4f}, fees {:.4f}",
                            stats.date, stats.total_trades, stats.successful_trades,
                            stats.net_pnl, stats.total_fees);
        utils::Logger::info("=== ATX Shutdown Complete ({}) ===", trading_engine::to_string(status));
        return status == trading_engine::EngineStatus::ERROR ? 1 : 0;
    }

private:
    void seed_exchange(const std::string& name) {
        auto client = factory_->get_paper_client(name);
        auto section = config_.get_section("paper.exchanges." + name);
        if (!section.is_object()) {
            utils::Logger::warn("No paper seed for {}", name);
            return;
        }

        for (const auto& quote : section.value("quotes", nlohmann::json::array())) {
            client->set_quote(quote.value("symbol", std::string()),
                              quote.value("bid", 0.0), quote.value("ask", 0.0),
                              quote.value("quantity", 10.0), quote.value("volume_24h", 1000000.0));
        }
        for (const auto& [currency, amount] : section.value("balances", nlohmann::json::object()).items()) {
            client->set_balance(currency, amount.get<double>());
        }
    }

    void subscribe_events() {
        using namespace trading_engine;

        engine_->events().subscribe<TradeCompletedEvent>([](const TradeCompletedEvent& event) {
            const auto& result = event.result;
            utils::Logger::info("Trade {} {} {}: net {:.4f} ({:.3f}%)", result.trade_id, result.symbol,
                                to_string(result.status), result.net_pnl, result.pnl_percent);
        });
        engine_->events().subscribe<EngineErrorEvent>([](const EngineErrorEvent& event) {
            utils::Logger::warn("[{}] {} {}: {} -> {}", to_string(event.severity), to_string(event.kind),
                                event.symbol, event.message, event.recommended_action);
        });
        engine_->events().subscribe<EmergencyTriggeredEvent>([](const EmergencyTriggeredEvent& event) {
            utils::Logger::warn("Emergency {}: {}", to_string(event.check.reason), event.check.message);
        });
        engine_->events().subscribe<RebalanceRecommendedEvent>([](const RebalanceRecommendedEvent& event) {
            utils::Logger::info("Rebalance {} ({}): {}", event.recommendation.asset,
                                to_string(event.recommendation.urgency), event.recommendation.reason);
        });
    }
};

int main(int argc, char* argv[]) {
    std::string config_path = argc > 1 ? argv[1] : "config/settings.json";

    try {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        ATXPaperRunner runner;
        if (!runner.initialize(config_path)) {
            return 1;
        }
        int exit_code = runner.run();
        utils::Logger::shutdown();
        return exit_code;

    } catch (const std::exception& e) {
        utils::Logger::error("Fatal error in main: {}", e.what());
        std::cerr << "FATAL: " << e.what() << std::endl;
        return 1;
    }
}
