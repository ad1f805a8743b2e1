#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "config/config_manager.hpp"
#include "engine_controller.hpp"
#include "exchange/paper_exchange_client.hpp"
#include "utils/cancellation.hpp"
#include <algorithm>
#include <functional>
#include <mutex>
#include <thread>

using namespace atx;
using namespace atx::trading_engine;
using ::testing::Contains;

namespace {

const char* kPaperConfig = R"({
  "exchanges": {
    "a": { "name": "binance", "taker_fee_percent": 0.1, "maker_fee_percent": 0.1 },
    "b": { "name": "upbit", "taker_fee_percent": 0.05, "maker_fee_percent": 0.05 }
  },
  "trading_pairs": [
    { "symbol": "BTC/USDT", "trade_amount": 20.0, "quantity_precision": 6, "min_order_size": 0.0001 }
  ],
  "engine": {
    "polling_interval_ms": 50,
    "balance_refresh_interval_ms": 100,
    "order_poll_interval_ms": 20,
    "shutdown_grace_timeout_ms": 300,
    "ticker_timeout_ms": 500,
    "execution_workers": 2,
    "io_threads": 4
  },
  "strategy": {
    "name": "integration",
    "entry": { "min_spread_percent": 0.05, "required_confirmations": 1, "min_volume_24h": 1000.0 },
    "risk": { "min_seconds_between_trades": 1, "max_trades_per_hour": 100 },
    "advanced": { "order_timeout_seconds": 1 }
  },
  "risk": {
    "critical_imbalance_threshold": 0.3,
    "rebalance_threshold_percent": 30.0,
    "imbalance_min_value": 10.0
  }
})";

bool wait_until(const std::function<bool()>& condition,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(10000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}

class EventLog {
public:
    void operator()(const EngineEvent& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        names_.push_back(event_name(event));
        if (const auto* changed = std::get_if<StatusChangedEvent>(&event)) {
            statuses_.push_back(changed->current);
        }
    }

    size_t count(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count(names_.begin(), names_.end(), name));
    }

    std::vector<EngineStatus> statuses() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return statuses_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> names_;
    std::vector<EngineStatus> statuses_;
};

} // namespace

class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(config.load_from_string(kPaperConfig));
        ASSERT_TRUE(config.validate_config());
        settings = EngineSettings::from_config(config);

        factory = std::make_shared<exchange::PaperExchangeClientFactory>(
            std::vector<types::ExchangeConfig>{settings.exchange_a, settings.exchange_b});
        binance = factory->get_paper_client("binance");
        upbit = factory->get_paper_client("upbit");
        for (const auto& client : {binance, upbit}) {
            client->set_balance("USDT", 10000.0);
            client->set_balance("BTC", 0.5);
        }
        binance->set_quote("BTCUSDT", 100.00, 100.05);
        upbit->set_quote("BTCUSDT", 100.40, 100.45);
    }

    config::ConfigManager config;
    EngineSettings settings;
    std::shared_ptr<exchange::PaperExchangeClientFactory> factory;
    std::shared_ptr<exchange::PaperExchangeClient> binance;
    std::shared_ptr<exchange::PaperExchangeClient> upbit;
    EventLog log;
};

TEST_F(EndToEndTest, SettingsComeFromJsonConfig) {
    EXPECT_EQ(settings.exchange_a.name, "binance");
    EXPECT_EQ(settings.exchange_b.name, "upbit");
    EXPECT_EQ(settings.engine.polling_interval_ms, 50);
    EXPECT_EQ(settings.strategy.name, "integration");
    EXPECT_EQ(settings.strategy.entry.required_confirmations, 1);
    // Unset sections keep their defaults
    EXPECT_EQ(settings.engine.quote_currency, "USDT");
    EXPECT_DOUBLE_EQ(settings.strategy.exit.take_profit_percent, 0.5);

    ASSERT_EQ(settings.pairs.size(), 1u);
    EXPECT_EQ(settings.pairs[0].exchange_a, "binance");
    EXPECT_EQ(settings.pairs[0].exchange_b, "upbit");
    EXPECT_TRUE(settings.validate().empty());
}

TEST_F(EndToEndTest, TradesUntilInventoryImbalancePausesTheEngine) {
    EngineController engine(settings, factory);
    engine.subscribe(std::ref(log));
    utils::CancellationSource cancellation;

    ASSERT_EQ(engine.start(cancellation.token()), EngineStatus::RUNNING);

    // Each trade moves ~0.2 BTC from upbit to binance; the second one pushes
    // the split past 80/20 and the next balance refresh pauses trading.
    ASSERT_TRUE(wait_until([&] { return engine.get_status() == EngineStatus::PAUSED; }));

    auto history = engine.get_trade_history();
    ASSERT_GE(history.size(), 2u);
    for (const auto& trade : history) {
        EXPECT_EQ(trade.status, TradeStatus::COMPLETED);
        EXPECT_EQ(trade.buy_exchange, "binance");
        EXPECT_EQ(trade.sell_exchange, "upbit");
        EXPECT_GT(trade.net_pnl, 0.0);
    }

    auto stats = engine.get_today_stats();
    EXPECT_EQ(stats.total_trades, static_cast<int>(history.size()));
    EXPECT_EQ(stats.successful_trades, stats.total_trades);
    EXPECT_GT(stats.net_pnl, 0.0);
    EXPECT_GT(stats.total_fees, 0.0);

    EXPECT_GE(log.count("TradeCompleted"), 2u);
    EXPECT_GE(log.count("EmergencyTriggered"), 1u);
    EXPECT_GE(log.count("RebalanceRecommended"), 1u);

    auto recommendation = engine.balance_pool().calculate_rebalance();
    EXPECT_TRUE(recommendation.needed);
    EXPECT_EQ(recommendation.asset, "BTC");

    cancellation.cancel();
    ASSERT_TRUE(wait_until([&] { return engine.get_status() == EngineStatus::STOPPED; }));
    EXPECT_EQ(engine.in_flight_executions(), 0u);

    auto statuses = log.statuses();
    EXPECT_THAT(statuses, Contains(EngineStatus::PAUSED));
    EXPECT_EQ(statuses.back(), EngineStatus::STOPPED);
}

TEST_F(EndToEndTest, PoolPnLReflectsCompletedTrades) {
    EngineController engine(settings, factory);
    engine.subscribe(std::ref(log));

    ASSERT_EQ(engine.start(), EngineStatus::RUNNING);
    ASSERT_TRUE(wait_until([&] { return log.count("TradeCompleted") >= 1; }));
    engine.stop();

    auto history = engine.get_trade_history();
    ASSERT_FALSE(history.empty());
    types::Amount realized = 0.0;
    for (const auto& trade : history) {
        realized += trade.net_pnl;
    }

    auto pnl = engine.balance_pool().calculate_pnl();
    EXPECT_EQ(pnl.trade_count, static_cast<int>(history.size()));
    EXPECT_NEAR(pnl.realized_pnl, realized, 1e-9);

    EXPECT_GT(binance->get_balance().total("BTC"), 0.5);
    EXPECT_LT(upbit->get_balance().total("BTC"), 0.5);
}
