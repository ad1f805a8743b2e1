#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "utils/logger.hpp"
#include "utils/cancellation.hpp"
#include "utils/thread_pool.hpp"
#include "config/config_manager.hpp"
#include "types/common_types.hpp"
#include "types/exceptions.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace atx;
using namespace atx::utils;
using namespace atx::config;
using namespace atx::types;

// Test fixtures
class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::filesystem::create_directories("test_logs");
    }

    void TearDown() override {
        Logger::shutdown();
        std::filesystem::remove_all("test_logs");
    }
};

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_config_file = "test_config.json";
        config_manager = std::make_unique<ConfigManager>();
    }

    void TearDown() override {
        std::filesystem::remove(test_config_file);
    }

    std::string test_config_file;
    std::unique_ptr<ConfigManager> config_manager;
};

// Logger Tests
TEST_F(LoggerTest, InitializationAndBasicLogging) {
    EXPECT_NO_THROW(Logger::initialize("test_logs/test.log", LogLevel::DEBUG));

    EXPECT_NO_THROW(Logger::info("Test info message"));
    EXPECT_NO_THROW(Logger::debug("Test debug message {}", 42));
    EXPECT_NO_THROW(Logger::warn("Test warning message"));
    EXPECT_NO_THROW(Logger::error("Test error message {} {}", "with", 2.5));

    EXPECT_EQ(Logger::get_level(), LogLevel::DEBUG);
    EXPECT_TRUE(Logger::is_enabled(LogLevel::INFO));
    EXPECT_TRUE(Logger::is_enabled(LogLevel::DEBUG));
}

TEST_F(LoggerTest, LogLevelFiltering) {
    Logger::initialize("test_logs/level_test.log", LogLevel::WARN);

    EXPECT_EQ(Logger::get_level(), LogLevel::WARN);
    EXPECT_FALSE(Logger::is_enabled(LogLevel::DEBUG));
    EXPECT_FALSE(Logger::is_enabled(LogLevel::INFO));
    EXPECT_TRUE(Logger::is_enabled(LogLevel::WARN));
    EXPECT_TRUE(Logger::is_enabled(LogLevel::ERROR));
}

TEST_F(LoggerTest, ReinitializeReplacesLogger) {
    Logger::initialize("test_logs/first.log", LogLevel::INFO);
    EXPECT_NO_THROW(Logger::initialize("test_logs/second.log", LogLevel::ERROR));
    EXPECT_EQ(Logger::get_level(), LogLevel::ERROR);
    EXPECT_TRUE(Logger::is_initialized());
}

TEST_F(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("WARN"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("critical"), LogLevel::CRITICAL);
}

TEST_F(LoggerTest, TradingLoggerFunctions) {
    Logger::initialize("test_logs/trading_test.log", LogLevel::INFO);

    EXPECT_NO_THROW(TradingLogger::log_opportunity("BTC/USDT", "binance", "upbit", 50000.0, 50500.0, 0.8, 40.0));
    EXPECT_NO_THROW(TradingLogger::log_leg_submitted("T-1", "binance", "BTCUSDT", "BUY", "order123", 0.1, 50000.0));
    EXPECT_NO_THROW(TradingLogger::log_leg_finished("T-1", "binance", "order123", "FILLED", 0.1, 50000.0));
    EXPECT_NO_THROW(TradingLogger::log_trade_result("T-1", "BTC/USDT", "COMPLETED", 12.5, 1.2, 340));
    EXPECT_NO_THROW(TradingLogger::log_partial_failure("T-2", "BTC/USDT", "binance", 0.05, "sell timed out"));
    EXPECT_NO_THROW(TradingLogger::log_emergency("MAX_DRAWDOWN_EXCEEDED", "STOP_TRADING", "drawdown 6%"));
    EXPECT_NO_THROW(TradingLogger::log_rebalance("BTC", "HIGH", 36.0));
    EXPECT_NO_THROW(TradingLogger::log_state_change("IDLE", "STARTING", "start requested"));
}

TEST_F(LoggerTest, LoggingBeforeInitializeIsDropped) {
    Logger::shutdown();
    EXPECT_NO_THROW(Logger::info("nobody is listening"));
    EXPECT_NO_THROW(Logger::error("still nobody {}", 1));
}

TEST_F(LoggerTest, ScopedTimer) {
    Logger::initialize("test_logs/timer_test.log", LogLevel::DEBUG);

    {
        ScopedTimer timer("test_operation");
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    SUCCEED();
}

// Config Manager Tests
TEST_F(ConfigManagerTest, DefaultConfiguration) {
    auto risk = config_manager->get_risk_config();
    EXPECT_EQ(risk.rapid_loss_min_trades, 5);
    EXPECT_DOUBLE_EQ(risk.critical_imbalance_threshold, 0.3);

    auto monitoring = config_manager->get_monitoring_config();
    EXPECT_EQ(monitoring.log_level, "INFO");

    EXPECT_TRUE(config_manager->get_trading_pairs().empty());
    EXPECT_FALSE(config_manager->validate_config());
}

TEST_F(ConfigManagerTest, ConfigurationSaveLoad) {
    ExchangeConfig binance;
    binance.name = "binance";
    binance.api_key = "key";
    binance.taker_fee_percent = 0.075;
    config_manager->set_exchange_config("a", binance);

    ExchangeConfig upbit;
    upbit.name = "upbit";
    config_manager->set_exchange_config("b", upbit);

    auto pair = TradingPair::from_symbol("ETH/USDT", "binance", "upbit");
    pair.trade_amount = 250.0;
    config_manager->set_trading_pairs({pair});

    ASSERT_TRUE(config_manager->save_config(test_config_file));

    ConfigManager loaded;
    ASSERT_TRUE(loaded.load_config(test_config_file));
    EXPECT_EQ(loaded.get_exchange_config("a").name, "binance");
    EXPECT_DOUBLE_EQ(loaded.get_exchange_config("a").taker_fee_percent, 0.075);

    auto pairs = loaded.get_trading_pairs();
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_EQ(pairs[0].base_currency, "ETH");
    EXPECT_EQ(pairs[0].quote_currency, "USDT");
    EXPECT_DOUBLE_EQ(pairs[0].trade_amount, 250.0);
    EXPECT_TRUE(loaded.validate_config());
}

TEST_F(ConfigManagerTest, PairsInheritConfiguredExchanges) {
    ASSERT_TRUE(config_manager->load_from_string(R"({
        "exchanges": {"a": {"name": "binance"}, "b": {"name": "upbit"}},
        "trading_pairs": [{"symbol": "BTC/USDT"}]
    })"));

    auto pairs = config_manager->get_trading_pairs();
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_EQ(pairs[0].exchange_a, "binance");
    EXPECT_EQ(pairs[0].exchange_b, "upbit");
    EXPECT_EQ(pairs[0].symbol_a, "BTCUSDT");
}

TEST_F(ConfigManagerTest, ConfigurationValidation) {
    ASSERT_TRUE(config_manager->load_from_string(R"({
        "exchanges": {"a": {"name": "binance"}, "b": {"name": "binance"}},
        "trading_pairs": [
            {"symbol": "BTC/USDT", "trade_amount": -1},
            {"symbol": "BTC/USDT"}
        ]
    })"));

    auto errors = config_manager->get_validation_errors();
    EXPECT_FALSE(errors.empty());
    EXPECT_THAT(errors, ::testing::Contains(::testing::HasSubstr("different exchanges")));
    EXPECT_THAT(errors, ::testing::Contains(::testing::HasSubstr("listed twice")));
}

TEST_F(ConfigManagerTest, GenericValueAccess) {
    config_manager->set_value("engine.polling_interval_ms", 250);
    config_manager->set_value<std::string>("engine.quote_currency", "KRW");

    EXPECT_EQ(config_manager->get_value<int>("engine.polling_interval_ms", 1000), 250);
    EXPECT_EQ(config_manager->get_value<std::string>("engine.quote_currency"), "KRW");
    EXPECT_EQ(config_manager->get_value<int>("engine.missing", 7), 7);
    EXPECT_TRUE(config_manager->has_value("engine.polling_interval_ms"));
    EXPECT_FALSE(config_manager->has_value("engine.nope"));
}

TEST_F(ConfigManagerTest, ChangeCallbackFiresForSection) {
    std::string changed;
    config_manager->register_change_callback("engine", [&](const std::string& section, const nlohmann::json&) {
        changed = section;
    });

    config_manager->set_value("engine.dry_run", true);
    EXPECT_EQ(changed, "engine");
}

TEST_F(ConfigManagerTest, DumpRedactsSecrets) {
    ExchangeConfig binance;
    binance.name = "binance";
    binance.api_key = "very-secret-key";
    binance.secret_key = "very-secret";
    config_manager->set_exchange_config("a", binance);

    auto dump = config_manager->dump_config();
    EXPECT_EQ(dump.find("very-secret"), std::string::npos);
    EXPECT_NE(dump.find("binance"), std::string::npos);
}

TEST_F(ConfigManagerTest, MalformedJsonIsRejected) {
    EXPECT_FALSE(config_manager->load_from_string("{not json"));
    EXPECT_FALSE(config_manager->load_config("does/not/exist.json"));
}

// Cancellation Tests
TEST(CancellationTest, DefaultTokenNeverCancels) {
    CancellationToken token;
    EXPECT_FALSE(token.can_be_cancelled());
    EXPECT_FALSE(token.is_cancelled());
    EXPECT_TRUE(token.wait_for(std::chrono::milliseconds(1)));
}

TEST(CancellationTest, CancelWakesWaiter) {
    CancellationSource source;
    auto token = source.token();

    std::thread canceller([&source]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        source.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(token.wait_for(std::chrono::seconds(5)));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
    EXPECT_TRUE(token.is_cancelled());
    canceller.join();
}

TEST(CancellationTest, ParentCancellationPropagatesToChildren) {
    CancellationSource parent;
    CancellationSource child(parent.token());
    CancellationSource grandchild(child.token());

    parent.cancel();
    EXPECT_TRUE(child.is_cancelled());
    EXPECT_TRUE(grandchild.token().is_cancelled());
}

TEST(CancellationTest, ChildCancellationDoesNotReachParent) {
    CancellationSource parent;
    CancellationSource child(parent.token());

    child.cancel();
    EXPECT_TRUE(child.is_cancelled());
    EXPECT_FALSE(parent.is_cancelled());
}

TEST(CancellationTest, ChildOfCancelledParentStartsCancelled) {
    CancellationSource parent;
    parent.cancel();
    CancellationSource child(parent.token());
    EXPECT_TRUE(child.is_cancelled());
}

// Thread Pool Tests
TEST(ThreadPoolTest, SubmitReturnsResult) {
    ThreadPool pool(2);
    auto future = pool.submit([](int a, int b) { return a + b; }, 2, 3);
    EXPECT_EQ(future.get(), 5);
}

TEST(ThreadPoolTest, WaitForAllDrainsQueue) {
    ThreadPool pool(4);
    std::atomic<int> counter{0};
    for (int i = 0; i < 100; ++i) {
        pool.submit([&counter]() { counter++; });
    }
    pool.wait_for_all();
    EXPECT_EQ(counter.load(), 100);
    EXPECT_EQ(pool.pending_tasks(), 0u);
}

TEST(ThreadPoolTest, ExceptionsReachTheFuture) {
    ThreadPool pool(1);
    auto future = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, SubmitAfterShutdownThrows) {
    ThreadPool pool(1);
    pool.shutdown();
    EXPECT_FALSE(pool.is_running());
    EXPECT_THROW(pool.submit([]() {}), std::runtime_error);
}

TEST(ThreadPoolTest, HigherPriorityRunsFirst) {
    ThreadPool pool(1);
    std::promise<void> gate;
    auto gate_future = gate.get_future().share();
    pool.submit([gate_future]() { gate_future.wait(); });

    std::vector<int> order;
    std::mutex order_mutex;
    pool.submit_priority(0, [&]() { std::lock_guard<std::mutex> lock(order_mutex); order.push_back(0); });
    pool.submit_priority(5, [&]() { std::lock_guard<std::mutex> lock(order_mutex); order.push_back(5); });

    gate.set_value();
    pool.wait_for_all();
    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], 5);
    EXPECT_EQ(order[1], 0);
}

// Common Types Tests
TEST(CommonTypesTest, TickerCreation) {
    Ticker ticker("BTCUSDT", "binance", 50000.0, 50010.0, 1000000.0);

    EXPECT_EQ(ticker.symbol, "BTCUSDT");
    EXPECT_EQ(ticker.exchange, "binance");
    EXPECT_DOUBLE_EQ(ticker.mid(), 50005.0);
    EXPECT_TRUE(ticker.has_valid_prices());

    Ticker empty;
    EXPECT_FALSE(empty.has_valid_prices());
}

TEST(CommonTypesTest, OrderFinalStates) {
    Order order;
    order.quantity = 1.0;
    order.filled_quantity = 0.4;
    order.avg_fill_price = 100.0;
    EXPECT_FALSE(order.is_final());
    EXPECT_DOUBLE_EQ(order.remaining_quantity(), 0.6);
    EXPECT_DOUBLE_EQ(order.filled_value(), 40.0);

    order.status = OrderStatus::PARTIALLY_FILLED;
    EXPECT_FALSE(order.is_final());
    order.status = OrderStatus::CANCELED;
    EXPECT_TRUE(order.is_final());
}

TEST(CommonTypesTest, TradingPairFromSymbol) {
    auto pair = TradingPair::from_symbol("ETH/USDT", "binance", "upbit");
    EXPECT_EQ(pair.base_currency, "ETH");
    EXPECT_EQ(pair.quote_currency, "USDT");
    EXPECT_EQ(pair.symbol_on("binance"), "ETHUSDT");
    EXPECT_TRUE(pair.has_distinct_legs());

    auto same = TradingPair::from_symbol("ETH/USDT", "binance", "binance");
    EXPECT_FALSE(same.has_distinct_legs());
}

TEST(CommonTypesTest, AccountBalanceLookups) {
    AccountBalance account;
    account.balances["USDT"] = Balance("USDT", "binance", 1000.0, 800.0);

    EXPECT_DOUBLE_EQ(account.total("USDT"), 1000.0);
    EXPECT_DOUBLE_EQ(account.available("USDT"), 800.0);
    EXPECT_DOUBLE_EQ(account.available("BTC"), 0.0);
    EXPECT_DOUBLE_EQ(account.balances["USDT"].locked, 200.0);
}

TEST(CommonTypesTest, ExchangeErrorCarriesTransience) {
    ExchangeError transient("binance", "timeout");
    EXPECT_TRUE(transient.is_transient());
    EXPECT_EQ(transient.exchange(), "binance");

    InsufficientBalanceError rejected("upbit", "USDT");
    EXPECT_FALSE(rejected.is_transient());
    EXPECT_THAT(rejected.what(), ::testing::HasSubstr("insufficient balance"));
}
