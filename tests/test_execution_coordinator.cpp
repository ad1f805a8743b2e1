#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "execution_coordinator.hpp"
#include "exchange/paper_exchange_client.hpp"
#include "mocks/mock_exchange_client.hpp"
#include "types/exceptions.hpp"
#include <future>
#include <thread>
#include <vector>

using namespace atx;
using namespace atx::trading_engine;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace {

types::ExchangeConfig exchange_config(const std::string& name, double taker_fee) {
    types::ExchangeConfig config;
    config.name = name;
    config.taker_fee_percent = taker_fee;
    return config;
}

SpreadOpportunity opportunity_for(const types::TradingPair& pair, types::Quantity quantity) {
    SpreadOpportunity opportunity;
    opportunity.pair = pair;
    opportunity.symbol = pair.symbol;
    opportunity.direction = ArbitrageDirection::BUY_A_SELL_B;
    opportunity.buy_exchange = "binance";
    opportunity.sell_exchange = "upbit";
    opportunity.buy_symbol = pair.symbol_a;
    opportunity.sell_symbol = pair.symbol_b;
    opportunity.buy_price = 100.05;
    opportunity.sell_price = 100.40;
    opportunity.suggested_quantity = quantity;
    opportunity.is_valid = true;
    opportunity.should_trade = true;
    return opportunity;
}

} // namespace

class ExecutionCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        buy_client = std::make_shared<exchange::PaperExchangeClient>(exchange_config("binance", 0.1));
        sell_client = std::make_shared<exchange::PaperExchangeClient>(exchange_config("upbit", 0.05));
        buy_client->set_quote("BTCUSDT", 100.00, 100.05);
        sell_client->set_quote("BTCUSDT", 100.40, 100.45);
        buy_client->set_balance("USDT", 10000.0);
        sell_client->set_balance("BTC", 5.0);

        strategy.advanced.order_timeout_seconds = 1;
        evaluator = std::make_shared<StrategyEvaluator>(strategy);

        config.order_poll_interval_ms = 20;
        coordinator = std::make_unique<ExecutionCoordinator>(
            exchange::ExchangeClientMap{{"binance", buy_client}, {"upbit", sell_client}}, evaluator, config);

        pair = types::TradingPair::from_symbol("BTC/USDT", "binance", "upbit");
    }

    std::shared_ptr<exchange::PaperExchangeClient> buy_client;
    std::shared_ptr<exchange::PaperExchangeClient> sell_client;
    TradingStrategy strategy;
    std::shared_ptr<StrategyEvaluator> evaluator;
    EngineConfig config;
    std::unique_ptr<ExecutionCoordinator> coordinator;
    types::TradingPair pair;
};

TEST_F(ExecutionCoordinatorTest, BothLegsFillCompletesTrade) {
    auto result = coordinator->execute(opportunity_for(pair, 1.0));

    EXPECT_EQ(result.status, TradeStatus::COMPLETED);
    EXPECT_DOUBLE_EQ(result.buy_order.filled_quantity, 1.0);
    EXPECT_DOUBLE_EQ(result.sell_order.filled_quantity, 1.0);
    EXPECT_EQ(result.buy_order.side, types::OrderSide::BUY);
    EXPECT_EQ(result.sell_order.side, types::OrderSide::SELL);
    EXPECT_FALSE(result.held_inventory.has_value());

    double buy_fee = 100.05 * 0.001;
    double sell_fee = 100.40 * 0.0005;
    EXPECT_NEAR(result.total_fees, buy_fee + sell_fee, 1e-9);
    EXPECT_NEAR(result.net_pnl, 100.40 - 100.05 - buy_fee - sell_fee, 1e-9);
    EXPECT_FALSE(result.is_loss());
    EXPECT_GE(result.end_time, result.start_time);

    auto stats = coordinator->get_statistics();
    EXPECT_EQ(stats.attempts, 1u);
    EXPECT_EQ(stats.completed, 1u);
    EXPECT_EQ(coordinator->in_flight_count(), 0u);
    EXPECT_TRUE(coordinator->get_active_attempts().empty());
}

TEST_F(ExecutionCoordinatorTest, SellsOnlyWhatTheBuyFilled) {
    buy_client->set_fill_ratio(0.5);

    auto result = coordinator->execute(opportunity_for(pair, 1.0));

    EXPECT_EQ(result.status, TradeStatus::COMPLETED);
    EXPECT_DOUBLE_EQ(result.buy_order.filled_quantity, 0.5);
    EXPECT_EQ(result.buy_order.status, types::OrderStatus::CANCELED);

    auto sells = sell_client->get_order_history();
    ASSERT_EQ(sells.size(), 1u);
    EXPECT_DOUBLE_EQ(sells[0].quantity, 0.5);
    EXPECT_DOUBLE_EQ(result.sell_order.filled_quantity, 0.5);
}

TEST_F(ExecutionCoordinatorTest, UnfilledBuyNeverSells) {
    buy_client->set_fill_ratio(0.0);

    auto result = coordinator->execute(opportunity_for(pair, 1.0));

    EXPECT_EQ(result.status, TradeStatus::BUY_FAILED);
    EXPECT_THAT(result.error_message, HasSubstr("not filled"));
    EXPECT_TRUE(sell_client->get_order_history().empty());
    EXPECT_DOUBLE_EQ(result.net_pnl, 0.0);
    EXPECT_EQ(coordinator->get_statistics().buy_failures, 1u);
}

TEST_F(ExecutionCoordinatorTest, RejectedBuyNeverSells) {
    buy_client->set_balance("USDT", 10.0);

    auto result = coordinator->execute(opportunity_for(pair, 1.0));

    EXPECT_EQ(result.status, TradeStatus::BUY_FAILED);
    EXPECT_THAT(result.error_message, HasSubstr("insufficient balance"));
    EXPECT_TRUE(sell_client->get_order_history().empty());
}

TEST_F(ExecutionCoordinatorTest, FailedSellLeavesHeldInventory) {
    sell_client->set_online(false);

    auto result = coordinator->execute(opportunity_for(pair, 1.0));

    EXPECT_EQ(result.status, TradeStatus::PARTIAL_FAILURE);
    ASSERT_TRUE(result.held_inventory.has_value());
    EXPECT_EQ(result.held_inventory->exchange, "binance");
    EXPECT_EQ(result.held_inventory->asset, "BTC");
    EXPECT_DOUBLE_EQ(result.held_inventory->quantity, 1.0);
    EXPECT_DOUBLE_EQ(result.held_inventory->average_price, 100.05);
    EXPECT_THAT(result.error_message, HasSubstr("offline"));
    // nothing matched, so nothing realized
    EXPECT_DOUBLE_EQ(result.net_pnl, 0.0);
    EXPECT_EQ(coordinator->get_statistics().partial_failures, 1u);
}

TEST_F(ExecutionCoordinatorTest, OneExecutionPerPair) {
    auto reservation = coordinator->try_reserve("BTC/USDT");
    ASSERT_TRUE(reservation.has_value());
    EXPECT_TRUE(coordinator->is_executing("BTC/USDT"));
    EXPECT_FALSE(coordinator->try_reserve("BTC/USDT").has_value());

    auto result = coordinator->execute(opportunity_for(pair, 1.0));
    EXPECT_EQ(result.status, TradeStatus::REJECTED);
    EXPECT_THAT(result.error_message, HasSubstr("already in flight"));
    EXPECT_TRUE(buy_client->get_order_history().empty());

    EXPECT_TRUE(coordinator->try_reserve("ETH/USDT").has_value());

    reservation->release();
    EXPECT_FALSE(coordinator->is_executing("BTC/USDT"));
    EXPECT_TRUE(coordinator->wait_for_idle(std::chrono::milliseconds(10)));
}

TEST_F(ExecutionCoordinatorTest, ConcurrentTriggersOnOnePairExecuteOnce) {
    // Keeps the winner in flight while the other threads arrive
    buy_client->set_fill_delay(std::chrono::milliseconds(200));

    constexpr int kThreads = 8;
    std::promise<void> go;
    std::shared_future<void> ready = go.get_future().share();
    std::vector<std::future<TradeResult>> results;
    for (int i = 0; i < kThreads; ++i) {
        results.push_back(std::async(std::launch::async, [this, ready]() {
            ready.wait();
            return coordinator->execute(opportunity_for(pair, 1.0));
        }));
    }
    go.set_value();

    int executed = 0;
    int rejected = 0;
    for (auto& future : results) {
        auto result = future.get();
        if (result.status == TradeStatus::REJECTED) {
            ++rejected;
            EXPECT_THAT(result.error_message, HasSubstr("already in flight"));
        } else {
            ++executed;
            EXPECT_EQ(result.status, TradeStatus::COMPLETED);
        }
    }

    EXPECT_EQ(executed, 1);
    EXPECT_EQ(rejected, kThreads - 1);
    EXPECT_EQ(buy_client->get_order_history().size(), 1u);
    EXPECT_EQ(sell_client->get_order_history().size(), 1u);
    EXPECT_EQ(coordinator->in_flight_count(), 0u);
}

TEST_F(ExecutionCoordinatorTest, NoNewBuyOnceStopping) {
    utils::CancellationSource run;
    run.cancel();
    ExecutionContext context{run.token(), utils::CancellationToken()};

    auto result = coordinator->execute(opportunity_for(pair, 1.0), context);
    EXPECT_EQ(result.status, TradeStatus::REJECTED);
    EXPECT_TRUE(buy_client->get_order_history().empty());
}

TEST_F(ExecutionCoordinatorTest, InvalidOpportunityIsRejected) {
    auto opportunity = opportunity_for(pair, 0.0);
    auto result = coordinator->execute(opportunity);
    EXPECT_EQ(result.status, TradeStatus::REJECTED);
    EXPECT_FALSE(result.was_attempted());
}

TEST_F(ExecutionCoordinatorTest, SellLegSurvivesStopRequest) {
    sell_client->set_fill_delay(std::chrono::milliseconds(300));
    utils::CancellationSource run;
    utils::CancellationSource abandon;
    ExecutionContext context{run.token(), abandon.token()};

    auto pending = std::async(std::launch::async, [&] {
        return coordinator->execute(opportunity_for(pair, 1.0), context);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    run.cancel();

    auto result = pending.get();
    EXPECT_EQ(result.status, TradeStatus::COMPLETED);
}

TEST_F(ExecutionCoordinatorTest, AbandonedSellReportsHeldInventory) {
    sell_client->set_fill_ratio(0.0);
    strategy.advanced.order_timeout_seconds = 30;
    evaluator->set_strategy(strategy);

    utils::CancellationSource abandon;
    ExecutionContext context{utils::CancellationToken(), abandon.token()};

    auto started = std::chrono::steady_clock::now();
    auto pending = std::async(std::launch::async, [&] {
        return coordinator->execute(opportunity_for(pair, 1.0), context);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_EQ(coordinator->in_flight_count(), 1u);
    abandon.cancel();

    auto result = pending.get();
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
    EXPECT_EQ(result.status, TradeStatus::PARTIAL_FAILURE);
    ASSERT_TRUE(result.held_inventory.has_value());
    EXPECT_DOUBLE_EQ(result.held_inventory->quantity, 1.0);
}

TEST_F(ExecutionCoordinatorTest, LargeOrdersAreSplit) {
    strategy.advanced.split_large_orders = true;
    strategy.advanced.max_single_order_size = 30.0;
    evaluator->set_strategy(strategy);

    auto result = coordinator->execute(opportunity_for(pair, 1.0));

    EXPECT_EQ(result.status, TradeStatus::COMPLETED);
    EXPECT_EQ(result.buy_child_orders.size(), 4u);
    EXPECT_NEAR(result.buy_order.filled_quantity, 1.0, 1e-9);
    EXPECT_NEAR(result.sell_order.filled_quantity, 1.0, 1e-9);
}

TEST(ExecutionCoordinatorRetryTest, PermanentRejectionIsNotRetried) {
    auto buy = std::make_shared<NiceMock<mocks::MockExchangeClient>>();
    auto sell = std::make_shared<NiceMock<mocks::MockExchangeClient>>();
    EXPECT_CALL(*buy, place_order(_))
        .Times(1)
        .WillOnce(Throw(OrderRejectedError("binance", "symbol halted")));
    EXPECT_CALL(*sell, place_order(_)).Times(0);

    ExecutionCoordinator coordinator({{"binance", buy}, {"upbit", sell}},
                                     std::make_shared<StrategyEvaluator>(), EngineConfig());
    auto pair = types::TradingPair::from_symbol("BTC/USDT", "binance", "upbit");

    auto result = coordinator.execute(opportunity_for(pair, 1.0));
    EXPECT_EQ(result.status, TradeStatus::BUY_FAILED);
    EXPECT_THAT(result.error_message, HasSubstr("symbol halted"));
}

TEST(ExecutionCoordinatorRetryTest, TransientSubmitErrorsAreRetried) {
    auto buy = std::make_shared<NiceMock<mocks::MockExchangeClient>>();
    auto sell = std::make_shared<NiceMock<mocks::MockExchangeClient>>();

    types::Order filled;
    filled.id = "B-1";
    filled.side = types::OrderSide::BUY;
    filled.quantity = 1.0;
    filled.filled_quantity = 1.0;
    filled.avg_fill_price = 100.0;
    filled.status = types::OrderStatus::FILLED;
    filled.fee_currency = "USDT";

    types::Order sold = filled;
    sold.id = "S-1";
    sold.side = types::OrderSide::SELL;
    sold.avg_fill_price = 101.0;

    EXPECT_CALL(*buy, place_order(_))
        .WillOnce(Throw(ExchangeError("binance", "gateway timeout", true)))
        .WillOnce(Return(filled));
    EXPECT_CALL(*sell, place_order(_)).WillOnce(Return(sold));

    ExecutionCoordinator coordinator({{"binance", buy}, {"upbit", sell}},
                                     std::make_shared<StrategyEvaluator>(), EngineConfig());
    auto pair = types::TradingPair::from_symbol("BTC/USDT", "binance", "upbit");

    auto result = coordinator.execute(opportunity_for(pair, 1.0));
    EXPECT_EQ(result.status, TradeStatus::COMPLETED);
    EXPECT_NEAR(result.net_pnl, 1.0, 1e-9);
}
