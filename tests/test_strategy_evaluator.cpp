#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "strategy_evaluator.hpp"
#include "trading_strategy.hpp"

using namespace atx;
using namespace atx::trading_engine;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

class StrategyEvaluatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        now = std::chrono::system_clock::now();
        opportunity.net_spread_percent = 0.5;
        buy = types::Ticker("BTCUSDT", "binance", 100.0, 100.1, 1000000.0);
        sell = types::Ticker("BTCUSDT", "upbit", 100.6, 100.7, 1000000.0);
        history.push_back({now, 0.5, 100.35});
    }

    bool evaluate(const StrategyEvaluator& evaluator, std::vector<std::string>& remarks) {
        EntryRuleInput input{opportunity, buy, sell, buy_book, sell_book, history, now};
        return evaluator.evaluate_entry(input, remarks);
    }

    types::Timestamp now;
    SpreadOpportunity opportunity;
    types::Ticker buy;
    types::Ticker sell;
    std::optional<types::OrderBook> buy_book;
    std::optional<types::OrderBook> sell_book;
    std::vector<SpreadObservation> history;
};

TEST_F(StrategyEvaluatorTest, DefaultRulesAndGatesAreRegistered) {
    StrategyEvaluator evaluator;
    EXPECT_THAT(evaluator.entry_rule_names(),
                ElementsAre("min_spread", "max_spread", "min_volume", "spread_confirmation",
                            "momentum", "volatility", "orderbook_depth"));
    EXPECT_THAT(evaluator.risk_gate_names(),
                ElementsAre("max_trades_per_hour", "min_time_between_trades", "max_open_positions",
                            "max_daily_loss", "pause_after_losses"));
    EXPECT_FALSE(evaluator.needs_order_books());
}

TEST_F(StrategyEvaluatorTest, SpreadWithinBandPasses) {
    TradingStrategy strategy;
    strategy.entry.required_confirmations = 1;
    StrategyEvaluator evaluator(strategy);

    std::vector<std::string> remarks;
    EXPECT_TRUE(evaluate(evaluator, remarks));
    EXPECT_THAT(remarks, IsEmpty());
}

TEST_F(StrategyEvaluatorTest, SpreadAboveMaximumIsSuspect) {
    TradingStrategy strategy;
    strategy.entry.required_confirmations = 1;
    strategy.entry.max_spread_percent = 0.4;
    StrategyEvaluator evaluator(strategy);

    std::vector<std::string> remarks;
    EXPECT_FALSE(evaluate(evaluator, remarks));
    EXPECT_THAT(remarks, Contains(HasSubstr("max_spread:")));
}

TEST_F(StrategyEvaluatorTest, ConfirmationCountsObservationsInWindow) {
    TradingStrategy strategy;
    strategy.entry.required_confirmations = 3;
    strategy.entry.spread_confirmation_seconds = 3;
    StrategyEvaluator evaluator(strategy);

    // Too old to count
    history.insert(history.begin(), SpreadObservation{now - std::chrono::seconds(10), 0.5, 100.3});
    history.insert(history.begin() + 1, SpreadObservation{now - std::chrono::seconds(1), 0.5, 100.3});

    std::vector<std::string> remarks;
    EXPECT_FALSE(evaluate(evaluator, remarks));
    EXPECT_THAT(remarks, Contains(HasSubstr("awaiting spread confirmation (2/3)")));

    history.insert(history.begin() + 1, SpreadObservation{now - std::chrono::seconds(2), 0.3, 100.3});
    remarks.clear();
    EXPECT_TRUE(evaluate(evaluator, remarks));
}

TEST_F(StrategyEvaluatorTest, MomentumRejectsNarrowingSpread) {
    TradingStrategy strategy;
    strategy.entry.required_confirmations = 1;
    strategy.entry.check_momentum = true;
    StrategyEvaluator evaluator(strategy);

    history.insert(history.begin(), SpreadObservation{now - std::chrono::minutes(1), 0.9, 100.3});

    std::vector<std::string> remarks;
    EXPECT_FALSE(evaluate(evaluator, remarks));
    EXPECT_THAT(remarks, Contains(HasSubstr("momentum: spread narrowing")));
}

TEST_F(StrategyEvaluatorTest, VolatilityFilter) {
    TradingStrategy strategy;
    strategy.entry.required_confirmations = 1;
    strategy.entry.avoid_high_volatility = true;
    strategy.entry.max_volatility_percent = 2.0;
    StrategyEvaluator evaluator(strategy);

    history.insert(history.begin(), SpreadObservation{now - std::chrono::minutes(2), 0.5, 95.0});

    std::vector<std::string> remarks;
    EXPECT_FALSE(evaluate(evaluator, remarks));
    EXPECT_THAT(remarks, Contains(HasSubstr("volatility:")));
}

TEST_F(StrategyEvaluatorTest, OrderBookDepthNeedsBooks) {
    TradingStrategy strategy;
    strategy.entry.required_confirmations = 1;
    strategy.entry.check_orderbook_depth = true;
    strategy.entry.min_orderbook_depth = 1000.0;
    StrategyEvaluator evaluator(strategy);
    EXPECT_TRUE(evaluator.needs_order_books());

    std::vector<std::string> remarks;
    EXPECT_FALSE(evaluate(evaluator, remarks));
    EXPECT_THAT(remarks, Contains(HasSubstr("order book unavailable")));

    types::OrderBook deep;
    deep.asks.push_back(types::OrderBookEntry(100.1, 50.0));
    deep.bids.push_back(types::OrderBookEntry(100.6, 50.0));
    buy_book = deep;
    sell_book = deep;
    remarks.clear();
    EXPECT_TRUE(evaluate(evaluator, remarks));
}

TEST_F(StrategyEvaluatorTest, CustomEntryRuleIsApplied) {
    TradingStrategy strategy;
    strategy.entry.required_confirmations = 1;
    StrategyEvaluator evaluator(strategy);
    evaluator.add_entry_rule({"no_weekend", [](const EntryRuleInput&, const EntryRules&) -> std::optional<std::string> {
        return std::string("market closed");
    }});

    std::vector<std::string> remarks;
    EXPECT_FALSE(evaluate(evaluator, remarks));
    EXPECT_THAT(remarks, ElementsAre("no_weekend: market closed"));
}

TEST_F(StrategyEvaluatorTest, RiskGatesApproveQuietInput) {
    StrategyEvaluator evaluator;
    RiskGateInput input;
    auto decision = evaluator.check_risk_gates(input);
    EXPECT_TRUE(decision.approved);
    EXPECT_THAT(decision.reasons, IsEmpty());
}

TEST_F(StrategyEvaluatorTest, RiskGatesBlockOnLimits) {
    TradingStrategy strategy;
    strategy.risk.max_trades_per_hour = 2;
    strategy.risk.min_seconds_between_trades = 30;
    strategy.risk.max_open_positions = 1;
    strategy.risk.max_daily_loss = 50.0;
    StrategyEvaluator evaluator(strategy);

    RiskGateInput input;
    input.trades_last_hour = 2;
    input.last_trade_time = input.now - std::chrono::seconds(5);
    input.open_positions = 1;
    input.daily_loss = 50.0;

    auto decision = evaluator.check_risk_gates(input);
    EXPECT_FALSE(decision.approved);
    EXPECT_EQ(decision.reasons.size(), 4u);
    EXPECT_THAT(decision.reasons, Contains(HasSubstr("max_trades_per_hour:")));
    EXPECT_THAT(decision.reasons, Contains(HasSubstr("min_time_between_trades:")));
    EXPECT_THAT(decision.reasons, Contains(HasSubstr("max_open_positions:")));
    EXPECT_THAT(decision.reasons, Contains(HasSubstr("max_daily_loss:")));
}

TEST_F(StrategyEvaluatorTest, LossStreakCoolsDown) {
    TradingStrategy strategy;
    strategy.risk.max_consecutive_losses = 3;
    strategy.risk.pause_after_losses_minutes = 30;
    StrategyEvaluator evaluator(strategy);

    RiskGateInput input;
    input.consecutive_losses = 3;
    input.last_loss_time = input.now - std::chrono::minutes(10);
    EXPECT_FALSE(evaluator.check_risk_gates(input).approved);

    input.last_loss_time = input.now - std::chrono::minutes(31);
    EXPECT_TRUE(evaluator.check_risk_gates(input).approved);
}

TEST_F(StrategyEvaluatorTest, ExitSignalsInPriority) {
    TradingStrategy strategy;
    strategy.exit.take_profit_percent = 0.5;
    strategy.exit.stop_loss_percent = 0.3;
    strategy.exit.max_hold_time_minutes = 30;
    StrategyEvaluator evaluator(strategy);

    HeldPosition position;
    position.entry_price = 100.0;
    position.peak_price = 100.0;
    position.opened_at = now;

    EXPECT_EQ(evaluator.evaluate_exit(position, 100.1, now), ExitSignal::NONE);
    EXPECT_EQ(evaluator.evaluate_exit(position, 99.6, now), ExitSignal::STOP_LOSS);
    EXPECT_EQ(evaluator.evaluate_exit(position, 100.6, now), ExitSignal::TAKE_PROFIT);
    EXPECT_DOUBLE_EQ(position.peak_price, 100.6);
    EXPECT_EQ(evaluator.evaluate_exit(position, 100.1, now + std::chrono::minutes(31)), ExitSignal::MAX_HOLD_TIME);
}

TEST_F(StrategyEvaluatorTest, TrailingStopAfterActivation) {
    TradingStrategy strategy;
    strategy.exit.take_profit_percent = 5.0;
    strategy.exit.use_trailing_stop = true;
    strategy.exit.trailing_stop_activation_percent = 0.3;
    strategy.exit.trailing_stop_distance_percent = 0.1;
    StrategyEvaluator evaluator(strategy);

    HeldPosition position;
    position.entry_price = 100.0;
    position.peak_price = 100.0;
    position.opened_at = now;

    EXPECT_EQ(evaluator.evaluate_exit(position, 100.4, now), ExitSignal::NONE);
    EXPECT_EQ(evaluator.evaluate_exit(position, 100.25, now), ExitSignal::TRAILING_STOP);
}

TEST(TradingStrategyTest, JsonRoundTripKeepsNestedRules) {
    TradingStrategy strategy;
    strategy.name = "aggressive";
    strategy.entry.min_spread_percent = 0.05;
    strategy.risk.max_open_positions = 7;
    strategy.advanced.use_limit_orders = false;

    nlohmann::json j = strategy;
    auto parsed = j.get<TradingStrategy>();
    EXPECT_EQ(parsed.name, "aggressive");
    EXPECT_DOUBLE_EQ(parsed.entry.min_spread_percent, 0.05);
    EXPECT_EQ(parsed.risk.max_open_positions, 7);
    EXPECT_FALSE(parsed.advanced.use_limit_orders);
}

TEST(TradingStrategyTest, PartialJsonKeepsDefaults) {
    auto parsed = nlohmann::json::parse(R"({"entry": {"min_spread_percent": 0.3}})").get<TradingStrategy>();
    EXPECT_DOUBLE_EQ(parsed.entry.min_spread_percent, 0.3);
    EXPECT_DOUBLE_EQ(parsed.entry.max_spread_percent, 5.0);
    EXPECT_EQ(parsed.risk.max_consecutive_losses, 3);
    EXPECT_EQ(parsed.name, "default");
}

TEST(TradingStrategyTest, ValidationFlagsBadValues) {
    TradingStrategy strategy;
    EXPECT_TRUE(strategy.validate().empty());

    strategy.entry.max_spread_percent = 0.1;
    strategy.risk.max_drawdown_percent = 150.0;
    auto errors = strategy.validate();
    EXPECT_EQ(errors.size(), 2u);
}
