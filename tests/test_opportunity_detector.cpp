#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "opportunity_detector.hpp"
#include "strategy_evaluator.hpp"

using namespace atx;
using namespace atx::trading_engine;
using ::testing::Contains;
using ::testing::HasSubstr;

namespace {

types::Ticker make_ticker(const std::string& exchange, double bid, double ask, double volume = 1000000.0) {
    return types::Ticker("BTCUSDT", exchange, bid, ask, volume);
}

} // namespace

class OpportunityDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        strategy.entry.min_spread_percent = 0.08;
        strategy.entry.required_confirmations = 1;
        strategy.entry.min_volume_24h = 1000.0;
        strategy.advanced.use_slippage_protection = true;
        strategy.advanced.max_slippage_percent = 0.05;

        evaluator = std::make_shared<StrategyEvaluator>(strategy);
        detector = std::make_unique<OpportunityDetector>(evaluator, config);
        detector->set_exchange_fees("binance", ExchangeFees(0.1, 0.1));
        detector->set_exchange_fees("upbit", ExchangeFees(0.1, 0.1));

        pair = types::TradingPair::from_symbol("BTC/USDT", "binance", "upbit");
        pair.trade_amount = 100.0;
    }

    TradingStrategy strategy;
    EngineConfig config;
    std::shared_ptr<StrategyEvaluator> evaluator;
    std::unique_ptr<OpportunityDetector> detector;
    types::TradingPair pair;
};

TEST_F(OpportunityDetectorTest, ProfitableSpreadAfterFeesAndSlippage) {
    auto opportunity = detector->evaluate(pair, make_ticker("binance", 100.00, 100.05),
                                          make_ticker("upbit", 100.40, 100.45));

    EXPECT_TRUE(opportunity.is_valid);
    EXPECT_TRUE(opportunity.should_trade);
    EXPECT_EQ(opportunity.direction, ArbitrageDirection::BUY_A_SELL_B);
    EXPECT_EQ(opportunity.buy_exchange, "binance");
    EXPECT_EQ(opportunity.sell_exchange, "upbit");
    EXPECT_DOUBLE_EQ(opportunity.buy_price, 100.05);
    EXPECT_DOUBLE_EQ(opportunity.sell_price, 100.40);
    EXPECT_NEAR(opportunity.gross_spread_percent, 0.34983, 1e-4);
    EXPECT_NEAR(opportunity.fee_percent, 0.2, 1e-12);
    EXPECT_NEAR(opportunity.net_spread_percent, 0.09983, 1e-4);
    EXPECT_NEAR(opportunity.suggested_quantity, 0.9995, 1e-6);
    EXPECT_TRUE(opportunity.remarks.empty());
}

TEST_F(OpportunityDetectorTest, ExpectedProfitDeductsCosts) {
    auto opportunity = detector->evaluate(pair, make_ticker("binance", 100.00, 100.05),
                                          make_ticker("upbit", 100.40, 100.45));

    double qty = opportunity.suggested_quantity;
    double buy_value = qty * 100.05;
    double sell_value = qty * 100.40;
    double expected = sell_value - buy_value - buy_value * 0.001 - sell_value * 0.001 - buy_value * 0.0005;
    EXPECT_NEAR(opportunity.expected_profit, expected, 1e-9);
    EXPECT_GT(opportunity.expected_profit, 0.0);
}

TEST_F(OpportunityDetectorTest, PicksReverseDirection) {
    auto opportunity = detector->evaluate(pair, make_ticker("binance", 100.40, 100.45),
                                          make_ticker("upbit", 100.00, 100.05));

    EXPECT_TRUE(opportunity.should_trade);
    EXPECT_EQ(opportunity.direction, ArbitrageDirection::BUY_B_SELL_A);
    EXPECT_EQ(opportunity.buy_exchange, "upbit");
    EXPECT_EQ(opportunity.sell_exchange, "binance");
    EXPECT_EQ(opportunity.buy_symbol, "BTCUSDT");
}

TEST_F(OpportunityDetectorTest, NetSpreadExactlyAtMinimumTrades) {
    auto probe = detector->evaluate(pair, make_ticker("binance", 100.00, 100.05),
                                    make_ticker("upbit", 100.40, 100.45));

    strategy.entry.min_spread_percent = probe.net_spread_percent;
    evaluator->set_strategy(strategy);
    auto at_minimum = detector->evaluate(pair, make_ticker("binance", 100.00, 100.05),
                                         make_ticker("upbit", 100.40, 100.45));
    EXPECT_TRUE(at_minimum.should_trade);

    strategy.entry.min_spread_percent = probe.net_spread_percent + 0.001;
    evaluator->set_strategy(strategy);
    auto below = detector->evaluate(pair, make_ticker("binance", 100.00, 100.05),
                                    make_ticker("upbit", 100.40, 100.45));
    EXPECT_FALSE(below.should_trade);
    EXPECT_TRUE(below.is_valid);
    EXPECT_THAT(below.remarks, Contains(HasSubstr("min_spread:")));
}

TEST_F(OpportunityDetectorTest, NoOpportunityWhenPricesAreTheSame) {
    auto opportunity = detector->evaluate(pair, make_ticker("binance", 100.0, 100.1),
                                          make_ticker("upbit", 100.0, 100.1));

    EXPECT_TRUE(opportunity.is_valid);
    EXPECT_FALSE(opportunity.should_trade);
    EXPECT_LT(opportunity.net_spread_percent, 0.0);
}

TEST_F(OpportunityDetectorTest, StaleTickerIsInvalid) {
    auto stale = make_ticker("binance", 100.00, 100.05);
    stale.timestamp = std::chrono::system_clock::now() - std::chrono::seconds(10);

    auto opportunity = detector->evaluate(pair, stale, make_ticker("upbit", 100.40, 100.45));

    EXPECT_FALSE(opportunity.is_valid);
    EXPECT_FALSE(opportunity.should_trade);
    EXPECT_THAT(opportunity.remarks, Contains(HasSubstr("stale ticker on binance")));
    EXPECT_EQ(detector->get_statistics().invalid, 1u);
}

TEST_F(OpportunityDetectorTest, NonPositivePriceIsInvalid) {
    auto opportunity = detector->evaluate(pair, make_ticker("binance", 0.0, 100.05),
                                          make_ticker("upbit", 100.40, 100.45));

    EXPECT_FALSE(opportunity.is_valid);
    EXPECT_FALSE(opportunity.should_trade);
    EXPECT_THAT(opportunity.remarks, Contains(HasSubstr("non-positive price")));
}

TEST_F(OpportunityDetectorTest, LegsOutsideDetectionWindowAreInvalid) {
    auto older = make_ticker("binance", 100.00, 100.05);
    older.timestamp = std::chrono::system_clock::now() - std::chrono::milliseconds(3000);

    auto opportunity = detector->evaluate(pair, older, make_ticker("upbit", 100.40, 100.45));

    EXPECT_FALSE(opportunity.is_valid);
    EXPECT_THAT(opportunity.remarks, Contains(HasSubstr("detection window")));
}

TEST_F(OpportunityDetectorTest, TiePrefersLowerFeeBuyExchange) {
    detector->set_exchange_fees("upbit", ExchangeFees(0.05, 0.05));

    auto opportunity = detector->evaluate(pair, make_ticker("binance", 100.0, 100.0),
                                          make_ticker("upbit", 100.0, 100.0));

    EXPECT_EQ(opportunity.direction, ArbitrageDirection::BUY_B_SELL_A);
    EXPECT_EQ(opportunity.buy_exchange, "upbit");
}

TEST_F(OpportunityDetectorTest, RequiresSpreadConfirmation) {
    strategy.entry.required_confirmations = 2;
    strategy.entry.spread_confirmation_seconds = 5;
    evaluator->set_strategy(strategy);

    auto first = detector->evaluate(pair, make_ticker("binance", 100.00, 100.05),
                                    make_ticker("upbit", 100.40, 100.45));
    EXPECT_FALSE(first.should_trade);
    EXPECT_THAT(first.remarks, Contains(HasSubstr("spread_confirmation:")));

    auto second = detector->evaluate(pair, make_ticker("binance", 100.00, 100.05),
                                     make_ticker("upbit", 100.40, 100.45));
    EXPECT_TRUE(second.should_trade);
    EXPECT_EQ(detector->history_size("BTC/USDT"), 2u);

    detector->clear_history("BTC/USDT");
    EXPECT_EQ(detector->history_size("BTC/USDT"), 0u);
}

TEST_F(OpportunityDetectorTest, SizingRespectsBalancesAndBookSize) {
    CombinedBalanceSnapshot balances;
    CombinedAssetBalance usdt;
    usdt.asset = "USDT";
    usdt.available_a = 5000.0;
    balances.assets["USDT"] = usdt;
    CombinedAssetBalance btc;
    btc.asset = "BTC";
    btc.available_b = 0.2;
    balances.assets["BTC"] = btc;

    auto opportunity = detector->evaluate(pair, make_ticker("binance", 100.00, 100.05),
                                          make_ticker("upbit", 100.40, 100.45),
                                          std::nullopt, std::nullopt, &balances);
    EXPECT_TRUE(opportunity.should_trade);
    EXPECT_NEAR(opportunity.suggested_quantity, 0.2, 1e-12);

    auto thin = make_ticker("binance", 100.00, 100.05);
    thin.ask_quantity = 0.05;
    auto capped = detector->evaluate(pair, thin, make_ticker("upbit", 100.40, 100.45));
    EXPECT_NEAR(capped.suggested_quantity, 0.05, 1e-12);
}

TEST_F(OpportunityDetectorTest, BelowMinimumOrderSizeIsNotTradeable) {
    pair.min_order_size = 5.0;

    auto opportunity = detector->evaluate(pair, make_ticker("binance", 100.00, 100.05),
                                          make_ticker("upbit", 100.40, 100.45));

    EXPECT_TRUE(opportunity.is_valid);
    EXPECT_FALSE(opportunity.should_trade);
    EXPECT_DOUBLE_EQ(opportunity.suggested_quantity, 0.0);
    EXPECT_THAT(opportunity.remarks, Contains(HasSubstr("sizing:")));
}

TEST_F(OpportunityDetectorTest, LowVolumeBlocksEntry) {
    auto opportunity = detector->evaluate(pair, make_ticker("binance", 100.00, 100.05, 10.0),
                                          make_ticker("upbit", 100.40, 100.45));

    EXPECT_FALSE(opportunity.should_trade);
    EXPECT_THAT(opportunity.remarks, Contains(HasSubstr("min_volume:")));
}
