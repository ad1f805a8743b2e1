#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "market_data_poller.hpp"
#include "exchange/paper_exchange_client.hpp"
#include "mocks/mock_exchange_client.hpp"
#include "types/exceptions.hpp"
#include <atomic>
#include <thread>

using namespace atx;
using namespace atx::trading_engine;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace {

types::ExchangeConfig exchange_config(const std::string& name) {
    types::ExchangeConfig config;
    config.name = name;
    return config;
}

} // namespace

class MarketDataPollerTest : public ::testing::Test {
protected:
    void SetUp() override {
        binance = std::make_shared<exchange::PaperExchangeClient>(exchange_config("binance"));
        upbit = std::make_shared<exchange::PaperExchangeClient>(exchange_config("upbit"));
        binance->set_quote("BTCUSDT", 100.0, 100.2);
        upbit->set_quote("BTCUSDT", 101.0, 101.2);

        config.ticker_timeout_ms = 200;
        io_pool = std::make_shared<utils::ThreadPool>(4);
        poller = std::make_unique<MarketDataPoller>(
            exchange::ExchangeClientMap{{"binance", binance}, {"upbit", upbit}}, io_pool, config);
        pair = types::TradingPair::from_symbol("BTC/USDT", "binance", "upbit");
    }

    std::shared_ptr<exchange::PaperExchangeClient> binance;
    std::shared_ptr<exchange::PaperExchangeClient> upbit;
    EngineConfig config;
    std::shared_ptr<utils::ThreadPool> io_pool;
    std::unique_ptr<MarketDataPoller> poller;
    types::TradingPair pair;
};

TEST_F(MarketDataPollerTest, PollsBothLegs) {
    std::vector<std::string> seen;
    poller->set_price_callback([&](const std::string& symbol, const types::Ticker& ticker) {
        seen.push_back(symbol + "@" + ticker.exchange);
    });

    auto snapshot = poller->poll(pair, false);
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_DOUBLE_EQ(snapshot->ticker_a.ask, 100.2);
    EXPECT_DOUBLE_EQ(snapshot->ticker_b.bid, 101.0);
    EXPECT_EQ(snapshot->ticker_a.exchange, "binance");
    EXPECT_FALSE(snapshot->book_a.has_value());
    EXPECT_THAT(seen, ::testing::UnorderedElementsAre("BTC/USDT@binance", "BTC/USDT@upbit"));
    EXPECT_EQ(poller->get_statistics().cycles_completed, 1u);
}

TEST_F(MarketDataPollerTest, FetchesOrderBooksOnDemand) {
    auto snapshot = poller->poll(pair, true);
    ASSERT_TRUE(snapshot.has_value());
    ASSERT_TRUE(snapshot->book_a.has_value());
    EXPECT_EQ(snapshot->book_a->asks.size(), static_cast<size_t>(config.order_book_depth));
}

TEST_F(MarketDataPollerTest, FailedLegSkipsCycle) {
    upbit->set_online(false);

    EXPECT_FALSE(poller->poll(pair, false).has_value());
    auto stats = poller->get_statistics();
    EXPECT_EQ(stats.cycles_skipped, 1u);
    EXPECT_EQ(stats.fetch_errors, 1u);
    // the healthy leg still refreshes the price table
    EXPECT_TRUE(poller->get_latest_ticker("binance", "BTC/USDT").has_value());
    EXPECT_FALSE(poller->get_latest_ticker("upbit", "BTC/USDT").has_value());
}

TEST_F(MarketDataPollerTest, UnknownExchangeIsAConfigurationError) {
    auto foreign = types::TradingPair::from_symbol("BTC/USDT", "binance", "kraken");
    EXPECT_THROW(poller->poll(foreign, false), ConfigurationError);
}

TEST_F(MarketDataPollerTest, SlowLegTimesOut) {
    auto slow = std::make_shared<NiceMock<mocks::MockExchangeClient>>();
    ON_CALL(*slow, get_ticker(_)).WillByDefault([](const std::string& symbol) {
        std::this_thread::sleep_for(std::chrono::milliseconds(400));
        return types::Ticker(symbol, "upbit", 101.0, 101.2, 1000000.0);
    });
    MarketDataPoller slow_poller({{"binance", binance}, {"upbit", slow}}, io_pool, config);

    EXPECT_FALSE(slow_poller.poll(pair, false).has_value());
    EXPECT_EQ(slow_poller.get_statistics().fetch_timeouts, 1u);
}

TEST_F(MarketDataPollerTest, LatestPriceAveragesExchanges) {
    types::Price price = 0.0;
    EXPECT_FALSE(poller->get_latest_price("BTC", "USDT", price));

    ASSERT_TRUE(poller->poll(pair, false).has_value());
    ASSERT_TRUE(poller->get_latest_price("BTC", "USDT", price));
    EXPECT_NEAR(price, (100.1 + 101.1) / 2.0, 1e-9);
    EXPECT_FALSE(poller->get_latest_price("ETH", "USDT", price));
}

TEST_F(MarketDataPollerTest, PairLoopStopsWhenPairIsRemoved) {
    config.polling_interval_ms = 10;
    poller->update_config(config);

    int cycles = 0;
    utils::CancellationSource source;
    poller->run_pair_loop(
        [&]() -> std::optional<types::TradingPair> {
            if (cycles >= 3) {
                return std::nullopt;
            }
            return pair;
        },
        source.token(),
        [&](const MarketSnapshot&) { ++cycles; },
        []() { return false; });

    EXPECT_EQ(cycles, 3);
}

TEST_F(MarketDataPollerTest, PairLoopStopsOnCancellation) {
    config.polling_interval_ms = 10;
    poller->update_config(config);

    utils::CancellationSource source;
    std::atomic<int> cycles{0};
    std::thread loop([&] {
        poller->run_pair_loop([&]() -> std::optional<types::TradingPair> { return pair; }, source.token(),
                              [&](const MarketSnapshot&) { ++cycles; }, []() { return false; });
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    source.cancel();
    loop.join();
    EXPECT_GT(cycles.load(), 0);
}

TEST(PaperExchangeClientTest, FillsAndChargesTakerFee) {
    types::ExchangeConfig config;
    config.name = "paper";
    config.taker_fee_percent = 0.1;
    exchange::PaperExchangeClient client(config);
    client.set_quote("ETH/USDT", 2000.0, 2001.0);
    client.set_balance("USDT", 5000.0);

    types::OrderRequest request;
    request.symbol = "ETHUSDT";
    request.side = types::OrderSide::BUY;
    request.type = types::OrderType::MARKET;
    request.quantity = 1.0;

    auto order = client.place_order(request);
    EXPECT_EQ(order.status, types::OrderStatus::FILLED);
    EXPECT_DOUBLE_EQ(order.avg_fill_price, 2001.0);
    EXPECT_NEAR(order.fee, 2.001, 1e-9);
    EXPECT_EQ(order.fee_currency, "USDT");

    auto balance = client.get_balance();
    EXPECT_NEAR(balance.total("USDT"), 5000.0 - 2001.0 - 2.001, 1e-9);
    EXPECT_DOUBLE_EQ(balance.total("ETH"), 1.0);
}

TEST(PaperExchangeClientTest, RestingLimitOrderCanBeCancelled) {
    exchange::PaperExchangeClient client(exchange_config("paper"));
    client.set_quote("BTCUSDT", 100.0, 101.0);
    client.set_balance("BTC", 1.0);

    types::OrderRequest request;
    request.symbol = "BTCUSDT";
    request.side = types::OrderSide::SELL;
    request.type = types::OrderType::LIMIT;
    request.price = 105.0;
    request.quantity = 0.5;

    auto order = client.place_order(request);
    EXPECT_EQ(order.status, types::OrderStatus::NEW);
    EXPECT_EQ(client.get_order_status("BTCUSDT", order.id).status, types::OrderStatus::NEW);

    auto cancelled = client.cancel_order("BTCUSDT", order.id);
    EXPECT_EQ(cancelled.status, types::OrderStatus::CANCELED);
    EXPECT_DOUBLE_EQ(cancelled.filled_quantity, 0.0);
    EXPECT_EQ(client.get_order_history().size(), 1u);
}

TEST(PaperExchangeClientTest, RejectsWhatItCannotFill) {
    exchange::PaperExchangeClient client(exchange_config("paper"));
    client.set_quote("BTCUSDT", 100.0, 101.0);

    types::OrderRequest request;
    request.symbol = "BTCUSDT";
    request.side = types::OrderSide::SELL;
    request.quantity = 1.0;
    EXPECT_THROW(client.place_order(request), InsufficientBalanceError);

    request.symbol = "DOGEUSDT";
    try {
        client.get_ticker(request.symbol);
        FAIL() << "expected ExchangeError";
    } catch (const ExchangeError& e) {
        EXPECT_FALSE(e.is_transient());
    }

    client.set_online(false);
    EXPECT_FALSE(client.test_connection());
    try {
        client.get_ticker("BTCUSDT");
        FAIL() << "expected ExchangeError";
    } catch (const ExchangeError& e) {
        EXPECT_TRUE(e.is_transient());
    }
}

TEST(PaperExchangeClientTest, FactoryReusesClients) {
    exchange::PaperExchangeClientFactory factory(
        std::vector<types::ExchangeConfig>{exchange_config("binance"), exchange_config("upbit")});
    EXPECT_EQ(factory.create_client("binance"), factory.create_client("binance"));
    EXPECT_EQ(factory.get_supported_exchanges().size(), 2u);
    EXPECT_THROW(factory.create_client("kraken"), ExchangeError);
}
