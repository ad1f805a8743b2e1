#include "market_data_poller.hpp"
#include "types/exceptions.hpp"
#include "utils/logger.hpp"
#include <cmath>

namespace atx {
namespace trading_engine {

namespace {

std::string ticker_key(const std::string& exchange, const std::string& symbol) {
    return exchange + "|" + symbol;
}

} // namespace

MarketDataPoller::MarketDataPoller(exchange::ExchangeClientMap clients,
                                   std::shared_ptr<utils::ThreadPool> io_pool,
                                   const EngineConfig& config)
    : clients_(std::move(clients)), io_pool_(std::move(io_pool)), config_(config) {}

MarketDataPoller::~MarketDataPoller() = default;

void MarketDataPoller::set_price_callback(PriceCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    price_callback_ = std::move(callback);
}

void MarketDataPoller::update_config(const EngineConfig& config) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_ = config;
}

EngineConfig MarketDataPoller::current_config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

exchange::ExchangeClientPtr MarketDataPoller::find_client(const std::string& exchange) const {
    auto it = clients_.find(exchange);
    if (it == clients_.end() || !it->second) {
        throw ConfigurationError("no exchange client registered for " + exchange);
    }
    return it->second;
}

template<typename T>
std::optional<T> MarketDataPoller::await_result(std::future<T>& future, const std::string& exchange,
                                                const std::string& what, std::chrono::milliseconds timeout) {
    if (future.wait_for(timeout) != std::future_status::ready) {
        ++fetch_timeouts_;
        utils::Logger::warn("{} request to {} timed out after {}ms", what, exchange, timeout.count());
        return std::nullopt;
    }

    try {
        return future.get();
    } catch (const ExchangeError& e) {
        ++fetch_errors_;
        utils::Logger::warn("{} request to {} failed: {}", what, exchange, e.what());
        return std::nullopt;
    }
}

std::optional<MarketSnapshot> MarketDataPoller::poll(const types::TradingPair& pair, bool with_order_books) {
    auto config = current_config();
    auto timeout = std::chrono::milliseconds(config.ticker_timeout_ms);

    auto client_a = find_client(pair.exchange_a);
    auto client_b = find_client(pair.exchange_b);
    const std::string symbol_a = pair.symbol_on(pair.exchange_a);
    const std::string symbol_b = pair.symbol_on(pair.exchange_b);

    auto future_a = io_pool_->submit([client_a, symbol_a]() { return client_a->get_ticker(symbol_a); });
    auto future_b = io_pool_->submit([client_b, symbol_b]() { return client_b->get_ticker(symbol_b); });

    std::future<types::OrderBook> book_future_a;
    std::future<types::OrderBook> book_future_b;
    if (with_order_books) {
        int depth = config.order_book_depth;
        book_future_a = io_pool_->submit([client_a, symbol_a, depth]() { return client_a->get_order_book(symbol_a, depth); });
        book_future_b = io_pool_->submit([client_b, symbol_b, depth]() { return client_b->get_order_book(symbol_b, depth); });
    }

    auto ticker_a = await_result(future_a, pair.exchange_a, "Ticker", timeout);
    auto ticker_b = await_result(future_b, pair.exchange_b, "Ticker", timeout);

    MarketSnapshot snapshot;
    if (with_order_books) {
        snapshot.book_a = await_result(book_future_a, pair.exchange_a, "Order book", timeout);
        snapshot.book_b = await_result(book_future_b, pair.exchange_b, "Order book", timeout);
    }

    auto now = std::chrono::system_clock::now();
    for (auto* ticker : {&ticker_a, &ticker_b}) {
        if (!ticker->has_value()) {
            continue;
        }
        auto& value = ticker->value();
        if (value.timestamp.time_since_epoch().count() == 0) {
            value.timestamp = now;
        }
    }

    if (ticker_a) {
        ticker_a->symbol = symbol_a;
        ticker_a->exchange = pair.exchange_a;
        store_ticker(pair.symbol, *ticker_a);
    }
    if (ticker_b) {
        ticker_b->symbol = symbol_b;
        ticker_b->exchange = pair.exchange_b;
        store_ticker(pair.symbol, *ticker_b);
    }

    if (!ticker_a || !ticker_b) {
        ++cycles_skipped_;
        utils::Logger::debug("Skipping {} cycle: a leg failed to refresh", pair.symbol);
        return std::nullopt;
    }

    auto skew = ticker_a->timestamp > ticker_b->timestamp
        ? ticker_a->timestamp - ticker_b->timestamp
        : ticker_b->timestamp - ticker_a->timestamp;
    if (skew > std::chrono::milliseconds(config.detection_window_ms)) {
        ++cycles_skipped_;
        utils::Logger::debug("Skipping {} cycle: legs are {}ms apart", pair.symbol,
                             std::chrono::duration_cast<std::chrono::milliseconds>(skew).count());
        return std::nullopt;
    }

    snapshot.pair = pair;
    snapshot.ticker_a = *ticker_a;
    snapshot.ticker_b = *ticker_b;
    snapshot.fetched_at = now;
    ++cycles_completed_;
    return snapshot;
}

void MarketDataPoller::run_pair_loop(const PairLookup& lookup, const utils::CancellationToken& token,
                                     const CycleHandler& handler, const std::function<bool()>& wants_order_books) {
    while (!token.is_cancelled()) {
        auto pair = lookup();
        if (!pair) {
            break;
        }

        auto snapshot = poll(*pair, wants_order_books());
        if (snapshot && !token.is_cancelled()) {
            handler(*snapshot);
        }

        auto interval = std::chrono::milliseconds(current_config().polling_interval_ms);
        if (!token.wait_for(interval)) {
            break;
        }
    }
}

void MarketDataPoller::store_ticker(const std::string& symbol, const types::Ticker& ticker) {
    {
        std::unique_lock<std::shared_mutex> lock(tickers_mutex_);
        latest_tickers_[ticker_key(ticker.exchange, symbol)] = ticker;
    }

    PriceCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = price_callback_;
    }
    if (callback) {
        callback(symbol, ticker);
    }
}

std::optional<types::Ticker> MarketDataPoller::get_latest_ticker(const std::string& exchange,
                                                                 const std::string& symbol) const {
    std::shared_lock<std::shared_mutex> lock(tickers_mutex_);
    auto it = latest_tickers_.find(ticker_key(exchange, symbol));
    if (it == latest_tickers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MarketDataPoller::get_latest_price(const std::string& asset, const std::string& quote, types::Price& price) {
    const std::string suffix = "|" + asset + "/" + quote;

    std::shared_lock<std::shared_mutex> lock(tickers_mutex_);
    double sum = 0.0;
    int count = 0;
    for (const auto& [key, ticker] : latest_tickers_) {
        if (key.size() > suffix.size() &&
            key.compare(key.size() - suffix.size(), suffix.size(), suffix) == 0 &&
            ticker.has_valid_prices()) {
            sum += ticker.mid();
            ++count;
        }
    }

    if (count == 0) {
        return false;
    }
    price = sum / count;
    return true;
}

PollerStatistics MarketDataPoller::get_statistics() const {
    PollerStatistics stats;
    stats.cycles_completed = cycles_completed_.load();
    stats.cycles_skipped = cycles_skipped_.load();
    stats.fetch_errors = fetch_errors_.load();
    stats.fetch_timeouts = fetch_timeouts_.load();
    return stats;
}

} // namespace trading_engine
} // namespace atx
