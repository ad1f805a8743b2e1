#pragma once

#include "engine_settings.hpp"
#include "exchange/exchange_client.hpp"
#include "price_provider.hpp"
#include "types/common_types.hpp"
#include "utils/cancellation.hpp"
#include "utils/thread_pool.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace atx {
namespace trading_engine {

// Both legs of one pair fetched in the same cycle
struct MarketSnapshot {
    types::TradingPair pair;
    types::Ticker ticker_a;
    types::Ticker ticker_b;
    std::optional<types::OrderBook> book_a;
    std::optional<types::OrderBook> book_b;
    types::Timestamp fetched_at;
};

struct PollerStatistics {
    uint64_t cycles_completed = 0;
    uint64_t cycles_skipped = 0;
    uint64_t fetch_errors = 0;
    uint64_t fetch_timeouts = 0;
};

class MarketDataPoller : public PriceProvider {
public:
    using PriceCallback = std::function<void(const std::string& symbol, const types::Ticker& ticker)>;
    using CycleHandler = std::function<void(const MarketSnapshot& snapshot)>;
    // Current registry entry for the polled pair, nullopt once it is removed
    using PairLookup = std::function<std::optional<types::TradingPair>()>;

    MarketDataPoller(exchange::ExchangeClientMap clients,
                     std::shared_ptr<utils::ThreadPool> io_pool,
                     const EngineConfig& config);
    ~MarketDataPoller() override;

    void set_price_callback(PriceCallback callback);
    void update_config(const EngineConfig& config);

    // Fetches both legs concurrently. Transient failures and timeouts are logged
    // and yield nullopt; anything else propagates to the caller.
    std::optional<MarketSnapshot> poll(const types::TradingPair& pair, bool with_order_books);

    // Polls until `token` is cancelled or the pair disappears from the registry
    void run_pair_loop(const PairLookup& lookup, const utils::CancellationToken& token,
                       const CycleHandler& handler, const std::function<bool()>& wants_order_books);

    std::optional<types::Ticker> get_latest_ticker(const std::string& exchange,
                                                   const std::string& symbol) const;

    // Average mid price of BASE/QUOTE across exchanges from the latest ticker table
    bool get_latest_price(const std::string& asset, const std::string& quote, types::Price& price) override;

    PollerStatistics get_statistics() const;

private:
    exchange::ExchangeClientMap clients_;
    std::shared_ptr<utils::ThreadPool> io_pool_;

    EngineConfig config_;
    mutable std::mutex config_mutex_;

    PriceCallback price_callback_;
    std::mutex callback_mutex_;

    // "exchange|BASE/QUOTE" -> ticker
    std::unordered_map<std::string, types::Ticker> latest_tickers_;
    mutable std::shared_mutex tickers_mutex_;

    std::atomic<uint64_t> cycles_completed_{0};
    std::atomic<uint64_t> cycles_skipped_{0};
    std::atomic<uint64_t> fetch_errors_{0};
    std::atomic<uint64_t> fetch_timeouts_{0};

    exchange::ExchangeClientPtr find_client(const std::string& exchange) const;
    EngineConfig current_config() const;
    void store_ticker(const std::string& symbol, const types::Ticker& ticker);

    template<typename T>
    std::optional<T> await_result(std::future<T>& future, const std::string& exchange,
                                  const std::string& what, std::chrono::milliseconds timeout);
};

} // namespace trading_engine
} // namespace atx
