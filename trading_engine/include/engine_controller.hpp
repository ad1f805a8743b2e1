#pragma once

#include "arbitrage_types.hpp"
#include "balance_pool.hpp"
#include "engine_settings.hpp"
#include "event_bus.hpp"
#include "exchange/exchange_client.hpp"
#include "trade_history.hpp"
#include "utils/cancellation.hpp"
#include <memory>
#include <string>
#include <vector>

namespace atx {
namespace trading_engine {

// Top-level arbitrage engine. Owns the pair registry and the run lifecycle:
//
//   IDLE/STOPPED/ERROR -> STARTING -> RUNNING <-> PAUSED -> STOPPING -> STOPPED
//
// Expected failures are reported as EngineErrorEvents on the event bus, not
// thrown. Event listeners run on engine threads and must not call start() or
// stop() synchronously.
class EngineController {
public:
    EngineController(const EngineSettings& settings,
                     std::shared_ptr<exchange::ExchangeClientFactory> client_factory,
                     std::shared_ptr<TradeHistoryRecorder> trade_history = nullptr);
    ~EngineController();

    EngineController(const EngineController&) = delete;
    EngineController& operator=(const EngineController&) = delete;

    // Returns the resulting status. Already running: returns the current status unchanged.
    // Cancelling `token` stops the run as if stop() had been called.
    EngineStatus start(const utils::CancellationToken& token = utils::CancellationToken());
    // Waits up to the shutdown grace period for sell legs in flight
    EngineStatus stop();
    bool pause(const std::string& reason = "paused by operator");
    bool resume();

    EngineStatus get_status() const;
    bool is_running() const;
    std::string get_last_error() const;

    // Throws ValidationError unless the pair names both configured exchanges
    void add_trading_pair(const types::TradingPair& pair);
    bool remove_trading_pair(const std::string& symbol);
    bool set_trading_pair_enabled(const std::string& symbol, bool enabled);
    std::vector<types::TradingPair> get_trading_pairs() const;

    SpreadOpportunity analyze_opportunity(const types::TradingPair& pair);
    TradeResult execute_arbitrage(const SpreadOpportunity& opportunity);

    // Strategy, thresholds and pairs reload. Exchange legs cannot change.
    bool update_config(const EngineSettings& settings);
    EngineSettings get_current_config() const;

    void reset_daily_stats();
    DailyStats get_today_stats() const;
    std::vector<TradeResult> get_trade_history(size_t count = 100) const;

    std::vector<HeldPosition> get_held_positions() const;
    bool acknowledge_held_position(const std::string& trade_id);

    EventBus& events();
    EventBus::SubscriptionId subscribe(EventBus::Listener listener);
    bool unsubscribe(EventBus::SubscriptionId id);

    BalancePool& balance_pool();
    size_t in_flight_executions() const;

private:
    struct Implementation;
    std::unique_ptr<Implementation> impl_;
};

} // namespace trading_engine
} // namespace atx
