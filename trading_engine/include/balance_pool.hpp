#pragma once

#include "arbitrage_types.hpp"
#include "emergency_guard.hpp"
#include "engine_settings.hpp"
#include "event_bus.hpp"
#include "exchange/exchange_client.hpp"
#include "price_provider.hpp"
#include "utils/thread_pool.hpp"
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace atx {
namespace trading_engine {

struct BalanceRefreshResult {
    bool success = false;
    CombinedBalanceSnapshot snapshot;
    EmergencyCheck check;
};

// Combined view of the funds held on both exchanges plus the running equity
// state the emergency guard reads. Balance refreshes and trade recording are
// serialized on one mutex.
class BalancePool {
public:
    BalancePool(exchange::ExchangeClientPtr client_a,
                exchange::ExchangeClientPtr client_b,
                PriceProvider* price_provider,
                std::shared_ptr<EmergencyGuard> guard,
                EventPusher* event_pusher,
                std::shared_ptr<utils::ThreadPool> io_pool,
                const EngineConfig& config,
                const types::RiskConfig& risk_config);
    ~BalancePool();

    // Takes the first snapshot and resets initial and peak equity
    bool initialize();
    bool is_initialized() const;

    BalanceRefreshResult update_balances();

    // Applies realized PnL immediately and re-runs the guard
    EmergencyCheck record_trade(const TradeResult& result);

    EmergencyCheck check_emergency() const;

    // Percent below the last equity high-water mark, within [0, 100]
    double current_drawdown() const;
    types::Amount current_equity() const;
    types::Amount peak_equity() const;
    types::Amount daily_pnl() const;
    int consecutive_losses() const;

    CombinedBalanceSnapshot get_snapshot() const;
    BalancePoolPnL calculate_pnl() const;
    AssetPoolStatus get_asset_status(const types::Currency& asset) const;
    std::map<types::Currency, AssetPoolStatus> get_all_asset_statuses() const;
    RebalanceRecommendation calculate_rebalance() const;
    std::vector<CombinedBalanceSnapshot> get_history(size_t count = 100) const;

    void reset_daily();
    void reset_loss_streak();
    void update_config(const EngineConfig& config, const types::RiskConfig& risk_config);

private:
    struct RecordedTrade {
        uint64_t sequence;
        types::Amount net_pnl;
    };

    exchange::ExchangeClientPtr client_a_;
    exchange::ExchangeClientPtr client_b_;
    PriceProvider* price_provider_;
    std::shared_ptr<EmergencyGuard> guard_;
    EventPusher* event_pusher_;
    std::shared_ptr<utils::ThreadPool> io_pool_;

    EngineConfig config_;
    types::RiskConfig risk_config_;

    bool initialized_ = false;
    CombinedBalanceSnapshot initial_snapshot_;
    CombinedBalanceSnapshot snapshot_;
    std::deque<CombinedBalanceSnapshot> history_;

    types::Amount snapshot_equity_ = 0.0;
    std::vector<RecordedTrade> trades_since_snapshot_;
    uint64_t trade_sequence_ = 0;
    types::Amount peak_equity_ = 0.0;
    types::Amount realized_pnl_ = 0.0;
    types::Amount total_fees_ = 0.0;
    int trade_count_ = 0;
    types::Amount daily_pnl_ = 0.0;
    int consecutive_losses_ = 0;
    std::deque<TradeOutcome> recent_trades_;
    EmergencyTriggerReason last_published_reason_ = EmergencyTriggerReason::NONE;

    mutable std::mutex mutex_;

    std::optional<CombinedBalanceSnapshot> fetch_snapshot(const EngineConfig& config);
    types::Price price_of(const types::Currency& asset, const std::string& quote_currency) const;

    types::Amount equity_locked() const;
    double drawdown_locked() const;
    void update_peak_locked();
    GuardInput guard_input_locked() const;
    // Returns true when the check should be published
    bool note_check_locked(const EmergencyCheck& check);
    AssetPoolStatus asset_status_locked(const types::Currency& asset) const;

    void publish(EngineEvent event);
};

} // namespace trading_engine
} // namespace atx
