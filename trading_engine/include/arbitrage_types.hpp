#pragma once

#include "types/common_types.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace atx {
namespace trading_engine {

enum class ArbitrageDirection {
    BUY_A_SELL_B,
    BUY_B_SELL_A
};

// Snapshot of one detection cycle. Never mutated after the detector returns it.
struct SpreadOpportunity {
    types::TradingPair pair;
    std::string symbol;
    ArbitrageDirection direction;
    std::string buy_exchange;
    std::string sell_exchange;
    std::string buy_symbol;   // exchange specific spelling
    std::string sell_symbol;
    types::Price buy_price;   // ask on the buy leg
    types::Price sell_price;  // bid on the sell leg
    double gross_spread_percent;
    double net_spread_percent;
    double fee_percent;       // both taker fees
    double slippage_percent;
    types::Amount expected_profit;
    types::Quantity suggested_quantity;
    bool should_trade;
    bool is_valid;            // false when market data was missing or stale
    std::vector<std::string> remarks;
    types::Timestamp detected_at;

    SpreadOpportunity()
        : direction(ArbitrageDirection::BUY_A_SELL_B), buy_price(0.0), sell_price(0.0),
          gross_spread_percent(0.0), net_spread_percent(0.0), fee_percent(0.0),
          slippage_percent(0.0), expected_profit(0.0), suggested_quantity(0.0),
          should_trade(false), is_valid(false),
          detected_at(std::chrono::system_clock::now()) {}
};

enum class TradeStatus {
    COMPLETED,
    PARTIAL_FAILURE,
    BUY_FAILED,
    REJECTED,
    ERROR
};

// Inventory left on one exchange after a sell leg failed
struct HeldInventory {
    std::string exchange;
    std::string symbol;
    types::Currency asset;
    types::Quantity quantity;
    types::Price average_price;

    HeldInventory() : quantity(0.0), average_price(0.0) {}
};

struct TradeResult {
    std::string trade_id;
    std::string symbol;
    ArbitrageDirection direction;
    std::string buy_exchange;
    std::string sell_exchange;
    TradeStatus status;

    // Aggregated legs; child orders hold every order sent when a leg was split
    types::Order buy_order;
    types::Order sell_order;
    std::vector<types::Order> buy_child_orders;
    std::vector<types::Order> sell_child_orders;

    SpreadOpportunity opportunity;
    types::Amount buy_value;
    types::Amount sell_value;
    types::Amount total_fees;  // quote currency
    types::Amount net_pnl;
    double pnl_percent;
    types::Timestamp start_time;
    types::Timestamp end_time;
    long long duration_ms;
    std::map<std::string, std::string> metadata;
    std::string error_message;
    std::optional<HeldInventory> held_inventory;

    TradeResult()
        : direction(ArbitrageDirection::BUY_A_SELL_B), status(TradeStatus::REJECTED),
          buy_value(0.0), sell_value(0.0), total_fees(0.0), net_pnl(0.0), pnl_percent(0.0),
          start_time(std::chrono::system_clock::now()), end_time(start_time), duration_ms(0) {}

    bool is_loss() const { return net_pnl < 0.0; }
    bool was_attempted() const { return status != TradeStatus::REJECTED; }
};

enum class ExecutionStage {
    PENDING,
    BUY_LEG_SUBMITTED,
    BUY_LEG_FILLED,
    SELL_LEG_SUBMITTED,
    SELL_LEG_FILLED,
    COMPLETED,
    PARTIAL_FAILURE,
    FAILED
};

struct ExecutionAttempt {
    std::string trade_id;
    std::string symbol;
    ExecutionStage stage;
    types::Quantity bought_quantity;
    types::Timestamp started_at;

    ExecutionAttempt()
        : stage(ExecutionStage::PENDING), bought_quantity(0.0),
          started_at(std::chrono::system_clock::now()) {}

    // Past the buy submission the attempt owns exchange-side state
    bool holds_exchange_state() const { return stage != ExecutionStage::PENDING; }
};

enum class EngineStatus {
    IDLE,
    STARTING,
    RUNNING,
    PAUSED,
    STOPPING,
    STOPPED,
    ERROR
};

bool is_valid_transition(EngineStatus from, EngineStatus to);

enum class EmergencyTriggerReason {
    NONE,
    MAX_DRAWDOWN_EXCEEDED,
    MAX_LOSS_EXCEEDED,
    CONSECUTIVE_LOSSES,
    RAPID_LOSS_RATE,
    CRITICAL_IMBALANCE
};

enum class EmergencyAction {
    NONE,
    PAUSE_TRADING,
    STOP_TRADING
};

enum class RebalanceUrgency {
    NONE,
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

struct RebalanceAction {
    types::Currency asset;
    std::string from_exchange;
    std::string to_exchange;
    types::Amount amount;

    RebalanceAction() : amount(0.0) {}
};

struct RebalanceRecommendation {
    bool needed;
    RebalanceUrgency urgency;
    types::Currency asset;
    double current_ratio;
    double target_ratio;
    double deviation_percent;
    std::vector<RebalanceAction> actions;
    std::string reason;
    types::Timestamp created_at;

    RebalanceRecommendation()
        : needed(false), urgency(RebalanceUrgency::NONE), current_ratio(0.5), target_ratio(0.5),
          deviation_percent(0.0), created_at(std::chrono::system_clock::now()) {}
};

struct EmergencyCheck {
    EmergencyTriggerReason reason;
    EmergencyAction action;
    std::string message;
    std::optional<RebalanceRecommendation> rebalance;
    types::Timestamp checked_at;

    EmergencyCheck()
        : reason(EmergencyTriggerReason::NONE), action(EmergencyAction::NONE),
          checked_at(std::chrono::system_clock::now()) {}

    bool triggered() const { return reason != EmergencyTriggerReason::NONE; }
};

// One asset merged across both exchanges
struct CombinedAssetBalance {
    types::Currency asset;
    types::Amount total_a;
    types::Amount available_a;
    types::Amount total_b;
    types::Amount available_b;
    types::Amount total;
    types::Price price;          // in quote currency
    types::Amount value;
    double distribution_ratio;   // total_a / total, 0.5 when empty

    CombinedAssetBalance()
        : total_a(0.0), available_a(0.0), total_b(0.0), available_b(0.0), total(0.0),
          price(0.0), value(0.0), distribution_ratio(0.5) {}
};

struct CombinedBalanceSnapshot {
    std::string exchange_a;
    std::string exchange_b;
    std::map<types::Currency, CombinedAssetBalance> assets;
    types::Amount total_value;
    types::Amount value_a;
    types::Amount value_b;
    types::Timestamp timestamp;

    CombinedBalanceSnapshot()
        : total_value(0.0), value_a(0.0), value_b(0.0),
          timestamp(std::chrono::system_clock::now()) {}
};

struct BalancePoolPnL {
    types::Amount initial_value;
    types::Amount current_value;
    types::Amount realized_pnl;
    double pnl_percent;
    std::map<types::Currency, types::Amount> asset_changes;
    int trade_count;
    types::Amount total_fees;
    types::Timestamp calculated_at;

    BalancePoolPnL()
        : initial_value(0.0), current_value(0.0), realized_pnl(0.0), pnl_percent(0.0),
          trade_count(0), total_fees(0.0), calculated_at(std::chrono::system_clock::now()) {}
};

struct AssetPoolStatus {
    types::Currency asset;
    types::Amount total_a;
    types::Amount total_b;
    double distribution_ratio;
    bool is_critical;  // ratio outside [0.2, 0.8]
    std::string status_message;

    AssetPoolStatus() : total_a(0.0), total_b(0.0), distribution_ratio(0.5), is_critical(false) {}
};

struct DailyStats {
    std::string date;  // YYYY-MM-DD, local time
    int total_trades;
    int successful_trades;
    int failed_trades;
    types::Amount total_profit;
    types::Amount total_loss;
    types::Amount net_pnl;
    types::Amount total_fees;
    types::Amount total_volume;
    double win_rate;
    types::Amount average_pnl;
    types::Amount best_trade;
    types::Amount worst_trade;
    int consecutive_losses;

    DailyStats()
        : total_trades(0), successful_trades(0), failed_trades(0), total_profit(0.0),
          total_loss(0.0), net_pnl(0.0), total_fees(0.0), total_volume(0.0), win_rate(0.0),
          average_pnl(0.0), best_trade(0.0), worst_trade(0.0), consecutive_losses(0) {}
};

enum class ExitSignal {
    NONE,
    TAKE_PROFIT,
    STOP_LOSS,
    TRAILING_STOP,
    MAX_HOLD_TIME
};

// Inventory stranded by a partial failure, watched by the exit rules
struct HeldPosition {
    std::string trade_id;
    std::string symbol;       // canonical pair symbol
    std::string exchange;
    std::string exchange_symbol;
    types::Currency asset;
    types::Quantity quantity;
    types::Price entry_price;
    types::Price peak_price;
    ExitSignal last_signal;
    types::Timestamp opened_at;

    HeldPosition()
        : quantity(0.0), entry_price(0.0), peak_price(0.0), last_signal(ExitSignal::NONE),
          opened_at(std::chrono::system_clock::now()) {}
};

std::string to_string(ArbitrageDirection direction);
std::string to_string(TradeStatus status);
std::string to_string(ExecutionStage stage);
std::string to_string(EngineStatus status);
std::string to_string(EmergencyTriggerReason reason);
std::string to_string(EmergencyAction action);
std::string to_string(RebalanceUrgency urgency);
std::string to_string(ExitSignal signal);

std::string format_date(types::Timestamp time);

} // namespace trading_engine
} // namespace atx
