#pragma once

#include "arbitrage_types.hpp"
#include "trading_strategy.hpp"
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace atx {
namespace trading_engine {

struct SpreadObservation {
    types::Timestamp time;
    double net_spread_percent;
    types::Price mid_price;  // average of both legs
};

// Everything an entry rule may look at for one candidate opportunity
struct EntryRuleInput {
    const SpreadOpportunity& opportunity;
    const types::Ticker& buy_ticker;
    const types::Ticker& sell_ticker;
    const std::optional<types::OrderBook>& buy_book;
    const std::optional<types::OrderBook>& sell_book;
    const std::vector<SpreadObservation>& history;  // oldest first, current cycle included
    types::Timestamp now;
};

struct EntryRule {
    std::string name;
    // Returns a rejection remark, or nullopt when the rule passes
    std::function<std::optional<std::string>(const EntryRuleInput&, const EntryRules&)> check;
};

struct RiskGateInput {
    int trades_last_hour;
    std::optional<types::Timestamp> last_trade_time;
    int open_positions;
    types::Amount daily_loss;  // positive amount lost today
    int consecutive_losses;
    std::optional<types::Timestamp> last_loss_time;
    types::Timestamp now;

    RiskGateInput()
        : trades_last_hour(0), open_positions(0), daily_loss(0.0), consecutive_losses(0),
          now(std::chrono::system_clock::now()) {}
};

struct RiskGate {
    std::string name;
    std::function<std::optional<std::string>(const RiskGateInput&, const RiskRules&)> check;
};

struct RiskDecision {
    bool approved = true;
    std::vector<std::string> reasons;
};

// Holds the active strategy and evaluates it as data-driven rule tables.
// The strategy is read-only during a run; set_strategy swaps it atomically.
class StrategyEvaluator {
public:
    explicit StrategyEvaluator(const TradingStrategy& strategy = TradingStrategy());

    TradingStrategy get_strategy() const;
    void set_strategy(const TradingStrategy& strategy);

    // Appends rejection remarks; true when every entry rule passed
    bool evaluate_entry(const EntryRuleInput& input, std::vector<std::string>& remarks) const;

    RiskDecision check_risk_gates(const RiskGateInput& input) const;

    // Updates the position's peak price as a side effect
    ExitSignal evaluate_exit(HeldPosition& position, types::Price current_price, types::Timestamp now) const;

    void add_entry_rule(EntryRule rule);
    void add_risk_gate(RiskGate gate);
    std::vector<std::string> entry_rule_names() const;
    std::vector<std::string> risk_gate_names() const;

    bool needs_order_books() const;

    static std::vector<EntryRule> default_entry_rules();
    static std::vector<RiskGate> default_risk_gates();

private:
    TradingStrategy strategy_;
    std::vector<EntryRule> entry_rules_;
    std::vector<RiskGate> risk_gates_;
    mutable std::shared_mutex mutex_;
};

} // namespace trading_engine
} // namespace atx
