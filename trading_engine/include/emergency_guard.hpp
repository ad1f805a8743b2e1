#pragma once

#include "arbitrage_types.hpp"
#include "trading_strategy.hpp"
#include "types/common_types.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace atx {
namespace trading_engine {

struct TradeOutcome {
    types::Timestamp time;
    types::Amount net_pnl;
};

struct GuardInput {
    double drawdown_percent;
    types::Amount daily_pnl;            // realized today, negative when losing
    int consecutive_losses;
    std::vector<TradeOutcome> recent_trades;
    types::Amount initial_equity;
    CombinedBalanceSnapshot snapshot;
    types::Timestamp now;

    GuardInput()
        : drawdown_percent(0.0), daily_pnl(0.0), consecutive_losses(0), initial_equity(0.0),
          now(std::chrono::system_clock::now()) {}
};

struct GuardLimits {
    bool drawdown_protection;
    double max_drawdown_percent;
    types::Amount max_daily_loss;
    int max_consecutive_losses;
    int rapid_loss_min_trades;
    int rapid_loss_window_seconds;
    double rapid_loss_threshold_percent;
    double critical_imbalance_threshold;
    double rebalance_threshold_percent;
    types::Amount imbalance_min_value;

    GuardLimits()
        : drawdown_protection(true), max_drawdown_percent(5.0), max_daily_loss(100.0),
          max_consecutive_losses(3), rapid_loss_min_trades(5), rapid_loss_window_seconds(300),
          rapid_loss_threshold_percent(1.0), critical_imbalance_threshold(0.3),
          rebalance_threshold_percent(30.0), imbalance_min_value(10.0) {}

    static GuardLimits from(const RiskRules& rules, const types::RiskConfig& config);
};

struct GuardRule {
    std::string name;
    EmergencyTriggerReason reason;
    EmergencyAction action;
    // Returns the trigger message when the rule fires
    std::function<std::optional<std::string>(const GuardInput&, const GuardLimits&)> check;
};

// Rebalance actions for every asset whose split between the two exchanges
// deviates from 50/50 by more than `threshold_percent` points
RebalanceRecommendation calculate_rebalance(const CombinedBalanceSnapshot& snapshot,
                                            double threshold_percent,
                                            types::Amount min_value = 0.0);

// Pure rule evaluator. It never acts on its verdict; the engine controller does.
class EmergencyGuard {
public:
    explicit EmergencyGuard(const GuardLimits& limits = GuardLimits());

    // First matching rule wins, most severe first
    EmergencyCheck check(const GuardInput& input) const;

    GuardLimits get_limits() const;
    void set_limits(const GuardLimits& limits);

    std::vector<std::string> rule_names() const;

private:
    GuardLimits limits_;
    std::vector<GuardRule> rules_;
    mutable std::mutex mutex_;

    static std::vector<GuardRule> default_rules();
};

} // namespace trading_engine
} // namespace atx
