#include "emergency_guard.hpp"
#include <cmath>
#include <fmt/format.h>

namespace atx {
namespace trading_engine {

namespace {

constexpr double TARGET_RATIO = 0.5;

RebalanceUrgency urgency_for(double deviation) {
    if (deviation > 0.40) {
        return RebalanceUrgency::CRITICAL;
    }
    if (deviation > 0.35) {
        return RebalanceUrgency::HIGH;
    }
    return RebalanceUrgency::MEDIUM;
}

} // namespace

GuardLimits GuardLimits::from(const RiskRules& rules, const types::RiskConfig& config) {
    GuardLimits limits;
    limits.drawdown_protection = rules.enable_drawdown_protection;
    limits.max_drawdown_percent = rules.max_drawdown_percent;
    limits.max_daily_loss = rules.max_daily_loss;
    limits.max_consecutive_losses = rules.max_consecutive_losses;
    limits.rapid_loss_min_trades = config.rapid_loss_min_trades;
    limits.rapid_loss_window_seconds = config.rapid_loss_window_seconds;
    limits.rapid_loss_threshold_percent = config.rapid_loss_threshold_percent;
    limits.critical_imbalance_threshold = config.critical_imbalance_threshold;
    limits.rebalance_threshold_percent = config.rebalance_threshold_percent;
    limits.imbalance_min_value = config.imbalance_min_value;
    return limits;
}

RebalanceRecommendation calculate_rebalance(const CombinedBalanceSnapshot& snapshot,
                                            double threshold_percent,
                                            types::Amount min_value) {
    RebalanceRecommendation recommendation;
    double worst_deviation = 0.0;

    for (const auto& [asset, balance] : snapshot.assets) {
        if (balance.total <= 0.0 || (min_value > 0.0 && balance.value < min_value)) {
            continue;
        }

        double deviation = std::abs(balance.distribution_ratio - TARGET_RATIO);
        if (deviation * 100.0 <= threshold_percent) {
            continue;
        }

        bool surplus_on_a = balance.distribution_ratio > TARGET_RATIO;
        RebalanceAction action;
        action.asset = asset;
        action.from_exchange = surplus_on_a ? snapshot.exchange_a : snapshot.exchange_b;
        action.to_exchange = surplus_on_a ? snapshot.exchange_b : snapshot.exchange_a;
        action.amount = std::round(balance.total * deviation * 1e8) / 1e8;
        recommendation.actions.push_back(action);

        auto urgency = urgency_for(deviation);
        if (urgency > recommendation.urgency) {
            recommendation.urgency = urgency;
        }
        if (deviation > worst_deviation) {
            worst_deviation = deviation;
            recommendation.asset = asset;
            recommendation.current_ratio = balance.distribution_ratio;
            recommendation.deviation_percent = deviation * 100.0;
        }
    }

    recommendation.target_ratio = TARGET_RATIO;
    recommendation.needed = !recommendation.actions.empty();
    recommendation.reason = recommendation.needed
        ? fmt::format("{} asset(s) need rebalancing ({})", recommendation.actions.size(),
                      to_string(recommendation.urgency))
        : "balances are well distributed";
    return recommendation;
}

EmergencyGuard::EmergencyGuard(const GuardLimits& limits)
    : limits_(limits), rules_(default_rules()) {}

std::vector<GuardRule> EmergencyGuard::default_rules() {
    std::vector<GuardRule> rules;

    rules.push_back({"max_drawdown", EmergencyTriggerReason::MAX_DRAWDOWN_EXCEEDED, EmergencyAction::STOP_TRADING,
        [](const GuardInput& in, const GuardLimits& limits) -> std::optional<std::string> {
            if (limits.drawdown_protection && in.drawdown_percent >= limits.max_drawdown_percent) {
                return fmt::format("drawdown {:.2f}% reached limit {:.2f}%",
                                   in.drawdown_percent, limits.max_drawdown_percent);
            }
            return std::nullopt;
        }});

    rules.push_back({"max_daily_loss", EmergencyTriggerReason::MAX_LOSS_EXCEEDED, EmergencyAction::STOP_TRADING,
        [](const GuardInput& in, const GuardLimits& limits) -> std::optional<std::string> {
            if (limits.max_daily_loss > 0.0 && -in.daily_pnl >= limits.max_daily_loss) {
                return fmt::format("daily loss {:.2f} reached limit {:.2f}", -in.daily_pnl, limits.max_daily_loss);
            }
            return std::nullopt;
        }});

    rules.push_back({"consecutive_losses", EmergencyTriggerReason::CONSECUTIVE_LOSSES, EmergencyAction::PAUSE_TRADING,
        [](const GuardInput& in, const GuardLimits& limits) -> std::optional<std::string> {
            if (limits.max_consecutive_losses > 0 && in.consecutive_losses >= limits.max_consecutive_losses) {
                return fmt::format("{} consecutive losing trades", in.consecutive_losses);
            }
            return std::nullopt;
        }});

    rules.push_back({"rapid_loss_rate", EmergencyTriggerReason::RAPID_LOSS_RATE, EmergencyAction::PAUSE_TRADING,
        [](const GuardInput& in, const GuardLimits& limits) -> std::optional<std::string> {
            if (in.initial_equity <= 0.0) {
                return std::nullopt;
            }
            auto window_start = in.now - std::chrono::seconds(limits.rapid_loss_window_seconds);
            int trades = 0;
            types::Amount pnl = 0.0;
            for (const auto& trade : in.recent_trades) {
                if (trade.time >= window_start) {
                    ++trades;
                    pnl += trade.net_pnl;
                }
            }
            types::Amount threshold = in.initial_equity * limits.rapid_loss_threshold_percent / 100.0;
            if (trades >= limits.rapid_loss_min_trades && -pnl > threshold) {
                return fmt::format("lost {:.2f} over {} trades in {}s", -pnl, trades,
                                   limits.rapid_loss_window_seconds);
            }
            return std::nullopt;
        }});

    rules.push_back({"critical_imbalance", EmergencyTriggerReason::CRITICAL_IMBALANCE, EmergencyAction::PAUSE_TRADING,
        [](const GuardInput& in, const GuardLimits& limits) -> std::optional<std::string> {
            for (const auto& [asset, balance] : in.snapshot.assets) {
                if (balance.total <= 0.0 || balance.value < limits.imbalance_min_value) {
                    continue;
                }
                double deviation = std::abs(balance.distribution_ratio - TARGET_RATIO);
                if (deviation > limits.critical_imbalance_threshold) {
                    return fmt::format("{} is {:.0f}% on {}", asset, balance.distribution_ratio * 100.0,
                                       in.snapshot.exchange_a);
                }
            }
            return std::nullopt;
        }});

    return rules;
}

EmergencyCheck EmergencyGuard::check(const GuardInput& input) const {
    std::lock_guard<std::mutex> lock(mutex_);

    EmergencyCheck result;
    result.checked_at = input.now;
    for (const auto& rule : rules_) {
        auto message = rule.check(input, limits_);
        if (!message) {
            continue;
        }

        result.reason = rule.reason;
        result.action = rule.action;
        result.message = *message;
        if (rule.reason == EmergencyTriggerReason::CRITICAL_IMBALANCE) {
            result.rebalance = calculate_rebalance(input.snapshot, limits_.critical_imbalance_threshold * 100.0,
                                                   limits_.imbalance_min_value);
        }
        return result;
    }
    return result;
}

GuardLimits EmergencyGuard::get_limits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return limits_;
}

void EmergencyGuard::set_limits(const GuardLimits& limits) {
    std::lock_guard<std::mutex> lock(mutex_);
    limits_ = limits;
}

std::vector<std::string> EmergencyGuard::rule_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& rule : rules_) {
        names.push_back(rule.name);
    }
    return names;
}

} // namespace trading_engine
} // namespace atx
