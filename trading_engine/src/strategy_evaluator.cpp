#include "strategy_evaluator.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <mutex>

namespace atx {
namespace trading_engine {

namespace {

constexpr double SPREAD_EPSILON = 1e-9;

std::vector<const SpreadObservation*> observations_since(const std::vector<SpreadObservation>& history,
                                                         types::Timestamp since) {
    std::vector<const SpreadObservation*> result;
    for (const auto& observation : history) {
        if (observation.time >= since) {
            result.push_back(&observation);
        }
    }
    return result;
}

} // namespace

StrategyEvaluator::StrategyEvaluator(const TradingStrategy& strategy)
    : strategy_(strategy), entry_rules_(default_entry_rules()), risk_gates_(default_risk_gates()) {}

std::vector<EntryRule> StrategyEvaluator::default_entry_rules() {
    std::vector<EntryRule> rules;

    rules.push_back({"min_spread", [](const EntryRuleInput& in, const EntryRules& entry) -> std::optional<std::string> {
        if (in.opportunity.net_spread_percent + SPREAD_EPSILON < entry.min_spread_percent) {
            return fmt::format("net spread {:.4f}% below minimum {:.4f}%",
                               in.opportunity.net_spread_percent, entry.min_spread_percent);
        }
        return std::nullopt;
    }});

    rules.push_back({"max_spread", [](const EntryRuleInput& in, const EntryRules& entry) -> std::optional<std::string> {
        if (in.opportunity.net_spread_percent > entry.max_spread_percent + SPREAD_EPSILON) {
            return fmt::format("net spread {:.4f}% above maximum {:.4f}%, quotes suspect",
                               in.opportunity.net_spread_percent, entry.max_spread_percent);
        }
        return std::nullopt;
    }});

    rules.push_back({"min_volume", [](const EntryRuleInput& in, const EntryRules& entry) -> std::optional<std::string> {
        double volume = std::min(in.buy_ticker.volume_24h, in.sell_ticker.volume_24h);
        if (volume < entry.min_volume_24h) {
            return fmt::format("24h volume {:.0f} below minimum {:.0f}", volume, entry.min_volume_24h);
        }
        return std::nullopt;
    }});

    rules.push_back({"spread_confirmation", [](const EntryRuleInput& in, const EntryRules& entry) -> std::optional<std::string> {
        if (entry.required_confirmations <= 1) {
            return std::nullopt;
        }
        auto window = observations_since(in.history, in.now - std::chrono::seconds(entry.spread_confirmation_seconds));
        auto confirmations = std::count_if(window.begin(), window.end(), [&](const SpreadObservation* o) {
            return o->net_spread_percent + SPREAD_EPSILON >= entry.min_spread_percent;
        });
        if (confirmations < entry.required_confirmations) {
            return fmt::format("awaiting spread confirmation ({}/{})", confirmations, entry.required_confirmations);
        }
        return std::nullopt;
    }});

    rules.push_back({"momentum", [](const EntryRuleInput& in, const EntryRules& entry) -> std::optional<std::string> {
        if (!entry.check_momentum) {
            return std::nullopt;
        }
        auto window = observations_since(in.history, in.now - std::chrono::minutes(entry.momentum_period_minutes));
        if (window.size() < 2) {
            return std::nullopt;
        }
        if (window.back()->net_spread_percent + SPREAD_EPSILON < window.front()->net_spread_percent) {
            return fmt::format("spread narrowing from {:.4f}% to {:.4f}%",
                               window.front()->net_spread_percent, window.back()->net_spread_percent);
        }
        return std::nullopt;
    }});

    rules.push_back({"volatility", [](const EntryRuleInput& in, const EntryRules& entry) -> std::optional<std::string> {
        if (!entry.avoid_high_volatility) {
            return std::nullopt;
        }
        auto window = observations_since(in.history, in.now - std::chrono::minutes(entry.momentum_period_minutes));
        if (window.size() < 2) {
            return std::nullopt;
        }
        auto [low, high] = std::minmax_element(window.begin(), window.end(),
            [](const SpreadObservation* a, const SpreadObservation* b) { return a->mid_price < b->mid_price; });
        if ((*low)->mid_price <= 0.0) {
            return std::nullopt;
        }
        double volatility = ((*high)->mid_price - (*low)->mid_price) / (*low)->mid_price * 100.0;
        if (volatility > entry.max_volatility_percent) {
            return fmt::format("price volatility {:.2f}% above {:.2f}%", volatility, entry.max_volatility_percent);
        }
        return std::nullopt;
    }});

    rules.push_back({"orderbook_depth", [](const EntryRuleInput& in, const EntryRules& entry) -> std::optional<std::string> {
        if (!entry.check_orderbook_depth) {
            return std::nullopt;
        }
        if (!in.buy_book || !in.sell_book) {
            return std::string("order book unavailable for depth check");
        }
        auto levels = static_cast<size_t>(entry.orderbook_levels);
        double ask_depth = in.buy_book->ask_depth_value(levels);
        double bid_depth = in.sell_book->bid_depth_value(levels);
        if (ask_depth < entry.min_orderbook_depth || bid_depth < entry.min_orderbook_depth) {
            return fmt::format("order book depth {:.0f}/{:.0f} below {:.0f}",
                               ask_depth, bid_depth, entry.min_orderbook_depth);
        }
        return std::nullopt;
    }});

    return rules;
}

std::vector<RiskGate> StrategyEvaluator::default_risk_gates() {
    std::vector<RiskGate> gates;

    gates.push_back({"max_trades_per_hour", [](const RiskGateInput& in, const RiskRules& risk) -> std::optional<std::string> {
        if (risk.max_trades_per_hour > 0 && in.trades_last_hour >= risk.max_trades_per_hour) {
            return fmt::format("{} trades in the last hour, limit {}", in.trades_last_hour, risk.max_trades_per_hour);
        }
        return std::nullopt;
    }});

    gates.push_back({"min_time_between_trades", [](const RiskGateInput& in, const RiskRules& risk) -> std::optional<std::string> {
        if (!in.last_trade_time || risk.min_seconds_between_trades <= 0) {
            return std::nullopt;
        }
        auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(in.now - *in.last_trade_time);
        if (elapsed.count() < risk.min_seconds_between_trades) {
            return fmt::format("last trade {}s ago, minimum gap {}s", elapsed.count(), risk.min_seconds_between_trades);
        }
        return std::nullopt;
    }});

    gates.push_back({"max_open_positions", [](const RiskGateInput& in, const RiskRules& risk) -> std::optional<std::string> {
        if (in.open_positions >= risk.max_open_positions) {
            return fmt::format("{} open positions, limit {}", in.open_positions, risk.max_open_positions);
        }
        return std::nullopt;
    }});

    gates.push_back({"max_daily_loss", [](const RiskGateInput& in, const RiskRules& risk) -> std::optional<std::string> {
        if (risk.max_daily_loss > 0.0 && in.daily_loss >= risk.max_daily_loss) {
            return fmt::format("daily loss {:.2f} reached limit {:.2f}", in.daily_loss, risk.max_daily_loss);
        }
        return std::nullopt;
    }});

    gates.push_back({"pause_after_losses", [](const RiskGateInput& in, const RiskRules& risk) -> std::optional<std::string> {
        if (in.consecutive_losses < risk.max_consecutive_losses || !in.last_loss_time) {
            return std::nullopt;
        }
        auto resume_at = *in.last_loss_time + std::chrono::minutes(risk.pause_after_losses_minutes);
        if (in.now < resume_at) {
            auto remaining = std::chrono::duration_cast<std::chrono::seconds>(resume_at - in.now);
            return fmt::format("{} consecutive losses, cooling down for {}s", in.consecutive_losses, remaining.count());
        }
        return std::nullopt;
    }});

    return gates;
}

TradingStrategy StrategyEvaluator::get_strategy() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return strategy_;
}

void StrategyEvaluator::set_strategy(const TradingStrategy& strategy) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    strategy_ = strategy;
}

bool StrategyEvaluator::evaluate_entry(const EntryRuleInput& input, std::vector<std::string>& remarks) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    bool passed = true;
    for (const auto& rule : entry_rules_) {
        if (auto remark = rule.check(input, strategy_.entry)) {
            remarks.push_back(rule.name + ": " + *remark);
            passed = false;
        }
    }
    return passed;
}

RiskDecision StrategyEvaluator::check_risk_gates(const RiskGateInput& input) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    RiskDecision decision;
    for (const auto& gate : risk_gates_) {
        if (auto reason = gate.check(input, strategy_.risk)) {
            decision.approved = false;
            decision.reasons.push_back(gate.name + ": " + *reason);
        }
    }
    return decision;
}

ExitSignal StrategyEvaluator::evaluate_exit(HeldPosition& position, types::Price current_price,
                                            types::Timestamp now) const {
    if (position.entry_price <= 0.0 || current_price <= 0.0) {
        return ExitSignal::NONE;
    }

    ExitRules exit;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        exit = strategy_.exit;
    }

    position.peak_price = std::max(position.peak_price, current_price);
    double change_percent = (current_price - position.entry_price) / position.entry_price * 100.0;

    if (change_percent <= -exit.stop_loss_percent) {
        return ExitSignal::STOP_LOSS;
    }
    if (change_percent >= exit.take_profit_percent) {
        return ExitSignal::TAKE_PROFIT;
    }
    if (exit.use_trailing_stop) {
        double peak_gain = (position.peak_price - position.entry_price) / position.entry_price * 100.0;
        double drop_from_peak = (position.peak_price - current_price) / position.peak_price * 100.0;
        if (peak_gain >= exit.trailing_stop_activation_percent &&
            drop_from_peak >= exit.trailing_stop_distance_percent) {
            return ExitSignal::TRAILING_STOP;
        }
    }
    if (exit.max_hold_time_minutes > 0 &&
        now - position.opened_at >= std::chrono::minutes(exit.max_hold_time_minutes)) {
        return ExitSignal::MAX_HOLD_TIME;
    }
    return ExitSignal::NONE;
}

void StrategyEvaluator::add_entry_rule(EntryRule rule) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entry_rules_.push_back(std::move(rule));
}

void StrategyEvaluator::add_risk_gate(RiskGate gate) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    risk_gates_.push_back(std::move(gate));
}

std::vector<std::string> StrategyEvaluator::entry_rule_names() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& rule : entry_rules_) {
        names.push_back(rule.name);
    }
    return names;
}

std::vector<std::string> StrategyEvaluator::risk_gate_names() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& gate : risk_gates_) {
        names.push_back(gate.name);
    }
    return names;
}

bool StrategyEvaluator::needs_order_books() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return strategy_.entry.check_orderbook_depth;
}

} // namespace trading_engine
} // namespace atx
