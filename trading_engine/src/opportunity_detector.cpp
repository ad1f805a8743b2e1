#include "opportunity_detector.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>

namespace atx {
namespace trading_engine {

namespace {

constexpr double TIE_EPSILON = 1e-9;
constexpr size_t MAX_HISTORY_PER_SYMBOL = 1000;

types::Quantity round_down(types::Quantity quantity, int precision) {
    double factor = std::pow(10.0, precision);
    return std::floor(quantity * factor + 1e-9) / factor;
}

} // namespace

OpportunityDetector::OpportunityDetector(std::shared_ptr<StrategyEvaluator> evaluator, const EngineConfig& config)
    : evaluator_(std::move(evaluator)), config_(config) {}

void OpportunityDetector::set_exchange_fees(const std::string& exchange, const ExchangeFees& fees) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    fees_[exchange] = fees;
}

ExchangeFees OpportunityDetector::get_exchange_fees(const std::string& exchange) const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    auto it = fees_.find(exchange);
    return it != fees_.end() ? it->second : ExchangeFees();
}

void OpportunityDetector::update_config(const EngineConfig& config) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_ = config;
}

SpreadOpportunity OpportunityDetector::evaluate(const MarketSnapshot& snapshot, const CombinedBalanceSnapshot* balances) {
    return evaluate(snapshot.pair, snapshot.ticker_a, snapshot.ticker_b, snapshot.book_a, snapshot.book_b, balances);
}

SpreadOpportunity OpportunityDetector::evaluate(const types::TradingPair& pair,
                                                const types::Ticker& ticker_a,
                                                const types::Ticker& ticker_b,
                                                const std::optional<types::OrderBook>& book_a,
                                                const std::optional<types::OrderBook>& book_b,
                                                const CombinedBalanceSnapshot* balances) {
    ++evaluations_;
    auto now = std::chrono::system_clock::now();
    auto strategy = evaluator_->get_strategy();

    EngineConfig config;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config = config_;
    }

    Leg a_to_b{&ticker_a, &ticker_b, &book_a, &book_b};
    Leg b_to_a{&ticker_b, &ticker_a, &book_b, &book_a};

    // Market data gaps are expected: report them on a non-tradeable opportunity
    std::vector<std::string> data_problems;
    for (const auto* ticker : {&ticker_a, &ticker_b}) {
        if (!ticker->has_valid_prices()) {
            data_problems.push_back(fmt::format("non-positive price on {} (bid {}, ask {})",
                                                ticker->exchange, ticker->bid, ticker->ask));
        } else if (now - ticker->timestamp > std::chrono::milliseconds(config.max_ticker_age_ms)) {
            auto age = std::chrono::duration_cast<std::chrono::milliseconds>(now - ticker->timestamp);
            data_problems.push_back(fmt::format("stale ticker on {} ({}ms old)", ticker->exchange, age.count()));
        }
    }
    auto skew = ticker_a.timestamp > ticker_b.timestamp ? ticker_a.timestamp - ticker_b.timestamp
                                                        : ticker_b.timestamp - ticker_a.timestamp;
    if (skew > std::chrono::milliseconds(config.detection_window_ms)) {
        data_problems.push_back("legs refreshed outside one detection window");
    }

    if (!data_problems.empty()) {
        ++invalid_;
        SpreadOpportunity invalid;
        invalid.pair = pair;
        invalid.symbol = pair.symbol;
        invalid.buy_exchange = pair.exchange_a;
        invalid.sell_exchange = pair.exchange_b;
        invalid.remarks = std::move(data_problems);
        return invalid;
    }

    auto forward = price_direction(pair, ArbitrageDirection::BUY_A_SELL_B, a_to_b, strategy);
    auto reverse = price_direction(pair, ArbitrageDirection::BUY_B_SELL_A, b_to_a, strategy);

    bool pick_reverse = reverse.net_spread_percent > forward.net_spread_percent + TIE_EPSILON;
    if (std::abs(reverse.net_spread_percent - forward.net_spread_percent) <= TIE_EPSILON &&
        strategy.advanced.enable_fee_optimization && strategy.advanced.prefer_lower_fee_exchange) {
        pick_reverse = get_exchange_fees(pair.exchange_b).taker_fee_percent <
                       get_exchange_fees(pair.exchange_a).taker_fee_percent;
    }

    SpreadOpportunity opportunity = pick_reverse ? reverse : forward;
    const Leg& leg = pick_reverse ? b_to_a : a_to_b;
    opportunity.is_valid = true;
    opportunity.detected_at = now;

    SpreadObservation observation{now, opportunity.net_spread_percent,
                                  (ticker_a.mid() + ticker_b.mid()) / 2.0};
    auto history = record_observation(pair.symbol, observation, strategy);

    EntryRuleInput input{opportunity, *leg.buy, *leg.sell, *leg.buy_book, *leg.sell_book, history, now};
    bool entry_passed = evaluator_->evaluate_entry(input, opportunity.remarks);

    size_opportunity(opportunity, leg, strategy, balances);

    opportunity.should_trade = entry_passed && opportunity.suggested_quantity > 0.0;
    if (opportunity.should_trade) {
        ++tradeable_;
    }
    return opportunity;
}

SpreadOpportunity OpportunityDetector::price_direction(const types::TradingPair& pair, ArbitrageDirection direction,
                                                       const Leg& leg, const TradingStrategy& strategy) const {
    SpreadOpportunity opportunity;
    opportunity.pair = pair;
    opportunity.symbol = pair.symbol;
    opportunity.direction = direction;
    bool buy_on_a = direction == ArbitrageDirection::BUY_A_SELL_B;
    opportunity.buy_exchange = buy_on_a ? pair.exchange_a : pair.exchange_b;
    opportunity.sell_exchange = buy_on_a ? pair.exchange_b : pair.exchange_a;
    opportunity.buy_symbol = pair.symbol_on(opportunity.buy_exchange);
    opportunity.sell_symbol = pair.symbol_on(opportunity.sell_exchange);
    opportunity.buy_price = leg.buy->ask;
    opportunity.sell_price = leg.sell->bid;

    opportunity.gross_spread_percent =
        (opportunity.sell_price - opportunity.buy_price) / opportunity.buy_price * 100.0;
    opportunity.fee_percent = get_exchange_fees(opportunity.buy_exchange).taker_fee_percent +
                              get_exchange_fees(opportunity.sell_exchange).taker_fee_percent;
    opportunity.slippage_percent = strategy.slippage_allowance_percent();
    opportunity.net_spread_percent =
        opportunity.gross_spread_percent - opportunity.fee_percent - opportunity.slippage_percent;
    return opportunity;
}

void OpportunityDetector::size_opportunity(SpreadOpportunity& opportunity, const Leg& leg,
                                           const TradingStrategy& strategy,
                                           const CombinedBalanceSnapshot* balances) const {
    const auto& pair = opportunity.pair;
    types::Amount notional = std::min(pair.trade_amount, strategy.risk.max_position_size);

    const CombinedAssetBalance* quote_balance = nullptr;
    const CombinedAssetBalance* base_balance = nullptr;
    if (balances) {
        auto quote_it = balances->assets.find(pair.quote_currency);
        auto base_it = balances->assets.find(pair.base_currency);
        quote_balance = quote_it != balances->assets.end() ? &quote_it->second : nullptr;
        base_balance = base_it != balances->assets.end() ? &base_it->second : nullptr;

        types::Amount available_quote = 0.0;
        if (quote_balance) {
            available_quote = opportunity.buy_exchange == pair.exchange_a ? quote_balance->available_a
                                                                         : quote_balance->available_b;
        }
        notional = std::min(notional, available_quote * strategy.risk.max_balance_percent_per_trade / 100.0);
    }

    types::Quantity quantity = notional / opportunity.buy_price;
    if (leg.buy->ask_quantity > 0.0) {
        quantity = std::min(quantity, leg.buy->ask_quantity);
    }
    if (leg.sell->bid_quantity > 0.0) {
        quantity = std::min(quantity, leg.sell->bid_quantity);
    }
    if (balances) {
        types::Quantity available_base = 0.0;
        if (base_balance) {
            available_base = opportunity.sell_exchange == pair.exchange_a ? base_balance->available_a
                                                                         : base_balance->available_b;
        }
        quantity = std::min(quantity, available_base);
    }

    quantity = std::max(0.0, round_down(quantity, pair.quantity_precision));
    if (quantity <= 0.0 || quantity < pair.min_order_size) {
        opportunity.suggested_quantity = 0.0;
        opportunity.remarks.push_back(fmt::format("sizing: quantity {} below minimum order size {}",
                                                  quantity, pair.min_order_size));
        return;
    }

    opportunity.suggested_quantity = quantity;

    double buy_fee = get_exchange_fees(opportunity.buy_exchange).taker_fee_percent / 100.0;
    double sell_fee = get_exchange_fees(opportunity.sell_exchange).taker_fee_percent / 100.0;
    types::Amount buy_value = quantity * opportunity.buy_price;
    types::Amount sell_value = quantity * opportunity.sell_price;
    opportunity.expected_profit = sell_value - buy_value
        - buy_value * buy_fee - sell_value * sell_fee
        - buy_value * opportunity.slippage_percent / 100.0;
}

std::vector<SpreadObservation> OpportunityDetector::record_observation(const std::string& symbol,
                                                                       const SpreadObservation& observation,
                                                                       const TradingStrategy& strategy) {
    auto retention = std::max<std::chrono::seconds>(
        std::chrono::seconds(strategy.entry.spread_confirmation_seconds),
        std::chrono::minutes(strategy.entry.momentum_period_minutes));

    std::lock_guard<std::mutex> lock(history_mutex_);
    auto& history = history_[symbol];
    history.push_back(observation);
    while (!history.empty() &&
           (history.size() > MAX_HISTORY_PER_SYMBOL || history.front().time < observation.time - retention)) {
        history.pop_front();
    }
    return std::vector<SpreadObservation>(history.begin(), history.end());
}

void OpportunityDetector::clear_history(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(history_mutex_);
    history_.erase(symbol);
}

size_t OpportunityDetector::history_size(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    auto it = history_.find(symbol);
    return it != history_.end() ? it->second.size() : 0;
}

DetectorStatistics OpportunityDetector::get_statistics() const {
    DetectorStatistics stats;
    stats.evaluations = evaluations_.load();
    stats.invalid = invalid_.load();
    stats.tradeable = tradeable_.load();
    return stats;
}

} // namespace trading_engine
} // namespace atx
