#pragma once

#include "arbitrage_types.hpp"
#include "engine_settings.hpp"
#include "market_data_poller.hpp"
#include "strategy_evaluator.hpp"
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace atx {
namespace trading_engine {

struct ExchangeFees {
    double taker_fee_percent;
    double maker_fee_percent;

    ExchangeFees() : taker_fee_percent(0.1), maker_fee_percent(0.1) {}
    ExchangeFees(double taker, double maker) : taker_fee_percent(taker), maker_fee_percent(maker) {}
};

struct DetectorStatistics {
    uint64_t evaluations = 0;
    uint64_t invalid = 0;
    uint64_t tradeable = 0;
};

// Turns a pair of tickers into a SpreadOpportunity. Market data gaps produce
// a non-tradeable opportunity with remarks, never an exception.
class OpportunityDetector {
public:
    OpportunityDetector(std::shared_ptr<StrategyEvaluator> evaluator, const EngineConfig& config);

    void set_exchange_fees(const std::string& exchange, const ExchangeFees& fees);
    ExchangeFees get_exchange_fees(const std::string& exchange) const;
    void update_config(const EngineConfig& config);

    // `balances` caps the suggested quantity by what the buy and sell legs hold
    SpreadOpportunity evaluate(const types::TradingPair& pair,
                               const types::Ticker& ticker_a,
                               const types::Ticker& ticker_b,
                               const std::optional<types::OrderBook>& book_a = std::nullopt,
                               const std::optional<types::OrderBook>& book_b = std::nullopt,
                               const CombinedBalanceSnapshot* balances = nullptr);

    SpreadOpportunity evaluate(const MarketSnapshot& snapshot, const CombinedBalanceSnapshot* balances = nullptr);

    void clear_history(const std::string& symbol);
    size_t history_size(const std::string& symbol) const;

    DetectorStatistics get_statistics() const;

private:
    struct Leg {
        const types::Ticker* buy;
        const types::Ticker* sell;
        const std::optional<types::OrderBook>* buy_book;
        const std::optional<types::OrderBook>* sell_book;
    };

    std::shared_ptr<StrategyEvaluator> evaluator_;

    EngineConfig config_;
    std::unordered_map<std::string, ExchangeFees> fees_;
    mutable std::mutex config_mutex_;

    std::unordered_map<std::string, std::deque<SpreadObservation>> history_;
    mutable std::mutex history_mutex_;

    std::atomic<uint64_t> evaluations_{0};
    std::atomic<uint64_t> invalid_{0};
    std::atomic<uint64_t> tradeable_{0};

    SpreadOpportunity price_direction(const types::TradingPair& pair, ArbitrageDirection direction,
                                      const Leg& leg, const TradingStrategy& strategy) const;
    void size_opportunity(SpreadOpportunity& opportunity, const Leg& leg,
                          const TradingStrategy& strategy, const CombinedBalanceSnapshot* balances) const;
    std::vector<SpreadObservation> record_observation(const std::string& symbol,
                                                      const SpreadObservation& observation,
                                                      const TradingStrategy& strategy);
};

} // namespace trading_engine
} // namespace atx
