#pragma once

#include "arbitrage_types.hpp"
#include "engine_settings.hpp"
#include "exchange/exchange_client.hpp"
#include "strategy_evaluator.hpp"
#include "utils/cancellation.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace atx {
namespace trading_engine {

struct ExecutionContext {
    utils::CancellationToken run_token;      // no new buy leg once cancelled
    utils::CancellationToken abandon_token;  // stop waiting on a sell leg once cancelled
};

struct ExecutionStatistics {
    uint64_t attempts = 0;
    uint64_t completed = 0;
    uint64_t partial_failures = 0;
    uint64_t buy_failures = 0;
    uint64_t rejected = 0;
    uint64_t errors = 0;
};

// Runs two-leg arbitrage attempts: buy first, then sell exactly what was bought.
// Holds an exclusivity lock per pair symbol; a second attempt on a busy pair is
// rejected, never queued.
class ExecutionCoordinator {
public:
    // Holds the pair's execution lock until destroyed
    class Reservation {
    public:
        Reservation(Reservation&& other) noexcept;
        Reservation& operator=(Reservation&& other) noexcept;
        Reservation(const Reservation&) = delete;
        Reservation& operator=(const Reservation&) = delete;
        ~Reservation();

        const std::string& symbol() const { return symbol_; }
        void release();

    private:
        friend class ExecutionCoordinator;
        Reservation(ExecutionCoordinator* owner, std::string symbol)
            : owner_(owner), symbol_(std::move(symbol)) {}

        ExecutionCoordinator* owner_;
        std::string symbol_;
    };

    ExecutionCoordinator(exchange::ExchangeClientMap clients,
                         std::shared_ptr<StrategyEvaluator> evaluator,
                         const EngineConfig& config);
    ~ExecutionCoordinator();

    std::optional<Reservation> try_reserve(const std::string& symbol);

    // Returns REJECTED when the pair already has an attempt in flight
    TradeResult execute(const SpreadOpportunity& opportunity, const ExecutionContext& context = ExecutionContext());
    TradeResult execute_reserved(Reservation reservation, const SpreadOpportunity& opportunity,
                                 const ExecutionContext& context = ExecutionContext());

    bool is_executing(const std::string& symbol) const;
    size_t in_flight_count() const;
    bool wait_for_idle(std::chrono::milliseconds timeout);
    std::vector<ExecutionAttempt> get_active_attempts() const;

    void update_config(const EngineConfig& config);
    ExecutionStatistics get_statistics() const;

private:
    struct LegOutcome {
        types::Order aggregate;
        std::vector<types::Order> children;
        types::Quantity filled_quantity = 0.0;
        types::Amount filled_value = 0.0;
        types::Amount fees_in_quote = 0.0;
        types::Quantity base_fee = 0.0;  // fee withheld from the bought asset
        std::string error;
        long long elapsed_ms = 0;
    };

    exchange::ExchangeClientMap clients_;
    std::shared_ptr<StrategyEvaluator> evaluator_;

    EngineConfig config_;
    mutable std::mutex config_mutex_;

    std::set<std::string> reserved_symbols_;
    std::unordered_map<std::string, ExecutionAttempt> attempts_;
    mutable std::mutex state_mutex_;
    std::condition_variable idle_cv_;

    std::atomic<uint64_t> trade_counter_{0};
    std::atomic<uint64_t> attempts_count_{0};
    std::atomic<uint64_t> completed_count_{0};
    std::atomic<uint64_t> partial_failure_count_{0};
    std::atomic<uint64_t> buy_failure_count_{0};
    std::atomic<uint64_t> rejected_count_{0};
    std::atomic<uint64_t> error_count_{0};

    void release(const std::string& symbol);
    std::string generate_trade_id();
    void set_stage(const std::string& trade_id, ExecutionStage stage, types::Quantity bought = -1.0);

    LegOutcome run_leg(const std::string& trade_id, types::OrderSide side,
                       const exchange::ExchangeClientPtr& client, const std::string& exchange,
                       const std::string& symbol, const types::TradingPair& pair,
                       types::Quantity quantity, types::Price reference_price,
                       const TradingStrategy& strategy, const ExecutionContext& context);

    types::Order submit_with_retry(const exchange::ExchangeClientPtr& client, const types::OrderRequest& request,
                                   const TradingStrategy& strategy, const utils::CancellationToken& interrupt);

    types::Order await_terminal(const std::string& trade_id, const exchange::ExchangeClientPtr& client,
                                const std::string& symbol, types::Order order,
                                std::chrono::steady_clock::time_point deadline,
                                const utils::CancellationToken& interrupt);

    TradeResult finish(TradeResult result, TradeStatus status);
};

} // namespace trading_engine
} // namespace atx
