#include "execution_coordinator.hpp"
#include "types/exceptions.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>

namespace atx {
namespace trading_engine {

namespace {

constexpr double QUANTITY_EPSILON = 1e-12;

types::Quantity round_down(types::Quantity quantity, int precision) {
    double factor = std::pow(10.0, precision);
    return std::floor(quantity * factor + 1e-9) / factor;
}

long long elapsed_ms_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

ExecutionCoordinator::Reservation::Reservation(Reservation&& other) noexcept
    : owner_(other.owner_), symbol_(std::move(other.symbol_)) {
    other.owner_ = nullptr;
}

ExecutionCoordinator::Reservation& ExecutionCoordinator::Reservation::operator=(Reservation&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        symbol_ = std::move(other.symbol_);
        other.owner_ = nullptr;
    }
    return *this;
}

ExecutionCoordinator::Reservation::~Reservation() {
    release();
}

void ExecutionCoordinator::Reservation::release() {
    if (owner_) {
        owner_->release(symbol_);
        owner_ = nullptr;
    }
}

ExecutionCoordinator::ExecutionCoordinator(exchange::ExchangeClientMap clients,
                                           std::shared_ptr<StrategyEvaluator> evaluator,
                                           const EngineConfig& config)
    : clients_(std::move(clients)), evaluator_(std::move(evaluator)), config_(config) {}

ExecutionCoordinator::~ExecutionCoordinator() = default;

std::optional<ExecutionCoordinator::Reservation> ExecutionCoordinator::try_reserve(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!reserved_symbols_.insert(symbol).second) {
        return std::nullopt;
    }
    return Reservation(this, symbol);
}

void ExecutionCoordinator::release(const std::string& symbol) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        reserved_symbols_.erase(symbol);
    }
    idle_cv_.notify_all();
}

bool ExecutionCoordinator::is_executing(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return reserved_symbols_.count(symbol) > 0;
}

size_t ExecutionCoordinator::in_flight_count() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return reserved_symbols_.size();
}

bool ExecutionCoordinator::wait_for_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return reserved_symbols_.empty(); });
}

std::vector<ExecutionAttempt> ExecutionCoordinator::get_active_attempts() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    std::vector<ExecutionAttempt> attempts;
    attempts.reserve(attempts_.size());
    for (const auto& [id, attempt] : attempts_) {
        attempts.push_back(attempt);
    }
    return attempts;
}

void ExecutionCoordinator::update_config(const EngineConfig& config) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_ = config;
}

ExecutionStatistics ExecutionCoordinator::get_statistics() const {
    ExecutionStatistics stats;
    stats.attempts = attempts_count_.load();
    stats.completed = completed_count_.load();
    stats.partial_failures = partial_failure_count_.load();
    stats.buy_failures = buy_failure_count_.load();
    stats.rejected = rejected_count_.load();
    stats.errors = error_count_.load();
    return stats;
}

std::string ExecutionCoordinator::generate_trade_id() {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return fmt::format("ATX-{}-{}", ms, ++trade_counter_);
}

void ExecutionCoordinator::set_stage(const std::string& trade_id, ExecutionStage stage, types::Quantity bought) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = attempts_.find(trade_id);
    if (it == attempts_.end()) {
        return;
    }
    it->second.stage = stage;
    if (bought >= 0.0) {
        it->second.bought_quantity = bought;
    }
    utils::Logger::debug("Trade {} stage {}", trade_id, to_string(stage));
}

TradeResult ExecutionCoordinator::execute(const SpreadOpportunity& opportunity, const ExecutionContext& context) {
    auto reservation = try_reserve(opportunity.symbol);
    if (!reservation) {
        ++rejected_count_;
        TradeResult result;
        result.trade_id = generate_trade_id();
        result.symbol = opportunity.symbol;
        result.direction = opportunity.direction;
        result.buy_exchange = opportunity.buy_exchange;
        result.sell_exchange = opportunity.sell_exchange;
        result.opportunity = opportunity;
        result.status = TradeStatus::REJECTED;
        result.error_message = "execution already in flight for " + opportunity.symbol;
        utils::Logger::debug("Dropping opportunity on {}: {}", opportunity.symbol, result.error_message);
        return result;
    }
    return execute_reserved(std::move(*reservation), opportunity, context);
}

TradeResult ExecutionCoordinator::execute_reserved(Reservation reservation, const SpreadOpportunity& opportunity,
                                                   const ExecutionContext& context) {
    ATX_SCOPED_TIMER("execute_arbitrage");
    auto started = std::chrono::steady_clock::now();

    TradeResult result;
    result.trade_id = generate_trade_id();
    result.symbol = opportunity.symbol;
    result.direction = opportunity.direction;
    result.buy_exchange = opportunity.buy_exchange;
    result.sell_exchange = opportunity.sell_exchange;
    result.opportunity = opportunity;
    result.start_time = std::chrono::system_clock::now();

    if (!opportunity.is_valid || opportunity.suggested_quantity <= 0.0 ||
        opportunity.buy_price <= 0.0 || opportunity.sell_price <= 0.0) {
        result.error_message = "opportunity is not executable";
        return finish(std::move(result), TradeStatus::REJECTED);
    }
    if (context.run_token.is_cancelled()) {
        result.error_message = "engine is stopping";
        return finish(std::move(result), TradeStatus::REJECTED);
    }

    auto buy_client = clients_.find(opportunity.buy_exchange);
    auto sell_client = clients_.find(opportunity.sell_exchange);
    if (buy_client == clients_.end() || sell_client == clients_.end()) {
        result.error_message = "no exchange client for " + opportunity.buy_exchange + " or " + opportunity.sell_exchange;
        return finish(std::move(result), TradeStatus::REJECTED);
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ExecutionAttempt attempt;
        attempt.trade_id = result.trade_id;
        attempt.symbol = result.symbol;
        attempts_[result.trade_id] = attempt;
    }
    ++attempts_count_;

    auto strategy = evaluator_->get_strategy();
    const auto& pair = opportunity.pair;
    types::Quantity bought = 0.0;
    types::Price buy_average = 0.0;

    try {
        set_stage(result.trade_id, ExecutionStage::BUY_LEG_SUBMITTED);
        auto buy = run_leg(result.trade_id, types::OrderSide::BUY, buy_client->second, opportunity.buy_exchange,
                           opportunity.buy_symbol, pair, opportunity.suggested_quantity, opportunity.buy_price,
                           strategy, context);
        result.buy_order = buy.aggregate;
        result.buy_child_orders = buy.children;
        result.metadata["buy_leg_ms"] = std::to_string(buy.elapsed_ms);
        result.metadata["buy_orders"] = std::to_string(buy.children.size());

        if (buy.filled_quantity <= QUANTITY_EPSILON) {
            result.error_message = buy.error.empty() ? "buy leg not filled before timeout" : buy.error;
            set_stage(result.trade_id, ExecutionStage::FAILED);
            result.metadata["total_ms"] = std::to_string(elapsed_ms_since(started));
            return finish(std::move(result), TradeStatus::BUY_FAILED);
        }

        bought = buy.filled_quantity;
        buy_average = buy.filled_value / buy.filled_quantity;
        result.metadata["buy_slippage_percent"] =
            fmt::format("{:.6f}", (buy_average - opportunity.buy_price) / opportunity.buy_price * 100.0);
        set_stage(result.trade_id, ExecutionStage::BUY_LEG_FILLED, bought);

        // Sell what actually arrived, never the requested amount
        types::Quantity sell_quantity = round_down(bought - buy.base_fee, pair.quantity_precision);
        LegOutcome sell;
        if (sell_quantity > QUANTITY_EPSILON) {
            set_stage(result.trade_id, ExecutionStage::SELL_LEG_SUBMITTED);
            sell = run_leg(result.trade_id, types::OrderSide::SELL, sell_client->second, opportunity.sell_exchange,
                           opportunity.sell_symbol, pair, sell_quantity, opportunity.sell_price, strategy, context);
        } else {
            sell.error = "bought quantity rounds to zero";
        }
        result.sell_order = sell.aggregate;
        result.sell_child_orders = sell.children;
        result.metadata["sell_leg_ms"] = std::to_string(sell.elapsed_ms);
        result.metadata["sell_orders"] = std::to_string(sell.children.size());
        if (sell.filled_quantity > QUANTITY_EPSILON) {
            types::Price sell_average = sell.filled_value / sell.filled_quantity;
            result.metadata["sell_slippage_percent"] =
                fmt::format("{:.6f}", (opportunity.sell_price - sell_average) / opportunity.sell_price * 100.0);
        }

        bool sell_complete = sell_quantity > QUANTITY_EPSILON &&
                             sell.filled_quantity + QUANTITY_EPSILON >= sell_quantity;

        // PnL covers the matched quantity only; unsold inventory is reported separately
        double matched_share = std::min(1.0, sell.filled_quantity / bought);
        result.buy_value = sell.filled_quantity * buy_average;
        result.sell_value = sell.filled_value;
        result.total_fees = buy.fees_in_quote * matched_share + sell.fees_in_quote;
        result.net_pnl = result.sell_value - result.buy_value - result.total_fees;
        result.pnl_percent = result.buy_value > 0.0 ? result.net_pnl / result.buy_value * 100.0 : 0.0;
        result.metadata["buy_value_total"] = fmt::format("{:.8f}", buy.filled_value);
        result.metadata["total_ms"] = std::to_string(elapsed_ms_since(started));

        if (sell_complete) {
            set_stage(result.trade_id, ExecutionStage::SELL_LEG_FILLED);
            set_stage(result.trade_id, ExecutionStage::COMPLETED);
            return finish(std::move(result), TradeStatus::COMPLETED);
        }

        HeldInventory held;
        held.exchange = opportunity.buy_exchange;
        held.symbol = opportunity.buy_symbol;
        held.asset = pair.base_currency;
        held.quantity = bought - buy.base_fee - sell.filled_quantity;
        held.average_price = buy_average;
        result.held_inventory = held;
        result.metadata["unmatched_quantity"] = fmt::format("{:.8f}", held.quantity);
        result.error_message = sell.error.empty() ? "sell leg not filled before timeout" : sell.error;

        set_stage(result.trade_id, ExecutionStage::PARTIAL_FAILURE);
        utils::TradingLogger::log_partial_failure(result.trade_id, result.symbol, held.exchange,
                                                  held.quantity, result.error_message);
        return finish(std::move(result), TradeStatus::PARTIAL_FAILURE);
    } catch (const std::exception& e) {
        utils::Logger::error("Trade {} failed unexpectedly: {}", result.trade_id, e.what());
        result.error_message = e.what();
        result.metadata["total_ms"] = std::to_string(elapsed_ms_since(started));
        if (bought > QUANTITY_EPSILON) {
            HeldInventory held;
            held.exchange = opportunity.buy_exchange;
            held.symbol = opportunity.buy_symbol;
            held.asset = pair.base_currency;
            held.quantity = bought;
            held.average_price = buy_average;
            result.held_inventory = held;
        }
        set_stage(result.trade_id, ExecutionStage::FAILED);
        return finish(std::move(result), TradeStatus::ERROR);
    }
}

TradeResult ExecutionCoordinator::finish(TradeResult result, TradeStatus status) {
    result.status = status;
    result.end_time = std::chrono::system_clock::now();
    result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(result.end_time - result.start_time).count();

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        attempts_.erase(result.trade_id);
    }

    switch (status) {
        case TradeStatus::COMPLETED: ++completed_count_; break;
        case TradeStatus::PARTIAL_FAILURE: ++partial_failure_count_; break;
        case TradeStatus::BUY_FAILED: ++buy_failure_count_; break;
        case TradeStatus::REJECTED: ++rejected_count_; break;
        case TradeStatus::ERROR: ++error_count_; break;
    }

    if (status != TradeStatus::REJECTED) {
        utils::TradingLogger::log_trade_result(result.trade_id, result.symbol, to_string(status),
                                               result.net_pnl, result.total_fees, result.duration_ms);
    }
    return result;
}

ExecutionCoordinator::LegOutcome ExecutionCoordinator::run_leg(const std::string& trade_id, types::OrderSide side,
                                                               const exchange::ExchangeClientPtr& client,
                                                               const std::string& exchange,
                                                               const std::string& symbol,
                                                               const types::TradingPair& pair,
                                                               types::Quantity quantity,
                                                               types::Price reference_price,
                                                               const TradingStrategy& strategy,
                                                               const ExecutionContext& context) {
    auto leg_started = std::chrono::steady_clock::now();
    bool is_buy = side == types::OrderSide::BUY;
    // The sell leg keeps running through a stop request until the grace period expires
    const utils::CancellationToken& interrupt = is_buy ? context.run_token : context.abandon_token;

    types::OrderType type = strategy.advanced.use_limit_orders ? types::OrderType::LIMIT : types::OrderType::MARKET;
    types::Price limit_price = 0.0;
    if (type == types::OrderType::LIMIT) {
        double offset = strategy.advanced.limit_order_offset_percent / 100.0;
        limit_price = is_buy ? reference_price * (1.0 + offset) : reference_price * (1.0 - offset);
    }

    std::vector<types::Quantity> chunks;
    types::Amount notional = quantity * reference_price;
    if (strategy.advanced.split_large_orders && strategy.advanced.max_single_order_size > 0.0 &&
        notional > strategy.advanced.max_single_order_size) {
        types::Quantity chunk = round_down(strategy.advanced.max_single_order_size / reference_price,
                                           pair.quantity_precision);
        types::Quantity remaining = quantity;
        while (chunk > 0.0 && remaining > QUANTITY_EPSILON) {
            types::Quantity next = std::min(chunk, remaining);
            chunks.push_back(next);
            remaining = round_down(remaining - next, pair.quantity_precision);
        }
    }
    if (chunks.empty()) {
        chunks.push_back(quantity);
    }

    auto deadline = leg_started + std::chrono::seconds(strategy.advanced.order_timeout_seconds);

    LegOutcome outcome;
    for (size_t index = 0; index < chunks.size(); ++index) {
        if (interrupt.is_cancelled()) {
            if (outcome.error.empty()) {
                outcome.error = is_buy ? "engine stopping before buy leg completed" : "sell leg abandoned";
            }
            break;
        }

        types::OrderRequest request;
        request.client_order_id = chunks.size() == 1 ? trade_id + (is_buy ? "-B" : "-S")
                                                     : fmt::format("{}-{}{}", trade_id, is_buy ? "B" : "S", index + 1);
        request.exchange = exchange;
        request.symbol = symbol;
        request.side = side;
        request.type = type;
        request.quantity = chunks[index];
        request.price = limit_price;

        types::Order placed;
        try {
            placed = submit_with_retry(client, request, strategy, interrupt);
        } catch (const ExchangeError& e) {
            outcome.error = e.what();
            utils::Logger::error("Trade {} {} leg rejected on {}: {}", trade_id, types::to_string(side),
                                 exchange, e.what());
            break;
        }

        utils::TradingLogger::log_leg_submitted(trade_id, exchange, symbol, types::to_string(side),
                                                placed.id, request.quantity, request.price);

        types::Order final_order = await_terminal(trade_id, client, symbol, placed, deadline, interrupt);
        final_order.filled_quantity = std::min(final_order.filled_quantity, request.quantity);
        utils::TradingLogger::log_leg_finished(trade_id, exchange, final_order.id,
                                               types::to_string(final_order.status),
                                               final_order.filled_quantity, final_order.avg_fill_price);

        outcome.children.push_back(final_order);
        outcome.filled_quantity += final_order.filled_quantity;
        outcome.filled_value += final_order.filled_value();
        if (final_order.fee_currency == pair.base_currency) {
            outcome.fees_in_quote += final_order.fee * final_order.avg_fill_price;
            if (is_buy) {
                outcome.base_fee += final_order.fee;
            }
        } else {
            outcome.fees_in_quote += final_order.fee;
        }

        if (final_order.status == types::OrderStatus::REJECTED && outcome.error.empty()) {
            outcome.error = final_order.reject_reason.empty() ? "order rejected" : final_order.reject_reason;
        }
        if (final_order.filled_quantity + QUANTITY_EPSILON < request.quantity) {
            break;
        }
    }

    auto& aggregate = outcome.aggregate;
    aggregate.client_order_id = trade_id + (is_buy ? "-B" : "-S");
    aggregate.exchange = exchange;
    aggregate.symbol = symbol;
    aggregate.side = side;
    aggregate.type = type;
    aggregate.quantity = quantity;
    aggregate.price = limit_price;
    aggregate.filled_quantity = std::min(outcome.filled_quantity, quantity);
    aggregate.avg_fill_price = outcome.filled_quantity > 0.0 ? outcome.filled_value / outcome.filled_quantity : 0.0;
    aggregate.fee = outcome.fees_in_quote;
    aggregate.fee_currency = pair.quote_currency;
    if (!outcome.children.empty()) {
        aggregate.id = outcome.children.front().id;
        aggregate.created_at = outcome.children.front().created_at;
        aggregate.updated_at = outcome.children.back().updated_at;
    }

    if (aggregate.filled_quantity + QUANTITY_EPSILON >= quantity) {
        aggregate.status = types::OrderStatus::FILLED;
    } else if (outcome.children.empty()) {
        aggregate.status = types::OrderStatus::REJECTED;
        aggregate.reject_reason = outcome.error;
    } else if (outcome.children.back().is_final()) {
        aggregate.status = aggregate.filled_quantity > 0.0 ? types::OrderStatus::CANCELED
                                                           : outcome.children.back().status;
    } else {
        aggregate.status = aggregate.filled_quantity > 0.0 ? types::OrderStatus::PARTIALLY_FILLED
                                                           : types::OrderStatus::NEW;
    }

    outcome.elapsed_ms = elapsed_ms_since(leg_started);
    return outcome;
}

types::Order ExecutionCoordinator::submit_with_retry(const exchange::ExchangeClientPtr& client,
                                                     const types::OrderRequest& request,
                                                     const TradingStrategy& strategy,
                                                     const utils::CancellationToken& interrupt) {
    int attempts = 1 + (strategy.advanced.retry_failed_orders ? std::max(0, strategy.advanced.max_retries) : 0);

    for (int attempt = 1;; ++attempt) {
        try {
            return client->place_order(request);
        } catch (const ExchangeError& e) {
            if (!e.is_transient() || attempt >= attempts) {
                throw;
            }
            utils::Logger::warn("Order {} submission failed (attempt {}/{}): {}",
                                request.client_order_id, attempt, attempts, e.what());
            if (!interrupt.wait_for(std::chrono::milliseconds(100 * attempt))) {
                throw;
            }
        }
    }
}

types::Order ExecutionCoordinator::await_terminal(const std::string& trade_id, const exchange::ExchangeClientPtr& client,
                                                  const std::string& symbol, types::Order order,
                                                  std::chrono::steady_clock::time_point deadline,
                                                  const utils::CancellationToken& interrupt) {
    std::chrono::milliseconds poll_interval;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        poll_interval = std::chrono::milliseconds(config_.order_poll_interval_ms);
    }

    while (!order.is_final()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            utils::Logger::warn("Trade {} order {} timed out", trade_id, order.id);
            break;
        }
        if (!interrupt.wait_for(poll_interval)) {
            utils::Logger::warn("Trade {} stopped waiting on order {}", trade_id, order.id);
            break;
        }

        try {
            order = client->get_order_status(symbol, order.id);
        } catch (const ExchangeError& e) {
            if (!e.is_transient()) {
                utils::Logger::error("Trade {} lost track of order {}: {}", trade_id, order.id, e.what());
                break;
            }
            utils::Logger::warn("Trade {} status poll failed: {}", trade_id, e.what());
        }
    }

    if (!order.is_final()) {
        try {
            order = client->cancel_order(symbol, order.id);
        } catch (const ExchangeError& e) {
            utils::Logger::critical("Trade {} could not cancel order {}: {}", trade_id, order.id, e.what());
        }
    }
    return order;
}

} // namespace trading_engine
} // namespace atx
