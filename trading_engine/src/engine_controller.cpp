#include "engine_controller.hpp"
#include "emergency_guard.hpp"
#include "execution_coordinator.hpp"
#include "market_data_poller.hpp"
#include "opportunity_detector.hpp"
#include "strategy_evaluator.hpp"
#include "types/exceptions.hpp"
#include "utils/logger.hpp"
#include "utils/thread_pool.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <thread>

namespace atx {
namespace trading_engine {

using utils::Logger;

namespace {

constexpr auto SUPERVISOR_POLL = std::chrono::milliseconds(100);

struct PairWorker {
    std::unique_ptr<utils::CancellationSource> source;
    std::thread thread;
};

void join_worker(PairWorker& worker) {
    if (worker.source) {
        worker.source->cancel();
    }
    if (worker.thread.joinable()) {
        worker.thread.join();
    }
}

} // namespace

struct EngineController::Implementation {
    Implementation(const EngineSettings& settings,
                   std::shared_ptr<exchange::ExchangeClientFactory> factory,
                   std::shared_ptr<TradeHistoryRecorder> trade_history);
    ~Implementation();

    // Run state. Guarded by run_mutex.
    struct RunState {
        bool active = false;
        utils::CancellationToken external;
        std::unique_ptr<utils::CancellationSource> run_source;
        std::unique_ptr<utils::CancellationSource> abandon_source;
        std::unique_ptr<utils::ThreadPool> execution_pool;
        std::map<std::string, PairWorker> workers;
        std::vector<PairWorker> retired;
        std::thread balance_thread;
    };

    EngineSettings settings;
    mutable std::mutex settings_mutex;

    std::shared_ptr<exchange::ExchangeClientFactory> factory;
    exchange::ExchangeClientPtr client_a;
    exchange::ExchangeClientPtr client_b;

    EventBus event_bus;
    std::shared_ptr<utils::ThreadPool> io_pool;
    std::shared_ptr<StrategyEvaluator> evaluator;
    std::unique_ptr<MarketDataPoller> poller;
    std::unique_ptr<OpportunityDetector> detector;
    std::unique_ptr<ExecutionCoordinator> coordinator;
    std::shared_ptr<EmergencyGuard> guard;
    std::unique_ptr<BalancePool> pool;
    std::shared_ptr<TradeHistoryRecorder> history;

    std::map<std::string, types::TradingPair> pairs;
    mutable std::mutex pairs_mutex;

    EngineStatus status = EngineStatus::IDLE;
    std::string last_error;
    mutable std::mutex status_mutex;

    std::mutex lifecycle_mutex;

    RunState run;
    mutable std::mutex run_mutex;

    std::thread supervisor;
    bool stop_requested = false;
    bool run_finished = true;
    std::string stop_reason;
    std::mutex supervisor_mutex;
    std::condition_variable supervisor_cv;

    DailyStats today;
    std::deque<types::Timestamp> trade_times;
    std::optional<types::Timestamp> last_trade_time;
    std::optional<types::Timestamp> last_loss_time;
    mutable std::mutex stats_mutex;

    std::map<std::string, HeldPosition> held_positions;
    mutable std::mutex held_mutex;

    // Lifecycle
    EngineStatus start(const utils::CancellationToken& token);
    EngineStatus stop();
    EngineStatus fail_start(ErrorKind kind, const std::string& message);
    void prime_prices();
    void cleanup_run_locked(const std::string& reason);
    void supervisor_loop();
    void join_supervisor();
    void request_stop(const std::string& reason);
    void fail(const std::string& message);
    bool transition(EngineStatus to, const std::string& message);
    EngineStatus get_status() const;

    // Run loops
    void start_pair_worker_locked(const std::string& symbol);
    void retire_pair_worker(const std::string& symbol);
    void pair_loop(const std::string& symbol, utils::CancellationToken token);
    void balance_loop(utils::CancellationToken token);
    void on_market_snapshot(const MarketSnapshot& snapshot);
    void dispatch(const SpreadOpportunity& opportunity);
    void on_price(const std::string& symbol, const types::Ticker& ticker);

    // Results
    void handle_trade_result(const TradeResult& result);
    void act_on_check(const EmergencyCheck& check);
    void update_stats(const TradeResult& result);
    void roll_daily_stats_locked(types::Timestamp now);
    void roll_daily_stats();
    RiskGateInput build_risk_input();
    void track_held_position(const TradeResult& result);

    std::optional<types::TradingPair> lookup_pair(const std::string& symbol) const;
    types::TradingPair validate_pair(const types::TradingPair& pair) const;
    void apply_fees(const EngineSettings& settings);

    void emit_error(ErrorSeverity severity, ErrorKind kind, const std::string& symbol,
                    const std::string& trade_id, const std::string& message,
                    const std::string& recommended_action,
                    const std::optional<HeldInventory>& held = std::nullopt);
    void publish(EngineEvent event);
};

EngineController::Implementation::Implementation(const EngineSettings& engine_settings,
                                                 std::shared_ptr<exchange::ExchangeClientFactory> client_factory,
                                                 std::shared_ptr<TradeHistoryRecorder> trade_history)
    : settings(engine_settings), factory(std::move(client_factory)) {
    auto errors = settings.validate();
    if (!errors.empty()) {
        std::string joined;
        for (const auto& error : errors) {
            joined += (joined.empty() ? "" : "; ") + error;
        }
        throw ConfigurationError(joined);
    }
    if (!factory) {
        throw ConfigurationError("exchange client factory is required");
    }

    client_a = factory->create_client(settings.exchange_a.name);
    client_b = factory->create_client(settings.exchange_b.name);
    if (!client_a || !client_b) {
        throw ConfigurationError("exchange client factory returned no client");
    }
    exchange::ExchangeClientMap clients{
        {settings.exchange_a.name, client_a},
        {settings.exchange_b.name, client_b}
    };

    io_pool = std::make_shared<utils::ThreadPool>(static_cast<size_t>(std::max(2, settings.engine.io_threads)));
    evaluator = std::make_shared<StrategyEvaluator>(settings.strategy);
    poller = std::make_unique<MarketDataPoller>(clients, io_pool, settings.engine);
    detector = std::make_unique<OpportunityDetector>(evaluator, settings.engine);
    apply_fees(settings);
    coordinator = std::make_unique<ExecutionCoordinator>(clients, evaluator, settings.engine);
    guard = std::make_shared<EmergencyGuard>(GuardLimits::from(settings.strategy.risk, settings.risk));
    pool = std::make_unique<BalancePool>(client_a, client_b, poller.get(), guard, &event_bus,
                                         io_pool, settings.engine, settings.risk);
    history = trade_history ? std::move(trade_history)
                            : std::make_shared<InMemoryTradeHistory>(settings.engine.history_capacity);

    for (const auto& pair : settings.pairs) {
        auto validated = validate_pair(pair);
        pairs[validated.symbol] = validated;
    }

    poller->set_price_callback([this](const std::string& symbol, const types::Ticker& ticker) {
        on_price(symbol, ticker);
    });

    today.date = format_date(std::chrono::system_clock::now());

    Logger::info("Engine controller created for {} <-> {} with {} pairs",
                 settings.exchange_a.name, settings.exchange_b.name, pairs.size());
}

EngineController::Implementation::~Implementation() {
    stop();
    join_supervisor();
    if (io_pool) {
        io_pool->shutdown();
    }
}

// --- lifecycle -------------------------------------------------------------

EngineStatus EngineController::Implementation::get_status() const {
    std::lock_guard<std::mutex> lock(status_mutex);
    return status;
}

bool EngineController::Implementation::transition(EngineStatus to, const std::string& message) {
    EngineStatus from;
    {
        std::lock_guard<std::mutex> lock(status_mutex);
        from = status;
        if (!is_valid_transition(from, to)) {
            return false;
        }
        status = to;
    }

    utils::TradingLogger::log_state_change(to_string(from), to_string(to), message);
    StatusChangedEvent event;
    event.previous = from;
    event.current = to;
    event.message = message;
    publish(event);
    return true;
}

EngineStatus EngineController::Implementation::start(const utils::CancellationToken& token) {
    // A supervisor left over from the previous run has already been told to finish
    join_supervisor();

    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex);

    auto current = get_status();
    if (current == EngineStatus::RUNNING || current == EngineStatus::PAUSED ||
        current == EngineStatus::STARTING || current == EngineStatus::STOPPING) {
        Logger::warn("Engine is already running ({})", to_string(current));
        return current;
    }
    {
        std::lock_guard<std::mutex> lock(run_mutex);
        if (run.active) {
            Logger::warn("Previous run is still shutting down");
            return current;
        }
    }

    if (!transition(EngineStatus::STARTING, "start requested")) {
        return get_status();
    }

    EngineSettings snapshot;
    {
        std::lock_guard<std::mutex> lock(settings_mutex);
        snapshot = settings;
    }

    try {
        for (const auto& client : {client_a, client_b}) {
            client->connect();
            if (!client->test_connection()) {
                throw ExchangeError(client->get_name(), "connection test failed");
            }
        }
    } catch (const std::exception& e) {
        return fail_start(ErrorKind::CONNECTION, e.what());
    }

    prime_prices();

    if (!pool->initialize()) {
        return fail_start(ErrorKind::CONNECTION, "initial balance snapshot failed");
    }

    roll_daily_stats();

    size_t started_pairs = 0;
    try {
        std::lock_guard<std::mutex> lock(run_mutex);
        run.external = token;
        run.run_source = std::make_unique<utils::CancellationSource>(token);
        run.abandon_source = std::make_unique<utils::CancellationSource>();
        run.execution_pool = std::make_unique<utils::ThreadPool>(
            static_cast<size_t>(std::max(1, snapshot.engine.execution_workers)));
        run.active = true;

        std::vector<std::string> enabled;
        {
            std::lock_guard<std::mutex> pairs_lock(pairs_mutex);
            for (const auto& entry : pairs) {
                if (entry.second.enabled) {
                    enabled.push_back(entry.first);
                }
            }
        }
        for (const auto& symbol : enabled) {
            start_pair_worker_locked(symbol);
            ++started_pairs;
        }
        run.balance_thread = std::thread(&Implementation::balance_loop, this, run.run_source->token());

        std::lock_guard<std::mutex> supervisor_lock(supervisor_mutex);
        stop_requested = false;
        run_finished = false;
        stop_reason.clear();
        supervisor = std::thread(&Implementation::supervisor_loop, this);
    } catch (const std::exception& e) {
        fail_start(ErrorKind::UNEXPECTED, fmt::format("failed to start run: {}", e.what()));
        cleanup_run_locked("start failed");
        return get_status();
    }

    transition(EngineStatus::RUNNING, fmt::format("polling {} pairs", started_pairs));
    return get_status();
}

// One ticker round per enabled pair so the initial snapshot values base assets
void EngineController::Implementation::prime_prices() {
    std::vector<types::TradingPair> enabled;
    {
        std::lock_guard<std::mutex> lock(pairs_mutex);
        for (const auto& entry : pairs) {
            if (entry.second.enabled) {
                enabled.push_back(entry.second);
            }
        }
    }

    for (const auto& pair : enabled) {
        try {
            if (!poller->poll(pair, false)) {
                Logger::warn("No opening quotes for {}, its base asset is unpriced", pair.symbol);
            }
        } catch (const std::exception& e) {
            Logger::warn("Price priming for {} failed: {}", pair.symbol, e.what());
        }
    }
}

EngineStatus EngineController::Implementation::fail_start(ErrorKind kind, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(status_mutex);
        last_error = message;
    }
    Logger::error("Engine start failed: {}", message);
    transition(EngineStatus::ERROR, message);
    emit_error(ErrorSeverity::CRITICAL, kind, "", "", message, "check exchange connectivity and restart");
    return get_status();
}

EngineStatus EngineController::Implementation::stop() {
    EngineStatus result;
    {
        std::lock_guard<std::mutex> lifecycle(lifecycle_mutex);
        bool active;
        {
            std::lock_guard<std::mutex> lock(run_mutex);
            active = run.active;
        }
        if (!active) {
            return get_status();
        }
        cleanup_run_locked("stop requested");
        result = get_status();
    }
    join_supervisor();
    return result;
}

// Caller holds lifecycle_mutex
void EngineController::Implementation::cleanup_run_locked(const std::string& reason) {
    std::map<std::string, PairWorker> workers;
    std::vector<PairWorker> retired;
    std::thread balance_thread;
    {
        std::lock_guard<std::mutex> lock(run_mutex);
        if (!run.active) {
            return;
        }
        run.active = false;
    }

    auto current = get_status();
    bool orderly = current == EngineStatus::RUNNING || current == EngineStatus::PAUSED ||
                   current == EngineStatus::STARTING;
    if (orderly) {
        transition(EngineStatus::STOPPING, reason);
    }

    utils::CancellationSource* abandon = nullptr;
    {
        std::lock_guard<std::mutex> lock(run_mutex);
        if (run.run_source) {
            run.run_source->cancel();
        }
        abandon = run.abandon_source.get();
        workers = std::move(run.workers);
        run.workers.clear();
        retired = std::move(run.retired);
        run.retired.clear();
        balance_thread = std::move(run.balance_thread);
    }

    int grace_ms;
    {
        std::lock_guard<std::mutex> lock(settings_mutex);
        grace_ms = settings.engine.shutdown_grace_timeout_ms;
    }

    if (!coordinator->wait_for_idle(std::chrono::milliseconds(grace_ms))) {
        auto attempts = coordinator->get_active_attempts();
        Logger::critical("Shutdown grace period of {}ms expired with {} executions in flight",
                         grace_ms, attempts.size());
        if (abandon) {
            abandon->cancel();
        }
        for (const auto& attempt : attempts) {
            emit_error(ErrorSeverity::CRITICAL, ErrorKind::ABANDONED_EXECUTION, attempt.symbol, attempt.trade_id,
                       fmt::format("execution abandoned at stage {} with {:.8f} bought",
                                   to_string(attempt.stage), attempt.bought_quantity),
                       "reconcile open orders and balances on both exchanges");
        }
    }

    for (auto& entry : workers) {
        join_worker(entry.second);
    }
    for (auto& worker : retired) {
        join_worker(worker);
    }
    if (balance_thread.joinable()) {
        balance_thread.join();
    }

    std::unique_ptr<utils::ThreadPool> execution_pool;
    {
        std::lock_guard<std::mutex> lock(run_mutex);
        execution_pool = std::move(run.execution_pool);
    }
    if (execution_pool) {
        execution_pool->shutdown();
    }

    {
        std::lock_guard<std::mutex> lock(supervisor_mutex);
        run_finished = true;
    }
    supervisor_cv.notify_all();

    if (orderly) {
        transition(EngineStatus::STOPPED, reason);
    }
}

void EngineController::Implementation::supervisor_loop() {
    utils::CancellationToken external;
    {
        std::lock_guard<std::mutex> lock(run_mutex);
        external = run.external;
    }

    std::unique_lock<std::mutex> lock(supervisor_mutex);
    while (!run_finished) {
        if (stop_requested || external.is_cancelled()) {
            std::string reason = stop_requested ? stop_reason : "cancellation requested";
            lock.unlock();
            std::lock_guard<std::mutex> lifecycle(lifecycle_mutex);
            cleanup_run_locked(reason);
            return;
        }
        supervisor_cv.wait_for(lock, SUPERVISOR_POLL);
    }
}

void EngineController::Implementation::join_supervisor() {
    std::thread previous;
    {
        std::lock_guard<std::mutex> lock(supervisor_mutex);
        previous = std::move(supervisor);
    }
    if (!previous.joinable()) {
        return;
    }
    if (previous.get_id() == std::this_thread::get_id()) {
        previous.detach();
    } else {
        previous.join();
    }
}

void EngineController::Implementation::request_stop(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(supervisor_mutex);
        if (run_finished || stop_requested) {
            return;
        }
        stop_requested = true;
        stop_reason = reason;
    }
    supervisor_cv.notify_all();
}

void EngineController::Implementation::fail(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(status_mutex);
        last_error = message;
    }
    Logger::error("Engine fault: {}", message);
    transition(EngineStatus::ERROR, message);
    emit_error(ErrorSeverity::CRITICAL, ErrorKind::UNEXPECTED, "", "", message,
               "inspect logs, reconcile balances and restart the engine");

    {
        std::lock_guard<std::mutex> lock(run_mutex);
        if (run.active && run.run_source) {
            run.run_source->cancel();
        }
    }
    request_stop(message);
}

// --- run loops -------------------------------------------------------------

// Caller holds run_mutex with an active run
void EngineController::Implementation::start_pair_worker_locked(const std::string& symbol) {
    auto existing = run.workers.find(symbol);
    if (existing != run.workers.end()) {
        if (existing->second.source && !existing->second.source->is_cancelled()) {
            return;
        }
        run.retired.push_back(std::move(existing->second));
        run.workers.erase(existing);
    }

    PairWorker worker;
    worker.source = std::make_unique<utils::CancellationSource>(run.run_source->token());
    worker.thread = std::thread(&Implementation::pair_loop, this, symbol, worker.source->token());
    run.workers.emplace(symbol, std::move(worker));
    Logger::debug("Started polling {}", symbol);
}

void EngineController::Implementation::retire_pair_worker(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(run_mutex);
    auto it = run.workers.find(symbol);
    if (it == run.workers.end()) {
        return;
    }
    if (it->second.source) {
        it->second.source->cancel();
    }
    run.retired.push_back(std::move(it->second));
    run.workers.erase(it);
    Logger::debug("Stopped polling {}", symbol);
}

void EngineController::Implementation::pair_loop(const std::string& symbol, utils::CancellationToken token) {
    try {
        poller->run_pair_loop(
            [this, symbol]() { return lookup_pair(symbol); },
            token,
            [this](const MarketSnapshot& snapshot) { on_market_snapshot(snapshot); },
            [this]() { return evaluator->needs_order_books(); });
    } catch (const std::exception& e) {
        fail(fmt::format("polling loop for {} failed: {}", symbol, e.what()));
    }
}

void EngineController::Implementation::balance_loop(utils::CancellationToken token) {
    while (true) {
        int interval_ms;
        {
            std::lock_guard<std::mutex> lock(settings_mutex);
            interval_ms = settings.engine.balance_refresh_interval_ms;
        }
        if (!token.wait_for(std::chrono::milliseconds(interval_ms))) {
            return;
        }

        try {
            auto refresh = pool->update_balances();
            if (refresh.success) {
                act_on_check(refresh.check);
            }
            roll_daily_stats();
        } catch (const std::exception& e) {
            fail(fmt::format("balance refresh failed: {}", e.what()));
            return;
        }
    }
}

void EngineController::Implementation::on_market_snapshot(const MarketSnapshot& snapshot) {
    roll_daily_stats();

    SpreadOpportunity opportunity;
    if (pool->is_initialized()) {
        auto balances = pool->get_snapshot();
        opportunity = detector->evaluate(snapshot, &balances);
    } else {
        opportunity = detector->evaluate(snapshot);
    }
    dispatch(opportunity);
}

void EngineController::Implementation::dispatch(const SpreadOpportunity& opportunity) {
    if (!opportunity.should_trade) {
        return;
    }

    utils::TradingLogger::log_opportunity(opportunity.symbol, opportunity.buy_exchange,
                                          opportunity.sell_exchange, opportunity.buy_price,
                                          opportunity.sell_price, opportunity.net_spread_percent,
                                          opportunity.expected_profit);
    OpportunityFoundEvent found;
    found.opportunity = opportunity;
    publish(found);

    auto current = get_status();
    if (current != EngineStatus::RUNNING) {
        Logger::debug("Discarding {} opportunity while {}", opportunity.symbol, to_string(current));
        return;
    }

    bool dry_run;
    {
        std::lock_guard<std::mutex> lock(settings_mutex);
        dry_run = settings.engine.dry_run;
    }
    if (dry_run) {
        return;
    }

    auto decision = evaluator->check_risk_gates(build_risk_input());
    if (!decision.approved) {
        std::string reasons;
        for (const auto& reason : decision.reasons) {
            reasons += (reasons.empty() ? "" : "; ") + reason;
        }
        Logger::debug("Risk gates blocked {}: {}", opportunity.symbol, reasons);
        return;
    }

    auto reservation = coordinator->try_reserve(opportunity.symbol);
    if (!reservation) {
        Logger::debug("Execution already in flight for {}, dropping opportunity", opportunity.symbol);
        return;
    }

    std::lock_guard<std::mutex> lock(run_mutex);
    if (!run.active || !run.execution_pool) {
        return;
    }
    ExecutionContext context;
    context.run_token = run.run_source->token();
    context.abandon_token = run.abandon_source->token();

    run.execution_pool->submit(
        [this, held = std::move(*reservation), opportunity, context]() mutable {
            auto result = coordinator->execute_reserved(std::move(held), opportunity, context);
            handle_trade_result(result);
        });
}

void EngineController::Implementation::on_price(const std::string& symbol, const types::Ticker& ticker) {
    PriceUpdatedEvent update;
    update.symbol = symbol;
    update.ticker = ticker;
    publish(update);

    std::vector<EngineErrorEvent> advisories;
    {
        std::lock_guard<std::mutex> lock(held_mutex);
        for (auto& entry : held_positions) {
            auto& position = entry.second;
            if (position.symbol != symbol || position.exchange != ticker.exchange) {
                continue;
            }
            auto signal = evaluator->evaluate_exit(position, ticker.bid, ticker.timestamp);
            if (signal == ExitSignal::NONE || signal == position.last_signal) {
                continue;
            }
            position.last_signal = signal;

            EngineErrorEvent advisory;
            advisory.severity = ErrorSeverity::WARNING;
            advisory.kind = ErrorKind::EXIT_ADVISORY;
            advisory.symbol = symbol;
            advisory.trade_id = position.trade_id;
            advisory.message = fmt::format("{}: holding {:.8f} {} on {} bought at {:.8f}, bid now {:.8f}",
                                           to_string(signal), position.quantity, position.asset,
                                           position.exchange, position.entry_price, ticker.bid);
            advisory.recommended_action = "close the held inventory";
            advisories.push_back(advisory);
        }
    }

    for (auto& advisory : advisories) {
        Logger::warn("Exit advisory for {}: {}", advisory.trade_id, advisory.message);
        publish(std::move(advisory));
    }
}

// --- results ---------------------------------------------------------------

void EngineController::Implementation::handle_trade_result(const TradeResult& result) {
    if (result.status == TradeStatus::REJECTED) {
        Logger::debug("Execution for {} rejected: {}", result.symbol, result.error_message);
        return;
    }

    history->record(result);
    update_stats(result);
    auto check = pool->record_trade(result);

    TradeCompletedEvent completed;
    completed.result = result;
    publish(completed);

    switch (result.status) {
        case TradeStatus::BUY_FAILED:
            emit_error(ErrorSeverity::ERROR, ErrorKind::ORDER_SUBMISSION, result.symbol, result.trade_id,
                       result.error_message, "check exchange connectivity and balances");
            break;
        case TradeStatus::PARTIAL_FAILURE:
            track_held_position(result);
            emit_error(ErrorSeverity::CRITICAL, ErrorKind::PARTIAL_FILL, result.symbol, result.trade_id,
                       result.error_message, "sell or transfer the held inventory manually",
                       result.held_inventory);
            break;
        case TradeStatus::ERROR:
            track_held_position(result);
            emit_error(ErrorSeverity::CRITICAL, ErrorKind::UNEXPECTED, result.symbol, result.trade_id,
                       result.error_message, "reconcile balances on both exchanges",
                       result.held_inventory);
            break;
        default:
            break;
    }

    act_on_check(check);

    if (result.status == TradeStatus::ERROR) {
        fail(fmt::format("execution {} failed: {}", result.trade_id, result.error_message));
    }
}

void EngineController::Implementation::act_on_check(const EmergencyCheck& check) {
    if (!check.triggered()) {
        return;
    }

    if (check.action == EmergencyAction::PAUSE_TRADING) {
        if (transition(EngineStatus::PAUSED, check.message)) {
            emit_error(ErrorSeverity::WARNING, ErrorKind::EMERGENCY, "", "", check.message,
                       "review losses then resume trading");
        }
    } else if (check.action == EmergencyAction::STOP_TRADING) {
        auto current = get_status();
        if (current == EngineStatus::RUNNING || current == EngineStatus::PAUSED) {
            emit_error(ErrorSeverity::CRITICAL, ErrorKind::EMERGENCY, "", "", check.message,
                       "investigate before restarting");
            request_stop(check.message);
        }
    }
}

void EngineController::Implementation::roll_daily_stats_locked(types::Timestamp now) {
    auto date = format_date(now);
    if (today.date == date) {
        return;
    }
    Logger::info("Daily stats rollover {} -> {}", today.date, date);
    today = DailyStats();
    today.date = date;
    pool->reset_daily();
}

void EngineController::Implementation::roll_daily_stats() {
    std::lock_guard<std::mutex> lock(stats_mutex);
    roll_daily_stats_locked(std::chrono::system_clock::now());
}

void EngineController::Implementation::update_stats(const TradeResult& result) {
    auto now = std::chrono::system_clock::now();
    std::lock_guard<std::mutex> lock(stats_mutex);
    roll_daily_stats_locked(now);

    bool first = today.total_trades == 0;
    ++today.total_trades;
    if (result.status == TradeStatus::COMPLETED) {
        ++today.successful_trades;
    } else {
        ++today.failed_trades;
    }

    if (result.net_pnl > 0.0) {
        today.total_profit += result.net_pnl;
        today.consecutive_losses = 0;
    } else if (result.net_pnl < 0.0) {
        today.total_loss += -result.net_pnl;
        ++today.consecutive_losses;
        last_loss_time = now;
    }
    today.net_pnl += result.net_pnl;
    today.total_fees += result.total_fees;
    today.total_volume += result.buy_value + result.sell_value;
    today.win_rate = static_cast<double>(today.successful_trades) / today.total_trades * 100.0;
    today.average_pnl = today.net_pnl / today.total_trades;
    today.best_trade = first ? result.net_pnl : std::max(today.best_trade, result.net_pnl);
    today.worst_trade = first ? result.net_pnl : std::min(today.worst_trade, result.net_pnl);

    trade_times.push_back(now);
    last_trade_time = now;
}

RiskGateInput EngineController::Implementation::build_risk_input() {
    RiskGateInput input;
    auto hour_ago = input.now - std::chrono::hours(1);
    {
        std::lock_guard<std::mutex> lock(stats_mutex);
        while (!trade_times.empty() && trade_times.front() < hour_ago) {
            trade_times.pop_front();
        }
        input.trades_last_hour = static_cast<int>(trade_times.size());
        input.last_trade_time = last_trade_time;
        input.last_loss_time = last_loss_time;
    }
    {
        std::lock_guard<std::mutex> lock(held_mutex);
        input.open_positions = static_cast<int>(coordinator->in_flight_count() + held_positions.size());
    }
    input.daily_loss = std::max(0.0, -pool->daily_pnl());
    input.consecutive_losses = pool->consecutive_losses();
    return input;
}

void EngineController::Implementation::track_held_position(const TradeResult& result) {
    if (!result.held_inventory || result.held_inventory->quantity <= 0.0) {
        return;
    }
    const auto& held = *result.held_inventory;

    HeldPosition position;
    position.trade_id = result.trade_id;
    position.symbol = result.symbol;
    position.exchange = held.exchange;
    position.exchange_symbol = held.symbol;
    position.asset = held.asset;
    position.quantity = held.quantity;
    position.entry_price = held.average_price;
    position.peak_price = held.average_price;

    std::lock_guard<std::mutex> lock(held_mutex);
    held_positions[result.trade_id] = position;
}

// --- helpers ---------------------------------------------------------------

std::optional<types::TradingPair> EngineController::Implementation::lookup_pair(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(pairs_mutex);
    auto it = pairs.find(symbol);
    if (it == pairs.end() || !it->second.enabled) {
        return std::nullopt;
    }
    return it->second;
}

types::TradingPair EngineController::Implementation::validate_pair(const types::TradingPair& pair) const {
    if (pair.symbol.empty()) {
        throw ValidationError("trading pair symbol is empty");
    }
    if (!pair.has_distinct_legs()) {
        throw ValidationError("trading pair " + pair.symbol + " must name two distinct exchanges");
    }

    std::string name_a;
    std::string name_b;
    {
        std::lock_guard<std::mutex> lock(settings_mutex);
        name_a = settings.exchange_a.name;
        name_b = settings.exchange_b.name;
    }
    bool forward = pair.exchange_a == name_a && pair.exchange_b == name_b;
    bool reverse = pair.exchange_a == name_b && pair.exchange_b == name_a;
    if (!forward && !reverse) {
        throw ValidationError(fmt::format("trading pair {} must trade between {} and {}",
                                          pair.symbol, name_a, name_b));
    }
    if (pair.trade_amount <= 0.0) {
        throw ValidationError("trading pair " + pair.symbol + " needs a positive trade amount");
    }

    auto normalized = pair;
    auto defaults = types::TradingPair::from_symbol(pair.symbol, pair.exchange_a, pair.exchange_b);
    if (normalized.base_currency.empty()) {
        normalized.base_currency = defaults.base_currency;
    }
    if (normalized.quote_currency.empty()) {
        normalized.quote_currency = defaults.quote_currency;
    }
    if (normalized.symbol_a.empty()) {
        normalized.symbol_a = defaults.symbol_a;
    }
    if (normalized.symbol_b.empty()) {
        normalized.symbol_b = defaults.symbol_b;
    }
    if (normalized.base_currency.empty() || normalized.quote_currency.empty()) {
        throw ValidationError("trading pair symbol " + pair.symbol + " is not BASE/QUOTE");
    }
    return normalized;
}

void EngineController::Implementation::apply_fees(const EngineSettings& engine_settings) {
    for (const auto* exchange_config : {&engine_settings.exchange_a, &engine_settings.exchange_b}) {
        detector->set_exchange_fees(exchange_config->name,
                                    ExchangeFees(exchange_config->taker_fee_percent,
                                                 exchange_config->maker_fee_percent));
    }
}

void EngineController::Implementation::emit_error(ErrorSeverity severity, ErrorKind kind,
                                                  const std::string& symbol, const std::string& trade_id,
                                                  const std::string& message,
                                                  const std::string& recommended_action,
                                                  const std::optional<HeldInventory>& held) {
    EngineErrorEvent event;
    event.severity = severity;
    event.kind = kind;
    event.symbol = symbol;
    event.trade_id = trade_id;
    event.message = message;
    event.recommended_action = recommended_action;
    event.held_inventory = held;
    publish(std::move(event));
}

void EngineController::Implementation::publish(EngineEvent event) {
    event_bus.push_event(std::move(event));
}

// --- EngineController ------------------------------------------------------

EngineController::EngineController(const EngineSettings& settings,
                                   std::shared_ptr<exchange::ExchangeClientFactory> client_factory,
                                   std::shared_ptr<TradeHistoryRecorder> trade_history)
    : impl_(std::make_unique<Implementation>(settings, std::move(client_factory), std::move(trade_history))) {}

EngineController::~EngineController() = default;

EngineStatus EngineController::start(const utils::CancellationToken& token) {
    return impl_->start(token);
}

EngineStatus EngineController::stop() {
    return impl_->stop();
}

bool EngineController::pause(const std::string& reason) {
    return impl_->transition(EngineStatus::PAUSED, reason);
}

bool EngineController::resume() {
    if (impl_->get_status() != EngineStatus::PAUSED) {
        Logger::debug("Resume ignored while {}", to_string(impl_->get_status()));
        return false;
    }
    impl_->pool->reset_loss_streak();
    {
        std::lock_guard<std::mutex> lock(impl_->stats_mutex);
        impl_->today.consecutive_losses = 0;
    }
    return impl_->transition(EngineStatus::RUNNING, "resumed");
}

EngineStatus EngineController::get_status() const {
    return impl_->get_status();
}

bool EngineController::is_running() const {
    auto status = impl_->get_status();
    return status == EngineStatus::RUNNING || status == EngineStatus::PAUSED;
}

std::string EngineController::get_last_error() const {
    std::lock_guard<std::mutex> lock(impl_->status_mutex);
    return impl_->last_error;
}

void EngineController::add_trading_pair(const types::TradingPair& pair) {
    auto validated = impl_->validate_pair(pair);
    {
        std::lock_guard<std::mutex> lock(impl_->pairs_mutex);
        bool replaced = impl_->pairs.count(validated.symbol) > 0;
        impl_->pairs[validated.symbol] = validated;
        Logger::info("{} trading pair {} ({} <-> {})", replaced ? "Updated" : "Added",
                     validated.symbol, validated.exchange_a, validated.exchange_b);
    }

    if (validated.enabled) {
        std::lock_guard<std::mutex> lock(impl_->run_mutex);
        if (impl_->run.active) {
            impl_->start_pair_worker_locked(validated.symbol);
        }
    }
}

bool EngineController::remove_trading_pair(const std::string& symbol) {
    {
        std::lock_guard<std::mutex> lock(impl_->pairs_mutex);
        if (impl_->pairs.erase(symbol) == 0) {
            return false;
        }
    }
    impl_->retire_pair_worker(symbol);
    impl_->detector->clear_history(symbol);
    Logger::info("Removed trading pair {}", symbol);
    return true;
}

bool EngineController::set_trading_pair_enabled(const std::string& symbol, bool enabled) {
    {
        std::lock_guard<std::mutex> lock(impl_->pairs_mutex);
        auto it = impl_->pairs.find(symbol);
        if (it == impl_->pairs.end()) {
            return false;
        }
        it->second.enabled = enabled;
    }

    if (enabled) {
        std::lock_guard<std::mutex> lock(impl_->run_mutex);
        if (impl_->run.active) {
            impl_->start_pair_worker_locked(symbol);
        }
    } else {
        impl_->retire_pair_worker(symbol);
    }
    return true;
}

std::vector<types::TradingPair> EngineController::get_trading_pairs() const {
    std::lock_guard<std::mutex> lock(impl_->pairs_mutex);
    std::vector<types::TradingPair> result;
    result.reserve(impl_->pairs.size());
    for (const auto& entry : impl_->pairs) {
        result.push_back(entry.second);
    }
    return result;
}

SpreadOpportunity EngineController::analyze_opportunity(const types::TradingPair& pair) {
    SpreadOpportunity unavailable;
    unavailable.pair = pair;
    unavailable.symbol = pair.symbol;

    try {
        auto validated = impl_->validate_pair(pair);
        auto snapshot = impl_->poller->poll(validated, impl_->evaluator->needs_order_books());
        if (!snapshot) {
            unavailable.remarks.push_back("market data unavailable on one or both exchanges");
            return unavailable;
        }
        if (impl_->pool->is_initialized()) {
            auto balances = impl_->pool->get_snapshot();
            return impl_->detector->evaluate(*snapshot, &balances);
        }
        return impl_->detector->evaluate(*snapshot);
    } catch (const std::exception& e) {
        Logger::warn("Opportunity analysis for {} failed: {}", pair.symbol, e.what());
        impl_->emit_error(ErrorSeverity::WARNING, ErrorKind::MARKET_DATA, pair.symbol, "", e.what(),
                          "check the pair configuration and exchange availability");
        unavailable.remarks.push_back(e.what());
        return unavailable;
    }
}

TradeResult EngineController::execute_arbitrage(const SpreadOpportunity& opportunity) {
    auto status = impl_->get_status();
    if (status == EngineStatus::STARTING || status == EngineStatus::STOPPING ||
        status == EngineStatus::ERROR) {
        TradeResult rejected;
        rejected.symbol = opportunity.symbol;
        rejected.opportunity = opportunity;
        rejected.status = TradeStatus::REJECTED;
        rejected.error_message = "engine is " + to_string(status);
        return rejected;
    }

    ExecutionContext context;
    {
        std::lock_guard<std::mutex> lock(impl_->run_mutex);
        if (impl_->run.active && impl_->run.run_source) {
            context.run_token = impl_->run.run_source->token();
            context.abandon_token = impl_->run.abandon_source->token();
        }
    }

    auto result = impl_->coordinator->execute(opportunity, context);
    impl_->handle_trade_result(result);
    return result;
}

bool EngineController::update_config(const EngineSettings& settings) {
    auto errors = settings.validate();
    if (!errors.empty()) {
        for (const auto& error : errors) {
            Logger::error("Rejected configuration update: {}", error);
        }
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(impl_->settings_mutex);
        if (settings.exchange_a.name != impl_->settings.exchange_a.name ||
            settings.exchange_b.name != impl_->settings.exchange_b.name) {
            Logger::error("Rejected configuration update: exchanges cannot change on a live controller");
            return false;
        }
    }

    std::map<std::string, types::TradingPair> next_pairs;
    try {
        for (const auto& pair : settings.pairs) {
            auto validated = impl_->validate_pair(pair);
            next_pairs[validated.symbol] = validated;
        }
    } catch (const ValidationError& e) {
        Logger::error("Rejected configuration update: {}", e.what());
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(impl_->settings_mutex);
        impl_->settings = settings;
    }
    impl_->evaluator->set_strategy(settings.strategy);
    impl_->detector->update_config(settings.engine);
    impl_->apply_fees(settings);
    impl_->poller->update_config(settings.engine);
    impl_->coordinator->update_config(settings.engine);
    impl_->guard->set_limits(GuardLimits::from(settings.strategy.risk, settings.risk));
    impl_->pool->update_config(settings.engine, settings.risk);
    if (auto* in_memory = dynamic_cast<InMemoryTradeHistory*>(impl_->history.get())) {
        in_memory->set_capacity(settings.engine.history_capacity);
    }

    std::vector<std::string> dropped;
    std::vector<std::string> enabled;
    {
        std::lock_guard<std::mutex> lock(impl_->pairs_mutex);
        for (const auto& entry : impl_->pairs) {
            auto next = next_pairs.find(entry.first);
            if (next == next_pairs.end() || !next->second.enabled) {
                dropped.push_back(entry.first);
            }
        }
        for (const auto& entry : next_pairs) {
            if (entry.second.enabled) {
                enabled.push_back(entry.first);
            }
        }
        impl_->pairs = std::move(next_pairs);
    }
    for (const auto& symbol : dropped) {
        impl_->retire_pair_worker(symbol);
    }
    {
        std::lock_guard<std::mutex> lock(impl_->run_mutex);
        if (impl_->run.active) {
            for (const auto& symbol : enabled) {
                impl_->start_pair_worker_locked(symbol);
            }
        }
    }

    Logger::info("Configuration reloaded: strategy {} v{}, {} pairs",
                 settings.strategy.name, settings.strategy.version, enabled.size());
    return true;
}

EngineSettings EngineController::get_current_config() const {
    EngineSettings current;
    {
        std::lock_guard<std::mutex> lock(impl_->settings_mutex);
        current = impl_->settings;
    }
    current.strategy = impl_->evaluator->get_strategy();
    current.pairs = get_trading_pairs();
    return current;
}

void EngineController::reset_daily_stats() {
    {
        std::lock_guard<std::mutex> lock(impl_->stats_mutex);
        impl_->today = DailyStats();
        impl_->today.date = format_date(std::chrono::system_clock::now());
    }
    impl_->pool->reset_daily();
    Logger::info("Daily statistics reset");
}

DailyStats EngineController::get_today_stats() const {
    std::lock_guard<std::mutex> lock(impl_->stats_mutex);
    impl_->roll_daily_stats_locked(std::chrono::system_clock::now());
    return impl_->today;
}

std::vector<TradeResult> EngineController::get_trade_history(size_t count) const {
    return impl_->history->get_recent(count);
}

std::vector<HeldPosition> EngineController::get_held_positions() const {
    std::lock_guard<std::mutex> lock(impl_->held_mutex);
    std::vector<HeldPosition> result;
    for (const auto& entry : impl_->held_positions) {
        result.push_back(entry.second);
    }
    return result;
}

bool EngineController::acknowledge_held_position(const std::string& trade_id) {
    std::lock_guard<std::mutex> lock(impl_->held_mutex);
    if (impl_->held_positions.erase(trade_id) == 0) {
        return false;
    }
    Logger::info("Held position from {} acknowledged", trade_id);
    return true;
}

EventBus& EngineController::events() {
    return impl_->event_bus;
}

EventBus::SubscriptionId EngineController::subscribe(EventBus::Listener listener) {
    return impl_->event_bus.subscribe(std::move(listener));
}

bool EngineController::unsubscribe(EventBus::SubscriptionId id) {
    return impl_->event_bus.unsubscribe(id);
}

BalancePool& EngineController::balance_pool() {
    return *impl_->pool;
}

size_t EngineController::in_flight_executions() const {
    return impl_->coordinator->in_flight_count();
}

} // namespace trading_engine
} // namespace atx
