#include "balance_pool.hpp"
#include "types/exceptions.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <set>

namespace atx {
namespace trading_engine {

namespace {

constexpr size_t MAX_SNAPSHOT_HISTORY = 1000;
constexpr size_t MAX_RECENT_TRADES = 1000;
constexpr double CRITICAL_RATIO_LOW = 0.2;
constexpr double CRITICAL_RATIO_HIGH = 0.8;

const std::set<std::string> STABLE_COINS = {"USDT", "USDC", "BUSD"};

std::optional<types::AccountBalance> await_balance(std::future<types::AccountBalance>& future,
                                                   const std::string& exchange,
                                                   std::chrono::milliseconds timeout) {
    if (future.wait_for(timeout) != std::future_status::ready) {
        utils::Logger::warn("Balance request to {} timed out", exchange);
        return std::nullopt;
    }
    try {
        return future.get();
    } catch (const ExchangeError& e) {
        utils::Logger::warn("Balance request to {} failed: {}", exchange, e.what());
        return std::nullopt;
    }
}

} // namespace

BalancePool::BalancePool(exchange::ExchangeClientPtr client_a,
                         exchange::ExchangeClientPtr client_b,
                         PriceProvider* price_provider,
                         std::shared_ptr<EmergencyGuard> guard,
                         EventPusher* event_pusher,
                         std::shared_ptr<utils::ThreadPool> io_pool,
                         const EngineConfig& config,
                         const types::RiskConfig& risk_config)
    : client_a_(std::move(client_a)), client_b_(std::move(client_b)), price_provider_(price_provider),
      guard_(std::move(guard)), event_pusher_(event_pusher), io_pool_(std::move(io_pool)),
      config_(config), risk_config_(risk_config) {
    if (!client_a_ || !client_b_) {
        throw ConfigurationError("balance pool needs clients for both exchanges");
    }
}

BalancePool::~BalancePool() = default;

bool BalancePool::initialize() {
    EngineConfig config;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config = config_;
    }

    auto snapshot = fetch_snapshot(config);
    if (!snapshot) {
        utils::Logger::error("Balance pool initialization failed: balances unavailable");
        return false;
    }

    double drawdown;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        initial_snapshot_ = *snapshot;
        snapshot_ = *snapshot;
        snapshot_equity_ = snapshot->total_value;
        peak_equity_ = snapshot_equity_;
        trades_since_snapshot_.clear();
        realized_pnl_ = 0.0;
        total_fees_ = 0.0;
        trade_count_ = 0;
        recent_trades_.clear();
        last_published_reason_ = EmergencyTriggerReason::NONE;
        history_.push_back(*snapshot);
        while (history_.size() > MAX_SNAPSHOT_HISTORY) {
            history_.pop_front();
        }
        initialized_ = true;
        drawdown = drawdown_locked();
    }

    utils::Logger::info("Balance pool initialized: {:.2f} {} across {} and {}",
                        snapshot->total_value, config.quote_currency, snapshot->exchange_a, snapshot->exchange_b);
    publish(BalanceUpdatedEvent{*snapshot, drawdown});
    return true;
}

bool BalancePool::is_initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

BalanceRefreshResult BalancePool::update_balances() {
    EngineConfig config;
    uint64_t sequence_at_start;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config = config_;
        sequence_at_start = trade_sequence_;
    }

    BalanceRefreshResult result;
    auto snapshot = fetch_snapshot(config);
    if (!snapshot) {
        return result;
    }

    std::vector<EngineEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot_ = *snapshot;
        snapshot_equity_ = snapshot->total_value;
        // Trades recorded while the fetch was in flight are not in the balances yet
        trades_since_snapshot_.erase(
            std::remove_if(trades_since_snapshot_.begin(), trades_since_snapshot_.end(),
                           [sequence_at_start](const RecordedTrade& t) { return t.sequence <= sequence_at_start; }),
            trades_since_snapshot_.end());
        update_peak_locked();

        history_.push_back(*snapshot);
        while (history_.size() > MAX_SNAPSHOT_HISTORY) {
            history_.pop_front();
        }

        result.snapshot = snapshot_;
        result.check = guard_->check(guard_input_locked());
        events.push_back(BalanceUpdatedEvent{snapshot_, drawdown_locked()});
        if (note_check_locked(result.check)) {
            events.push_back(EmergencyTriggeredEvent{result.check});
        }

        auto rebalance = trading_engine::calculate_rebalance(snapshot_, risk_config_.rebalance_threshold_percent,
                                                             risk_config_.imbalance_min_value);
        if (rebalance.needed && rebalance.urgency >= RebalanceUrgency::MEDIUM) {
            utils::TradingLogger::log_rebalance(rebalance.asset, to_string(rebalance.urgency),
                                                rebalance.deviation_percent);
            events.push_back(RebalanceRecommendedEvent{rebalance});
        }
    }

    for (auto& event : events) {
        publish(std::move(event));
    }
    result.success = true;
    return result;
}

EmergencyCheck BalancePool::record_trade(const TradeResult& result) {
    if (!result.was_attempted()) {
        return EmergencyCheck();
    }

    EmergencyCheck check;
    bool publish_check;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        trades_since_snapshot_.push_back({++trade_sequence_, result.net_pnl});
        realized_pnl_ += result.net_pnl;
        total_fees_ += result.total_fees;
        ++trade_count_;
        daily_pnl_ += result.net_pnl;

        if (result.is_loss()) {
            ++consecutive_losses_;
        } else if (result.net_pnl > 0.0) {
            consecutive_losses_ = 0;
        }

        recent_trades_.push_back({result.end_time, result.net_pnl});
        auto window_start = std::chrono::system_clock::now() -
                            std::chrono::seconds(risk_config_.rapid_loss_window_seconds);
        while (!recent_trades_.empty() &&
               (recent_trades_.size() > MAX_RECENT_TRADES || recent_trades_.front().time < window_start)) {
            recent_trades_.pop_front();
        }

        update_peak_locked();
        check = guard_->check(guard_input_locked());
        publish_check = note_check_locked(check);
    }

    if (publish_check) {
        publish(EmergencyTriggeredEvent{check});
    }
    return check;
}

EmergencyCheck BalancePool::check_emergency() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return guard_->check(guard_input_locked());
}

double BalancePool::current_drawdown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return drawdown_locked();
}

types::Amount BalancePool::current_equity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return equity_locked();
}

types::Amount BalancePool::peak_equity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_equity_;
}

types::Amount BalancePool::daily_pnl() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return daily_pnl_;
}

int BalancePool::consecutive_losses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consecutive_losses_;
}

CombinedBalanceSnapshot BalancePool::get_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

BalancePoolPnL BalancePool::calculate_pnl() const {
    std::lock_guard<std::mutex> lock(mutex_);

    BalancePoolPnL pnl;
    pnl.initial_value = initial_snapshot_.total_value;
    pnl.current_value = equity_locked();
    pnl.realized_pnl = realized_pnl_;
    pnl.pnl_percent = pnl.initial_value > 0.0
        ? (pnl.current_value - pnl.initial_value) / pnl.initial_value * 100.0
        : 0.0;
    pnl.trade_count = trade_count_;
    pnl.total_fees = total_fees_;

    for (const auto& [asset, balance] : snapshot_.assets) {
        auto initial = initial_snapshot_.assets.find(asset);
        types::Amount initial_total = initial != initial_snapshot_.assets.end() ? initial->second.total : 0.0;
        pnl.asset_changes[asset] = balance.total - initial_total;
    }
    for (const auto& [asset, balance] : initial_snapshot_.assets) {
        if (snapshot_.assets.count(asset) == 0) {
            pnl.asset_changes[asset] = -balance.total;
        }
    }
    return pnl;
}

AssetPoolStatus BalancePool::get_asset_status(const types::Currency& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return asset_status_locked(asset);
}

std::map<types::Currency, AssetPoolStatus> BalancePool::get_all_asset_statuses() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::map<types::Currency, AssetPoolStatus> statuses;
    for (const auto& [asset, balance] : snapshot_.assets) {
        statuses[asset] = asset_status_locked(asset);
    }
    for (const auto& [asset, balance] : initial_snapshot_.assets) {
        if (statuses.count(asset) == 0) {
            statuses[asset] = asset_status_locked(asset);
        }
    }
    return statuses;
}

AssetPoolStatus BalancePool::asset_status_locked(const types::Currency& asset) const {
    AssetPoolStatus status;
    status.asset = asset;

    auto it = snapshot_.assets.find(asset);
    if (it == snapshot_.assets.end()) {
        status.status_message = "no balance";
        return status;
    }

    const auto& balance = it->second;
    status.total_a = balance.total_a;
    status.total_b = balance.total_b;
    status.distribution_ratio = balance.distribution_ratio;
    status.is_critical = balance.total > 0.0 &&
        (balance.distribution_ratio < CRITICAL_RATIO_LOW || balance.distribution_ratio > CRITICAL_RATIO_HIGH);
    if (status.is_critical) {
        bool surplus_on_a = balance.distribution_ratio > 0.5;
        status.status_message = fmt::format("transfer {} from {} to {}", asset,
                                            surplus_on_a ? snapshot_.exchange_a : snapshot_.exchange_b,
                                            surplus_on_a ? snapshot_.exchange_b : snapshot_.exchange_a);
    } else {
        status.status_message = "balanced";
    }
    return status;
}

RebalanceRecommendation BalancePool::calculate_rebalance() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trading_engine::calculate_rebalance(snapshot_, risk_config_.rebalance_threshold_percent,
                                               risk_config_.imbalance_min_value);
}

std::vector<CombinedBalanceSnapshot> BalancePool::get_history(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t start = history_.size() > count ? history_.size() - count : 0;
    return std::vector<CombinedBalanceSnapshot>(history_.begin() + static_cast<std::ptrdiff_t>(start), history_.end());
}

void BalancePool::reset_daily() {
    std::lock_guard<std::mutex> lock(mutex_);
    daily_pnl_ = 0.0;
}

void BalancePool::reset_loss_streak() {
    std::lock_guard<std::mutex> lock(mutex_);
    consecutive_losses_ = 0;
    last_published_reason_ = EmergencyTriggerReason::NONE;
}

void BalancePool::update_config(const EngineConfig& config, const types::RiskConfig& risk_config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    risk_config_ = risk_config;
}

std::optional<CombinedBalanceSnapshot> BalancePool::fetch_snapshot(const EngineConfig& config) {
    auto timeout = std::chrono::milliseconds(config.ticker_timeout_ms);
    auto client_a = client_a_;
    auto client_b = client_b_;

    auto future_a = io_pool_->submit([client_a]() { return client_a->get_balance(); });
    auto future_b = io_pool_->submit([client_b]() { return client_b->get_balance(); });

    auto balance_a = await_balance(future_a, client_a->get_name(), timeout);
    auto balance_b = await_balance(future_b, client_b->get_name(), timeout);
    if (!balance_a || !balance_b) {
        return std::nullopt;
    }

    CombinedBalanceSnapshot snapshot;
    snapshot.exchange_a = client_a->get_name();
    snapshot.exchange_b = client_b->get_name();

    std::set<types::Currency> currencies;
    for (const auto& [currency, balance] : balance_a->balances) {
        currencies.insert(currency);
    }
    for (const auto& [currency, balance] : balance_b->balances) {
        currencies.insert(currency);
    }

    for (const auto& currency : currencies) {
        CombinedAssetBalance combined;
        combined.asset = currency;
        combined.total_a = balance_a->total(currency);
        combined.available_a = balance_a->available(currency);
        combined.total_b = balance_b->total(currency);
        combined.available_b = balance_b->available(currency);
        combined.total = combined.total_a + combined.total_b;
        combined.price = price_of(currency, config.quote_currency);
        combined.value = combined.total * combined.price;
        combined.distribution_ratio = combined.total > 0.0 ? combined.total_a / combined.total : 0.5;

        snapshot.value_a += combined.total_a * combined.price;
        snapshot.value_b += combined.total_b * combined.price;
        snapshot.total_value += combined.value;
        snapshot.assets[currency] = combined;
    }
    snapshot.timestamp = std::chrono::system_clock::now();
    return snapshot;
}

types::Price BalancePool::price_of(const types::Currency& asset, const std::string& quote_currency) const {
    if (asset == quote_currency || STABLE_COINS.count(asset) > 0) {
        return 1.0;
    }
    types::Price price = 0.0;
    if (price_provider_ && price_provider_->get_latest_price(asset, quote_currency, price)) {
        return price;
    }
    utils::Logger::debug("No price for {} in {}, valued at 0", asset, quote_currency);
    return 0.0;
}

types::Amount BalancePool::equity_locked() const {
    types::Amount equity = snapshot_equity_;
    for (const auto& trade : trades_since_snapshot_) {
        equity += trade.net_pnl;
    }
    return equity;
}

double BalancePool::drawdown_locked() const {
    if (peak_equity_ <= 0.0) {
        return 0.0;
    }
    double drawdown = (peak_equity_ - equity_locked()) / peak_equity_ * 100.0;
    return std::clamp(drawdown, 0.0, 100.0);
}

void BalancePool::update_peak_locked() {
    peak_equity_ = std::max(peak_equity_, equity_locked());
}

GuardInput BalancePool::guard_input_locked() const {
    GuardInput input;
    input.drawdown_percent = drawdown_locked();
    input.daily_pnl = daily_pnl_;
    input.consecutive_losses = consecutive_losses_;
    input.recent_trades.assign(recent_trades_.begin(), recent_trades_.end());
    input.initial_equity = initial_snapshot_.total_value;
    input.snapshot = snapshot_;
    input.now = std::chrono::system_clock::now();
    return input;
}

bool BalancePool::note_check_locked(const EmergencyCheck& check) {
    if (!check.triggered()) {
        last_published_reason_ = EmergencyTriggerReason::NONE;
        return false;
    }
    if (check.reason == last_published_reason_) {
        return false;
    }
    last_published_reason_ = check.reason;
    utils::TradingLogger::log_emergency(to_string(check.reason), to_string(check.action), check.message);
    return true;
}

void BalancePool::publish(EngineEvent event) {
    if (event_pusher_) {
        event_pusher_->push_event(std::move(event));
    }
}

} // namespace trading_engine
} // namespace atx
