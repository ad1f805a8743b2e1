#include "exchange/paper_exchange_client.hpp"
#include "types/exceptions.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <random>
#include <unordered_map>

namespace atx {
namespace exchange {

namespace {

const std::vector<std::string> KNOWN_QUOTES = {"USDT", "USDC", "BUSD", "KRW", "USD", "BTC", "ETH"};

std::string normalize_symbol(const std::string& symbol) {
    std::string normalized;
    normalized.reserve(symbol.size());
    for (char c : symbol) {
        if (c != '/' && c != '-' && c != '_') {
            normalized.push_back(c);
        }
    }
    return normalized;
}

std::pair<std::string, std::string> split_symbol(const std::string& symbol) {
    auto slash = symbol.find('/');
    if (slash != std::string::npos) {
        return {symbol.substr(0, slash), symbol.substr(slash + 1)};
    }

    std::string normalized = normalize_symbol(symbol);
    for (const auto& quote : KNOWN_QUOTES) {
        if (normalized.size() > quote.size() &&
            normalized.compare(normalized.size() - quote.size(), quote.size(), quote) == 0) {
            return {normalized.substr(0, normalized.size() - quote.size()), quote};
        }
    }
    return {normalized, "USDT"};
}

} // namespace

struct PaperExchangeClient::Implementation {
    struct Quote {
        types::Price bid = 0.0;
        types::Price ask = 0.0;
        types::Quantity level_quantity = 0.0;
        types::Amount volume_24h = 0.0;
    };

    struct PaperOrder {
        types::Order order;
        types::Quantity fillable_quantity = 0.0;
        std::chrono::steady_clock::time_point fillable_at;
    };

    types::ExchangeConfig config;
    PaperExchangeSettings settings;

    std::unordered_map<std::string, Quote> quotes;  // normalized symbol -> quote
    std::unordered_map<std::string, types::Balance> balances;
    std::unordered_map<std::string, PaperOrder> orders;
    std::vector<std::string> order_sequence;

    bool online = true;
    std::mt19937 random_generator;
    std::atomic<uint64_t> order_counter{0};
    mutable std::mutex mutex;

    Implementation(const types::ExchangeConfig& cfg, const PaperExchangeSettings& s)
        : config(cfg), settings(s), random_generator(s.seed) {}

    void ensure_online(const char* operation) const {
        if (!online) {
            throw ExchangeError(config.name, std::string(operation) + " failed: exchange offline", true);
        }
    }

    Quote& find_quote(const std::string& symbol) {
        auto it = quotes.find(normalize_symbol(symbol));
        if (it == quotes.end()) {
            throw ExchangeError(config.name, "unknown symbol " + symbol, false);
        }
        return it->second;
    }

    types::Balance& balance_of(const std::string& currency) {
        auto& balance = balances[currency];
        balance.currency = currency;
        balance.exchange = config.name;
        return balance;
    }

    // Marketable price for an order against the current quote, 0 when it would rest
    types::Price execution_price(const types::Order& order, const Quote& quote) const {
        if (order.side == types::OrderSide::BUY) {
            if (order.type == types::OrderType::MARKET || order.price >= quote.ask) {
                return quote.ask;
            }
        } else {
            if (order.type == types::OrderType::MARKET || order.price <= quote.bid) {
                return quote.bid;
            }
        }
        return 0.0;
    }

    void try_fill(PaperOrder& paper) {
        auto& order = paper.order;
        if (order.is_final() || order.filled_quantity >= paper.fillable_quantity) {
            return;
        }
        if (std::chrono::steady_clock::now() < paper.fillable_at) {
            return;
        }

        auto quote_it = quotes.find(normalize_symbol(order.symbol));
        if (quote_it == quotes.end()) {
            return;
        }
        types::Price price = execution_price(order, quote_it->second);
        if (price <= 0.0) {
            return;
        }

        auto [base, quote_currency] = split_symbol(order.symbol);
        types::Quantity quantity = paper.fillable_quantity - order.filled_quantity;
        types::Amount value = quantity * price;
        types::Amount fee = value * config.taker_fee_percent / 100.0;

        auto& base_balance = balance_of(base);
        auto& quote_balance = balance_of(quote_currency);
        if (order.side == types::OrderSide::BUY) {
            quote_balance.total -= value + fee;
            quote_balance.available -= value + fee;
            base_balance.total += quantity;
            base_balance.available += quantity;
        } else {
            base_balance.total -= quantity;
            base_balance.available -= quantity;
            quote_balance.total += value - fee;
            quote_balance.available += value - fee;
        }

        types::Amount previous_value = order.filled_quantity * order.avg_fill_price;
        order.filled_quantity += quantity;
        order.avg_fill_price = (previous_value + value) / order.filled_quantity;
        order.fee += fee;
        order.fee_currency = quote_currency;
        order.status = order.filled_quantity >= order.quantity
            ? types::OrderStatus::FILLED
            : types::OrderStatus::PARTIALLY_FILLED;
        order.updated_at = std::chrono::system_clock::now();
    }

    PaperOrder& find_order(const std::string& order_id) {
        auto it = orders.find(order_id);
        if (it == orders.end()) {
            throw ExchangeError(config.name, "unknown order " + order_id, false);
        }
        return it->second;
    }
};

PaperExchangeClient::PaperExchangeClient(const types::ExchangeConfig& config,
                                         const PaperExchangeSettings& settings)
    : impl_(std::make_unique<Implementation>(config, settings)) {}

PaperExchangeClient::~PaperExchangeClient() = default;

std::string PaperExchangeClient::get_name() const {
    return impl_->config.name;
}

void PaperExchangeClient::connect() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->ensure_online("connect");
    utils::Logger::debug("Paper exchange {} connected", impl_->config.name);
}

void PaperExchangeClient::disconnect() {
    utils::Logger::debug("Paper exchange {} disconnected", impl_->config.name);
}

bool PaperExchangeClient::test_connection() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->online;
}

types::Ticker PaperExchangeClient::get_ticker(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->ensure_online("get_ticker");

    auto& quote = impl_->find_quote(symbol);
    if (impl_->settings.price_volatility_percent > 0.0) {
        std::uniform_real_distribution<double> step(-impl_->settings.price_volatility_percent,
                                                     impl_->settings.price_volatility_percent);
        double factor = 1.0 + step(impl_->random_generator) / 100.0;
        quote.bid *= factor;
        quote.ask *= factor;
    }

    types::Ticker ticker(symbol, impl_->config.name, quote.bid, quote.ask, quote.volume_24h);
    ticker.bid_quantity = quote.level_quantity;
    ticker.ask_quantity = quote.level_quantity;
    return ticker;
}

types::OrderBook PaperExchangeClient::get_order_book(const std::string& symbol, int depth) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->ensure_online("get_order_book");

    const auto& quote = impl_->find_quote(symbol);
    types::OrderBook book(symbol, impl_->config.name);
    double tick = (quote.bid + quote.ask) / 2.0 * 0.0001;
    for (int level = 0; level < depth; ++level) {
        book.bids.emplace_back(quote.bid - tick * level, quote.level_quantity);
        book.asks.emplace_back(quote.ask + tick * level, quote.level_quantity);
    }
    return book;
}

types::AccountBalance PaperExchangeClient::get_balance() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->ensure_online("get_balance");

    types::AccountBalance account;
    account.exchange = impl_->config.name;
    account.balances.insert(impl_->balances.begin(), impl_->balances.end());
    return account;
}

types::Order PaperExchangeClient::place_order(const types::OrderRequest& request) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->ensure_online("place_order");

    if (request.quantity <= 0.0) {
        throw OrderRejectedError(impl_->config.name, "quantity must be positive");
    }
    if (request.type == types::OrderType::LIMIT && request.price <= 0.0) {
        throw OrderRejectedError(impl_->config.name, "limit order without price");
    }

    const auto& quote = impl_->find_quote(request.symbol);
    auto [base, quote_currency] = split_symbol(request.symbol);

    if (request.side == types::OrderSide::BUY) {
        types::Price reference = request.type == types::OrderType::LIMIT ? request.price : quote.ask;
        types::Amount cost = request.quantity * reference * (1.0 + impl_->config.taker_fee_percent / 100.0);
        if (impl_->balance_of(quote_currency).available < cost) {
            throw InsufficientBalanceError(impl_->config.name,
                                           "need " + std::to_string(cost) + " " + quote_currency);
        }
    } else if (impl_->balance_of(base).available < request.quantity) {
        throw InsufficientBalanceError(impl_->config.name,
                                       "need " + std::to_string(request.quantity) + " " + base);
    }

    Implementation::PaperOrder paper;
    paper.order.id = "PAPER-" + impl_->config.name + "-" + std::to_string(++impl_->order_counter);
    paper.order.client_order_id = request.client_order_id;
    paper.order.exchange = impl_->config.name;
    paper.order.symbol = request.symbol;
    paper.order.side = request.side;
    paper.order.type = request.type;
    paper.order.quantity = request.quantity;
    paper.order.price = request.price;
    paper.order.status = types::OrderStatus::NEW;
    paper.fillable_quantity = request.quantity * std::clamp(impl_->settings.fill_ratio, 0.0, 1.0);
    paper.fillable_at = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(impl_->settings.fill_delay_ms);

    impl_->try_fill(paper);

    auto order = paper.order;
    impl_->order_sequence.push_back(order.id);
    impl_->orders.emplace(order.id, std::move(paper));
    return order;
}

types::Order PaperExchangeClient::get_order_status(const std::string& /*symbol*/, const std::string& order_id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->ensure_online("get_order_status");

    auto& paper = impl_->find_order(order_id);
    impl_->try_fill(paper);
    return paper.order;
}

types::Order PaperExchangeClient::cancel_order(const std::string& /*symbol*/, const std::string& order_id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->ensure_online("cancel_order");

    auto& paper = impl_->find_order(order_id);
    impl_->try_fill(paper);
    if (!paper.order.is_final()) {
        paper.order.status = types::OrderStatus::CANCELED;
        paper.order.updated_at = std::chrono::system_clock::now();
    }
    return paper.order;
}

void PaperExchangeClient::set_quote(const std::string& symbol, types::Price bid, types::Price ask,
                                    types::Quantity level_quantity, types::Amount volume_24h) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto& quote = impl_->quotes[normalize_symbol(symbol)];
    quote.bid = bid;
    quote.ask = ask;
    quote.level_quantity = level_quantity;
    quote.volume_24h = volume_24h;
}

void PaperExchangeClient::set_balance(const types::Currency& currency, types::Amount total) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto& balance = impl_->balance_of(currency);
    balance.total = total;
    balance.available = total;
    balance.locked = 0.0;
}

void PaperExchangeClient::set_online(bool online) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->online = online;
}

void PaperExchangeClient::set_fill_ratio(double fill_ratio) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->settings.fill_ratio = fill_ratio;
}

void PaperExchangeClient::set_fill_delay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->settings.fill_delay_ms = static_cast<int>(delay.count());
}

void PaperExchangeClient::set_price_volatility(double percent) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->settings.price_volatility_percent = percent;
}

std::vector<types::Order> PaperExchangeClient::get_order_history() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::vector<types::Order> history;
    history.reserve(impl_->order_sequence.size());
    for (const auto& id : impl_->order_sequence) {
        history.push_back(impl_->orders.at(id).order);
    }
    return history;
}

PaperExchangeClientFactory::PaperExchangeClientFactory(const std::vector<types::ExchangeConfig>& configs,
                                                       const PaperExchangeSettings& settings)
    : configs_(configs), settings_(settings) {}

ExchangeClientPtr PaperExchangeClientFactory::create_client(const std::string& exchange_name) {
    return get_paper_client(exchange_name);
}

std::vector<std::string> PaperExchangeClientFactory::get_supported_exchanges() const {
    std::vector<std::string> names;
    for (const auto& config : configs_) {
        names.push_back(config.name);
    }
    return names;
}

std::shared_ptr<PaperExchangeClient> PaperExchangeClientFactory::get_paper_client(const std::string& exchange_name) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto existing = clients_.find(exchange_name);
    if (existing != clients_.end()) {
        return existing->second;
    }

    auto config = std::find_if(configs_.begin(), configs_.end(),
                               [&](const types::ExchangeConfig& c) { return c.name == exchange_name; });
    if (config == configs_.end()) {
        throw ExchangeError(exchange_name, "unsupported exchange", false);
    }

    auto client = std::make_shared<PaperExchangeClient>(*config, settings_);
    clients_.emplace(exchange_name, client);
    utils::Logger::info("Created paper exchange client {}", exchange_name);
    return client;
}

} // namespace exchange
} // namespace atx
