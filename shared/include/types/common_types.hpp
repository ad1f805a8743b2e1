#pragma once

#include <string>
#include <chrono>
#include <unordered_map>
#include <vector>
#include <cstdint>

namespace atx {
namespace types {

// Basic numeric types
using Price = double;
using Quantity = double;
using Amount = double;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

using ExchangeId = std::string;
using Symbol = std::string;
using Currency = std::string;
using OrderId = std::string;
using TradeId = std::string;

enum class OrderType {
    MARKET,
    LIMIT
};

enum class OrderSide {
    BUY,
    SELL
};

enum class OrderStatus {
    NEW,
    PARTIALLY_FILLED,
    FILLED,
    CANCELED,
    REJECTED,
    EXPIRED
};

std::string to_string(OrderType type);
std::string to_string(OrderSide side);
std::string to_string(OrderStatus status);

// Order book entry
struct OrderBookEntry {
    Price price;
    Quantity quantity;

    OrderBookEntry() : price(0.0), quantity(0.0) {}
    OrderBookEntry(Price p, Quantity q) : price(p), quantity(q) {}
};

struct OrderBook {
    Symbol symbol;
    ExchangeId exchange;
    std::vector<OrderBookEntry> bids;  // Sorted by price descending
    std::vector<OrderBookEntry> asks;  // Sorted by price ascending
    Timestamp timestamp;

    OrderBook() = default;
    OrderBook(const Symbol& sym, const ExchangeId& ex)
        : symbol(sym), exchange(ex) {
        timestamp = std::chrono::system_clock::now();
    }

    // Quote-currency value resting in the first `levels` entries of each side
    Amount bid_depth_value(size_t levels) const;
    Amount ask_depth_value(size_t levels) const;

    // Volume weighted price to fill `quantity` by walking the book, 0 if the book is too thin
    Price average_ask_price(Quantity quantity) const;
    Price average_bid_price(Quantity quantity) const;
};

// Market data structure
struct Ticker {
    Symbol symbol;
    ExchangeId exchange;
    Price bid;
    Price ask;
    Quantity bid_quantity;
    Quantity ask_quantity;
    Price last;
    Amount volume_24h;  // quote currency
    Timestamp timestamp;

    Ticker() : bid(0.0), ask(0.0), bid_quantity(0.0), ask_quantity(0.0),
               last(0.0), volume_24h(0.0) {}
    Ticker(const Symbol& sym, const ExchangeId& ex, Price b, Price a, Amount volume)
        : symbol(sym), exchange(ex), bid(b), ask(a), bid_quantity(0.0), ask_quantity(0.0),
          last((b + a) / 2.0), volume_24h(volume) {
        timestamp = std::chrono::system_clock::now();
    }

    Price mid() const { return (bid + ask) / 2.0; }
    bool has_valid_prices() const { return bid > 0.0 && ask > 0.0; }
};

struct OrderRequest {
    OrderId client_order_id;
    ExchangeId exchange;
    Symbol symbol;
    OrderSide side;
    OrderType type;
    Quantity quantity;
    Price price;  // 0 for market orders

    OrderRequest() : side(OrderSide::BUY), type(OrderType::MARKET), quantity(0.0), price(0.0) {}
};

struct Order {
    OrderId id;               // exchange assigned
    OrderId client_order_id;
    ExchangeId exchange;
    Symbol symbol;
    OrderSide side;
    OrderType type;
    Quantity quantity;
    Price price;
    OrderStatus status;
    Quantity filled_quantity;
    Price avg_fill_price;
    Amount fee;
    Currency fee_currency;
    std::string reject_reason;
    Timestamp created_at;
    Timestamp updated_at;

    Order() : side(OrderSide::BUY), type(OrderType::MARKET), quantity(0.0), price(0.0),
              status(OrderStatus::NEW), filled_quantity(0.0), avg_fill_price(0.0), fee(0.0) {
        created_at = std::chrono::system_clock::now();
        updated_at = created_at;
    }

    bool is_final() const {
        return status == OrderStatus::FILLED || status == OrderStatus::CANCELED ||
               status == OrderStatus::REJECTED || status == OrderStatus::EXPIRED;
    }

    Amount filled_value() const { return filled_quantity * avg_fill_price; }
    Quantity remaining_quantity() const { return quantity - filled_quantity; }
};

// Balance of one currency on one exchange
struct Balance {
    Currency currency;
    ExchangeId exchange;
    Amount total;
    Amount available;
    Amount locked;

    Balance() : total(0.0), available(0.0), locked(0.0) {}
    Balance(const Currency& cur, const ExchangeId& ex, Amount t, Amount a)
        : currency(cur), exchange(ex), total(t), available(a), locked(t - a) {}
};

struct AccountBalance {
    ExchangeId exchange;
    std::unordered_map<Currency, Balance> balances;
    Timestamp updated_at;

    AccountBalance() {
        updated_at = std::chrono::system_clock::now();
    }

    Amount total(const Currency& currency) const;
    Amount available(const Currency& currency) const;
};

// One arbitrage route: the same asset quoted on two exchanges
struct TradingPair {
    Symbol symbol;            // canonical "BASE/QUOTE"
    Currency base_currency;
    Currency quote_currency;
    ExchangeId exchange_a;
    ExchangeId exchange_b;
    Symbol symbol_a;          // symbol as exchange A spells it
    Symbol symbol_b;
    Amount trade_amount;      // quote currency per attempt
    int quantity_precision;   // decimals
    Quantity min_order_size;
    bool enabled;

    TradingPair() : trade_amount(100.0), quantity_precision(6), min_order_size(0.0), enabled(true) {}

    // "BTC/USDT" -> base BTC, quote USDT, exchange symbols "BTCUSDT"
    static TradingPair from_symbol(const Symbol& symbol,
                                   const ExchangeId& exchange_a,
                                   const ExchangeId& exchange_b);

    const Symbol& symbol_on(const ExchangeId& exchange) const;
    bool has_distinct_legs() const;
};

// Configuration types
struct ExchangeConfig {
    ExchangeId name;
    std::string api_key;
    std::string secret_key;
    double taker_fee_percent;
    double maker_fee_percent;
    int timeout_ms;
    bool sandbox_mode;
    std::unordered_map<std::string, std::string> parameters;

    ExchangeConfig() : taker_fee_percent(0.1), maker_fee_percent(0.1), timeout_ms(5000),
                       sandbox_mode(false) {}
};

// Emergency protection thresholds that are not part of a strategy bundle
struct RiskConfig {
    int rapid_loss_min_trades;
    int rapid_loss_window_seconds;
    double rapid_loss_threshold_percent;  // of initial equity
    double critical_imbalance_threshold;  // deviation of distribution ratio from 0.5
    double rebalance_threshold_percent;
    Amount imbalance_min_value;           // ignore dust positions

    RiskConfig() : rapid_loss_min_trades(5), rapid_loss_window_seconds(300),
                   rapid_loss_threshold_percent(1.0), critical_imbalance_threshold(0.3),
                   rebalance_threshold_percent(30.0), imbalance_min_value(10.0) {}
};

} // namespace types
} // namespace atx
