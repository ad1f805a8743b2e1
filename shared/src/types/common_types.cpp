#include "types/common_types.hpp"
#include <algorithm>

namespace atx {
namespace types {

std::string to_string(OrderType type) {
    switch (type) {
        case OrderType::MARKET: return "MARKET";
        case OrderType::LIMIT: return "LIMIT";
    }
    return "UNKNOWN";
}

std::string to_string(OrderSide side) {
    switch (side) {
        case OrderSide::BUY: return "BUY";
        case OrderSide::SELL: return "SELL";
    }
    return "UNKNOWN";
}

std::string to_string(OrderStatus status) {
    switch (status) {
        case OrderStatus::NEW: return "NEW";
        case OrderStatus::PARTIALLY_FILLED: return "PARTIALLY_FILLED";
        case OrderStatus::FILLED: return "FILLED";
        case OrderStatus::CANCELED: return "CANCELED";
        case OrderStatus::REJECTED: return "REJECTED";
        case OrderStatus::EXPIRED: return "EXPIRED";
    }
    return "UNKNOWN";
}

namespace {

Amount depth_value(const std::vector<OrderBookEntry>& side, size_t levels) {
    Amount value = 0.0;
    size_t count = std::min(levels, side.size());
    for (size_t i = 0; i < count; ++i) {
        value += side[i].price * side[i].quantity;
    }
    return value;
}

Price average_price(const std::vector<OrderBookEntry>& side, Quantity quantity) {
    if (quantity <= 0.0) {
        return 0.0;
    }

    Quantity remaining = quantity;
    Amount cost = 0.0;
    for (const auto& level : side) {
        Quantity take = std::min(remaining, level.quantity);
        cost += take * level.price;
        remaining -= take;
        if (remaining <= 0.0) {
            return cost / quantity;
        }
    }
    return 0.0;
}

} // namespace

Amount OrderBook::bid_depth_value(size_t levels) const {
    return depth_value(bids, levels);
}

Amount OrderBook::ask_depth_value(size_t levels) const {
    return depth_value(asks, levels);
}

Price OrderBook::average_ask_price(Quantity quantity) const {
    return average_price(asks, quantity);
}

Price OrderBook::average_bid_price(Quantity quantity) const {
    return average_price(bids, quantity);
}

Amount AccountBalance::total(const Currency& currency) const {
    auto it = balances.find(currency);
    return it != balances.end() ? it->second.total : 0.0;
}

Amount AccountBalance::available(const Currency& currency) const {
    auto it = balances.find(currency);
    return it != balances.end() ? it->second.available : 0.0;
}

TradingPair TradingPair::from_symbol(const Symbol& symbol,
                                     const ExchangeId& exchange_a,
                                     const ExchangeId& exchange_b) {
    TradingPair pair;
    pair.symbol = symbol;
    pair.exchange_a = exchange_a;
    pair.exchange_b = exchange_b;

    auto slash = symbol.find('/');
    if (slash != std::string::npos) {
        pair.base_currency = symbol.substr(0, slash);
        pair.quote_currency = symbol.substr(slash + 1);
    } else {
        pair.base_currency = symbol;
    }

    std::string compact = pair.base_currency + pair.quote_currency;
    pair.symbol_a = compact;
    pair.symbol_b = compact;
    return pair;
}

const Symbol& TradingPair::symbol_on(const ExchangeId& exchange) const {
    if (exchange == exchange_b && !symbol_b.empty()) {
        return symbol_b;
    }
    if (exchange == exchange_a && !symbol_a.empty()) {
        return symbol_a;
    }
    return symbol;
}

bool TradingPair::has_distinct_legs() const {
    return !exchange_a.empty() && !exchange_b.empty() && exchange_a != exchange_b;
}

} // namespace types
} // namespace atx
