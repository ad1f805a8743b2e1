#pragma once

#include "types/common_types.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace atx {
namespace exchange {

// Uniform capability every exchange integration provides to the engine.
// Implementations report failures by throwing ExchangeError (or a subclass);
// transient errors set ExchangeError::is_transient().
class ExchangeClient {
public:
    virtual ~ExchangeClient() = default;

    virtual std::string get_name() const = 0;

    virtual void connect() = 0;
    virtual void disconnect() = 0;
    virtual bool test_connection() = 0;

    virtual types::Ticker get_ticker(const std::string& symbol) = 0;
    virtual types::OrderBook get_order_book(const std::string& symbol, int depth) = 0;
    virtual types::AccountBalance get_balance() = 0;

    virtual types::Order place_order(const types::OrderRequest& request) = 0;
    virtual types::Order get_order_status(const std::string& symbol, const std::string& order_id) = 0;
    virtual types::Order cancel_order(const std::string& symbol, const std::string& order_id) = 0;
};

using ExchangeClientPtr = std::shared_ptr<ExchangeClient>;
using ExchangeClientMap = std::unordered_map<std::string, ExchangeClientPtr>;

class ExchangeClientFactory {
public:
    virtual ~ExchangeClientFactory() = default;

    // Throws ExchangeError when the exchange is unknown
    virtual ExchangeClientPtr create_client(const std::string& exchange_name) = 0;
    virtual std::vector<std::string> get_supported_exchanges() const = 0;
};

} // namespace exchange
} // namespace atx
