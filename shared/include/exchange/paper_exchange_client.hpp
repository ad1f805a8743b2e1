#pragma once

#include "exchange/exchange_client.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace atx {
namespace exchange {

struct PaperExchangeSettings {
    double price_volatility_percent;  // random walk step applied on every ticker read
    int fill_delay_ms;                // orders become fillable after this delay
    double fill_ratio;                // share of each order that ever fills
    unsigned int seed;

    PaperExchangeSettings() : price_volatility_percent(0.0), fill_delay_ms(0),
                              fill_ratio(1.0), seed(42) {}
};

// In-memory exchange used for paper trading and tests. Quotes, balances and
// fill behaviour are set by the caller; fees are charged in the quote currency.
class PaperExchangeClient : public ExchangeClient {
public:
    explicit PaperExchangeClient(const types::ExchangeConfig& config,
                                 const PaperExchangeSettings& settings = PaperExchangeSettings());
    ~PaperExchangeClient() override;

    std::string get_name() const override;

    void connect() override;
    void disconnect() override;
    bool test_connection() override;

    types::Ticker get_ticker(const std::string& symbol) override;
    types::OrderBook get_order_book(const std::string& symbol, int depth) override;
    types::AccountBalance get_balance() override;

    types::Order place_order(const types::OrderRequest& request) override;
    types::Order get_order_status(const std::string& symbol, const std::string& order_id) override;
    types::Order cancel_order(const std::string& symbol, const std::string& order_id) override;

    // Simulation controls
    void set_quote(const std::string& symbol, types::Price bid, types::Price ask,
                   types::Quantity level_quantity = 10.0, types::Amount volume_24h = 1000000.0);
    void set_balance(const types::Currency& currency, types::Amount total);
    void set_online(bool online);
    void set_fill_ratio(double fill_ratio);
    void set_fill_delay(std::chrono::milliseconds delay);
    void set_price_volatility(double percent);

    std::vector<types::Order> get_order_history() const;

private:
    struct Implementation;
    std::unique_ptr<Implementation> impl_;
};

class PaperExchangeClientFactory : public ExchangeClientFactory {
public:
    PaperExchangeClientFactory(const std::vector<types::ExchangeConfig>& configs,
                               const PaperExchangeSettings& settings = PaperExchangeSettings());

    // Returns the same instance for repeated calls with one name
    ExchangeClientPtr create_client(const std::string& exchange_name) override;
    std::vector<std::string> get_supported_exchanges() const override;

    std::shared_ptr<PaperExchangeClient> get_paper_client(const std::string& exchange_name);

private:
    std::vector<types::ExchangeConfig> configs_;
    PaperExchangeSettings settings_;
    std::unordered_map<std::string, std::shared_ptr<PaperExchangeClient>> clients_;
    mutable std::mutex mutex_;
};

} // namespace exchange
} // namespace atx
