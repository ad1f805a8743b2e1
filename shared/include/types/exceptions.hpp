#pragma once

#include <stdexcept>
#include <string>

namespace atx {

class AtxException : public std::runtime_error {
public:
    explicit AtxException(const std::string& message) : std::runtime_error(message) {}
    explicit AtxException(const char* message) : std::runtime_error(message) {}
};

class ConfigurationError : public AtxException {
public:
    explicit ConfigurationError(const std::string& message)
        : AtxException("Configuration Error: " + message) {}
};

// Raised by exchange clients. Transient errors (timeouts, rate limits, network)
// are skipped for the current cycle; the rest abort the operation.
class ExchangeError : public AtxException {
public:
    ExchangeError(const std::string& exchange, const std::string& message, bool transient = true)
        : AtxException("Exchange Error [" + exchange + "]: " + message),
          exchange_(exchange), transient_(transient) {}

    const std::string& exchange() const { return exchange_; }
    bool is_transient() const { return transient_; }

private:
    std::string exchange_;
    bool transient_;
};

class OrderRejectedError : public ExchangeError {
public:
    OrderRejectedError(const std::string& exchange, const std::string& reason)
        : ExchangeError(exchange, "order rejected: " + reason, false) {}
};

class InsufficientBalanceError : public OrderRejectedError {
public:
    InsufficientBalanceError(const std::string& exchange, const std::string& reason)
        : OrderRejectedError(exchange, "insufficient balance: " + reason) {}
};

class TradingError : public AtxException {
public:
    explicit TradingError(const std::string& message)
        : AtxException("Trading Error: " + message) {}
};

class ValidationError : public AtxException {
public:
    explicit ValidationError(const std::string& message)
        : AtxException("Validation Error: " + message) {}
};

} // namespace atx
