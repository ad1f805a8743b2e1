#pragma once

#include "arbitrage_types.hpp"
#include <optional>
#include <string>
#include <variant>

namespace atx {
namespace trading_engine {

enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

enum class ErrorKind {
    MARKET_DATA,
    ORDER_SUBMISSION,
    PARTIAL_FILL,
    EMERGENCY,
    UNEXPECTED,
    ABANDONED_EXECUTION,
    EXIT_ADVISORY,
    CONNECTION
};

std::string to_string(ErrorSeverity severity);
std::string to_string(ErrorKind kind);

struct StatusChangedEvent {
    EngineStatus previous;
    EngineStatus current;
    std::string message;
};

struct PriceUpdatedEvent {
    std::string symbol;
    types::Ticker ticker;
};

struct OpportunityFoundEvent {
    SpreadOpportunity opportunity;
};

struct TradeCompletedEvent {
    TradeResult result;
};

struct EngineErrorEvent {
    ErrorSeverity severity;
    ErrorKind kind;
    std::string symbol;
    std::string trade_id;
    std::string message;
    std::string recommended_action;
    std::optional<HeldInventory> held_inventory;
    types::Timestamp timestamp;

    EngineErrorEvent()
        : severity(ErrorSeverity::ERROR), kind(ErrorKind::UNEXPECTED),
          timestamp(std::chrono::system_clock::now()) {}
};

struct BalanceUpdatedEvent {
    CombinedBalanceSnapshot snapshot;
    double drawdown_percent;
};

struct EmergencyTriggeredEvent {
    EmergencyCheck check;
};

struct RebalanceRecommendedEvent {
    RebalanceRecommendation recommendation;
};

using EngineEvent = std::variant<StatusChangedEvent, PriceUpdatedEvent, OpportunityFoundEvent,
                                 TradeCompletedEvent, EngineErrorEvent, BalanceUpdatedEvent,
                                 EmergencyTriggeredEvent, RebalanceRecommendedEvent>;

std::string event_name(const EngineEvent& event);

} // namespace trading_engine
} // namespace atx
