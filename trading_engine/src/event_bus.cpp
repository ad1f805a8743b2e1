#include "event_bus.hpp"
#include "utils/logger.hpp"
#include <vector>

namespace atx {
namespace trading_engine {

std::string to_string(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::INFO: return "INFO";
        case ErrorSeverity::WARNING: return "WARNING";
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MARKET_DATA: return "MARKET_DATA";
        case ErrorKind::ORDER_SUBMISSION: return "ORDER_SUBMISSION";
        case ErrorKind::PARTIAL_FILL: return "PARTIAL_FILL";
        case ErrorKind::EMERGENCY: return "EMERGENCY";
        case ErrorKind::UNEXPECTED: return "UNEXPECTED";
        case ErrorKind::ABANDONED_EXECUTION: return "ABANDONED_EXECUTION";
        case ErrorKind::EXIT_ADVISORY: return "EXIT_ADVISORY";
        case ErrorKind::CONNECTION: return "CONNECTION";
    }
    return "UNKNOWN";
}

std::string event_name(const EngineEvent& event) {
    return std::visit([](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, StatusChangedEvent>) {
            return "StatusChanged";
        } else if constexpr (std::is_same_v<T, PriceUpdatedEvent>) {
            return "PriceUpdated";
        } else if constexpr (std::is_same_v<T, OpportunityFoundEvent>) {
            return "OpportunityFound";
        } else if constexpr (std::is_same_v<T, TradeCompletedEvent>) {
            return "TradeCompleted";
        } else if constexpr (std::is_same_v<T, EngineErrorEvent>) {
            return "ErrorOccurred";
        } else if constexpr (std::is_same_v<T, BalanceUpdatedEvent>) {
            return "BalanceUpdated";
        } else if constexpr (std::is_same_v<T, EmergencyTriggeredEvent>) {
            return "EmergencyTriggered";
        } else {
            return "RebalanceRecommended";
        }
    }, event);
}

EventBus::SubscriptionId EventBus::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.erase(id) > 0;
}

size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
}

void EventBus::push_event(EngineEvent event) {
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners.reserve(listeners_.size());
        for (const auto& [id, listener] : listeners_) {
            listeners.push_back(listener);
        }
    }

    for (const auto& listener : listeners) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            utils::Logger::error("Event listener failed on {}: {}", event_name(event), e.what());
        }
    }
}

} // namespace trading_engine
} // namespace atx
