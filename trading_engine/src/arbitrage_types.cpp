#include "arbitrage_types.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace atx {
namespace trading_engine {

bool is_valid_transition(EngineStatus from, EngineStatus to) {
    switch (to) {
        case EngineStatus::STARTING:
            return from == EngineStatus::IDLE || from == EngineStatus::STOPPED ||
                   from == EngineStatus::ERROR;
        case EngineStatus::RUNNING:
            return from == EngineStatus::STARTING || from == EngineStatus::PAUSED;
        case EngineStatus::PAUSED:
            return from == EngineStatus::RUNNING;
        case EngineStatus::STOPPING:
            return from == EngineStatus::RUNNING || from == EngineStatus::PAUSED ||
                   from == EngineStatus::STARTING;
        case EngineStatus::STOPPED:
            return from == EngineStatus::STOPPING;
        case EngineStatus::ERROR:
            return from == EngineStatus::STARTING || from == EngineStatus::RUNNING ||
                   from == EngineStatus::PAUSED || from == EngineStatus::STOPPING;
        case EngineStatus::IDLE:
            return false;
    }
    return false;
}

std::string to_string(ArbitrageDirection direction) {
    switch (direction) {
        case ArbitrageDirection::BUY_A_SELL_B: return "BUY_A_SELL_B";
        case ArbitrageDirection::BUY_B_SELL_A: return "BUY_B_SELL_A";
    }
    return "UNKNOWN";
}

std::string to_string(TradeStatus status) {
    switch (status) {
        case TradeStatus::COMPLETED: return "COMPLETED";
        case TradeStatus::PARTIAL_FAILURE: return "PARTIAL_FAILURE";
        case TradeStatus::BUY_FAILED: return "BUY_FAILED";
        case TradeStatus::REJECTED: return "REJECTED";
        case TradeStatus::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

std::string to_string(ExecutionStage stage) {
    switch (stage) {
        case ExecutionStage::PENDING: return "PENDING";
        case ExecutionStage::BUY_LEG_SUBMITTED: return "BUY_LEG_SUBMITTED";
        case ExecutionStage::BUY_LEG_FILLED: return "BUY_LEG_FILLED";
        case ExecutionStage::SELL_LEG_SUBMITTED: return "SELL_LEG_SUBMITTED";
        case ExecutionStage::SELL_LEG_FILLED: return "SELL_LEG_FILLED";
        case ExecutionStage::COMPLETED: return "COMPLETED";
        case ExecutionStage::PARTIAL_FAILURE: return "PARTIAL_FAILURE";
        case ExecutionStage::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

std::string to_string(EngineStatus status) {
    switch (status) {
        case EngineStatus::IDLE: return "IDLE";
        case EngineStatus::STARTING: return "STARTING";
        case EngineStatus::RUNNING: return "RUNNING";
        case EngineStatus::PAUSED: return "PAUSED";
        case EngineStatus::STOPPING: return "STOPPING";
        case EngineStatus::STOPPED: return "STOPPED";
        case EngineStatus::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

std::string to_string(EmergencyTriggerReason reason) {
    switch (reason) {
        case EmergencyTriggerReason::NONE: return "NONE";
        case EmergencyTriggerReason::MAX_DRAWDOWN_EXCEEDED: return "MAX_DRAWDOWN_EXCEEDED";
        case EmergencyTriggerReason::MAX_LOSS_EXCEEDED: return "MAX_LOSS_EXCEEDED";
        case EmergencyTriggerReason::CONSECUTIVE_LOSSES: return "CONSECUTIVE_LOSSES";
        case EmergencyTriggerReason::RAPID_LOSS_RATE: return "RAPID_LOSS_RATE";
        case EmergencyTriggerReason::CRITICAL_IMBALANCE: return "CRITICAL_IMBALANCE";
    }
    return "UNKNOWN";
}

std::string to_string(EmergencyAction action) {
    switch (action) {
        case EmergencyAction::NONE: return "NONE";
        case EmergencyAction::PAUSE_TRADING: return "PAUSE_TRADING";
        case EmergencyAction::STOP_TRADING: return "STOP_TRADING";
    }
    return "UNKNOWN";
}

std::string to_string(RebalanceUrgency urgency) {
    switch (urgency) {
        case RebalanceUrgency::NONE: return "NONE";
        case RebalanceUrgency::LOW: return "LOW";
        case RebalanceUrgency::MEDIUM: return "MEDIUM";
        case RebalanceUrgency::HIGH: return "HIGH";
        case RebalanceUrgency::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

std::string to_string(ExitSignal signal) {
    switch (signal) {
        case ExitSignal::NONE: return "NONE";
        case ExitSignal::TAKE_PROFIT: return "TAKE_PROFIT";
        case ExitSignal::STOP_LOSS: return "STOP_LOSS";
        case ExitSignal::TRAILING_STOP: return "TRAILING_STOP";
        case ExitSignal::MAX_HOLD_TIME: return "MAX_HOLD_TIME";
    }
    return "UNKNOWN";
}

std::string format_date(types::Timestamp time) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm local_tm{};
    localtime_r(&t, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d");
    return oss.str();
}

} // namespace trading_engine
} // namespace atx
