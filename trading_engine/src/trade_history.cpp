#include "trade_history.hpp"
#include <algorithm>

namespace atx {
namespace trading_engine {

InMemoryTradeHistory::InMemoryTradeHistory(size_t capacity)
    : capacity_(std::max<size_t>(1, capacity)) {}

void InMemoryTradeHistory::record(const TradeResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    trades_.push_back(result);
    while (trades_.size() > capacity_) {
        trades_.pop_front();
    }
}

std::vector<TradeResult> InMemoryTradeHistory::get_recent(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TradeResult> recent;
    recent.reserve(std::min(count, trades_.size()));
    for (auto it = trades_.rbegin(); it != trades_.rend() && recent.size() < count; ++it) {
        recent.push_back(*it);
    }
    return recent;
}

size_t InMemoryTradeHistory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trades_.size();
}

void InMemoryTradeHistory::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    trades_.clear();
}

void InMemoryTradeHistory::set_capacity(size_t capacity) {
    std::lock_guard<std::mutex> lock(mutex_);
    capacity_ = std::max<size_t>(1, capacity);
    while (trades_.size() > capacity_) {
        trades_.pop_front();
    }
}

size_t InMemoryTradeHistory::capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_;
}

} // namespace trading_engine
} // namespace atx
