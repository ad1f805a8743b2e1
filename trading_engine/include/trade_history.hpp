#pragma once

#include "arbitrage_types.hpp"
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

namespace atx {
namespace trading_engine {

// Sink for finalized trade results. Durable storage lives outside the core.
class TradeHistoryRecorder {
public:
    virtual ~TradeHistoryRecorder() = default;

    virtual void record(const TradeResult& result) = 0;
    // Most recent first
    virtual std::vector<TradeResult> get_recent(size_t count) const = 0;
    virtual size_t size() const = 0;
    virtual void clear() = 0;
};

class InMemoryTradeHistory : public TradeHistoryRecorder {
public:
    explicit InMemoryTradeHistory(size_t capacity = 1000);

    void record(const TradeResult& result) override;
    std::vector<TradeResult> get_recent(size_t count) const override;
    size_t size() const override;
    void clear() override;

    void set_capacity(size_t capacity);
    size_t capacity() const;

private:
    std::deque<TradeResult> trades_;
    size_t capacity_;
    mutable std::mutex mutex_;
};

} // namespace trading_engine
} // namespace atx
