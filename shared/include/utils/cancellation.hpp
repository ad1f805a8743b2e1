#pragma once

#include <chrono>
#include <memory>

namespace atx {
namespace utils {

class CancellationSource;

// Read side of a cancellation scope. A default-constructed token is never cancelled.
class CancellationToken {
public:
    CancellationToken() = default;

    bool is_cancelled() const;

    // Sleeps for up to `timeout`. Returns false if the wait ended because of cancellation.
    bool wait_for(std::chrono::milliseconds timeout) const;

    bool can_be_cancelled() const { return state_ != nullptr; }

private:
    friend class CancellationSource;
    struct State;

    explicit CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

// Owns one cancellation scope. Sources created from a parent token are cancelled
// together with the parent, never the other way round.
class CancellationSource {
public:
    CancellationSource();
    explicit CancellationSource(const CancellationToken& parent);

    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;

    void cancel();
    bool is_cancelled() const;
    CancellationToken token() const;

private:
    static void cancel_state(const std::shared_ptr<CancellationToken::State>& state);

    std::shared_ptr<CancellationToken::State> state_;
};

} // namespace utils
} // namespace atx
