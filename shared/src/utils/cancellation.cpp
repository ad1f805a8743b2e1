#include "utils/cancellation.hpp"
#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

namespace atx {
namespace utils {

struct CancellationToken::State {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
    std::vector<std::weak_ptr<State>> children;
};

void CancellationSource::cancel_state(const std::shared_ptr<CancellationToken::State>& state) {
    std::vector<std::weak_ptr<CancellationToken::State>> children;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->cancelled) {
            return;
        }
        state->cancelled = true;
        children.swap(state->children);
    }
    state->cv.notify_all();

    for (auto& weak_child : children) {
        if (auto child = weak_child.lock()) {
            cancel_state(child);
        }
    }
}

bool CancellationToken::is_cancelled() const {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) const {
    if (!state_) {
        std::this_thread::sleep_for(timeout);
        return true;
    }

    std::unique_lock<std::mutex> lock(state_->mutex);
    bool cancelled = state_->cv.wait_for(lock, timeout, [this] { return state_->cancelled; });
    return !cancelled;
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<CancellationToken::State>()) {}

CancellationSource::CancellationSource(const CancellationToken& parent)
    : state_(std::make_shared<CancellationToken::State>()) {
    if (!parent.state_) {
        return;
    }

    std::lock_guard<std::mutex> lock(parent.state_->mutex);
    if (parent.state_->cancelled) {
        state_->cancelled = true;
        return;
    }

    auto& children = parent.state_->children;
    children.erase(std::remove_if(children.begin(), children.end(),
                                  [](const std::weak_ptr<CancellationToken::State>& child) {
                                      return child.expired();
                                  }),
                   children.end());
    children.push_back(state_);
}

void CancellationSource::cancel() {
    cancel_state(state_);
}

bool CancellationSource::is_cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

CancellationToken CancellationSource::token() const {
    return CancellationToken(state_);
}

} // namespace utils
} // namespace atx
