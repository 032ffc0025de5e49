#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace mhub {

// Shared cooperative cancellation flag. Copies observe the same state.
class CancelToken {
public:
    CancelToken() : state_(std::make_shared<State>()) {}

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->cancelled = true;
        }
        state_->cv.notify_all();
    }

    bool cancelled() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->cancelled;
    }

    // Sleeps up to `timeout`, waking early on cancellation. Returns cancelled().
    bool waitFor(std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return state_->cv.wait_for(lock, timeout, [this]() { return state_->cancelled; });
    }

private:
    struct State {
        mutable std::mutex mutex;
        std::condition_variable cv;
        bool cancelled{false};
    };

    std::shared_ptr<State> state_;
};

}  // namespace mhub
