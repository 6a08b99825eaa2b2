#include "cancel_token.hpp"
#include <condition_variable>
#include <mutex>

struct CancelToken::State {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
};

CancelToken::CancelToken() : state_(std::make_shared<State>()) {}

CancelToken CancelToken::none() {
    return CancelToken();
}

void CancelToken::cancel() const {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled = true;
    }
    state_->cv.notify_all();
}

bool CancelToken::is_cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool CancelToken::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this] { return state_->cancelled; });
}
