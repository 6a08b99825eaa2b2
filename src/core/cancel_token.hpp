#pragma once

#include <chrono>
#include <memory>

// Shared cancellation flag. Copies observe the same state; a
// default-constructed token is live and can be cancelled.
//
//   CancelToken cancel;
//   std::thread t([cancel] { while (!cancel.wait_for(ms(100))) { ... } });
//   cancel.cancel();
//
class CancelToken {
public:
    CancelToken();

    // A token nobody can cancel (the reconnection loop uses this).
    static CancelToken none();

    void cancel() const;
    bool is_cancelled() const;

    // Sleep up to `timeout`. Returns true if cancelled before or during the wait.
    bool wait_for(std::chrono::milliseconds timeout) const;

private:
    struct State;
    std::shared_ptr<State> state_;
};
