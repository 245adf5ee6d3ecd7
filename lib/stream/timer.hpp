// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <functional>
#include <utility>

#include "lib/stream/event_loop.hpp"

namespace termq {

/// One-shot, re-armable timer built on IEventLoop::Schedule().
///
/// At most one instance is outstanding: Start() cancels whatever was armed
/// before. Stop() is idempotent. Destroying an armed timer cancels the
/// scheduled callback in the loop, so the callback may capture its owner.
///
/// @code
/// Timer timeout(loop);
/// timeout.OnTimer([this] { HandleTimeout(); });
/// timeout.Start(std::chrono::milliseconds(500));
/// @endcode
class Timer {
public:
    using Callback = std::function<void()>;

    /// @param loop  Event loop that drives this timer
    explicit Timer(IEventLoop& loop) : loop_(loop) {}

    ~Timer() { Stop(); }

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;
    Timer(Timer&&) = delete;
    Timer& operator=(Timer&&) = delete;

    /// Set the callback invoked when the timer expires.
    void OnTimer(Callback cb) { callback_ = std::move(cb); }

    /// Arm the timer, replacing any pending expiry.
    void Start(std::chrono::milliseconds delay) {
        Stop();
        id_ = loop_.Schedule(delay, [this]() { Fire(); });
    }

    /// Disarm the timer. No callback fires until the next Start().
    void Stop() {
        if (id_ != 0) {
            loop_.CancelTimer(id_);
            id_ = 0;
        }
    }

    /// Return true if the timer is armed.
    bool IsArmed() const { return id_ != 0; }

private:
    void Fire() {
        // Disarm first: the callback may re-arm
        id_ = 0;
        if (callback_) {
            callback_();
        }
    }

    IEventLoop& loop_;
    Callback callback_;
    TimerId id_ = 0;
};

}  // namespace termq
