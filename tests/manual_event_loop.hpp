// SPDX-License-Identifier: MIT

// tests/manual_event_loop.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <unordered_map>
#include <utility>

#include "lib/stream/event_loop.hpp"

namespace termq {

/// Single-threaded IEventLoop with a virtual clock.
///
/// Nothing happens on its own: tests move time with AdvanceBy() and flush
/// deferred work with RunDeferred(). Timers fire in deadline order (ties in
/// scheduling order) and deferred callbacks queued by a timer run before the
/// next timer fires. File descriptors are not polled; Register() returns a
/// handle that only records the requested interest.
class ManualEventLoop : public IEventLoop {
public:
    using Duration = std::chrono::milliseconds;

    class Handle : public IEventHandle {
    public:
        Handle(int fd, bool want_read, bool want_write)
            : fd_(fd), want_read_(want_read), want_write_(want_write) {}

        void Update(bool want_read, bool want_write) override {
            want_read_ = want_read;
            want_write_ = want_write;
        }
        int fd() const override { return fd_; }

        bool want_read() const { return want_read_; }
        bool want_write() const { return want_write_; }

    private:
        int fd_;
        bool want_read_;
        bool want_write_;
    };

    std::unique_ptr<IEventHandle> Register(int fd, bool want_read, bool want_write,
                                           ReadCallback, WriteCallback,
                                           ErrorCallback) override {
        return std::make_unique<Handle>(fd, want_read, want_write);
    }

    void Defer(std::function<void()> fn) override { deferred_.push_back(std::move(fn)); }

    TimerId Schedule(std::chrono::milliseconds delay, TimerCallback fn) override {
        TimerId id = next_id_++;
        Duration deadline = now_ + delay;
        timers_.emplace(Key{deadline, id}, std::move(fn));
        deadlines_.emplace(id, deadline);
        return id;
    }

    void CancelTimer(TimerId id) override {
        auto it = deadlines_.find(id);
        if (it == deadlines_.end()) {
            return;
        }
        timers_.erase(Key{it->second, id});
        deadlines_.erase(it);
    }

    bool IsInEventLoopThread() const override { return true; }

    /// Run deferred callbacks, including ones they defer in turn.
    void RunDeferred() {
        while (!deferred_.empty()) {
            auto fn = std::move(deferred_.front());
            deferred_.pop_front();
            fn();
        }
    }

    /// Move the clock forward by @p delta, firing every timer that comes due.
    void AdvanceBy(Duration delta) {
        const Duration target = now_ + delta;
        RunDeferred();
        while (!timers_.empty() && timers_.begin()->first.first <= target) {
            auto it = timers_.begin();
            now_ = it->first.first;
            TimerCallback fn = std::move(it->second);
            deadlines_.erase(it->first.second);
            timers_.erase(it);
            fn();
            RunDeferred();
        }
        now_ = target;
    }

    Duration now() const { return now_; }
    std::size_t PendingTimers() const { return timers_.size(); }
    std::size_t PendingDeferred() const { return deferred_.size(); }

    /// Time until the earliest timer, if any is scheduled.
    bool NextDeadline(Duration* out) const {
        if (timers_.empty()) {
            return false;
        }
        *out = timers_.begin()->first.first - now_;
        return true;
    }

private:
    using Key = std::pair<Duration, TimerId>;

    Duration now_{0};
    TimerId next_id_ = 1;
    std::map<Key, TimerCallback> timers_;
    std::unordered_map<TimerId, Duration> deadlines_;
    std::deque<std::function<void()>> deferred_;
};

}  // namespace termq
