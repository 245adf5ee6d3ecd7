// SPDX-License-Identifier: MIT

#pragma once

#include <sys/epoll.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "lib/stream/event_loop.hpp"

namespace termq {

class EpollEventLoop;

/// Handle for a registered file descriptor in the epoll event loop.
///
/// Returned by EpollEventLoop::Register().  Destroying the handle
/// automatically removes the fd from the epoll set.
class EpollEventHandle : public IEventHandle {
public:
    /// Construct a handle and register @p fd with the epoll instance.
    EpollEventHandle(EpollEventLoop& loop, int fd,
                     bool want_read, bool want_write,
                     IEventLoop::ReadCallback on_read,
                     IEventLoop::WriteCallback on_write,
                     IEventLoop::ErrorCallback on_error);

    ~EpollEventHandle() override;

    EpollEventHandle(const EpollEventHandle&) = delete;
    EpollEventHandle& operator=(const EpollEventHandle&) = delete;
    EpollEventHandle(EpollEventHandle&&) = delete;
    EpollEventHandle& operator=(EpollEventHandle&&) = delete;

    /// Change which I/O directions are monitored.
    void Update(bool want_read, bool want_write) override;

    /// @return The monitored file descriptor.
    int fd() const override { return fd_; }

    /// Dispatch callbacks for the given epoll event mask (called internally).
    ///
    /// Readable data is delivered before a hangup is reported: a PTY master
    /// signals EPOLLHUP together with the child's final output.
    void HandleEvents(uint32_t events);

private:
    uint32_t ComputeEpollFlags(bool want_read, bool want_write) const;

    EpollEventLoop& loop_;
    int fd_;
    IEventLoop::ReadCallback on_read_;
    IEventLoop::WriteCallback on_write_;
    IEventLoop::ErrorCallback on_error_;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

/// Epoll-based event loop for non-blocking I/O and timer scheduling.
///
/// Timers share a single timerfd: scheduled callbacks are kept ordered by
/// deadline and the timerfd is re-armed for the earliest one.  Cancelling a
/// timer only touches that ordered set, so a callback may cancel any other
/// timer (including one that expired in the same poll) without leaving a
/// dangling epoll registration behind.
///
/// Thread safety: the loop itself runs on a single thread.  Defer(),
/// Schedule(), CancelTimer() and Wake() may be called from any thread.
class EpollEventLoop : public IEventLoop {
public:
    /// Create an epoll instance, the shared timerfd and an eventfd for
    /// cross-thread wakeups.
    EpollEventLoop();
    ~EpollEventLoop() override;

    EpollEventLoop(const EpollEventLoop&) = delete;
    EpollEventLoop& operator=(const EpollEventLoop&) = delete;
    EpollEventLoop(EpollEventLoop&&) = delete;
    EpollEventLoop& operator=(EpollEventLoop&&) = delete;

    std::unique_ptr<IEventHandle> Register(
        int fd,
        bool want_read,
        bool want_write,
        ReadCallback on_read,
        WriteCallback on_write,
        ErrorCallback on_error) override;

    /// Queue a callback to run on the event-loop thread.
    void Defer(std::function<void()> fn) override;

    /// Schedule a one-shot callback after @p delay.
    TimerId Schedule(std::chrono::milliseconds delay, TimerCallback fn) override;

    /// Drop a scheduled callback. No-op for fired or unknown ids.
    void CancelTimer(TimerId id) override;

    /// @return True if the calling thread is the event-loop thread.
    bool IsInEventLoopThread() const override;

    /// Poll for events with the given timeout (milliseconds).  -1 blocks.
    void Poll(int timeout_ms);

    /// Run the event loop until Stop() is called.
    void Run();

    /// Signal the loop to exit after the current poll completes.
    void Stop();

    /// Wake the event loop from another thread (e.g. after Defer()).
    void Wake();

    /// Number of scheduled callbacks that have not fired or been cancelled.
    std::size_t PendingTimers() const;

    /// @return The underlying epoll file descriptor (used internally by EpollEventHandle).
    int epoll_fd() const { return epoll_fd_; }

private:
    using Clock = std::chrono::steady_clock;
    using TimerKey = std::pair<Clock::time_point, TimerId>;

    void ProcessDeferredCallbacks();
    void HandleTimerExpired();
    void RearmTimerFd();  // requires timers_mutex_

    enum class State { Idle, Running, Stopped };

    int epoll_fd_;
    int wake_fd_ = -1;
    int timer_fd_ = -1;
    std::atomic<State> state_{State::Idle};
    std::atomic<std::thread::id> loop_thread_id_{};

    std::mutex deferred_mutex_;
    std::vector<std::function<void()>> deferred_callbacks_;

    mutable std::mutex timers_mutex_;
    std::map<TimerKey, TimerCallback> timers_;
    std::unordered_map<TimerId, Clock::time_point> timer_deadlines_;
    TimerId next_timer_id_ = 1;

    static constexpr int kMaxEvents = 64;
};

}  // namespace termq
