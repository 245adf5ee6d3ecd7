// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace termq {

/// Handle for a registered file descriptor, returned by IEventLoop::Register().
class IEventHandle {
public:
    virtual ~IEventHandle() = default;

    /// Change which events (read/write) are being monitored.
    virtual void Update(bool want_read, bool want_write) = 0;

    /// Return the monitored file descriptor.
    virtual int fd() const = 0;
};

/// Identifies a callback scheduled with IEventLoop::Schedule().
/// Zero is never a valid id.
using TimerId = std::uint64_t;

/// Event loop interface for I/O multiplexing and timers.
///
/// The interaction queue and the PTY process are written against this
/// interface so they can run on the built-in epoll loop, or on a manual
/// loop with a virtual clock in tests.
///
/// All callbacks are invoked on the event loop thread.
class IEventLoop {
public:
    using ReadCallback = std::function<void()>;
    using WriteCallback = std::function<void()>;
    using ErrorCallback = std::function<void(int error_code)>;
    using TimerCallback = std::function<void()>;

    virtual ~IEventLoop() = default;

    /// Register a file descriptor for event monitoring.
    ///
    /// @param fd         File descriptor to monitor
    /// @param want_read  Monitor for readability
    /// @param want_write Monitor for writability
    /// @param on_read    Called when fd is readable
    /// @param on_write   Called when fd is writable
    /// @param on_error   Called on EPOLLERR/EPOLLHUP with SO_ERROR value
    /// @return Handle to modify or unregister the fd (unregisters on destruction)
    virtual std::unique_ptr<IEventHandle> Register(
        int fd,
        bool want_read,
        bool want_write,
        ReadCallback on_read,
        WriteCallback on_write,
        ErrorCallback on_error) = 0;

    /// Schedule a callback for the next event loop iteration.
    virtual void Defer(std::function<void()> fn) = 0;

    /// Schedule a one-shot callback after a delay.
    /// @param delay  Minimum time before callback fires
    /// @param fn     Callback to invoke
    /// @return Id usable with CancelTimer()
    virtual TimerId Schedule(std::chrono::milliseconds delay, TimerCallback fn) = 0;

    /// Cancel a scheduled callback. Unknown or already-fired ids are ignored.
    virtual void CancelTimer(TimerId id) = 0;

    /// Return true if the caller is on the event loop thread.
    virtual bool IsInEventLoopThread() const = 0;
};

}  // namespace termq
