// SPDX-License-Identifier: MIT

#include "lib/stream/epoll_event_loop.hpp"

#include <sys/eventfd.h>
#include <sys/socket.h>
#include <sys/timerfd.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>
#include <utility>

namespace termq {

// EpollEventHandle implementation

EpollEventHandle::EpollEventHandle(EpollEventLoop& loop, int fd,
                                   bool want_read, bool want_write,
                                   IEventLoop::ReadCallback on_read,
                                   IEventLoop::WriteCallback on_write,
                                   IEventLoop::ErrorCallback on_error)
    : loop_(loop),
      fd_(fd),
      on_read_(std::move(on_read)),
      on_write_(std::move(on_write)),
      on_error_(std::move(on_error)) {
    epoll_event ev{};
    ev.events = ComputeEpollFlags(want_read, want_write);
    ev.data.ptr = this;

    if (epoll_ctl(loop_.epoll_fd(), EPOLL_CTL_ADD, fd_, &ev) < 0) {
        throw std::system_error(errno, std::system_category(), "epoll_ctl ADD");
    }
}

EpollEventHandle::~EpollEventHandle() {
    // fd may already be closed by its owner
    epoll_ctl(loop_.epoll_fd(), EPOLL_CTL_DEL, fd_, nullptr);
}

void EpollEventHandle::Update(bool want_read, bool want_write) {
    epoll_event ev{};
    ev.events = ComputeEpollFlags(want_read, want_write);
    ev.data.ptr = this;

    if (epoll_ctl(loop_.epoll_fd(), EPOLL_CTL_MOD, fd_, &ev) < 0) {
        throw std::system_error(errno, std::system_category(), "epoll_ctl MOD");
    }
}

void EpollEventHandle::HandleEvents(uint32_t events) {
    const bool failed = (events & (EPOLLERR | EPOLLHUP)) != 0;

    if ((events & EPOLLIN) != 0 && on_read_) {
        // The read callback may destroy this handle
        std::weak_ptr<bool> alive = alive_;
        on_read_();
        if (alive.expired()) {
            return;
        }
    }

    if (failed) {
        int error_code = 0;
        socklen_t len = sizeof(error_code);
        if (getsockopt(fd_, SOL_SOCKET, SO_ERROR, &error_code, &len) < 0) {
            // Not a socket (pipe, pty): a plain hangup carries no error
            error_code = (errno == ENOTSOCK) ? 0 : errno;
        }
        if (on_error_) {
            on_error_(error_code);
        }
        return;
    }

    if ((events & EPOLLOUT) != 0 && on_write_) {
        on_write_();
    }
}

uint32_t EpollEventHandle::ComputeEpollFlags(bool want_read,
                                              bool want_write) const {
    uint32_t flags = EPOLLET;
    if (want_read) {
        flags |= EPOLLIN;
    }
    if (want_write) {
        flags |= EPOLLOUT;
    }
    return flags;
}

// EpollEventLoop implementation

EpollEventLoop::EpollEventLoop() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        throw std::system_error(errno, std::system_category(), "epoll_create1");
    }

    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        int err = errno;
        close(epoll_fd_);
        throw std::system_error(err, std::system_category(), "eventfd");
    }

    timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timer_fd_ < 0) {
        int err = errno;
        close(wake_fd_);
        close(epoll_fd_);
        throw std::system_error(err, std::system_category(), "timerfd_create");
    }

    // data.ptr == nullptr marks the wake fd, &timer_fd_ marks the timer fd
    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.ptr = nullptr;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wake_fd_, &ev) < 0) {
        int err = errno;
        close(timer_fd_);
        close(wake_fd_);
        close(epoll_fd_);
        throw std::system_error(err, std::system_category(), "epoll_ctl wake_fd");
    }

    ev.data.ptr = &timer_fd_;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, timer_fd_, &ev) < 0) {
        int err = errno;
        close(timer_fd_);
        close(wake_fd_);
        close(epoll_fd_);
        throw std::system_error(err, std::system_category(), "epoll_ctl timer_fd");
    }
}

EpollEventLoop::~EpollEventLoop() {
    {
        std::lock_guard<std::mutex> lock(timers_mutex_);
        timers_.clear();
        timer_deadlines_.clear();
    }

    if (timer_fd_ >= 0) {
        close(timer_fd_);
    }
    if (wake_fd_ >= 0) {
        close(wake_fd_);
    }
    if (epoll_fd_ >= 0) {
        close(epoll_fd_);
    }
}

std::unique_ptr<IEventHandle> EpollEventLoop::Register(
    int fd,
    bool want_read,
    bool want_write,
    ReadCallback on_read,
    WriteCallback on_write,
    ErrorCallback on_error) {
    return std::make_unique<EpollEventHandle>(
        *this, fd, want_read, want_write,
        std::move(on_read), std::move(on_write), std::move(on_error));
}

void EpollEventLoop::Defer(std::function<void()> fn) {
    {
        std::lock_guard<std::mutex> lock(deferred_mutex_);
        deferred_callbacks_.push_back(std::move(fn));
    }

    if (!IsInEventLoopThread()) {
        Wake();
    }
}

TimerId EpollEventLoop::Schedule(std::chrono::milliseconds delay, TimerCallback fn) {
    auto deadline = Clock::now() + delay;

    std::lock_guard<std::mutex> lock(timers_mutex_);
    TimerId id = next_timer_id_++;
    timers_.emplace(TimerKey{deadline, id}, std::move(fn));
    timer_deadlines_.emplace(id, deadline);
    if (timers_.begin()->first.second == id) {
        RearmTimerFd();
    }
    return id;
}

void EpollEventLoop::CancelTimer(TimerId id) {
    std::lock_guard<std::mutex> lock(timers_mutex_);
    auto it = timer_deadlines_.find(id);
    if (it == timer_deadlines_.end()) {
        return;
    }
    bool was_first = timers_.begin()->first.second == id;
    timers_.erase(TimerKey{it->second, id});
    timer_deadlines_.erase(it);
    if (was_first) {
        RearmTimerFd();
    }
}

std::size_t EpollEventLoop::PendingTimers() const {
    std::lock_guard<std::mutex> lock(timers_mutex_);
    return timers_.size();
}

void EpollEventLoop::RearmTimerFd() {
    itimerspec ts{};  // zero disarms
    if (!timers_.empty()) {
        auto since_epoch = timers_.begin()->first.first.time_since_epoch();
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
        auto nsecs = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - secs);
        ts.it_value.tv_sec = secs.count();
        ts.it_value.tv_nsec = nsecs.count();
        if (ts.it_value.tv_sec == 0 && ts.it_value.tv_nsec == 0) {
            ts.it_value.tv_nsec = 1;
        }
    }
    // steady_clock is CLOCK_MONOTONIC on Linux
    if (timerfd_settime(timer_fd_, TFD_TIMER_ABSTIME, &ts, nullptr) < 0) {
        throw std::system_error(errno, std::system_category(), "timerfd_settime");
    }
}

void EpollEventLoop::HandleTimerExpired() {
    uint64_t expirations = 0;
    [[maybe_unused]] ssize_t n = read(timer_fd_, &expirations, sizeof(expirations));

    const auto now = Clock::now();
    TimerId last_id;
    {
        std::lock_guard<std::mutex> lock(timers_mutex_);
        last_id = next_timer_id_ - 1;
    }

    // Fire due timers one at a time; a callback may cancel or schedule others.
    for (;;) {
        TimerCallback callback;
        {
            std::lock_guard<std::mutex> lock(timers_mutex_);
            auto it = timers_.begin();
            while (it != timers_.end() && it->first.first <= now &&
                   it->first.second > last_id) {
                ++it;
            }
            if (it == timers_.end() || it->first.first > now) {
                RearmTimerFd();
                return;
            }
            callback = std::move(it->second);
            timer_deadlines_.erase(it->first.second);
            timers_.erase(it);
        }
        if (callback) {
            callback();
        }
    }
}

bool EpollEventLoop::IsInEventLoopThread() const {
    return std::this_thread::get_id() == loop_thread_id_.load();
}

void EpollEventLoop::Poll(int timeout_ms) {
    loop_thread_id_.store(std::this_thread::get_id());

    ProcessDeferredCallbacks();

    epoll_event events[kMaxEvents];
    int nfds = epoll_wait(epoll_fd_, events, kMaxEvents, timeout_ms);

    if (nfds < 0) {
        if (errno == EINTR) {
            return;
        }
        throw std::system_error(errno, std::system_category(), "epoll_wait");
    }

    bool timers_due = false;
    for (int i = 0; i < nfds; ++i) {
        void* ptr = events[i].data.ptr;
        if (ptr == nullptr) {
            uint64_t val;
            [[maybe_unused]] ssize_t n = read(wake_fd_, &val, sizeof(val));
        } else if (ptr == &timer_fd_) {
            timers_due = true;
        } else {
            static_cast<EpollEventHandle*>(ptr)->HandleEvents(events[i].events);
        }
    }

    // Timers run after the fd batch so a timer callback that destroys a
    // handle cannot invalidate an event still waiting in the batch.
    if (timers_due) {
        HandleTimerExpired();
    }

    ProcessDeferredCallbacks();
}

void EpollEventLoop::Run() {
    State expected = State::Idle;
    if (!state_.compare_exchange_strong(expected, State::Running)) {
        return;  // Already running or stopped
    }
    while (state_.load() == State::Running) {
        Poll(100);
    }
}

void EpollEventLoop::Stop() {
    state_.store(State::Stopped);
    Wake();
}

void EpollEventLoop::Wake() {
    uint64_t val = 1;
    [[maybe_unused]] ssize_t n = write(wake_fd_, &val, sizeof(val));
}

void EpollEventLoop::ProcessDeferredCallbacks() {
    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(deferred_mutex_);
        callbacks.swap(deferred_callbacks_);
    }

    for (auto& cb : callbacks) {
        if (cb) {
            cb();
        }
    }
}

}  // namespace termq
