// SPDX-License-Identifier: MIT

// example/shell_probe/include/shell_probe/asio_event_loop.hpp
#pragma once

#include <poll.h>

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <thread>
#include <unordered_map>
#include <utility>

#include "lib/stream/event_loop.hpp"

namespace shell_probe {

// Registration state shared with pending async_wait handlers, so a handler
// that runs after the handle is gone sees `destroyed` instead of freed memory.
//
// ASIO's epoll reactor is edge-triggered: output that lands between a
// handler being dequeued and the next async_wait would go unnoticed. The
// wait is re-armed before the callback runs, and readiness is re-checked
// with poll() afterwards.
struct AsioWatch : std::enable_shared_from_this<AsioWatch> {
    asio::posix::stream_descriptor stream;
    termq::IEventLoop::ReadCallback on_read;
    termq::IEventLoop::WriteCallback on_write;
    termq::IEventLoop::ErrorCallback on_error;
    bool want_read = false;
    bool want_write = false;
    bool read_pending = false;
    bool write_pending = false;
    bool destroyed = false;

    AsioWatch(asio::io_context& ctx, int fd) : stream(ctx, fd) {}

    void Arm() {
        if (want_read && !read_pending) {
            Wait(asio::posix::stream_descriptor::wait_read, POLLIN);
        }
        if (want_write && !write_pending) {
            Wait(asio::posix::stream_descriptor::wait_write, POLLOUT);
        }
    }

    void Wait(asio::posix::stream_descriptor::wait_type type, short poll_event) {
        if (destroyed) return;
        const bool reading = type == asio::posix::stream_descriptor::wait_read;
        (reading ? read_pending : write_pending) = true;

        std::weak_ptr<AsioWatch> weak_self = weak_from_this();
        stream.async_wait(type, [weak_self, reading, poll_event](std::error_code ec) {
            auto self = weak_self.lock();
            if (!self || self->destroyed) return;
            (reading ? self->read_pending : self->write_pending) = false;

            if (ec) {
                if (ec != asio::error::operation_aborted && self->on_error) {
                    self->on_error(ec.value());
                }
                return;
            }

            const bool& wanted = reading ? self->want_read : self->want_write;
            auto& callback = reading ? self->on_read : self->on_write;
            int fd = self->stream.native_handle();

            // Bounded: a hung-up pty can stay "readable" forever
            for (int round = 0; round < kMaxRounds; ++round) {
                if (!wanted || self->destroyed || !callback) break;
                callback();
                if (!Ready(fd, poll_event)) break;
            }
            if (wanted && !self->destroyed) {
                self->Arm();
            }
        });
    }

    static bool Ready(int fd, short poll_event) {
        pollfd pfd{fd, poll_event, 0};
        return ::poll(&pfd, 1, 0) > 0 && (pfd.revents & poll_event) != 0;
    }

    static constexpr int kMaxRounds = 16;
};

// fd registration on an io_context; the fd stays owned by the caller
class AsioEventHandle : public termq::IEventHandle {
public:
    AsioEventHandle(asio::io_context& ctx, int fd, bool want_read, bool want_write,
                    termq::IEventLoop::ReadCallback on_read,
                    termq::IEventLoop::WriteCallback on_write,
                    termq::IEventLoop::ErrorCallback on_error)
        : fd_(fd), watch_(std::make_shared<AsioWatch>(ctx, fd)) {
        watch_->on_read = std::move(on_read);
        watch_->on_write = std::move(on_write);
        watch_->on_error = std::move(on_error);
        watch_->want_read = want_read;
        watch_->want_write = want_write;
        watch_->Arm();
    }

    ~AsioEventHandle() override {
        watch_->destroyed = true;
        std::error_code ignored;
        watch_->stream.cancel(ignored);
        watch_->stream.release();
    }

    AsioEventHandle(const AsioEventHandle&) = delete;
    AsioEventHandle& operator=(const AsioEventHandle&) = delete;

    void Update(bool want_read, bool want_write) override {
        watch_->want_read = want_read;
        watch_->want_write = want_write;
        watch_->Arm();
    }

    int fd() const override { return fd_; }

private:
    int fd_;
    std::shared_ptr<AsioWatch> watch_;
};

// termq::IEventLoop on top of an asio::io_context owned by the host program.
// Timers are asio::steady_timer instances kept by id so they can be cancelled.
class AsioEventLoop : public termq::IEventLoop {
public:
    explicit AsioEventLoop(asio::io_context& ctx)
        : ctx_(ctx), thread_id_(std::this_thread::get_id()) {}

    ~AsioEventLoop() override {
        for (auto& [id, timer] : timers_) {
            timer->cancel();
        }
    }

    std::unique_ptr<termq::IEventHandle> Register(
        int fd,
        bool want_read,
        bool want_write,
        ReadCallback on_read,
        WriteCallback on_write,
        ErrorCallback on_error) override {
        return std::make_unique<AsioEventHandle>(
            ctx_, fd, want_read, want_write,
            std::move(on_read), std::move(on_write), std::move(on_error));
    }

    void Defer(std::function<void()> fn) override {
        asio::post(ctx_, std::move(fn));
    }

    termq::TimerId Schedule(std::chrono::milliseconds delay, TimerCallback fn) override {
        termq::TimerId id = next_id_++;
        auto timer = std::make_shared<asio::steady_timer>(ctx_, delay);
        timers_.emplace(id, timer);
        timer->async_wait([this, id, timer, fn = std::move(fn)](std::error_code ec) {
            if (ec) return;  // cancelled
            if (timers_.erase(id) == 0) return;
            fn();
        });
        return id;
    }

    void CancelTimer(termq::TimerId id) override {
        auto it = timers_.find(id);
        if (it == timers_.end()) return;
        it->second->cancel();
        timers_.erase(it);
    }

    bool IsInEventLoopThread() const override {
        return std::this_thread::get_id() == thread_id_.load();
    }

    // Runs the io_context on the calling thread until it is stopped or out of work
    void Run() {
        thread_id_.store(std::this_thread::get_id());
        ctx_.run();
    }

    void Stop() { ctx_.stop(); }

    std::size_t PendingTimers() const { return timers_.size(); }

    asio::io_context& context() { return ctx_; }

private:
    asio::io_context& ctx_;
    std::atomic<std::thread::id> thread_id_;
    std::unordered_map<termq::TimerId, std::shared_ptr<asio::steady_timer>> timers_;
    termq::TimerId next_id_ = 1;
};

}  // namespace shell_probe
