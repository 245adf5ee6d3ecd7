// SPDX-License-Identifier: MIT

// src/co_generator.hpp
#pragma once

#include <coroutine>
#include <exception>
#include <utility>

#include "src/generator.hpp"
#include "src/yield.hpp"

namespace termq {

/// Coroutine-backed Generator.
///
/// A function returning CoGenerator is written as straight-line code; each
/// `co_yield` hands a Yield to the queue and evaluates to the ResumeValue of
/// the next resume:
///
/// @code
/// CoGenerator Login(std::string user) {
///     auto reply = co_yield yield::Send{user + "\n"};
///     if (reply.IsTimeout()) co_return;
///     co_yield yield::WaitUntil{"id\n", [](const ResumeValue& v) {
///         return v.text.find("uid=") != std::string::npos;
///     }};
/// }
///
/// queue.Enqueue(std::make_unique<CoGenerator>(Login("root")));
/// @endcode
///
/// The body does not start until the first Next(); that first value is not
/// observable from the body. Falling off the end is yield::Done. Close()
/// destroys the frame, so destructors of the body's locals act as cleanup.
/// An exception escaping the body is rethrown from Next() and ends the
/// coroutine.
class CoGenerator : public Generator {
public:
    struct promise_type;
    using Handle = std::coroutine_handle<promise_type>;

    struct promise_type {
        Yield current = yield::Done{};
        ResumeValue resume_value;
        std::exception_ptr exception;

        struct YieldAwaiter {
            promise_type& promise;

            bool await_ready() const noexcept { return false; }
            void await_suspend(std::coroutine_handle<>) const noexcept {}
            ResumeValue await_resume() const { return std::move(promise.resume_value); }
        };

        CoGenerator get_return_object() { return CoGenerator{Handle::from_promise(*this)}; }
        std::suspend_always initial_suspend() noexcept { return {}; }
        std::suspend_always final_suspend() noexcept { return {}; }

        YieldAwaiter yield_value(Yield y) {
            current = std::move(y);
            return YieldAwaiter{*this};
        }

        void return_void() noexcept {}
        void unhandled_exception() { exception = std::current_exception(); }

        // Suspension happens only at co_yield
        template <typename U>
        std::suspend_never await_transform(U&&) = delete;
    };

    CoGenerator(CoGenerator&& other) noexcept
        : handle_(std::exchange(other.handle_, nullptr)) {}

    CoGenerator& operator=(CoGenerator&& other) noexcept {
        if (this != &other) {
            Close();
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    CoGenerator(const CoGenerator&) = delete;
    CoGenerator& operator=(const CoGenerator&) = delete;

    ~CoGenerator() override { Close(); }

    Yield Next(const ResumeValue& value) override {
        if (!handle_ || handle_.done()) {
            return yield::Done{};
        }
        handle_.promise().resume_value = value;
        handle_.resume();

        if (handle_.done()) {
            std::exception_ptr error = handle_.promise().exception;
            Close();
            if (error) {
                std::rethrow_exception(error);
            }
            return yield::Done{};
        }
        return std::move(handle_.promise().current);
    }

    void Close() override {
        if (handle_) {
            handle_.destroy();
            handle_ = nullptr;
        }
    }

    /// True once the body finished or the generator was closed.
    bool IsDone() const { return !handle_ || handle_.done(); }

private:
    explicit CoGenerator(Handle handle) : handle_(handle) {}

    Handle handle_;
};

}  // namespace termq
