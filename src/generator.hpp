// SPDX-License-Identifier: MIT

// src/generator.hpp
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <utility>

#include "src/yield.hpp"

namespace termq {

/// Resumable computation driven by the InteractionQueue.
///
/// The queue calls Next() with whatever happened since the generator last
/// suspended and acts on the returned Yield. yield::Done means the
/// generator is exhausted; the queue then drops it and starts the next one.
///
/// Close() may be called at any time (including before the first Next())
/// and must be idempotent. After Close() the queue never calls Next() again.
class Generator {
public:
    virtual ~Generator() = default;

    /// Resume with @p value and run to the next suspension point.
    virtual Yield Next(const ResumeValue& value) = 0;

    /// Abandon the computation and release whatever it holds.
    virtual void Close() = 0;
};

/// Generator backed by a single step function.
///
/// The function is called once per Next(); it owns whatever state it needs
/// through its captures. Close() drops the function and runs the optional
/// on_close hook once.
class FunctionGenerator : public Generator {
public:
    using StepFn = std::function<Yield(const ResumeValue&)>;
    using CloseFn = std::function<void()>;

    explicit FunctionGenerator(StepFn step, CloseFn on_close = {})
        : step_(std::move(step)), on_close_(std::move(on_close)) {}

    ~FunctionGenerator() override { Close(); }

    Yield Next(const ResumeValue& value) override {
        if (!step_) {
            return yield::Done{};
        }
        Yield result = step_(value);
        if (std::holds_alternative<yield::Done>(result)) {
            Close();
        }
        return result;
    }

    void Close() override {
        step_ = nullptr;
        if (auto on_close = std::exchange(on_close_, nullptr)) {
            on_close();
        }
    }

private:
    StepFn step_;
    CloseFn on_close_;
};

/// Wrap a step function as a generator.
inline std::unique_ptr<Generator> MakeGenerator(FunctionGenerator::StepFn step,
                                                FunctionGenerator::CloseFn on_close = {}) {
    return std::make_unique<FunctionGenerator>(std::move(step), std::move(on_close));
}

/// One-shot generator for a plain string.
///
/// Yields the text once (as yield::Send, or yield::FireAndForget when
/// @p fire_and_forget is set) and is done on the following resume.
/// Returns nullptr for empty text, which InteractionQueue::Enqueue ignores.
inline std::unique_ptr<Generator> MakeSend(std::string text, bool fire_and_forget = false) {
    if (text.empty()) {
        return nullptr;
    }
    bool sent = false;
    return MakeGenerator(
        [text = std::move(text), fire_and_forget, sent](const ResumeValue&) mutable -> Yield {
            if (sent) {
                return yield::Done{};
            }
            sent = true;
            if (fire_and_forget) {
                return yield::FireAndForget{text};
            }
            return yield::Send{text};
        });
}

}  // namespace termq
