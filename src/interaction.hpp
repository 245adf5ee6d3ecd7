// SPDX-License-Identifier: MIT

// src/interaction.hpp
#pragma once

#include <functional>
#include <memory>
#include <utility>

#include "lib/stream/error.hpp"
#include "src/generator.hpp"
#include "src/yield.hpp"

namespace termq {

/// A multi-step exchange with the subprocess, written as a stateful callback.
///
/// The callback runs "inside" a context value (typically a handle to the
/// buffer the exchange belongs to). Each resume hands it a mutable copy of
/// the context it left behind last time; whatever it assigns there is what
/// the next resume sees. The cleanup always runs inside the context the
/// interaction was created with.
///
/// Interaction satisfies Generator, so the queue drives it exactly like any
/// other generator:
/// - Next() restores the saved context, calls the callback, saves the
///   context and returns the result. When the callback returns yield::Done
///   the interaction closes itself and reports Done.
/// - Close() runs the cleanup once, even if the callback never ran, and
///   swaps the callback for one that throws, so a stray resume fails loudly.
///
/// An exception thrown by the callback propagates out of Next(); the
/// interaction stays open and its context is left as it was.
template <typename Context>
class Interaction : public Generator {
public:
    using Callback = std::function<Yield(Context& context, const ResumeValue& value)>;
    using Cleanup = std::function<void(const Context& initial_context)>;

    Interaction(Context context, Callback callback, Cleanup cleanup = {})
        : callback_(std::move(callback)),
          cleanup_(std::move(cleanup)),
          context_(context),
          initial_context_(std::move(context)) {}

    ~Interaction() override { Close(); }

    Interaction(const Interaction&) = delete;
    Interaction& operator=(const Interaction&) = delete;
    Interaction(Interaction&&) = delete;
    Interaction& operator=(Interaction&&) = delete;

    Yield Next(const ResumeValue& value) override {
        Context context = context_;
        Yield result = callback_(context, value);
        context_ = std::move(context);

        if (std::holds_alternative<yield::Done>(result)) {
            Close();
        }
        return result;
    }

    void Close() override {
        if (closed_) {
            return;
        }
        closed_ = true;
        callback_ = [](Context&, const ResumeValue&) -> Yield {
            throw InteractionError(ErrorCode::ResumeAfterClose,
                                   "resumed an interaction after it was closed");
        };
        if (auto cleanup = std::exchange(cleanup_, nullptr)) {
            cleanup(initial_context_);
        }
    }

    bool IsClosed() const { return closed_; }

    /// Context left behind by the most recent resume.
    const Context& context() const { return context_; }

    /// Context the interaction was created in.
    const Context& initial_context() const { return initial_context_; }

private:
    Callback callback_;
    Cleanup cleanup_;
    Context context_;
    Context initial_context_;
    bool closed_ = false;
};

/// Build an Interaction as a queue-ready generator.
template <typename Context>
std::unique_ptr<Generator> MakeInteraction(
    Context context,
    typename Interaction<Context>::Callback callback,
    typename Interaction<Context>::Cleanup cleanup = {}) {
    return std::make_unique<Interaction<Context>>(
        std::move(context), std::move(callback), std::move(cleanup));
}

}  // namespace termq
