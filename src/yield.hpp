// SPDX-License-Identifier: MIT

// src/yield.hpp
#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace termq {

/// What happened since a generator last suspended.
///
/// The queue resumes a generator with one of these. `None` is the default
/// (nothing happened yet, or the generator is being started), `Output`
/// carries text received from the subprocess, `Timeout` is delivered when
/// the subprocess stayed silent past the timeout bound, and `SendAck`
/// acknowledges a fire-and-forget send.
struct ResumeValue {
    enum class Kind { None, Output, Timeout, SendAck };

    Kind kind = Kind::None;
    std::string text;

    static ResumeValue Output(std::string text) {
        return ResumeValue{Kind::Output, std::move(text)};
    }
    static ResumeValue Timeout() { return ResumeValue{Kind::Timeout, {}}; }
    static ResumeValue SendAck() { return ResumeValue{Kind::SendAck, {}}; }

    bool IsNone() const { return kind == Kind::None; }
    bool IsOutput() const { return kind == Kind::Output; }
    bool IsTimeout() const { return kind == Kind::Timeout; }
    bool IsSendAck() const { return kind == Kind::SendAck; }

    bool operator==(const ResumeValue&) const = default;
};

/// Condition gating a WaitUntil yield. May throw; the queue treats a throw
/// as "stop waiting on this predicate" and keeps the generator suspended.
using AcceptPredicate = std::function<bool(const ResumeValue&)>;

namespace yield {

/// Suspend without sending; only an external Resume() continues.
struct KeepWaiting {};

/// Send text and continue immediately with ResumeValue::SendAck().
struct FireAndForget {
    std::string text;
};

/// Send text, then stay suspended until `accept` returns true.
struct WaitUntil {
    std::string text;
    AcceptPredicate accept;
};

/// Send text, then suspend until any response (or timeout).
struct Send {
    std::string text;
};

/// The generator is exhausted.
struct Done {};

}  // namespace yield

/// One step of a generator.
using Yield = std::variant<yield::KeepWaiting, yield::FireAndForget,
                           yield::WaitUntil, yield::Send, yield::Done>;

/// Short name of the yielded shape, for logging.
inline std::string_view yield_name(const Yield& y) {
    switch (y.index()) {
        case 0: return "keep-waiting";
        case 1: return "fire-and-forget";
        case 2: return "until";
        case 3: return "send";
        case 4: return "done";
    }
    return "invalid";
}

constexpr std::string_view resume_kind_name(ResumeValue::Kind kind) {
    switch (kind) {
        case ResumeValue::Kind::None: return "none";
        case ResumeValue::Kind::Output: return "output";
        case ResumeValue::Kind::Timeout: return "timeout";
        case ResumeValue::Kind::SendAck: return "send-ack";
    }
    return "unknown";
}

}  // namespace termq
