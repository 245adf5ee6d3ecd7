// SPDX-License-Identifier: MIT

// src/interaction_queue.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "lib/stream/event_loop.hpp"
#include "lib/stream/timer.hpp"
#include "src/generator.hpp"
#include "src/process_sink.hpp"
#include "src/queue_config.hpp"
#include "src/yield.hpp"

namespace termq {

/// Serializes interactions with one subprocess.
///
/// Generators are driven strictly one at a time in enqueue order. The queue
/// resumes the current generator, sends what it yields to the subprocess,
/// and suspends it until the next Resume(): new output from the I/O layer,
/// a debounced burst of output, or the timeout sentinel when the subprocess
/// stays silent for `config.timeout`.
///
/// One drive cycle (Resume):
/// 1. The timeout timer is cancelled.
/// 2. If an accept predicate from a WaitUntil yield is armed, it must
///    accept the value before the generator is resumed. A predicate that
///    rejects ends the cycle; one that throws is logged and dropped.
/// 3. The generator runs: FireAndForget sends and continues at once with
///    SendAck; WaitUntil sends and arms its predicate; Send sends and
///    suspends; KeepWaiting suspends without sending; Done moves on to the
///    next pending generator. Anything else throws InteractionError.
/// 4. If a generator is still current, the timeout timer is armed.
///
/// Threading: every member must be called on the event loop thread; timer
/// callbacks run there too.
class InteractionQueue {
public:
    /// @throws std::invalid_argument if @p config does not validate
    InteractionQueue(IEventLoop& loop, ProcessSink& sink,
                     QueueConfig config = QueueConfig::Defaults());

    /// Cancels everything still queued.
    ~InteractionQueue();

    InteractionQueue(const InteractionQueue&) = delete;
    InteractionQueue& operator=(const InteractionQueue&) = delete;
    InteractionQueue(InteractionQueue&&) = delete;
    InteractionQueue& operator=(InteractionQueue&&) = delete;

    /// Queue @p generator. An idle queue starts driving it immediately.
    /// Null generators are ignored.
    void Enqueue(std::unique_ptr<Generator> generator);

    /// Queue a one-shot send of @p text (see MakeSend()).
    void EnqueueString(std::string text, bool fire_and_forget = false);

    /// Run one drive cycle with @p value.
    /// @throws InteractionError if the current generator yields an invalid shape
    void Resume(ResumeValue value = {});

    /// Resume with @p value once no further call arrives for
    /// `config.debounce`. Only the last value of a burst is delivered.
    void ResumeDebounced(ResumeValue value);

    /// Close the current and all pending generators (running their cleanup)
    /// and disarm both timers. The queue stays usable.
    void Cancel();

    bool IsIdle() const { return current_ == nullptr; }
    std::size_t PendingCount() const { return pending_.size(); }
    bool IsWaitingForAccept() const { return static_cast<bool>(accept_); }
    bool IsTimeoutArmed() const { return timeout_timer_.IsArmed(); }
    bool IsDebounceArmed() const { return debounce_timer_.IsArmed(); }
    const QueueConfig& config() const { return config_; }

private:
    enum class StepOutcome {
        Suspended,  // waiting for the next Resume()
        Exhausted,  // generator returned Done
        Detached,   // queue was cancelled while the generator ran
    };

    StepOutcome DriveCurrent(ResumeValue value);
    void AdvanceToNext();
    void SendToProcess(std::string_view text);
    void CloseDetached();
    void HandleTimeout();
    void HandleDebounce();

    IEventLoop& loop_;
    ProcessSink& sink_;
    QueueConfig config_;

    std::shared_ptr<Generator> current_;
    std::deque<std::unique_ptr<Generator>> pending_;
    AcceptPredicate accept_;

    Timer timeout_timer_;
    Timer debounce_timer_;
    std::optional<ResumeValue> debounced_value_;

    // A generator cannot be closed from inside its own Next(); a Cancel()
    // issued there parks it here until Next() returns.
    std::shared_ptr<Generator> detached_;
    bool driving_ = false;
    std::uint64_t cancel_epoch_ = 0;
    std::shared_ptr<bool> alive_;
};

}  // namespace termq
