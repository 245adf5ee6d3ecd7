// SPDX-License-Identifier: MIT

// src/terminal_session.hpp
#pragma once

#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "src/generator.hpp"
#include "src/interaction_queue.hpp"
#include "src/pty_process.hpp"
#include "src/session_config.hpp"

namespace termq {

/// One subprocess connection and the queue that serializes its interactions.
///
/// Output read from the pty resumes the queue, either directly or through
/// the queue's debounce timer (SessionConfig::debounce_output). With
/// debouncing, the value delivered is all output received since the
/// previous debounced resume. When the subprocess exits the queue is
/// cancelled, so every pending interaction gets its cleanup.
///
/// @code
/// EpollEventLoop loop;
/// TerminalSession session(loop, SessionConfig::Shell());
/// if (auto started = session.Start(); !started) { ... }
/// session.Enqueue(MakeSend("echo hello\n"));
/// loop.Run();
/// @endcode
class TerminalSession {
public:
    using OutputObserver = std::function<void(std::string_view data)>;
    using ExitObserver = std::function<void(int wait_status)>;

    /// @throws std::invalid_argument if @p config.queue does not validate
    TerminalSession(IEventLoop& loop, SessionConfig config);
    ~TerminalSession();

    TerminalSession(const TerminalSession&) = delete;
    TerminalSession& operator=(const TerminalSession&) = delete;
    TerminalSession(TerminalSession&&) = delete;
    TerminalSession& operator=(TerminalSession&&) = delete;

    /// Validate the configuration and spawn the subprocess.
    std::expected<void, Error> Start();

    /// Queue an interaction on this connection.
    void Enqueue(std::unique_ptr<Generator> generator) { queue_.Enqueue(std::move(generator)); }

    /// Queue a one-shot send.
    void Send(std::string text, bool fire_and_forget = false) {
        queue_.EnqueueString(std::move(text), fire_and_forget);
    }

    /// Drop every queued interaction; the subprocess keeps running.
    void Cancel();

    /// Cancel the queue and terminate the subprocess.
    void Stop();

    bool IsRunning() const { return process_.IsAlive(); }

    /// Observe raw output as it is read (before the queue sees it).
    void OnOutput(OutputObserver cb) { on_output_ = std::move(cb); }

    /// Observe subprocess exit, after the queue was cancelled.
    void OnExit(ExitObserver cb) { on_exit_ = std::move(cb); }

    InteractionQueue& queue() { return queue_; }
    PtyProcess& process() { return process_; }
    const SessionConfig& config() const { return config_; }

private:
    void HandleOutput(std::string_view data);
    void HandleExit(int wait_status);

    SessionConfig config_;
    PtyProcess process_;
    InteractionQueue queue_;
    std::string debounced_output_;

    OutputObserver on_output_;
    ExitObserver on_exit_;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

}  // namespace termq
