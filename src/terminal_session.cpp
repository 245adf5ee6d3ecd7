// SPDX-License-Identifier: MIT

#include "src/terminal_session.hpp"

#include <easylogging++.h>

#include <memory>
#include <utility>

namespace termq {

TerminalSession::TerminalSession(IEventLoop& loop, SessionConfig config)
    : config_(std::move(config)),
      process_(loop),
      queue_(loop, process_, config_.queue) {
    process_.OnOutput([this](std::string_view data) { HandleOutput(data); });
    process_.OnExit([this](int wait_status) { HandleExit(wait_status); });
}

TerminalSession::~TerminalSession() {
    Stop();
}

std::expected<void, Error> TerminalSession::Start() {
    if (auto valid = config_.Validate(); !valid) {
        return std::unexpected(valid.error());
    }
    return process_.Spawn(config_.argv, config_.env, config_.rows, config_.cols);
}

void TerminalSession::Cancel() {
    queue_.Cancel();
    debounced_output_.clear();
}

void TerminalSession::Stop() {
    Cancel();
    process_.Close();
}

void TerminalSession::HandleOutput(std::string_view data) {
    if (on_output_) {
        // The observer may destroy the session
        std::weak_ptr<bool> alive = alive_;
        OutputObserver observer = on_output_;
        observer(data);
        if (alive.expired()) {
            return;
        }
    }
    if (!config_.debounce_output) {
        queue_.Resume(ResumeValue::Output(std::string(data)));
        return;
    }
    // A disarmed debounce timer means the previous burst was delivered
    if (!queue_.IsDebounceArmed()) {
        debounced_output_.clear();
    }
    debounced_output_.append(data);
    queue_.ResumeDebounced(ResumeValue::Output(debounced_output_));
}

void TerminalSession::HandleExit(int wait_status) {
    VLOG(1) << "session subprocess ended, cancelling "
            << (queue_.IsIdle() ? 0 : 1 + queue_.PendingCount()) << " interactions";
    Cancel();
    if (on_exit_) {
        on_exit_(wait_status);
    }
}

}  // namespace termq
