// SPDX-License-Identifier: MIT

#include "src/interaction_queue.hpp"

#include <easylogging++.h>
#include <fmt/format.h>

#include <exception>
#include <stdexcept>
#include <utility>
#include <variant>

#include "lib/stream/error.hpp"

namespace termq {

namespace {

// Clears the driving flag however the cycle ends
struct DriveScope {
    explicit DriveScope(bool& flag) : flag_(flag) { flag_ = true; }
    ~DriveScope() { flag_ = false; }

    DriveScope(const DriveScope&) = delete;
    DriveScope& operator=(const DriveScope&) = delete;

    bool& flag_;
};

}  // namespace

InteractionQueue::InteractionQueue(IEventLoop& loop, ProcessSink& sink,
                                   QueueConfig config)
    : loop_(loop),
      sink_(sink),
      config_(config),
      timeout_timer_(loop),
      debounce_timer_(loop),
      alive_(std::make_shared<bool>(true)) {
    if (auto valid = config_.Validate(); !valid) {
        throw std::invalid_argument(valid.error().message);
    }
    timeout_timer_.OnTimer([this]() { HandleTimeout(); });
    debounce_timer_.OnTimer([this]() { HandleDebounce(); });
}

InteractionQueue::~InteractionQueue() {
    Cancel();
}

void InteractionQueue::Enqueue(std::unique_ptr<Generator> generator) {
    if (!generator) {
        return;
    }
    if (current_) {
        pending_.push_back(std::move(generator));
        VLOG(1) << "queued generator, " << pending_.size() << " pending";
        return;
    }
    current_ = std::move(generator);
    Resume();
}

void InteractionQueue::EnqueueString(std::string text, bool fire_and_forget) {
    Enqueue(MakeSend(std::move(text), fire_and_forget));
}

void InteractionQueue::Resume(ResumeValue value) {
    if (driving_) {
        // Output delivered synchronously from inside a send: run it after
        // the current cycle instead of re-entering the generator. A Cancel()
        // in between discards it.
        std::weak_ptr<bool> alive = alive_;
        loop_.Defer([this, alive, epoch = cancel_epoch_, value = std::move(value)]() mutable {
            if (alive.lock() && epoch == cancel_epoch_) {
                Resume(std::move(value));
            }
        });
        return;
    }

    timeout_timer_.Stop();
    DriveScope scope(driving_);

    while (current_) {
        if (accept_) {
            bool accepted = false;
            try {
                accepted = accept_(value);
            } catch (const std::exception& e) {
                LOG(WARNING) << "accept predicate failed, dropping it: " << e.what();
                accept_ = nullptr;
                break;
            }
            if (!accepted) {
                break;
            }
            accept_ = nullptr;
        }

        StepOutcome outcome = DriveCurrent(std::move(value));
        if (outcome == StepOutcome::Detached) {
            return;
        }
        if (outcome == StepOutcome::Suspended) {
            break;
        }
        AdvanceToNext();
        value = ResumeValue{};
    }

    if (current_) {
        timeout_timer_.Start(config_.timeout);
    }
}

InteractionQueue::StepOutcome InteractionQueue::DriveCurrent(ResumeValue value) {
    for (;;) {
        std::shared_ptr<Generator> generator = current_;
        Yield step;
        try {
            step = generator->Next(value);
        } catch (...) {
            CloseDetached();
            throw;
        }

        if (current_ != generator) {
            CloseDetached();
            return StepOutcome::Detached;
        }

        if (std::holds_alternative<yield::Done>(step)) {
            return StepOutcome::Exhausted;
        }
        if (std::holds_alternative<yield::KeepWaiting>(step)) {
            return StepOutcome::Suspended;
        }
        if (auto* fire = std::get_if<yield::FireAndForget>(&step);
            fire != nullptr && !fire->text.empty()) {
            SendToProcess(fire->text);
            value = ResumeValue::SendAck();
            continue;
        }
        if (auto* until = std::get_if<yield::WaitUntil>(&step);
            until != nullptr && !until->text.empty() && until->accept) {
            accept_ = std::move(until->accept);
            SendToProcess(until->text);
            return StepOutcome::Suspended;
        }
        if (auto* send = std::get_if<yield::Send>(&step);
            send != nullptr && !send->text.empty()) {
            SendToProcess(send->text);
            return StepOutcome::Suspended;
        }
        throw InteractionError(ErrorCode::InvalidYield,
            fmt::format("invalid yielded value: {} without text or predicate",
                        yield_name(step)));
    }
}

void InteractionQueue::AdvanceToNext() {
    std::shared_ptr<Generator> finished = std::move(current_);
    if (!pending_.empty()) {
        current_ = std::move(pending_.front());
        pending_.pop_front();
    }
    finished->Close();
}

void InteractionQueue::SendToProcess(std::string_view text) {
    if (!sink_.IsAlive()) {
        VLOG(1) << "process not running, dropped " << text.size() << " bytes";
        return;
    }
    VLOG(1) << "send " << text.size() << " bytes";
    if (auto sent = sink_.Send(text); !sent) {
        LOG(WARNING) << "send failed (" << error_category(sent.error().code)
                     << "): " << sent.error().message;
    }
}

void InteractionQueue::Cancel() {
    ++cancel_epoch_;
    accept_ = nullptr;
    timeout_timer_.Stop();
    debounce_timer_.Stop();
    debounced_value_.reset();

    std::deque<std::unique_ptr<Generator>> pending = std::move(pending_);
    pending_.clear();

    if (current_) {
        VLOG(1) << "cancel: closing current generator and "
                << pending.size() << " pending";
        std::shared_ptr<Generator> current = std::move(current_);
        if (driving_) {
            detached_ = std::move(current);
        } else {
            current->Close();
        }
    }
    for (auto& generator : pending) {
        generator->Close();
    }
}

void InteractionQueue::CloseDetached() {
    if (auto detached = std::move(detached_)) {
        detached->Close();
    }
}

void InteractionQueue::HandleTimeout() {
    if (!current_) {
        return;
    }
    // Output already arrived and is waiting out the debounce period
    if (debounce_timer_.IsArmed()) {
        return;
    }
    // Last resort: output may be sitting unread in the pty. Its handlers
    // may tear down the queue.
    std::weak_ptr<bool> alive = alive_;
    if (sink_.IsAlive() && sink_.DrainPendingOutput()) {
        if (alive.expired()) {
            return;
        }
        if (current_ && !timeout_timer_.IsArmed() && !debounce_timer_.IsArmed()) {
            timeout_timer_.Start(config_.timeout);
        }
        return;
    }
    VLOG(1) << "no response within " << config_.timeout.count()
            << "ms, resuming with timeout";
    Resume(ResumeValue::Timeout());
}

void InteractionQueue::HandleDebounce() {
    if (!debounced_value_) {
        return;
    }
    ResumeValue value = std::move(*debounced_value_);
    debounced_value_.reset();
    Resume(std::move(value));
}

void InteractionQueue::ResumeDebounced(ResumeValue value) {
    debounced_value_ = std::move(value);
    debounce_timer_.Start(config_.debounce);
}

}  // namespace termq
