// SPDX-License-Identifier: MIT

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "src/co_generator.hpp"
#include "src/generator.hpp"
#include "src/interaction.hpp"
#include "src/yield.hpp"

namespace shell_probe {

// What a finished command left behind
struct CommandResult {
    std::string command;
    std::string output;     // Everything echoed back, marker line removed
    bool completed = false; // Marker seen before the timeout budget ran out
    int timeouts = 0;       // Silent periods sat through while waiting
};

using ResultHandler = std::function<void(const CommandResult&)>;

// Marker echoed after each command. It is split by quotes so the echo of the
// command line itself does not match.
inline std::string CompletionMarker(int sequence) {
    return "__termq_" + std::to_string(sequence) + "__";
}

inline std::string MarkerCommand(int sequence) {
    return "echo '__termq_''" + std::to_string(sequence) + "__'\n";
}

// Strip the marker line and everything after it, plus \r from the pty
inline std::string CleanTranscript(std::string_view transcript, std::string_view marker) {
    std::string_view body = transcript;
    if (auto pos = body.find(marker); pos != std::string_view::npos) {
        body = body.substr(0, pos);
        if (auto line = body.rfind('\n'); line != std::string_view::npos) {
            body = body.substr(0, line + 1);
        } else {
            body = {};
        }
    }
    std::string out;
    out.reserve(body.size());
    for (char c : body) {
        if (c != '\r') out.push_back(c);
    }
    return out;
}

// Run `command` in the shell and report its output.
//
// The command is fired without waiting, then a marker echo is sent with a
// WaitUntil that accepts only once the marker comes back. Output that
// arrives before that is collected by the predicate itself. Each timeout
// while waiting costs one unit of `timeout_budget`; when it is spent the
// command is reported incomplete.
inline termq::CoGenerator RunCommand(std::string command, int sequence,
                                     int timeout_budget, ResultHandler on_result) {
    auto result = std::make_shared<CommandResult>();
    result->command = command;
    auto transcript = std::make_shared<std::string>();
    std::string marker = CompletionMarker(sequence);

    // Report exactly once, even if the queue closes us half way
    struct Reporter {
        std::shared_ptr<CommandResult> result;
        ResultHandler on_result;
        ~Reporter() {
            if (on_result) on_result(*result);
        }
    } reporter{result, std::move(on_result)};

    co_yield termq::yield::FireAndForget{command + "\n"};

    auto reply = co_yield termq::yield::WaitUntil{
        MarkerCommand(sequence),
        [transcript, marker](const termq::ResumeValue& value) {
            if (value.IsTimeout()) return true;
            transcript->append(value.text);
            return transcript->find(marker) != std::string::npos;
        }};

    while (transcript->find(marker) == std::string::npos) {
        if (reply.IsTimeout() && ++result->timeouts > timeout_budget) {
            result->output = CleanTranscript(*transcript, marker);
            co_return;
        }
        reply = co_yield termq::yield::KeepWaiting{};
        if (reply.IsOutput()) {
            transcript->append(reply.text);
        }
    }

    result->completed = true;
    result->output = CleanTranscript(*transcript, marker);
}

// Wait for the shell's first prompt. The context is the buffer the banner
// accumulates in; cleanup reports what was seen.
inline std::unique_ptr<termq::Generator> WaitForPrompt(
    std::string prompt, std::function<void(std::string_view banner)> on_ready) {
    return termq::MakeInteraction<std::shared_ptr<std::string>>(
        std::make_shared<std::string>(),
        [prompt = std::move(prompt)](std::shared_ptr<std::string>& banner,
                                     const termq::ResumeValue& value) -> termq::Yield {
            if (value.IsOutput()) {
                banner->append(value.text);
            }
            if (value.IsTimeout() || banner->find(prompt) != std::string::npos) {
                return termq::yield::Done{};
            }
            return termq::yield::KeepWaiting{};
        },
        [on_ready = std::move(on_ready)](const std::shared_ptr<std::string>& banner) {
            if (on_ready) on_ready(*banner);
        });
}

}  // namespace shell_probe
