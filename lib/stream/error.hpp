// SPDX-License-Identifier: MIT

// lib/stream/error.hpp
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace termq {

/// Error codes for queue, interaction and process operations.
enum class ErrorCode {
    // Interaction contract
    InvalidYield,          ///< Generator yielded a shape the queue cannot drive
    ResumeAfterClose,      ///< Closed interaction was resumed

    // Process
    SpawnFailed,           ///< forkpty/exec of the subprocess failed
    ProcessExited,         ///< Subprocess is no longer running
    WriteFailed,           ///< write() to the subprocess failed
    ReadFailed,            ///< read() from the subprocess failed

    // State
    InvalidState,          ///< Method called in wrong session state
    InvalidConfig,         ///< Configuration value out of range
};

/// Error payload delivered to callbacks and std::expected results.
struct Error {
    ErrorCode code;                ///< Classified error code
    std::string message;           ///< Human-readable description
    int os_errno = 0;              ///< OS errno if applicable, 0 otherwise
};

/// Return a short category string for an error code (e.g. "process").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidYield:
        case ErrorCode::ResumeAfterClose:
            return "interaction";
        case ErrorCode::SpawnFailed:
        case ErrorCode::ProcessExited:
        case ErrorCode::WriteFailed:
        case ErrorCode::ReadFailed:
            return "process";
        case ErrorCode::InvalidState:
            return "state";
        case ErrorCode::InvalidConfig:
            return "config";
    }
    return "unknown";
}

/// Thrown when an interaction breaks the queue contract: an unrecognized
/// yield shape or a resume after close. These indicate a bug in the
/// interaction, so they propagate to whoever drove the queue.
class InteractionError : public std::logic_error {
public:
    InteractionError(ErrorCode code, const std::string& message)
        : std::logic_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

}  // namespace termq
