// SPDX-License-Identifier: MIT

// src/session_config.hpp
#pragma once

#include <expected>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "lib/stream/error.hpp"
#include "src/queue_config.hpp"

namespace termq {

/// How a TerminalSession launches its subprocess and paces its queue.
struct SessionConfig {
    std::vector<std::string> argv;                 ///< Command line; argv[0] is looked up in PATH
    std::vector<std::string> env{"TERM=dumb"};     ///< NAME=value entries added to the child environment
    unsigned short rows = 24;                      ///< Initial window height
    unsigned short cols = 80;                      ///< Initial window width
    bool debounce_output = true;                   ///< Route output through the queue's debounce timer
    QueueConfig queue = QueueConfig::Defaults();   ///< Timeout and debounce tunables

    /// Interactive shell without rc files, so prompts are predictable.
    static SessionConfig Shell(std::string shell = "/bin/sh") {
        SessionConfig config;
        config.argv = {std::move(shell)};
        config.env.push_back("PS1=$ ");
        config.env.push_back("ENV=");
        return config;
    }

    std::expected<void, Error> Validate() const {
        if (argv.empty() || argv.front().empty()) {
            return std::unexpected(Error{ErrorCode::InvalidConfig, "no command to run"});
        }
        if (rows == 0 || cols == 0) {
            return std::unexpected(Error{ErrorCode::InvalidConfig,
                fmt::format("window size {}x{} is empty", cols, rows)});
        }
        for (const auto& entry : env) {
            if (entry.find('=') == std::string::npos || entry.front() == '=') {
                return std::unexpected(Error{ErrorCode::InvalidConfig,
                    fmt::format("environment entry '{}' is not NAME=value", entry)});
            }
        }
        return queue.Validate();
    }
};

}  // namespace termq
