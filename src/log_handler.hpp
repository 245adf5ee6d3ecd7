// SPDX-License-Identifier: MIT

// src/log_handler.hpp
#pragma once

#include <easylogging++.h>

#include <cstddef>
#include <expected>
#include <string>

#include "lib/stream/error.hpp"

namespace termq {

/// Configures easylogging++ for programs built on termq.
///
/// The queue logs through the default logger: sends, drops and timeouts at
/// verbose level 1, recovered failures at WARNING. Programs call
/// SetupLogHandler() once at startup, adjust the returned configuration and
/// apply it with Apply().
class LogHandler {
public:
    /// Start easylogging with the program arguments (honours --v=N) and
    /// return the default configuration.
    static el::Configurations SetupLogHandler(int* argc, char*** argv);

    /// Send every level to @p path/@p prefix-<timestamp>.log.
    static std::expected<std::string, Error> SetupLogFile(
        el::Configurations* conf, const std::string& path,
        const std::string& prefix, bool log_to_stdout = false,
        const std::string& max_log_size = "20971520");

    /// Reconfigure every logger with @p conf.
    static void Apply(const el::Configurations& conf);

    /// Rollout callback: drops the full log file.
    static void RolloutHandler(const char* filename, std::size_t size);
};

}  // namespace termq
