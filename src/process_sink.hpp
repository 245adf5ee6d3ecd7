// SPDX-License-Identifier: MIT

// src/process_sink.hpp
#pragma once

#include <expected>
#include <string_view>

#include "lib/stream/error.hpp"

namespace termq {

/// The subprocess as seen by the interaction queue.
///
/// The queue only sends bytes, asks whether the process is still running,
/// and (when a timeout is about to fire) asks the I/O layer to deliver any
/// output it has already received but not yet dispatched.
class ProcessSink {
public:
    virtual ~ProcessSink() = default;

    /// Transmit @p data to the subprocess.
    virtual std::expected<void, Error> Send(std::string_view data) = 0;

    /// Return true while the subprocess is running.
    virtual bool IsAlive() const = 0;

    /// Dispatch output that is already readable without blocking.
    /// @return true if any output was delivered to the output handler
    virtual bool DrainPendingOutput() = 0;
};

}  // namespace termq
