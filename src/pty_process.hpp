// SPDX-License-Identifier: MIT

// src/pty_process.hpp
#pragma once

#include <signal.h>
#include <sys/types.h>

#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "lib/stream/error.hpp"
#include "lib/stream/event_loop.hpp"
#include "lib/stream/timer.hpp"
#include "src/process_sink.hpp"

namespace termq {

/// Subprocess attached to a pseudo terminal.
///
/// The master side is non-blocking and registered with the event loop.
/// Output is delivered to OnOutput() in the order it is read; writes that
/// the pty cannot take immediately are buffered and flushed when the master
/// becomes writable again.
///
/// When the child hangs up, remaining output is delivered first, the master
/// is closed, the child is reaped and OnExit() fires with its wait status.
/// Teardown runs from a deferred callback, so the exit handler may destroy
/// the PtyProcess.
class PtyProcess : public ProcessSink {
public:
    using OutputCallback = std::function<void(std::string_view data)>;
    using ExitCallback = std::function<void(int wait_status)>;

    explicit PtyProcess(IEventLoop& loop);

    /// Hangs up and reaps a child that is still running.
    ~PtyProcess() override;

    PtyProcess(const PtyProcess&) = delete;
    PtyProcess& operator=(const PtyProcess&) = delete;
    PtyProcess(PtyProcess&&) = delete;
    PtyProcess& operator=(PtyProcess&&) = delete;

    /// Fork @p argv on a new pty of @p rows x @p cols.
    /// @param env  "NAME=value" entries added to the child's environment
    std::expected<void, Error> Spawn(const std::vector<std::string>& argv,
                                     const std::vector<std::string>& env,
                                     unsigned short rows, unsigned short cols);

    void OnOutput(OutputCallback cb) { on_output_ = std::move(cb); }
    void OnExit(ExitCallback cb) { on_exit_ = std::move(cb); }

    // ProcessSink
    std::expected<void, Error> Send(std::string_view data) override;
    bool IsAlive() const override { return pid_ > 0 && !hung_up_; }
    bool DrainPendingOutput() override;

    /// Change the window size reported to the child.
    std::expected<void, Error> Resize(unsigned short rows, unsigned short cols);

    /// Deliver @p sig to the child.
    void Terminate(int sig = SIGHUP);

    /// Close the master and reap the child without waiting for a hangup.
    /// No callbacks fire afterwards.
    void Close();

    pid_t pid() const { return pid_; }
    int fd() const { return fd_; }
    std::size_t BufferedWriteBytes() const { return write_buffer_.size(); }

private:
    std::size_t ReadAvailable();
    std::expected<void, Error> Flush();
    void HandleWritable();
    void HandleHangup();
    void FinishExit();
    void NotifyExit();
    bool TryReap();
    void UpdateWriteInterest(bool want_write);
    void ReportError(const Error& error);

    IEventLoop& loop_;
    std::unique_ptr<IEventHandle> handle_;
    Timer reap_timer_;
    int fd_ = -1;
    pid_t pid_ = -1;
    int wait_status_ = 0;
    bool hung_up_ = false;
    bool reaped_ = false;
    bool closing_ = false;
    bool exit_scheduled_ = false;
    bool watching_write_ = false;
    int dispatch_depth_ = 0;
    std::string write_buffer_;

    OutputCallback on_output_;
    ExitCallback on_exit_;

    std::shared_ptr<bool> alive_;

    static constexpr std::size_t kReadChunk = 4096;
    static constexpr std::chrono::milliseconds kReapInterval{20};
};

}  // namespace termq
