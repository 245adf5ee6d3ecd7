// SPDX-License-Identifier: MIT

#include "src/pty_process.hpp"

#include <fcntl.h>
#include <pty.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <easylogging++.h>
#include <fmt/format.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <system_error>
#include <thread>
#include <utility>

namespace termq {

namespace {

std::string ErrnoText(int err) {
    return std::system_category().message(err);
}

// Counts nested output dispatch so Close() from a callback is deferred.
// The counter is left alone once its owner is gone.
struct DispatchScope {
    DispatchScope(int& depth, std::weak_ptr<bool> owner)
        : depth_(depth), owner_(std::move(owner)) {
        ++depth_;
    }
    ~DispatchScope() {
        if (!owner_.expired()) {
            --depth_;
        }
    }

    DispatchScope(const DispatchScope&) = delete;
    DispatchScope& operator=(const DispatchScope&) = delete;

    int& depth_;
    std::weak_ptr<bool> owner_;
};

}  // namespace

PtyProcess::PtyProcess(IEventLoop& loop)
    : loop_(loop), reap_timer_(loop), alive_(std::make_shared<bool>(true)) {
    reap_timer_.OnTimer([this]() {
        if (TryReap()) {
            NotifyExit();
        } else {
            reap_timer_.Start(kReapInterval);
        }
    });
}

PtyProcess::~PtyProcess() {
    dispatch_depth_ = 0;
    Close();
}

std::expected<void, Error> PtyProcess::Spawn(const std::vector<std::string>& argv,
                                             const std::vector<std::string>& env,
                                             unsigned short rows, unsigned short cols) {
    if (fd_ >= 0) {
        return std::unexpected(Error{ErrorCode::InvalidState,
                                     "pty process already running"});
    }
    if (argv.empty() || argv.front().empty()) {
        return std::unexpected(Error{ErrorCode::SpawnFailed, "empty command line"});
    }

    // Everything the child touches is prepared before fork()
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);
    std::vector<std::string> child_env = env;

    winsize ws{};
    ws.ws_row = rows;
    ws.ws_col = cols;

    int master = -1;
    pid_t pid = forkpty(&master, nullptr, nullptr, &ws);
    if (pid < 0) {
        int err = errno;
        return std::unexpected(Error{ErrorCode::SpawnFailed,
            fmt::format("forkpty() failed: {}", ErrnoText(err)), err});
    }

    if (pid == 0) {
        for (auto& entry : child_env) {
            putenv(entry.data());
        }
        execvp(args[0], args.data());
        _exit(127);
    }

    fd_ = master;
    pid_ = pid;
    wait_status_ = 0;
    hung_up_ = false;
    reaped_ = false;
    closing_ = false;
    exit_scheduled_ = false;
    watching_write_ = false;
    write_buffer_.clear();

    int flags = fcntl(fd_, F_GETFL);
    if (flags < 0 || fcntl(fd_, F_SETFL, flags | O_NONBLOCK) < 0 ||
        fcntl(fd_, F_SETFD, FD_CLOEXEC) < 0) {
        int err = errno;
        Close();
        return std::unexpected(Error{ErrorCode::SpawnFailed,
            fmt::format("cannot make pty non-blocking: {}", ErrnoText(err)), err});
    }

    try {
        handle_ = loop_.Register(
            fd_,
            /*want_read=*/true,
            /*want_write=*/false,
            [this]() { ReadAvailable(); },
            [this]() { HandleWritable(); },
            [this](int error_code) {
                if (error_code != 0) {
                    ReportError(Error{ErrorCode::ReadFailed,
                        fmt::format("pty error: {}", ErrnoText(error_code)), error_code});
                }
                HandleHangup();
            });
    } catch (const std::system_error& e) {
        Close();
        return std::unexpected(Error{ErrorCode::SpawnFailed,
            fmt::format("cannot watch pty: {}", e.what()), e.code().value()});
    }

    LOG(INFO) << "spawned '" << argv.front() << "' as pid " << pid_
              << " (" << cols << "x" << rows << ")";
    return {};
}

std::expected<void, Error> PtyProcess::Send(std::string_view data) {
    if (!IsAlive() || fd_ < 0) {
        return std::unexpected(Error{ErrorCode::ProcessExited,
                                     "pty process is not running"});
    }
    write_buffer_.append(data);
    return Flush();
}

std::expected<void, Error> PtyProcess::Flush() {
    while (!write_buffer_.empty()) {
        ssize_t n = ::write(fd_, write_buffer_.data(), write_buffer_.size());
        if (n > 0) {
            write_buffer_.erase(0, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            UpdateWriteInterest(true);
            return {};
        }
        int err = errno;
        write_buffer_.clear();
        UpdateWriteInterest(false);
        return std::unexpected(Error{ErrorCode::WriteFailed,
            fmt::format("write() failed: {}", ErrnoText(err)), err});
    }
    UpdateWriteInterest(false);
    return {};
}

void PtyProcess::HandleWritable() {
    if (fd_ < 0) {
        return;
    }
    if (auto flushed = Flush(); !flushed) {
        ReportError(flushed.error());
    }
}

void PtyProcess::UpdateWriteInterest(bool want_write) {
    if (!handle_ || watching_write_ == want_write) {
        return;
    }
    watching_write_ = want_write;
    handle_->Update(true, want_write);
}

bool PtyProcess::DrainPendingOutput() {
    return ReadAvailable() > 0;
}

std::size_t PtyProcess::ReadAvailable() {
    if (fd_ < 0 || hung_up_) {
        return 0;
    }
    std::weak_ptr<bool> alive = alive_;
    DispatchScope scope(dispatch_depth_, alive);

    std::size_t total = 0;
    char buffer[kReadChunk];
    while (!closing_) {
        ssize_t n = ::read(fd_, buffer, sizeof(buffer));
        if (n > 0) {
            total += static_cast<std::size_t>(n);
            if (on_output_) {
                // The handler may destroy this object
                OutputCallback on_output = on_output_;
                on_output(std::string_view(buffer, static_cast<std::size_t>(n)));
                if (alive.expired()) {
                    return total;
                }
            }
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            break;
        }
        // EOF, or EIO once the slave side is closed
        if (n < 0 && errno != EIO) {
            int err = errno;
            ReportError(Error{ErrorCode::ReadFailed,
                fmt::format("read() failed: {}", ErrnoText(err)), err});
        }
        HandleHangup();
        break;
    }
    return total;
}

void PtyProcess::HandleHangup() {
    if (hung_up_) {
        return;
    }
    hung_up_ = true;
    if (exit_scheduled_) {
        return;
    }
    exit_scheduled_ = true;

    // Still inside the handle's callback: tear down on the next iteration
    std::weak_ptr<bool> alive = alive_;
    loop_.Defer([this, alive]() {
        if (alive.lock()) {
            FinishExit();
        }
    });
}

void PtyProcess::FinishExit() {
    if (closing_) {
        return;
    }
    handle_.reset();
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    write_buffer_.clear();
    watching_write_ = false;

    if (TryReap()) {
        NotifyExit();
    } else {
        reap_timer_.Start(kReapInterval);
    }
}

void PtyProcess::NotifyExit() {
    if (WIFEXITED(wait_status_)) {
        LOG(INFO) << "pid " << pid_ << " exited with status " << WEXITSTATUS(wait_status_);
    } else if (WIFSIGNALED(wait_status_)) {
        LOG(INFO) << "pid " << pid_ << " killed by signal " << WTERMSIG(wait_status_);
    }
    if (on_exit_ && !closing_) {
        // The handler may destroy this object
        ExitCallback on_exit = on_exit_;
        on_exit(wait_status_);
    }
}

bool PtyProcess::TryReap() {
    if (reaped_) {
        return true;
    }
    int status = 0;
    pid_t r = waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
        wait_status_ = status;
        reaped_ = true;
    } else if (r < 0 && errno == ECHILD) {
        reaped_ = true;
    }
    return reaped_;
}

std::expected<void, Error> PtyProcess::Resize(unsigned short rows, unsigned short cols) {
    if (fd_ < 0) {
        return std::unexpected(Error{ErrorCode::ProcessExited,
                                     "pty process is not running"});
    }
    winsize ws{};
    ws.ws_row = rows;
    ws.ws_col = cols;
    if (ioctl(fd_, TIOCSWINSZ, &ws) < 0) {
        int err = errno;
        return std::unexpected(Error{ErrorCode::WriteFailed,
            fmt::format("TIOCSWINSZ failed: {}", ErrnoText(err)), err});
    }
    return {};
}

void PtyProcess::Terminate(int sig) {
    if (pid_ > 0 && !reaped_) {
        ::kill(pid_, sig);
    }
}

void PtyProcess::Close() {
    if (dispatch_depth_ > 0) {
        // Called from an output callback: finish after the read loop unwinds
        closing_ = true;
        std::weak_ptr<bool> alive = alive_;
        loop_.Defer([this, alive]() {
            if (alive.lock()) {
                Close();
            }
        });
        return;
    }

    closing_ = true;
    reap_timer_.Stop();
    handle_.reset();
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    write_buffer_.clear();
    watching_write_ = false;
    hung_up_ = true;

    if (pid_ > 0 && !reaped_) {
        ::kill(pid_, SIGHUP);
        for (int i = 0; i < 20 && !TryReap(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        if (!reaped_) {
            LOG(WARNING) << "pid " << pid_ << " ignored SIGHUP, killing";
            ::kill(pid_, SIGKILL);
            int status = 0;
            if (waitpid(pid_, &status, 0) == pid_) {
                wait_status_ = status;
            }
            reaped_ = true;
        }
    }
}

void PtyProcess::ReportError(const Error& error) {
    LOG(WARNING) << "pty pid " << pid_ << ": " << error.message;
}

}  // namespace termq
