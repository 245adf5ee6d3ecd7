// SPDX-License-Identifier: MIT

// shell_probe: run commands in an interactive shell through a termq queue
// and print what each one answered.
//
//   shell_probe [--v=N] [--log-dir DIR] [--shell PATH] [--budget N] COMMAND...

#include <sys/wait.h>

#include <asio.hpp>
#include <easylogging++.h>
#include <fmt/format.h>

#include <charconv>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "shell_probe/asio_event_loop.hpp"
#include "shell_probe/command_runner.hpp"
#include "src/co_generator.hpp"
#include "src/log_handler.hpp"
#include "src/queue_config.hpp"
#include "src/session_config.hpp"
#include "src/terminal_session.hpp"

namespace {

struct Options {
    std::string shell = "/bin/sh";
    std::string log_dir;
    int timeout_budget = 4;
    std::vector<std::string> commands;
};

bool ParseOptions(int argc, char** argv, Options& options) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg.starts_with("--v")) {
            continue;  // consumed by easylogging
        }
        if (arg == "--log-dir" && i + 1 < argc) {
            options.log_dir = argv[++i];
            continue;
        }
        if (arg == "--shell" && i + 1 < argc) {
            options.shell = argv[++i];
            continue;
        }
        if (arg == "--budget" && i + 1 < argc) {
            std::string_view value = argv[++i];
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(),
                                             options.timeout_budget);
            if (ec != std::errc{} || ptr != value.data() + value.size() ||
                options.timeout_budget < 0) {
                fmt::print(stderr, "--budget: '{}' is not a count\n", value);
                return false;
            }
            continue;
        }
        options.commands.emplace_back(arg);
    }
    if (options.commands.empty()) {
        fmt::print(stderr,
                   "usage: {} [--v=N] [--log-dir DIR] [--shell PATH] [--budget N] COMMAND...\n",
                   argv[0]);
        return false;
    }
    return true;
}

}  // namespace

int main(int argc, char** argv) {
    el::Configurations conf = termq::LogHandler::SetupLogHandler(&argc, &argv);

    Options options;
    if (!ParseOptions(argc, argv, options)) {
        return 2;
    }
    if (!options.log_dir.empty()) {
        auto log_file = termq::LogHandler::SetupLogFile(&conf, options.log_dir, "shell_probe");
        if (!log_file) {
            fmt::print(stderr, "{}\n", log_file.error().message);
            return 2;
        }
    }
    termq::LogHandler::Apply(conf);

    auto queue_config = termq::QueueConfig::FromEnvironment();
    if (!queue_config) {
        LOG(ERROR) << queue_config.error().message;
        return 2;
    }

    asio::io_context ctx;
    shell_probe::AsioEventLoop loop(ctx);
    asio::signal_set signals(ctx, SIGINT, SIGTERM);

    int failures = 0;
    int shell_status = 0;

    termq::SessionConfig session_config = termq::SessionConfig::Shell(options.shell);
    session_config.queue = *queue_config;
    termq::TerminalSession session(loop, session_config);

    session.OnExit([&](int wait_status) {
        shell_status = wait_status;
        signals.cancel();
        loop.Stop();
    });

    signals.async_wait([&](std::error_code ec, int signo) {
        if (ec) return;
        LOG(WARNING) << "signal " << signo << ", stopping";
        session.Stop();
        loop.Stop();
    });

    if (auto started = session.Start(); !started) {
        LOG(ERROR) << "cannot start " << options.shell << ": " << started.error().message;
        return 1;
    }

    session.Enqueue(shell_probe::WaitForPrompt("$ ", [](std::string_view banner) {
        VLOG(1) << "shell ready after " << banner.size() << " bytes";
    }));

    int sequence = 0;
    for (const auto& command : options.commands) {
        session.Enqueue(std::make_unique<termq::CoGenerator>(shell_probe::RunCommand(
            command, ++sequence, options.timeout_budget,
            [&failures](const shell_probe::CommandResult& result) {
                fmt::print("$ {}\n{}", result.command, result.output);
                if (!result.completed) {
                    fmt::print("[no completion after {} timeouts]\n", result.timeouts);
                    ++failures;
                }
            })));
    }
    session.Send("exit\n", /*fire_and_forget=*/true);

    loop.Run();
    session.Stop();

    if (WIFEXITED(shell_status) && WEXITSTATUS(shell_status) != 0) {
        LOG(WARNING) << "shell exited with status " << WEXITSTATUS(shell_status);
    }
    return failures == 0 ? 0 : 1;
}
