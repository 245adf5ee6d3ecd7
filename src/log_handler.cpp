// SPDX-License-Identifier: MIT

#include "src/log_handler.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <system_error>

#include <fmt/format.h>

INITIALIZE_EASYLOGGINGPP

namespace termq {

el::Configurations LogHandler::SetupLogHandler(int* argc, char*** argv) {
    START_EASYLOGGINGPP(*argc, *argv);

    el::Configurations conf;
    conf.setToDefault();
    conf.setGlobally(el::ConfigurationType::Format,
                     "[%level %datetime %thread %fbase:%line] %msg");
    conf.setGlobally(el::ConfigurationType::Enabled, "true");
    conf.setGlobally(el::ConfigurationType::ToFile, "false");
    conf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
    conf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
    conf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
    conf.set(el::Level::Verbose, el::ConfigurationType::Format,
             "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
    return conf;
}

std::expected<std::string, Error> LogHandler::SetupLogFile(
    el::Configurations* conf, const std::string& path,
    const std::string& prefix, bool log_to_stdout,
    const std::string& max_log_size) {
    std::time_t now = std::time(nullptr);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d_%H-%M-%S", std::localtime(&now));
    std::string filename = fmt::format("{}/{}-{}_{}.log", path, prefix, stamp, getpid());

    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        return std::unexpected(Error{ErrorCode::InvalidConfig,
            fmt::format("cannot create log directory {}: {}", path, ec.message()),
            ec.value()});
    }

    int fd = ::open(filename.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0) {
        int err = errno;
        return std::unexpected(Error{ErrorCode::InvalidConfig,
            fmt::format("cannot create log file {}: {}", filename,
                        std::system_category().message(err)),
            err});
    }
    ::close(fd);

    el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
    conf->setGlobally(el::ConfigurationType::Filename, filename);
    conf->setGlobally(el::ConfigurationType::ToFile, "true");
    conf->setGlobally(el::ConfigurationType::MaxLogFileSize, max_log_size);
    conf->setGlobally(el::ConfigurationType::ToStandardOutput,
                      log_to_stdout ? "true" : "false");
    el::Helpers::installPreRollOutCallback(RolloutHandler);
    return filename;
}

void LogHandler::Apply(const el::Configurations& conf) {
    el::Loggers::reconfigureAllLoggers(conf);
}

void LogHandler::RolloutHandler(const char* filename, std::size_t /*size*/) {
    // The log file is closed at this point: do not log here
    std::remove(filename);
}

}  // namespace termq
