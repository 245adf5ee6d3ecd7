// SPDX-License-Identifier: MIT

// src/queue_config.hpp
#pragma once

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <expected>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "lib/stream/error.hpp"

namespace termq {

/// Timing tunables of an InteractionQueue.
struct QueueConfig {
    std::chrono::milliseconds timeout{500};   ///< Wait for a response before delivering Timeout
    std::chrono::milliseconds debounce{100};  ///< Quiet period before a debounced resume

    /// Local shells: answers arrive within a few hundred milliseconds.
    static QueueConfig Defaults() { return QueueConfig{}; }

    /// Remote or heavily loaded sessions (ssh, containers): more patience.
    static QueueConfig Remote() {
        return QueueConfig{
            .timeout = std::chrono::milliseconds{2000},
            .debounce = std::chrono::milliseconds{250},
        };
    }

    /// Check the values are usable by the timers.
    std::expected<void, Error> Validate() const {
        if (timeout.count() <= 0) {
            return std::unexpected(Error{ErrorCode::InvalidConfig,
                fmt::format("timeout must be positive, got {}ms", timeout.count())});
        }
        if (debounce.count() < 0) {
            return std::unexpected(Error{ErrorCode::InvalidConfig,
                fmt::format("debounce must not be negative, got {}ms", debounce.count())});
        }
        return {};
    }

    /// Defaults overridden by TERMQ_TIMEOUT_MS and TERMQ_DEBOUNCE_MS.
    static std::expected<QueueConfig, Error> FromEnvironment(QueueConfig base = Defaults()) {
        if (auto r = ReadMillis("TERMQ_TIMEOUT_MS", base.timeout); !r) {
            return std::unexpected(r.error());
        }
        if (auto r = ReadMillis("TERMQ_DEBOUNCE_MS", base.debounce); !r) {
            return std::unexpected(r.error());
        }
        if (auto valid = base.Validate(); !valid) {
            return std::unexpected(valid.error());
        }
        return base;
    }

private:
    static std::expected<void, Error> ReadMillis(const char* name,
                                                 std::chrono::milliseconds& out) {
        const char* raw = std::getenv(name);
        if (raw == nullptr || *raw == '\0') {
            return {};
        }
        std::string_view text(raw);
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr != text.data() + text.size()) {
            return std::unexpected(Error{ErrorCode::InvalidConfig,
                fmt::format("{}: '{}' is not a number of milliseconds", name, text)});
        }
        out = std::chrono::milliseconds{value};
        return {};
    }
};

}  // namespace termq
