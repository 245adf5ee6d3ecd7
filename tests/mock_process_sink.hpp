// SPDX-License-Identifier: MIT

// tests/mock_process_sink.hpp
#pragma once

#include <gmock/gmock.h>

#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "lib/stream/error.hpp"
#include "src/process_sink.hpp"

namespace termq::testing {

/// ProcessSink mock that, unless told otherwise, is alive, records what is
/// sent in `sent` and has nothing left to drain.
class MockProcessSink : public ProcessSink {
public:
    MockProcessSink() {
        ON_CALL(*this, Send).WillByDefault(
            [this](std::string_view data) -> std::expected<void, Error> {
                sent.emplace_back(data);
                return {};
            });
        ON_CALL(*this, IsAlive).WillByDefault(::testing::Return(true));
        ON_CALL(*this, DrainPendingOutput).WillByDefault(::testing::Return(false));
    }

    MOCK_METHOD((std::expected<void, Error>), Send, (std::string_view), (override));
    MOCK_METHOD(bool, IsAlive, (), (const, override));
    MOCK_METHOD(bool, DrainPendingOutput, (), (override));

    std::vector<std::string> sent;
};

}  // namespace termq::testing
