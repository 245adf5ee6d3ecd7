// SPDX-License-Identifier: MIT

// tests/error_test.cpp
#include <cerrno>
#include <stdexcept>

#include <gtest/gtest.h>

#include "lib/stream/error.hpp"

using namespace termq;

TEST(ErrorTest, Construction) {
    Error err{ErrorCode::SpawnFailed, "no such file"};
    EXPECT_EQ(err.code, ErrorCode::SpawnFailed);
    EXPECT_EQ(err.message, "no such file");
    EXPECT_EQ(err.os_errno, 0);
}

TEST(ErrorTest, WithErrno) {
    Error err{ErrorCode::WriteFailed, "Input/output error", EIO};
    EXPECT_EQ(err.code, ErrorCode::WriteFailed);
    EXPECT_EQ(err.os_errno, EIO);
}

TEST(ErrorTest, CategoryString) {
    EXPECT_EQ(error_category(ErrorCode::InvalidYield), "interaction");
    EXPECT_EQ(error_category(ErrorCode::ResumeAfterClose), "interaction");

    EXPECT_EQ(error_category(ErrorCode::SpawnFailed), "process");
    EXPECT_EQ(error_category(ErrorCode::ProcessExited), "process");
    EXPECT_EQ(error_category(ErrorCode::WriteFailed), "process");
    EXPECT_EQ(error_category(ErrorCode::ReadFailed), "process");

    EXPECT_EQ(error_category(ErrorCode::InvalidState), "state");
    EXPECT_EQ(error_category(ErrorCode::InvalidConfig), "config");
}

TEST(ErrorTest, CategoryIsConstexpr) {
    static_assert(error_category(ErrorCode::InvalidConfig) == "config");
}

TEST(InteractionErrorTest, CarriesCodeAndMessage) {
    InteractionError err(ErrorCode::InvalidYield, "invalid yielded value");
    EXPECT_EQ(err.code(), ErrorCode::InvalidYield);
    EXPECT_STREQ(err.what(), "invalid yielded value");
}

TEST(InteractionErrorTest, IsALogicError) {
    try {
        throw InteractionError(ErrorCode::ResumeAfterClose, "closed");
    } catch (const std::logic_error& e) {
        EXPECT_STREQ(e.what(), "closed");
        return;
    }
    FAIL() << "InteractionError not caught as std::logic_error";
}
