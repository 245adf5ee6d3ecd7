// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>

#include <unistd.h>

#include <chrono>

#include "lib/stream/event_loop.hpp"
#include "lib/stream/timer.hpp"
#include "shell_probe/asio_event_loop.hpp"

namespace shell_probe {
namespace {

TEST(AsioEventLoopTest, ImplementsIEventLoop) {
    asio::io_context ctx;
    AsioEventLoop loop(ctx);

    termq::IEventLoop& iloop = loop;
    EXPECT_TRUE(iloop.IsInEventLoopThread());
}

TEST(AsioEventLoopTest, DeferExecutesCallback) {
    asio::io_context ctx;
    AsioEventLoop loop(ctx);

    bool called = false;
    loop.Defer([&] { called = true; });

    ctx.run();

    EXPECT_TRUE(called);
}

TEST(AsioEventLoopTest, ScheduleExecutesAfterDelay) {
    asio::io_context ctx;
    AsioEventLoop loop(ctx);

    bool called = false;
    termq::TimerId id = loop.Schedule(std::chrono::milliseconds(10), [&] { called = true; });
    EXPECT_NE(id, 0u);
    EXPECT_EQ(loop.PendingTimers(), 1u);

    ctx.run();

    EXPECT_TRUE(called);
    EXPECT_EQ(loop.PendingTimers(), 0u);
}

TEST(AsioEventLoopTest, CancelledTimerNeverFires) {
    asio::io_context ctx;
    AsioEventLoop loop(ctx);

    bool called = false;
    termq::TimerId id = loop.Schedule(std::chrono::milliseconds(5), [&] { called = true; });
    loop.CancelTimer(id);
    loop.CancelTimer(id);  // second cancel is a no-op

    ctx.run_for(std::chrono::milliseconds(30));

    EXPECT_FALSE(called);
    EXPECT_EQ(loop.PendingTimers(), 0u);
}

TEST(AsioEventLoopTest, TimerRestartDropsEarlierExpiry) {
    asio::io_context ctx;
    AsioEventLoop loop(ctx);
    termq::Timer timer(loop);

    int fired = 0;
    timer.OnTimer([&] { ++fired; });
    timer.Start(std::chrono::milliseconds(5));
    timer.Start(std::chrono::milliseconds(15));

    ctx.run_for(std::chrono::milliseconds(50));

    EXPECT_EQ(fired, 1);
    EXPECT_FALSE(timer.IsArmed());
}

TEST(AsioEventLoopTest, RegisterFdForRead) {
    asio::io_context ctx;
    AsioEventLoop loop(ctx);

    int pipefd[2];
    ASSERT_EQ(pipe(pipefd), 0);

    int reads = 0;
    auto handle = loop.Register(
        pipefd[0],
        true,
        false,
        [&] {
            char buf[16];
            ASSERT_GT(read(pipefd[0], buf, sizeof(buf)), 0);
            ++reads;
        },
        [] {},
        [](int) {});

    char c = 'x';
    ASSERT_EQ(write(pipefd[1], &c, 1), 1);

    ctx.run_for(std::chrono::milliseconds(50));

    EXPECT_EQ(reads, 1);

    handle.reset();
    close(pipefd[0]);
    close(pipefd[1]);
}

TEST(AsioEventLoopTest, RegisterFdForWrite) {
    asio::io_context ctx;
    AsioEventLoop loop(ctx);

    int pipefd[2];
    ASSERT_EQ(pipe(pipefd), 0);

    bool write_called = false;
    std::unique_ptr<termq::IEventHandle> handle;
    handle = loop.Register(
        pipefd[1],
        false,
        true,
        [] {},
        [&] {
            write_called = true;
            handle->Update(false, false);
        },
        [](int) {});

    ctx.run_for(std::chrono::milliseconds(50));

    EXPECT_TRUE(write_called);

    handle.reset();
    close(pipefd[0]);
    close(pipefd[1]);
}

TEST(AsioEventLoopTest, DestroyedHandleStopsCallbacks) {
    asio::io_context ctx;
    AsioEventLoop loop(ctx);

    int pipefd[2];
    ASSERT_EQ(pipe(pipefd), 0);

    bool read_called = false;
    auto handle = loop.Register(
        pipefd[0], true, false,
        [&] { read_called = true; },
        [] {},
        [](int) {});

    char c = 'x';
    ASSERT_EQ(write(pipefd[1], &c, 1), 1);
    handle.reset();

    ctx.run_for(std::chrono::milliseconds(20));

    EXPECT_FALSE(read_called);

    close(pipefd[0]);
    close(pipefd[1]);
}

}  // namespace
}  // namespace shell_probe
