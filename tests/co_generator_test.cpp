// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "src/co_generator.hpp"
#include "src/interaction_queue.hpp"
#include "tests/manual_event_loop.hpp"
#include "tests/mock_process_sink.hpp"

using namespace termq;
using namespace std::chrono_literals;

namespace {

// Sets a flag when the coroutine frame is destroyed
struct FrameGuard {
    bool* destroyed;
    ~FrameGuard() { *destroyed = true; }
};

CoGenerator Login(std::string user, std::vector<ResumeValue>* seen) {
    auto reply = co_yield yield::Send{user + "\n"};
    seen->push_back(reply);
    if (reply.IsTimeout()) {
        co_return;
    }
    reply = co_yield yield::FireAndForget{"id\n"};
    seen->push_back(reply);
}

CoGenerator WaitForever(bool* destroyed) {
    FrameGuard guard{destroyed};
    for (;;) {
        co_yield yield::KeepWaiting{};
    }
}

CoGenerator FailsOnSecondStep() {
    co_yield yield::Send{"x\n"};
    throw std::runtime_error("unexpected reply");
}

}  // namespace

TEST(CoGeneratorTest, BodyStartsOnFirstNext) {
    std::vector<ResumeValue> seen;
    CoGenerator generator = Login("root", &seen);

    EXPECT_FALSE(generator.IsDone());
    Yield first = generator.Next(ResumeValue{});

    ASSERT_TRUE(std::holds_alternative<yield::Send>(first));
    EXPECT_EQ(std::get<yield::Send>(first).text, "root\n");
    EXPECT_TRUE(seen.empty());
}

TEST(CoGeneratorTest, CoYieldEvaluatesToResumeValue) {
    std::vector<ResumeValue> seen;
    CoGenerator generator = Login("root", &seen);

    generator.Next(ResumeValue{});
    Yield second = generator.Next(ResumeValue::Output("Password:"));
    ASSERT_TRUE(std::holds_alternative<yield::FireAndForget>(second));

    Yield last = generator.Next(ResumeValue::SendAck());
    EXPECT_TRUE(std::holds_alternative<yield::Done>(last));
    EXPECT_TRUE(generator.IsDone());

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], ResumeValue::Output("Password:"));
    EXPECT_TRUE(seen[1].IsSendAck());

    // Exhausted generators keep reporting Done
    EXPECT_TRUE(std::holds_alternative<yield::Done>(generator.Next(ResumeValue{})));
}

TEST(CoGeneratorTest, CoReturnEndsEarly) {
    std::vector<ResumeValue> seen;
    CoGenerator generator = Login("root", &seen);

    generator.Next(ResumeValue{});
    EXPECT_TRUE(std::holds_alternative<yield::Done>(generator.Next(ResumeValue::Timeout())));
    EXPECT_EQ(seen.size(), 1u);
}

TEST(CoGeneratorTest, CloseDestroysFrameLocals) {
    bool destroyed = false;
    CoGenerator generator = WaitForever(&destroyed);

    generator.Next(ResumeValue{});
    EXPECT_FALSE(destroyed);

    generator.Close();
    EXPECT_TRUE(destroyed);
    EXPECT_TRUE(generator.IsDone());
    generator.Close();
}

TEST(CoGeneratorTest, ExceptionRethrownFromNext) {
    CoGenerator generator = FailsOnSecondStep();

    generator.Next(ResumeValue{});
    EXPECT_THROW(generator.Next(ResumeValue::Output("?")), std::runtime_error);
    EXPECT_TRUE(generator.IsDone());
}

TEST(CoGeneratorTest, MoveTransfersFrame) {
    bool destroyed = false;
    CoGenerator a = WaitForever(&destroyed);
    CoGenerator b = std::move(a);

    EXPECT_TRUE(a.IsDone());
    EXPECT_FALSE(b.IsDone());
    EXPECT_TRUE(std::holds_alternative<yield::KeepWaiting>(b.Next(ResumeValue{})));
}

TEST(CoGeneratorTest, QueueCancelDestroysSuspendedCoroutine) {
    ManualEventLoop loop;
    ::testing::NiceMock<termq::testing::MockProcessSink> sink;
    InteractionQueue queue(loop, sink);
    bool destroyed = false;

    queue.Enqueue(std::make_unique<CoGenerator>(WaitForever(&destroyed)));
    loop.AdvanceBy(1200ms);  // sits through two timeouts
    EXPECT_FALSE(destroyed);

    queue.Cancel();
    EXPECT_TRUE(destroyed);
}

TEST(CoGeneratorTest, QueueDrivesCoroutineToCompletion) {
    ManualEventLoop loop;
    ::testing::NiceMock<termq::testing::MockProcessSink> sink;
    InteractionQueue queue(loop, sink);
    std::vector<ResumeValue> seen;

    queue.Enqueue(std::make_unique<CoGenerator>(Login("admin", &seen)));
    queue.EnqueueString("whoami\n");
    queue.Resume(ResumeValue::Output("ok"));

    EXPECT_EQ(sink.sent, (std::vector<std::string>{"admin\n", "id\n", "whoami\n"}));
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_TRUE(seen[1].IsSendAck());
}
