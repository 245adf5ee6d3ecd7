// SPDX-License-Identifier: MIT

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "shell_probe/command_runner.hpp"
#include "src/interaction_queue.hpp"
#include "tests/manual_event_loop.hpp"
#include "tests/mock_process_sink.hpp"

namespace shell_probe {
namespace {

using namespace std::chrono_literals;
using termq::ResumeValue;

class CommandRunnerTest : public ::testing::Test {
protected:
    std::unique_ptr<termq::Generator> Run(std::string command, int budget = 2) {
        return std::make_unique<termq::CoGenerator>(RunCommand(
            std::move(command), 1, budget,
            [this](const CommandResult& r) { results_.push_back(r); }));
    }

    termq::ManualEventLoop loop_;
    ::testing::NiceMock<termq::testing::MockProcessSink> sink_;
    std::vector<CommandResult> results_;
    termq::InteractionQueue queue_{loop_, sink_, termq::QueueConfig::Defaults()};
};

TEST(CommandRunnerHelpersTest, MarkerCommandDoesNotEchoTheMarker) {
    EXPECT_EQ(CompletionMarker(3), "__termq_3__");
    EXPECT_EQ(MarkerCommand(3).find(CompletionMarker(3)), std::string::npos);
}

TEST(CommandRunnerHelpersTest, CleanTranscriptStopsBeforeMarkerLine) {
    std::string transcript = "uname\r\nLinux\r\n__termq_1__\r\n$ ";
    EXPECT_EQ(CleanTranscript(transcript, "__termq_1__"), "uname\nLinux\n");
}

TEST(CommandRunnerHelpersTest, CleanTranscriptWithoutMarkerKeepsEverything) {
    EXPECT_EQ(CleanTranscript("partial\r\nout", "__termq_1__"), "partial\nout");
}

TEST_F(CommandRunnerTest, SendsCommandThenMarker) {
    queue_.Enqueue(Run("uname"));

    EXPECT_EQ(sink_.sent, (std::vector<std::string>{"uname\n", MarkerCommand(1)}));
    EXPECT_TRUE(queue_.IsWaitingForAccept());
}

TEST_F(CommandRunnerTest, CollectsOutputUntilMarker) {
    queue_.Enqueue(Run("uname"));

    queue_.Resume(ResumeValue::Output("Linux\r\n"));
    EXPECT_TRUE(results_.empty());

    queue_.Resume(ResumeValue::Output("__termq_1__\r\n$ "));

    ASSERT_EQ(results_.size(), 1u);
    EXPECT_TRUE(results_[0].completed);
    EXPECT_EQ(results_[0].command, "uname");
    EXPECT_EQ(results_[0].output, "Linux\n");
    EXPECT_EQ(results_[0].timeouts, 0);
    EXPECT_TRUE(queue_.IsIdle());
}

TEST_F(CommandRunnerTest, SlowCommandSurvivesTimeouts) {
    queue_.Enqueue(Run("sleep 1; echo late", 2));

    loop_.AdvanceBy(500ms);
    EXPECT_TRUE(results_.empty());

    queue_.Resume(ResumeValue::Output("late\r\n__termq_1__\r\n"));

    ASSERT_EQ(results_.size(), 1u);
    EXPECT_TRUE(results_[0].completed);
    EXPECT_EQ(results_[0].timeouts, 1);
    EXPECT_EQ(results_[0].output, "late\n");
}

TEST_F(CommandRunnerTest, GivesUpWhenBudgetIsSpent) {
    queue_.Enqueue(Run("cat", 1));

    loop_.AdvanceBy(500ms);
    EXPECT_TRUE(results_.empty());
    loop_.AdvanceBy(500ms);

    ASSERT_EQ(results_.size(), 1u);
    EXPECT_FALSE(results_[0].completed);
    EXPECT_EQ(results_[0].timeouts, 2);
    EXPECT_TRUE(queue_.IsIdle());
}

TEST_F(CommandRunnerTest, CancelReportsIncompleteResult) {
    queue_.Enqueue(Run("top"));
    queue_.Resume(ResumeValue::Output("load average"));

    queue_.Cancel();

    ASSERT_EQ(results_.size(), 1u);
    EXPECT_FALSE(results_[0].completed);
}

TEST_F(CommandRunnerTest, WaitForPromptReportsBanner) {
    std::optional<std::string> banner;
    queue_.Enqueue(WaitForPrompt("$ ", [&banner](std::string_view text) {
        banner = std::string(text);
    }));
    queue_.Enqueue(Run("id"));

    EXPECT_TRUE(sink_.sent.empty());

    queue_.Resume(ResumeValue::Output("welcome\r\n"));
    EXPECT_FALSE(banner.has_value());

    queue_.Resume(ResumeValue::Output("$ "));
    ASSERT_TRUE(banner.has_value());
    EXPECT_EQ(*banner, "welcome\r\n$ ");
    EXPECT_EQ(sink_.sent.front(), "id\n");
}

TEST_F(CommandRunnerTest, WaitForPromptGivesUpOnTimeout) {
    bool ready = false;
    queue_.Enqueue(WaitForPrompt("$ ", [&ready](std::string_view) { ready = true; }));

    loop_.AdvanceBy(500ms);

    EXPECT_TRUE(ready);
    EXPECT_TRUE(queue_.IsIdle());
}

}  // namespace
}  // namespace shell_probe
