#include <atomic>
#include <chrono>
#include <string>

#include <gtest/gtest.h>

#include "execution/execution_types.hpp"
#include "sandbox/output_collector.hpp"

namespace codebox::sandbox {
namespace {

using namespace std::chrono_literals;

class OutputCollectorTest : public ::testing::Test {
protected:
    ProcessOutcome RunShell(const std::string& script,
                            const std::optional<std::string>& stdin_text = std::nullopt,
                            std::chrono::milliseconds timeout = 5000ms,
                            const std::function<void()>& on_timeout = {}) {
        return collector_.Run({"/bin/sh", "-c", script}, stdin_text, timeout, on_timeout);
    }

    utils::WorkerPool pool_{4, 4};
    OutputCollector collector_{pool_};
};

TEST_F(OutputCollectorTest, CapturesStdoutAndExitCode) {
    const auto outcome = RunShell("echo hello; echo world");
    EXPECT_FALSE(outcome.timed_out);
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(outcome.stdout_text, "hello\nworld\n");
    EXPECT_TRUE(outcome.stderr_text.empty());
}

TEST_F(OutputCollectorTest, TerminatesLastLineWithNewline) {
    const auto outcome = RunShell("printf 'no newline'");
    EXPECT_EQ(outcome.stdout_text, "no newline\n");
}

TEST_F(OutputCollectorTest, SeparatesStderrAndExitStatus) {
    const auto outcome = RunShell("echo out; echo err 1>&2; exit 3");
    EXPECT_EQ(outcome.exit_code, 3);
    EXPECT_EQ(outcome.stdout_text, "out\n");
    EXPECT_EQ(outcome.stderr_text, "err\n");
}

TEST_F(OutputCollectorTest, FeedsStdinAndClosesIt) {
    const auto outcome = RunShell("cat", std::string("line one\nline two"));
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(outcome.stdout_text, "line one\nline two\n");
}

TEST_F(OutputCollectorTest, ChildSeesEofWithoutStdin) {
    const auto outcome = RunShell("cat; echo done", std::nullopt, 3000ms);
    EXPECT_FALSE(outcome.timed_out);
    EXPECT_EQ(outcome.stdout_text, "done\n");
}

TEST_F(OutputCollectorTest, LargeOutputOnBothStreamsDoesNotDeadlock) {
    const auto outcome = RunShell(
        "i=0; while [ $i -lt 20000 ]; do echo \"line $i\"; echo \"err $i\" 1>&2; i=$((i+1)); done",
        std::nullopt, 20000ms);
    EXPECT_FALSE(outcome.timed_out);
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_NE(outcome.stdout_text.find("line 19999\n"), std::string::npos);
    EXPECT_NE(outcome.stderr_text.find("err 19999\n"), std::string::npos);
}

TEST_F(OutputCollectorTest, TimeoutKillsChildAndKeepsPartialOutput) {
    std::atomic<int> hook_calls{0};
    const auto started = std::chrono::steady_clock::now();
    const auto outcome = RunShell("echo started; sleep 30", std::nullopt, 500ms,
                                  [&hook_calls] { ++hook_calls; });
    const auto waited = std::chrono::steady_clock::now() - started;
    EXPECT_TRUE(outcome.timed_out);
    EXPECT_EQ(hook_calls.load(), 1);
    EXPECT_EQ(outcome.stdout_text, "started\n");
    EXPECT_LT(waited, 5s);
}

TEST_F(OutputCollectorTest, BackgroundedDescendantsDoNotHoldPipesOpen) {
    const auto started = std::chrono::steady_clock::now();
    const auto outcome = RunShell("sleep 30 & echo parent", std::nullopt, 5000ms);
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(outcome.stdout_text, "parent\n");
    EXPECT_LT(std::chrono::steady_clock::now() - started, 4s);
}

TEST_F(OutputCollectorTest, TruncatesOversizedOutput) {
    CollectorOptions options{};
    options.max_output_bytes = 64;
    OutputCollector small(pool_, options);
    const auto outcome = small.Run({"/bin/sh", "-c", "yes abcdefgh | head -c 100000"},
                                   std::nullopt, 5000ms);
    EXPECT_EQ(outcome.exit_code, 0);
    const std::string marker = OutputCollector::kTruncatedMarker;
    ASSERT_GE(outcome.stdout_text.size(), marker.size());
    EXPECT_EQ(outcome.stdout_text.substr(outcome.stdout_text.size() - marker.size()), marker);
    EXPECT_LE(outcome.stdout_text.size(), 64 + 1 + marker.size());
}

TEST_F(OutputCollectorTest, SignalledChildReportsShellStyleCode) {
    const auto outcome = RunShell("kill -9 $$");
    EXPECT_EQ(outcome.exit_code, 128 + 9);
}

TEST_F(OutputCollectorTest, MissingExecutableThrowsSystemError) {
    EXPECT_THROW(collector_.Run({"codebox-no-such-binary"}, std::nullopt, 1000ms),
                 execution::SystemError);
    EXPECT_THROW(collector_.Run({}, std::nullopt, 1000ms), execution::SystemError);
}

TEST_F(OutputCollectorTest, SaturatedPoolIsReportedNotHung) {
    utils::WorkerPool tiny(1, 0);
    OutputCollector starved(tiny);
    EXPECT_THROW(starved.Run({"/bin/sh", "-c", "echo hi"}, std::nullopt, 1000ms),
                 execution::SystemError);
}

}  // namespace
}  // namespace codebox::sandbox
