#include "utils/process_runner.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <thread>

using namespace kls::tui;
using namespace std::chrono_literals;

TEST(ProcessRunnerTest, CapturesTrimmedNonEmptyLines) {
    ProcessRunner sh("/bin/sh");
    auto result = sh.capture({"-c", "printf '  alpha \\n\\n\\tbeta\\r\\n   \\ngamma'"});

    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.lines, (std::vector<std::string>{"alpha", "beta", "gamma"}));
}

TEST(ProcessRunnerTest, NonZeroExitIsFailure) {
    ProcessRunner sh("/bin/sh");
    auto result = sh.capture({"-c", "echo partial; exit 3"});

    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.cancelled);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_TRUE(result.lines.empty());
}

TEST(ProcessRunnerTest, StderrIsDiscarded) {
    ProcessRunner sh("/bin/sh");
    auto result = sh.capture({"-c", "echo out; echo err >&2"});

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.lines, (std::vector<std::string>{"out"}));
}

TEST(ProcessRunnerTest, MissingProgramFails) {
    ProcessRunner missing("/nonexistent/kubectl");
    auto result = missing.capture({"get", "pods"});

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 127);
    EXPECT_FALSE(result.error_message.empty());
}

TEST(ProcessRunnerTest, StopRequestKillsChild) {
    ProcessRunner sh("/bin/sh");
    std::stop_source source;

    std::thread stopper([&source] {
        std::this_thread::sleep_for(100ms);
        source.request_stop();
    });

    const auto started = std::chrono::steady_clock::now();
    auto result = sh.capture({"-c", "sleep 30"}, source.get_token());
    const auto elapsed = std::chrono::steady_clock::now() - started;
    stopper.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.success);
    EXPECT_LT(elapsed, 10s);
}

TEST(ProcessRunnerTest, SplitLines) {
    EXPECT_TRUE(ProcessRunner::split_lines("").empty());
    EXPECT_TRUE(ProcessRunner::split_lines("\n \n\t\n").empty());
    EXPECT_EQ(ProcessRunner::split_lines("a\nb c\n"), (std::vector<std::string>{"a", "b c"}));
}

TEST(ProcessRunnerTest, RunShellReturnsExitStatus) {
    EXPECT_EQ(ProcessRunner::run_shell("true"), 0);
    EXPECT_EQ(ProcessRunner::run_shell("exit 4"), 4);
}
