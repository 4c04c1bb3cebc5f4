#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>

#include "process_runner.h"
#include "test_support.h"

using process_runner::RunOptions;

namespace {
bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}
}  // namespace

TEST(ProcessRunner, CapturesStdout) {
    auto result = process_runner::run({"echo", "hello", "world"});
    ASSERT_TRUE(result.is_ok()) << result.error();
    EXPECT_EQ(result.value(), "hello world\n");
}

TEST(ProcessRunner, StderrIsDiscarded) {
    auto result = process_runner::run({"sh", "-c", "echo out; echo err >&2"});
    ASSERT_TRUE(result.is_ok()) << result.error();
    EXPECT_EQ(result.value(), "out\n");
}

TEST(ProcessRunner, EmptyCommand) {
    auto result = process_runner::run({});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error(), "empty command");
}

TEST(ProcessRunner, NonZeroExitIsError) {
    auto result = process_runner::run({"sh", "-c", "exit 3"});
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(contains(result.error(), "failed with exit code 3")) << result.error();
}

TEST(ProcessRunner, MissingBinaryExitsWith127) {
    auto result = process_runner::run({"tabsh-test-no-such-binary"});
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(contains(result.error(), "exit code 127")) << result.error();
}

TEST(ProcessRunner, TimeoutKillsChild) {
    RunOptions options;
    options.timeout = std::chrono::milliseconds(100);
    const auto started = std::chrono::steady_clock::now();

    auto result = process_runner::run({"sleep", "5"}, options);
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(contains(result.error(), "timed out")) << result.error();
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(3));
}

TEST(ProcessRunner, CancelledBeforeStart) {
    std::atomic<bool> cancelled{true};
    RunOptions options;
    options.cancelled = &cancelled;

    auto result = process_runner::run({"sleep", "5"}, options);
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(contains(result.error(), "cancelled")) << result.error();
}

TEST(ProcessRunner, RunsInWorkingDirectory) {
    test_support::ScratchDir dir;
    RunOptions options;
    options.working_directory = dir.path().string();

    auto result = process_runner::run({"pwd", "-P"}, options);
    ASSERT_TRUE(result.is_ok()) << result.error();
    EXPECT_EQ(result.value(), std::filesystem::canonical(dir.path()).string() + "\n");
}

TEST(ProcessRunner, OutputCap) {
    RunOptions options;
    options.max_output = 16;

    auto result = process_runner::run({"sh", "-c", "printf '%0100d' 0"}, options);
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(contains(result.error(), "too much output")) << result.error();
}

TEST(DescribeCommand, JoinsWithSpaces) {
    EXPECT_EQ(process_runner::describe_command({"git", "branch", "-r"}), "git branch -r");
    EXPECT_EQ(process_runner::describe_command({}), "");
}
