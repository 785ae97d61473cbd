#include <gtest/gtest.h>
#include "core/CommandRunner.hpp"
#include <chrono>

using namespace mcpline;
using namespace std::chrono_literals;

TEST(CommandRunnerTest, CapturesStdout) {
    CommandRunner runner(5000ms);
    CommandResult result = runner.run({"echo", "hello", "world"});

    EXPECT_EQ(result.standard_output, "hello world\n");
    EXPECT_TRUE(result.standard_error.empty());
    EXPECT_EQ(result.exit_status, 0);
}

TEST(CommandRunnerTest, CapturesStderrAndExitStatus) {
    CommandRunner runner(5000ms);
    CommandResult result = runner.run({"/bin/sh", "-c", "echo out; echo err 1>&2; exit 3"});

    EXPECT_EQ(result.standard_output, "out\n");
    EXPECT_EQ(result.standard_error, "err\n");
    EXPECT_EQ(result.exit_status, 3);
}

TEST(CommandRunnerTest, ArgumentsAreNotInterpretedByShell) {
    CommandRunner runner(5000ms);
    CommandResult result = runner.run({"echo", "$HOME", ";", "ls"});

    EXPECT_EQ(result.standard_output, "$HOME ; ls\n");
}

TEST(CommandRunnerTest, StdinIsEmpty) {
    CommandRunner runner(5000ms);
    CommandResult result = runner.run({"cat"});

    EXPECT_TRUE(result.standard_output.empty());
    EXPECT_EQ(result.exit_status, 0);
}

TEST(CommandRunnerTest, LargeOutputIsFullyRead) {
    CommandRunner runner(5000ms);
    // Well beyond a pipe buffer on both streams
    CommandResult result = runner.run({"/bin/sh", "-c",
        "i=0; while [ $i -lt 20000 ]; do echo 0123456789; echo abcdefghij 1>&2; i=$((i+1)); done"});

    EXPECT_EQ(result.standard_output.size(), 20000u * 11u);
    EXPECT_EQ(result.standard_error.size(), 20000u * 11u);
    EXPECT_EQ(result.exit_status, 0);
}

TEST(CommandRunnerTest, MissingProgramExits127) {
    CommandRunner runner(5000ms);
    CommandResult result = runner.run({"mcpline-no-such-program-xyz"});

    EXPECT_EQ(result.exit_status, 127);
    EXPECT_NE(result.standard_error.find("exec failed"), std::string::npos);
}

TEST(CommandRunnerTest, KilledBySignalReports128PlusSignal) {
    CommandRunner runner(5000ms);
    CommandResult result = runner.run({"/bin/sh", "-c", "kill -9 $$"});

    EXPECT_EQ(result.exit_status, 128 + 9);
}

TEST(CommandRunnerTest, TimeoutKillsCommand) {
    CommandRunner runner(200ms);

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(runner.run({"sleep", "10"}), CommandTimeout);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, 5s);
}

TEST(CommandRunnerTest, InvalidInput) {
    EXPECT_THROW(CommandRunner(0ms), std::invalid_argument);

    CommandRunner runner(1000ms);
    EXPECT_THROW(runner.run({}), std::invalid_argument);
    EXPECT_THROW(runner.run({""}), std::invalid_argument);
}
