#include <string>
#include <vector>
#include "gtest/gtest.h"

#include "src/lib/command_runner.h"

using std::string;
using std::vector;

TEST(SpawnCommandRunnerTest, ExitCodes) {
    spawn_command_runner runner;
    EXPECT_EQ(0, runner.run({"true"}, false).exit_code);
    EXPECT_EQ(1, runner.run({"false"}, false).exit_code);
    EXPECT_EQ(3, runner.run({"sh", "-c", "exit 3"}, false).exit_code);
}

TEST(SpawnCommandRunnerTest, CapturesStdout) {
    spawn_command_runner runner;
    command_result res = runner.run({"echo", "hello", "world"}, true);
    EXPECT_EQ(0, res.exit_code);
    EXPECT_EQ("hello world\n", res.output);
}

TEST(SpawnCommandRunnerTest, DiscardsOutputUnlessCaptured) {
    spawn_command_runner runner;
    command_result res = runner.run({"echo", "hello"}, false);
    EXPECT_EQ(0, res.exit_code);
    EXPECT_EQ("", res.output);

    res = runner.run({"sh", "-c", "echo oops >&2"}, true);
    EXPECT_EQ("", res.output);
}

TEST(SpawnCommandRunnerTest, ArgumentsAreNotShellExpanded) {
    spawn_command_runner runner;
    command_result res = runner.run({"echo", "$HOME; `true` \"q\""}, true);
    EXPECT_EQ("$HOME; `true` \"q\"\n", res.output);
}

TEST(SpawnCommandRunnerTest, LargeOutput) {
    spawn_command_runner runner;
    command_result res = runner.run({"sh", "-c", "i=0; while [ $i -lt 5000 ]; do echo line$i; i=$((i+1)); done"}, true);
    EXPECT_EQ(0, res.exit_code);
    EXPECT_GT(res.output.size(), 40000u);
}

TEST(SpawnCommandRunnerTest, MissingBinary) {
    spawn_command_runner runner;
    EXPECT_THROW(runner.run({"/nonexistent/linelookup-no-such-tool"}, false),
                 command_error);
}

TEST(SpawnCommandRunnerTest, EmptyArgv) {
    spawn_command_runner runner;
    EXPECT_THROW(runner.run(vector<string>(), false), command_error);
}

TEST(SpawnCommandRunnerTest, DefaultRunnerIsShared) {
    EXPECT_EQ(default_command_runner(), default_command_runner());
    EXPECT_EQ(0, default_command_runner()->run({"true"}, false).exit_code);
}
