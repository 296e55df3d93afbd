#include <gtest/gtest.h>

#include "mkp/process_exec.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>

using namespace makeport;
using namespace std::chrono_literals;

namespace {

bool process_alive(int pid) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat.is_open())
        return false;
    std::string line;
    std::getline(stat, line);
    size_t close = line.rfind(')');
    if (close == std::string::npos || close + 2 >= line.size())
        return false;
    char state = line[close + 2];
    return state != 'Z' && state != 'X';
}

bool wait_until_dead(int pid, std::chrono::milliseconds limit = 3000ms) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!process_alive(pid))
            return true;
        std::this_thread::sleep_for(20ms);
    }
    return !process_alive(pid);
}

ProcessSpec shell(std::string script, std::chrono::milliseconds timeout) {
    return {.args = {"sh", "-c", std::move(script)}, .working_dir = std::nullopt, .env = {}, .timeout = timeout};
}

} // namespace

TEST(ProcessExec, ReportsExitCodeAndMergedOutput) {
    auto out = process_exec({.args = {"sh", "-c", "echo out; echo err >&2; exit 7"},
                             .working_dir = std::nullopt,
                             .env = {},
                             .timeout = 10s});
    ASSERT_TRUE(out) << out.error();
    EXPECT_FALSE(out->timed_out);
    EXPECT_EQ(out->exit_code, 7);
    EXPECT_EQ(out->output, "out\nerr\n");
}

TEST(ProcessExec, ExtendsEnvironment) {
    auto out = process_exec({.args = {"sh", "-c", "printf '%s' \"$MAKEPORT_TEST_VALUE\""},
                             .working_dir = std::nullopt,
                             .env = {{"MAKEPORT_TEST_VALUE", "42"}},
                             .timeout = 10s});
    ASSERT_TRUE(out) << out.error();
    EXPECT_EQ(out->output, "42");
}

TEST(ProcessExec, DeadlineKeepsPartialOutput) {
    int started_pid = -1;
    auto out = process_exec({.args = {"sh", "-c", "echo start; sleep 30"},
                             .working_dir = std::nullopt,
                             .env = {},
                             .timeout = 500ms},
                            [&](int pid) { started_pid = pid; });
    ASSERT_TRUE(out) << out.error();
    EXPECT_TRUE(out->timed_out);
    EXPECT_EQ(out->output, "start\n");
    EXPECT_GT(started_pid, 0);
}

TEST(ProcessExec, MissingProgramIsAnError) {
    auto out = process_exec(
        {.args = {"makeport-definitely-missing"}, .working_dir = std::nullopt, .env = {}, .timeout = 10s});
    ASSERT_FALSE(out);
    EXPECT_NE(out.error().find("makeport-definitely-missing"), std::string::npos);
}

TEST(ProcessExec, EmptyCommandIsAnError) {
    EXPECT_FALSE(process_exec({}));
}

TEST(ProcessExec, OverridesInheritedVariables) {
    setenv("MAKEPORT_TEST_OVERRIDE", "parent", 1);
    auto spec = shell("printf '%s' \"$MAKEPORT_TEST_OVERRIDE\"", 10s);
    spec.env = {{"MAKEPORT_TEST_OVERRIDE", "child"}};
    auto out = process_exec(spec);
    unsetenv("MAKEPORT_TEST_OVERRIDE");

    ASSERT_TRUE(out) << out.error();
    EXPECT_EQ(out->output, "child");
}

TEST(ProcessExec, RunsInWorkingDirectory) {
    auto spec = shell("pwd -P", 10s);
    spec.working_dir = std::filesystem::temp_directory_path();
    auto out = process_exec(spec);

    ASSERT_TRUE(out) << out.error();
    EXPECT_EQ(out->output, std::filesystem::canonical(std::filesystem::temp_directory_path()).string() + "\n");
}

TEST(ProcessExec, ChildLeadsItsOwnProcessGroup) {
    int started_pid = -1;
    auto out = process_exec(shell("cut -d' ' -f5 /proc/$$/stat", 10s), [&](int pid) { started_pid = pid; });

    ASSERT_TRUE(out) << out.error();
    EXPECT_EQ(out->output, std::to_string(started_pid) + "\n");
}

TEST(ProcessExec, DeadlineKillsReparentedGrandchild) {
    auto start = std::chrono::steady_clock::now();
    auto out = process_exec(shell("(sleep 60 >/dev/null & echo $!); sleep 60", 1000ms));
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(out) << out.error();
    EXPECT_TRUE(out->timed_out);
    EXPECT_LT(elapsed, 4s);

    int grandchild = std::atoi(out->output.c_str());
    ASSERT_GT(grandchild, 0);
    EXPECT_TRUE(wait_until_dead(grandchild));
}

TEST(ProcessExec, DetachedBackgroundJobDoesNotHoldExit) {
    auto start = std::chrono::steady_clock::now();
    auto out = process_exec(shell("sleep 5 >/dev/null 2>&1 </dev/null & echo $!; exit 0", 3000ms));
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(out) << out.error();
    EXPECT_FALSE(out->timed_out);
    EXPECT_EQ(out->exit_code, 0);
    EXPECT_LT(elapsed, 2s);

    int background = std::atoi(out->output.c_str());
    if (background > 0)
        kill(background, SIGKILL);
}
