#include <signal.h>
#include <cerrno>
#include <chrono>
#include <thread>
#include "common/cancellation.hpp"
#include "common/utils.hpp"
#include "exec/sandbox.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace kata;

static runguard_options shell(const string &script, chrono::milliseconds wall_limit = chrono::milliseconds(5000)) {
    runguard_options opt;
    opt.command = {"/bin/sh", "-c", script};
    opt.wall_limit = wall_limit;
    return opt;
}

static bool group_alive(int pgid) {
    return kill(-pgid, 0) == 0 || errno != ESRCH;
}

TEST(SandboxTest, CapturesOutputAndExitCode) {
    process_sandbox sb;
    runguard_result result = sb.run(shell("echo hello; echo oops >&2; exit 3"), nullptr);

    ASSERT_TRUE(result.exec_error.empty());
    ASSERT_TRUE(result.exitcode);
    EXPECT_EQ(*result.exitcode, 3);
    EXPECT_EQ(result.stdout_data, "hello\n");
    EXPECT_EQ(result.stderr_data, "oops\n");
    EXPECT_FALSE(result.timed_out);
    EXPECT_FALSE(result.cancelled);
    EXPECT_FALSE(result.stdout_truncated);
}

TEST(SandboxTest, ReportsSignal) {
    process_sandbox sb;
    runguard_result result = sb.run(shell("kill -SEGV $$"), nullptr);

    EXPECT_FALSE(result.exitcode);
    EXPECT_EQ(result.signal, SIGSEGV);
}

TEST(SandboxTest, MissingCommandIsExecError) {
    process_sandbox sb;
    runguard_options opt;
    opt.command = {"kata-engine-no-such-command"};
    runguard_result result = sb.run(opt, nullptr);

    EXPECT_FALSE(result.exec_error.empty());
    EXPECT_FALSE(result.exitcode);
}

TEST(SandboxTest, PassesEnvironmentAndWorkDir) {
    process_sandbox sb;
    runguard_options opt = shell("echo $KATA_VALUE; pwd");
    opt.env = {"KATA_VALUE=42"};
    opt.work_dir = "/";
    runguard_result result = sb.run(opt, nullptr);

    EXPECT_EQ(result.stdout_data, "42\n/\n");
}

TEST(SandboxTest, TimeoutKillsWholeProcessGroup) {
    process_sandbox sb;
    runguard_options opt = shell("sleep 30 & sleep 30; wait", chrono::milliseconds(200));

    elapsed_time timer;
    runguard_result result = sb.run(opt, nullptr);
    auto elapsed = timer.duration<chrono::milliseconds>();

    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.exitcode);
    // 时间限制 + SIGTERM 宽限期 + 调度余量
    EXPECT_LT(elapsed.count(), 200 + 200 + 1000);
    EXPECT_FALSE(group_alive(result.pid));
}

TEST(SandboxTest, IgnoredSigtermIsFollowedBySigkill) {
    process_sandbox sb;
    runguard_options opt = shell("trap '' TERM; while true; do sleep 1; done", chrono::milliseconds(100));

    runguard_result result = sb.run(opt, nullptr);

    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.signal, SIGKILL);
    EXPECT_FALSE(group_alive(result.pid));
}

TEST(SandboxTest, OutputBeyondLimitIsTruncated) {
    process_sandbox sb;
    runguard_options opt = shell("head -c 100000 /dev/zero | tr '\\0' 'a'");
    opt.stream_size = 1024;
    runguard_result result = sb.run(opt, nullptr);

    ASSERT_TRUE(result.exitcode);
    EXPECT_EQ(*result.exitcode, 0);
    EXPECT_EQ(result.stdout_data.size(), 1024);
    EXPECT_EQ(result.stdout_bytes, 100000);
    EXPECT_TRUE(result.stdout_truncated);
    EXPECT_FALSE(result.stderr_truncated);
}

TEST(SandboxTest, CancellationKillsCommand) {
    process_sandbox sb;
    cancellation_token token;
    thread canceller([&] {
        this_thread::sleep_for(chrono::milliseconds(100));
        token.cancel();
    });

    elapsed_time timer;
    runguard_result result = sb.run(shell("sleep 30"), &token);
    canceller.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.timed_out);
    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 2000);
    EXPECT_FALSE(group_alive(result.pid));
}

TEST(SandboxTest, ReadsStdinFromFile) {
    process_sandbox sb;
    runguard_options opt = shell("cat");
    opt.stdin_filename = "/dev/null";
    runguard_result result = sb.run(opt, nullptr);

    ASSERT_TRUE(result.exitcode);
    EXPECT_EQ(*result.exitcode, 0);
    EXPECT_EQ(result.stdout_data, "");
}
