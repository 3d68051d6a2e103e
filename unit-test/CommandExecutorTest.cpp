#include <signal.h>
#include "common/utils.hpp"
#include "executor/executor.hpp"
#include "gtest/gtest.h"
#include "sandbox/process_runtime.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace grader;

class CommandExecutorTest : public ::testing::Test {
protected:
    CommandExecutorTest() : dir("executor-test"), runtime(make_options(dir)), executor(runtime, dog) {
        handle = runtime.acquire({});
    }

    ~CommandExecutorTest() override {
        runtime.release(*handle);
    }

    static runtime_options make_options(const test::temp_dir &dir) {
        runtime_options options;
        options.sandbox_dir = dir.path();
        return options;
    }

    command_result run(const vector<string> &argv, const string &input = "") {
        command cmd;
        cmd.argv = argv;
        cmd.input = input;
        return executor.run(*handle, cmd);
    }

    test::temp_dir dir;
    process_sandbox_runtime runtime;
    watchdog dog;
    command_executor executor;
    shared_ptr<sandbox_handle> handle;
};

TEST_F(CommandExecutorTest, ExitStatusTest) {
    auto result = run({"sh", "-c", "echo out; echo err >&2; exit 3"});
    EXPECT_EQ(result.exit_status, 3);
    EXPECT_EQ(result.signal, 0);
    EXPECT_EQ(result.stdout_text, "out\n");
    EXPECT_EQ(result.stderr_text, "err\n");
    EXPECT_FALSE(result.timed_out);
    EXPECT_FALSE(result.resource_killed);
}

TEST_F(CommandExecutorTest, SignalTest) {
    auto result = run({"sh", "-c", "kill -SEGV $$"});
    EXPECT_EQ(result.signal, SIGSEGV);
    EXPECT_EQ(result.exit_status, 128 + SIGSEGV);
    EXPECT_FALSE(result.timed_out);
}

TEST_F(CommandExecutorTest, StdinTest) {
    auto result = run({"cat"}, "line 1\nline 2\n");
    EXPECT_EQ(result.exit_status, 0);
    EXPECT_EQ(result.stdout_text, "line 1\nline 2\n");
}

TEST_F(CommandExecutorTest, StdinNotConsumedTest) {
    // 程序不读取标准输入就退出，不能让评测进程收到 SIGPIPE
    string input(1 << 20, 'x');
    auto result = run({"true"}, input);
    EXPECT_EQ(result.exit_status, 0);
}

TEST_F(CommandExecutorTest, WallTimeLimitTest) {
    command cmd;
    cmd.argv = {"sleep", "10"};
    cmd.limits.wall_time = 2;

    elapsed_time timer;
    auto result = executor.run(*handle, cmd);
    EXPECT_LE(timer.seconds(), 2.5);
    EXPECT_TRUE(result.timed_out);
    EXPECT_NE(result.exit_status, 0);
    EXPECT_EQ(dog.pending(), 0u);
}

TEST_F(CommandExecutorTest, BackgroundChildTimeLimitTest) {
    // 后台进程持有输出管道，也不能让执行超过时间限制
    command cmd;
    cmd.argv = {"sh", "-c", "sleep 10 & sleep 10"};
    cmd.limits.wall_time = 1;

    elapsed_time timer;
    auto result = executor.run(*handle, cmd);
    EXPECT_LE(timer.seconds(), 2.5);
    EXPECT_TRUE(result.timed_out);
}

TEST_F(CommandExecutorTest, LeaderExitWithBackgroundChildTest) {
    elapsed_time timer;
    auto result = run({"sh", "-c", "sleep 10 & echo done"});
    EXPECT_LE(timer.seconds(), 2.5);
    EXPECT_EQ(result.exit_status, 0);
    EXPECT_EQ(result.stdout_text, "done\n");
    EXPECT_FALSE(result.timed_out);
}

TEST_F(CommandExecutorTest, OutputTruncationTest) {
    command cmd;
    cmd.argv = {"sh", "-c", "head -c 100000 /dev/zero | tr '\\0' a"};
    cmd.limits.output_limit = 1000;

    auto result = executor.run(*handle, cmd);
    EXPECT_EQ(result.exit_status, 0);
    EXPECT_EQ(result.stdout_text.size(), 1000u);
    EXPECT_TRUE(result.stdout_truncated);
    EXPECT_FALSE(result.stderr_truncated);
}

TEST_F(CommandExecutorTest, MissingProgramTest) {
    auto result = run({"./does-not-exist"});
    EXPECT_EQ(result.exit_status, 127);
    EXPECT_NE(result.stderr_text.find("does-not-exist"), string::npos);
}

TEST_F(CommandExecutorTest, CpuTimeLimitTest) {
    command cmd;
    cmd.argv = {"sh", "-c", "while :; do :; done"};
    cmd.limits.cpu_time = 1;
    cmd.limits.wall_time = 5;

    auto result = executor.run(*handle, cmd);
    EXPECT_FALSE(result.timed_out);
    EXPECT_TRUE(result.resource_killed);
    EXPECT_NE(result.signal, 0);
}

TEST_F(CommandExecutorTest, WorkingDirectoryTest) {
    runtime.copy_in(*handle, {{"sub/input.txt", "hello", {}}});

    command cmd;
    cmd.argv = {"cat", "input.txt"};
    cmd.working_dir = "sub";
    auto result = executor.run(*handle, cmd);
    EXPECT_EQ(result.exit_status, 0);
    EXPECT_EQ(result.stdout_text, "hello");
}

TEST_F(CommandExecutorTest, EnvironmentTest) {
    command cmd;
    cmd.argv = {"sh", "-c", "echo $GREETING"};
    cmd.env = {"GREETING=hi"};
    auto result = executor.run(*handle, cmd);
    EXPECT_EQ(result.stdout_text, "hi\n");
}
