#include <unistd.h>
#include "common/utils.hpp"
#include "executor/executor.hpp"
#include "gtest/gtest.h"
#include "sandbox/cgroup.hpp"
#include "sandbox/cgroup_runtime.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace grader;

/**
 * cgroup 运行时需要 root 权限和 cgroup v1 的 memory、pids、cpuacct 控制器
 */
class CgroupRuntimeTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (geteuid() != 0) GTEST_SKIP() << "cgroup runtime requires root";
        options.sandbox_dir = dir.path();
        options.cgroup_parent = "grader-test";
        runtime = make_unique<cgroup_sandbox_runtime>(options);
    }

    test::temp_dir dir{"cgroup-test"};
    runtime_options options;
    unique_ptr<cgroup_sandbox_runtime> runtime;
    watchdog dog;
};

TEST_F(CgroupRuntimeTest, RunAndReleaseTest) {
    auto handle = runtime->acquire({});
    command_executor executor(*runtime, dog);

    command cmd;
    cmd.argv = {"sh", "-c", "sleep 100 & echo started"};
    auto result = executor.run(*handle, cmd);
    EXPECT_EQ(result.exit_status, 0);
    EXPECT_EQ(result.stdout_text, "started\n");

    EXPECT_NO_THROW(runtime->release(*handle));
    EXPECT_TRUE(handle->released);
    EXPECT_NO_THROW(runtime->release(*handle));
}

TEST_F(CgroupRuntimeTest, EscapedProcessGroupKilledTest) {
    auto handle = runtime->acquire({});
    command_executor executor(*runtime, dog);

    // setsid 逃出了进程组，但逃不出 cgroup
    command cmd;
    cmd.argv = {"sh", "-c", "setsid sleep 100 > /dev/null 2>&1 < /dev/null &"};
    executor.run(*handle, cmd);

    EXPECT_NO_THROW(runtime->release(*handle));
}

TEST_F(CgroupRuntimeTest, MemoryLimitTest) {
    resource_limits limits;
    limits.memory = 32 << 20;
    auto handle = runtime->acquire(limits);
    command_executor executor(*runtime, dog);

    command cmd;
    cmd.argv = {"sh", "-c", "head -c 200000000 /dev/zero | tail > /dev/null"};
    cmd.limits.wall_time = 10;
    auto result = executor.run(*handle, cmd);
    EXPECT_FALSE(result.timed_out);
    EXPECT_TRUE(result.resource_killed);

    runtime->release(*handle);
}

TEST_F(CgroupRuntimeTest, WallTimeLimitTest) {
    auto handle = runtime->acquire({});
    command_executor executor(*runtime, dog);

    command cmd;
    cmd.argv = {"sleep", "10"};
    cmd.limits.wall_time = 1;
    elapsed_time timer;
    auto result = executor.run(*handle, cmd);
    EXPECT_TRUE(result.timed_out);
    EXPECT_LE(timer.seconds(), 2.5);

    runtime->release(*handle);
}
