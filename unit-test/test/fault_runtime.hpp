#pragma once

#include <atomic>
#include <mutex>
#include <set>
#include "sandbox/process_runtime.hpp"

/**
 * 测试用的沙箱运行时
 * 在 process 运行时的基础上统计沙箱的创建和销毁，并可以在指定的操作注入基础设施错误：
 * 1. fault_runtime runtime(options);
 * 2. runtime.fail_acquire = 2; // 前两次创建沙箱失败
 * 3. 评测结束后检查 runtime.live_sandboxes() == 0
 */
namespace grader::test {

struct fault_runtime : public process_sandbox_runtime {
    explicit fault_runtime(const runtime_options &options);

    std::shared_ptr<sandbox_handle> acquire(const resource_limits &limits) override;

    void release(sandbox_handle &handle) override;

    void copy_in(sandbox_handle &handle, const std::vector<submission_file> &files) override;

    spawned_process spawn(sandbox_handle &handle, const spawn_request &request) override;

    /**
     * @brief 已经创建但还没有销毁的沙箱数
     */
    std::size_t live_sandboxes();

    /**
     * @brief 剩余多少次 acquire 抛出 provisioning_error
     */
    std::atomic<int> fail_acquire{0};

    /**
     * @brief 剩余多少次 copy_in 抛出 sandbox_error
     */
    std::atomic<int> fail_copy_in{0};

    /**
     * @brief 剩余多少次 release 在销毁沙箱后抛出 sandbox_error
     */
    std::atomic<int> fail_release{0};

    /**
     * @brief 第几次 spawn（从 1 开始计数）抛出 sandbox_error，0 表示不注入
     */
    std::atomic<int> fail_spawn_at{0};

    std::atomic<int> acquired{0};
    std::atomic<int> released{0};
    std::atomic<int> spawned{0};

private:
    std::mutex mut;
    std::set<std::string> live;
};

}  // namespace grader::test
