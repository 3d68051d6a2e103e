#pragma once

#include <map>
#include <mutex>
#include "sandbox/sandbox.hpp"

namespace grader {

/**
 * @brief 基于 cgroup 的沙箱运行时，需要 root 权限
 * 每个沙箱对应一个 cgroup（memory、pids、cpuacct），沙箱中的所有进程
 * 在开始运行前就被放入该 cgroup，因此无论进程如何 fork、setsid 都无法逃出。
 * 不允许访问网络时，进程运行在新的网络命名空间中。
 */
struct cgroup_sandbox_runtime : public sandbox_runtime {
    /**
     * @throw cgroup_exception 若 libcgroup 无法初始化
     */
    explicit cgroup_sandbox_runtime(const runtime_options &options);

    std::string name() const override;

    std::shared_ptr<sandbox_handle> acquire(const resource_limits &limits) override;

    void release(sandbox_handle &handle) override;

    spawned_process spawn(sandbox_handle &handle, const spawn_request &request) override;

    void terminate(sandbox_handle &handle) override;

    std::size_t oom_kill_count(sandbox_handle &handle) override;

private:
    std::string cgroup_name(const std::string &sandbox_id) const;

    /**
     * @brief 反复杀死 cgroup 中的所有进程，直到 cgroup 为空或超时
     * @return 仍然存活的进程数量
     */
    std::size_t kill_tasks(const std::string &cgroup, std::chrono::milliseconds timeout);

    std::mutex mut;

    /**
     * @brief 存活的沙箱编号到 cgroup 名的映射
     */
    std::map<std::string, std::string> cgroups;
};

}  // namespace grader
