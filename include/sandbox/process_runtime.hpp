#pragma once

#include <sys/types.h>
#include <map>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <vector>
#include "sandbox/sandbox.hpp"

namespace grader {

/**
 * @brief /proc/<pid>/stat 中与沙箱清理相关的字段
 */
struct process_entry {
    pid_t pid;
    pid_t ppid;
    pid_t pgrp;
    char state;
};

/**
 * @brief 扫描 /proc 获得当前所有进程
 * @throw sandbox_error 若 /proc 无法读取
 */
std::vector<process_entry> scan_processes();

/**
 * @brief 统计属于指定进程组且还没有退出的进程（不包括僵尸进程）
 */
std::size_t count_live_processes(const std::set<pid_t> &process_groups);

/**
 * @brief 不需要特权的沙箱运行时，用于调试和测试
 * 每个沙箱是一个独立的目录，每条命令运行在自己的进程组中，
 * 通过 rlimit 限制 CPU 时间、地址空间、文件大小。
 * 销毁沙箱时杀死所有进程组，并通过 /proc 确认没有进程存活。
 * 
 * 学生程序可以通过 setsid 逃出进程组。运行时将本进程设置为 child subreaper，
 * 逃出的进程在父进程退出后会被本进程收养，销毁沙箱时这些不属于任何存活命令的孤儿进程
 * 也会被杀死并回收。孤儿进程无法区分来自哪个沙箱，因此销毁任意沙箱都会清理所有孤儿进程，
 * 需要精确隔离时应当使用 cgroup_sandbox_runtime。
 */
struct process_sandbox_runtime : public sandbox_runtime {
    explicit process_sandbox_runtime(const runtime_options &options);

    std::string name() const override;

    std::shared_ptr<sandbox_handle> acquire(const resource_limits &limits) override;

    void release(sandbox_handle &handle) override;

    spawned_process spawn(sandbox_handle &handle, const spawn_request &request) override;

    void terminate(sandbox_handle &handle) override;

    /**
     * @brief 沙箱中仍然存活的进程数量
     */
    std::size_t live_processes(sandbox_handle &handle);

private:
    /**
     * @brief 杀死被本进程收养的孤儿进程，并回收已经退出的孤儿进程
     * 存活沙箱和 released_leaders 中的命令组长不是孤儿进程
     * @return 仍然存活的孤儿进程数量
     */
    std::size_t reap_orphans(const std::vector<process_entry> &processes, const std::set<pid_t> &released_leaders);

    std::mutex mut;

    /**
     * @brief 启动命令时持有共享锁，清理孤儿进程时持有独占锁
     */
    std::shared_mutex spawning;

    /**
     * @brief 每个存活沙箱中启动过的进程组
     */
    std::map<std::string, std::set<pid_t>> groups;
};

}  // namespace grader
