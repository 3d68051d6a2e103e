#pragma once

#include <sys/resource.h>
#include <filesystem>
#include <functional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>
#include "sandbox/sandbox.hpp"

namespace grader {

/**
 * @brief 子进程在 exec 之前需要完成的设置
 * 评测进程是多线程的，fork 之后子进程中只能调用异步信号安全的函数，
 * 因此所有需要分配内存的准备工作（参数数组、环境变量、可执行文件路径）
 * 都在 fork 之前完成。
 */
struct child_setup {
    std::vector<std::string> argv;

    /**
     * @brief 子进程的完整环境变量，格式为 KEY=VALUE
     */
    std::vector<std::string> env;

    /**
     * @brief 子进程的工作目录（宿主机上的绝对路径）
     */
    std::filesystem::path work_dir;

    /**
     * @brief 需要设置的 rlimit，(资源, 软限制, 硬限制)
     */
    std::vector<std::tuple<int, rlim_t, rlim_t>> rlimits;

    /**
     * @brief 是否将子进程移入新的网络命名空间以禁止访问网络
     */
    bool isolate_network = false;

    int user_id = -1;
    int group_id = -1;
};

/**
 * @brief 根据 resource_limits 生成 rlimit 设置
 * @param include_memory 是否通过 RLIMIT_AS 限制内存，使用 cgroup 时内存由 cgroup 限制
 * @param include_nproc 是否通过 RLIMIT_NPROC 限制进程数，该限制按用户计数，只有切换了运行用户时才有意义
 */
std::vector<std::tuple<int, rlim_t, rlim_t>> make_rlimits(const resource_limits &limits, bool include_memory, bool include_nproc);

/**
 * @brief 生成子进程的环境变量
 * 不继承评测进程的环境变量，只保留 PATH，再附加命令自己的环境变量
 */
std::vector<std::string> make_environment(const std::vector<std::string> &extra);

/**
 * @brief 在环境变量 PATH 中查找可执行文件
 * 若 program 包含 '/' 或者找不到，原样返回，交给 execve 处理
 */
std::string resolve_executable(const std::string &program, const std::vector<std::string> &env);

/**
 * @brief 启动子进程
 * 子进程会在 before_start 执行完毕后才开始设置自身并 exec，
 * 用于在学生代码运行前把子进程放入 cgroup。
 * @param before_start 在子进程开始运行前调用，参数为子进程 pid
 * @throw sandbox_error 若子进程的设置失败
 */
spawned_process fork_child(const child_setup &setup, const std::function<void(pid_t)> &before_start);

}  // namespace grader
