#pragma once

#include <sys/types.h>
#include <cstdint>
#include <string>
#include <vector>
#include "common/exceptions.hpp"

struct cgroup;
struct cgroup_controller;

namespace grader {

/**
 * @brief libcgroup 调用失败
 * 沙箱运行时会将其转换为 provisioning_error 或 sandbox_error
 */
struct cgroup_exception : public grader_exception {
    cgroup_exception(const std::string &cgroup_op, int err);

    static void ensure(const std::string &cgroup_op, int err);
};

/**
 * @brief 表示一个 cgroup 的 controller
 * 
 * 沙箱使用的 controller 有：
 * 1. memory - 对 cgroup 中的任务可用内存做出限制，并且自动生成任务占用内存资源报告
 * 2. pids - 限制 cgroup 中的进程数量，防止 fork 炸弹
 * 3. cpuacct - 自动生成 cgroup 中任务占用 CPU 资源的报告
 * 
 * https://access.redhat.com/documentation/zh-cn/red_hat_enterprise_linux/7/html/resource_management_guide/ch-subsystems_and_tunable_parameters
 */
struct cgroup_ctrl {
    struct cgroup_controller *ctrl;

    /**
     * @brief 为 controller 添加设定
     */
    void add_value(const std::string &name, int64_t value);
};

/**
 * @brief 创建指定 cgroup 的管理器
 * 在析构时释放内存以确保没有内存泄漏
 */
struct cgroup_guard {
    /**
     * @brief 构造函数，调用 libcgroup 的创建函数
     * @param cgroup_name cgroup 的内核名称
     */
    explicit cgroup_guard(const std::string &cgroup_name);

    cgroup_guard(const cgroup_guard &) = delete;

    /**
     * @brief 析构函数，调用 libcgroup 的释放函数
     */
    ~cgroup_guard();

    /**
     * @brief 在内核中创建这个 cgroup
     * cgroup_guard 在创建时只会记录 cgroup 的信息，而不会对内核中存储的 cgroup
     * 进行修改。通过 create_cgroup 能真正在内核中创建这个 cgroup。
     * 这里将 add_controller 函数、add_value 函数添加的数据也写入内核中。
     */
    void create_cgroup(int ignore_ownership);

    /**
     * @brief 创建一个新的 controller
     * @param name 控制器的名称，如 "memory"
     * @throw cgroup_exception 当创建失败时
     */
    cgroup_ctrl add_controller(const std::string &name);

    /**
     * 从内核中读入 cgroup 的所有信息。
     */
    void get_cgroup();

    /**
     * @brief 将指定进程移入本 cgroup 的所有 controller
     */
    void attach_task_pid(pid_t pid);

    /**
     * @brief 从内核中删除这个 cgroup。
     * 所有的进程都会被移入上一层的 cgroup。所有的子 cgroup 都会被删除。
     */
    void delete_cgroup();

    static void init();

private:
    struct cgroup *cg;
};

/**
 * @brief 列出 cgroup 中指定 controller 下的所有进程
 */
std::vector<pid_t> cgroup_tasks(const std::string &cgroup_name, const std::string &controller);

}  // namespace grader
