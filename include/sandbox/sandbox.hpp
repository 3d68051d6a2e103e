#pragma once

#include <sys/types.h>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "common/io_utils.hpp"
#include "sandbox/limits.hpp"

namespace grader {

/**
 * @brief 一个存活的隔离执行环境
 * 只能被一次评测独占，评测结束时（无论成功、失败还是崩溃）必须被销毁
 */
struct sandbox_handle {
    /**
     * @brief 沙箱编号，由运行时在 acquire 时分配
     */
    std::string id;

    /**
     * @brief 沙箱在宿主机上的根目录，学生文件会被拷贝到这里
     */
    std::filesystem::path root;

    /**
     * @brief 沙箱整体的资源限制
     */
    resource_limits limits;

    /**
     * @brief 沙箱是否已经被销毁，由运行时维护
     */
    bool released = false;
};

/**
 * @brief 需要拷贝进沙箱的文件
 * 若 source_path 非空，则从宿主机的该路径拷贝，否则写入 content
 */
struct submission_file {
    /**
     * @brief 在沙箱中的相对路径
     */
    std::string name;

    std::string content;

    std::filesystem::path source_path;
};

/**
 * @brief 在沙箱中启动一个进程的请求
 */
struct spawn_request {
    std::vector<std::string> argv;

    /**
     * @brief 附加的环境变量，格式为 KEY=VALUE
     */
    std::vector<std::string> env;

    /**
     * @brief 相对于沙箱根目录的工作目录，为空表示根目录
     */
    std::string working_dir;

    /**
     * @brief 已经与沙箱限制合并过的限制
     */
    resource_limits limits;
};

/**
 * @brief 已经启动的进程
 * 进程是一个新的进程组的组长，stdin/stdout/stderr 连接到这里的管道
 */
struct spawned_process {
    pid_t pid = -1;
    scoped_fd stdin_fd;
    scoped_fd stdout_fd;
    scoped_fd stderr_fd;
};

struct runtime_options {
    /**
     * @brief 所有沙箱目录的父目录
     */
    std::filesystem::path sandbox_dir;

    /**
     * @brief 拷贝文件进出沙箱的超时时间，与命令执行超时相互独立
     */
    std::chrono::milliseconds io_timeout{30000};

    /**
     * @brief 运行学生程序的用户和组，小于 0 表示不切换
     */
    int user_id = -1;
    int group_id = -1;

    /**
     * @brief 沙箱 cgroup 的父 cgroup 名
     */
    std::string cgroup_parent = "autograder";
};

/**
 * @brief 沙箱运行时适配器
 * 封装隔离环境的创建、销毁以及资源限制的实施。
 * 所有方法可以被多个工作线程并发调用，但同一个沙箱同时只会被一个工作线程使用，
 * 除了 terminate 可以由看门狗或者取消请求在其他线程调用。
 */
struct sandbox_runtime {
    explicit sandbox_runtime(const runtime_options &options);
    virtual ~sandbox_runtime();

    virtual std::string name() const = 0;

    /**
     * @brief 创建一个新的沙箱
     * @param limits 沙箱整体的资源限制
     * @throw provisioning_error 若隔离机制无法创建
     */
    virtual std::shared_ptr<sandbox_handle> acquire(const resource_limits &limits) = 0;

    /**
     * @brief 销毁沙箱，杀死沙箱内的所有进程并删除沙箱目录
     * 可以重复调用，已经销毁的沙箱不会有任何操作
     * @throw leak_detected_error 若杀死进程后仍有进程存活，此时沙箱仍被标记为已销毁
     */
    virtual void release(sandbox_handle &handle) = 0;

    /**
     * @brief 将文件拷贝到沙箱中
     * @throw sandbox_error 若拷贝失败或超时
     */
    virtual void copy_in(sandbox_handle &handle, const std::vector<submission_file> &files);

    /**
     * @brief 从沙箱中读取文件
     * @param max_bytes 每个文件的大小上限，负数表示不限制
     * @return 每个路径对应的文件内容
     * @throw not_found_error 若某个文件不存在
     * @throw file_too_large_error 若某个文件超过 max_bytes
     * @throw sandbox_error 若读取失败或超时
     */
    virtual std::map<std::string, std::string> copy_out(sandbox_handle &handle, const std::vector<std::string> &paths,
                                                        std::int64_t max_bytes = -1);

    /**
     * @brief 在沙箱中启动一个进程
     * 若可执行文件不存在，进程会以 127 退出，这属于学生程序的结果而非错误
     * @throw sandbox_error 若进程无法启动
     */
    virtual spawned_process spawn(sandbox_handle &handle, const spawn_request &request) = 0;

    /**
     * @brief 强制杀死沙箱内的所有进程，沙箱本身仍然可用
     */
    virtual void terminate(sandbox_handle &handle) = 0;

    /**
     * @brief 沙箱创建以来因内存不足被杀死的进程次数
     * 不支持统计的运行时返回 0
     */
    virtual std::size_t oom_kill_count(sandbox_handle &handle);

protected:
    /**
     * @brief 创建沙箱目录，若设置了运行用户则将目录所有者改为该用户
     * @throw provisioning_error 若目录无法创建
     */
    std::filesystem::path create_sandbox_dir(const std::string &id);

    /**
     * @brief 删除沙箱目录
     * @return false 若删除失败，错误已经记录到日志
     */
    bool remove_sandbox_dir(const sandbox_handle &handle);

    runtime_options options;
};

/**
 * @brief 根据名称创建沙箱运行时
 * @param name "cgroup" 或者 "process"
 * @throw std::invalid_argument 若名称不存在
 */
std::unique_ptr<sandbox_runtime> make_sandbox_runtime(const std::string &name, const runtime_options &options);

}  // namespace grader
