#pragma once

#include <chrono>
#include "common/watchdog.hpp"
#include "executor/command.hpp"
#include "sandbox/sandbox.hpp"

namespace grader {

/**
 * @brief 在沙箱中执行单条命令，捕获输出、退出状态以及资源使用情况
 * 
 * 墙上时间限制由独立的看门狗线程实施：到期后看门狗直接杀死沙箱内的进程，
 * 执行路径本身从不依赖学生程序自行退出。
 * 命令的主进程退出后，整个进程组都会被杀死，剩余的输出在有限时间内读完。
 */
struct command_executor {
    /**
     * @param runtime 沙箱所属的运行时
     * @param dog 实施超时的看门狗
     * @param default_output_limit 没有配置输出限制时每个输出流捕获的最大字节数
     */
    command_executor(sandbox_runtime &runtime, watchdog &dog, int64_t default_output_limit = 64 << 20);

    /**
     * @brief 执行一条命令
     * 学生程序的异常行为都记录在返回值中
     * @throw sandbox_error 若沙箱无法启动命令或者读取输出失败
     */
    command_result run(sandbox_handle &handle, const command &cmd);

    /**
     * @brief 在沙箱中以给定的限制运行时，每个输出流最多捕获的字节数
     */
    std::int64_t output_limit(const sandbox_handle &handle, const resource_limits &limits) const;

private:
    sandbox_runtime &runtime;
    watchdog &dog;
    int64_t default_output_limit;
};

}  // namespace grader
