#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "sandbox/limits.hpp"

namespace grader {

/**
 * @brief 在沙箱中执行的一条命令
 */
struct command {
    std::vector<std::string> argv;

    /**
     * @brief 相对于沙箱根目录的工作目录
     */
    std::string working_dir;

    /**
     * @brief 通过管道传给命令的标准输入
     */
    std::string input;

    /**
     * @brief 附加的环境变量，格式为 KEY=VALUE
     */
    std::vector<std::string> env;

    /**
     * @brief 命令自己的资源限制，会与沙箱的限制合并，只能更严格
     */
    resource_limits limits;
};

/**
 * @brief 命令的执行结果
 * 学生程序的所有异常行为（非零退出、崩溃、超时、资源超限）都记录在这里，而不是抛出异常
 */
struct command_result {
    /**
     * @brief 退出码，被信号杀死时为 128 + 信号
     */
    int exit_status = -1;

    /**
     * @brief 杀死进程的信号，正常退出时为 0
     */
    int signal = 0;

    std::string stdout_text;
    std::string stderr_text;

    /**
     * @brief 输出是否因为超过限制而被截断
     */
    bool stdout_truncated = false;
    bool stderr_truncated = false;

    /**
     * @brief 墙上时间，单位为秒
     */
    double wall_time = 0;

    /**
     * @brief 用户态与内核态 CPU 时间之和，单位为秒
     */
    double cpu_time = 0;

    /**
     * @brief 内存峰值，单位为字节
     */
    int64_t memory = 0;

    /**
     * @brief 是否因为超出墙上时间限制而被杀死
     */
    bool timed_out = false;

    /**
     * @brief 是否因为超出内存或 CPU 等资源限制而被杀死
     */
    bool resource_killed = false;
};

void to_json(nlohmann::json &j, const command_result &result);
void from_json(const nlohmann::json &j, command_result &result);

}  // namespace grader
