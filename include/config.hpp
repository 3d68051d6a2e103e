#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "scheduler/scheduler.hpp"

namespace grader {

/**
 * @brief 评测守护进程的配置文件
 * 
 * {
 *     "pools": [
 *         { "name": "default", "slots": 4, "queue_wait_limit": 600 },
 *         { "name": "gpu", "slots": 1 }
 *     ],
 *     "max_infrastructure_retries": 2,
 *     "provision_attempts": 3,
 *     "provision_backoff": 0.1,
 *     "io_timeout": 30,
 *     "cgroup_parent": "autograder"
 * }
 * 
 * 所有字段都可以省略，省略 pools 时只有一个名为 default 的资源池，
 * 省略 queue_wait_limit 时排队最多等待 600 秒。
 */
struct daemon_config {
    std::vector<pool_options> pools;

    /**
     * @brief 基础设施错误的自动重试次数
     */
    int max_infrastructure_retries = 2;

    provision_policy provisioning;

    /**
     * @brief 文件拷贝超时，单位为秒
     */
    double io_timeout = 30;

    std::string cgroup_parent = "autograder";
};

/**
 * @brief 是否为调试模式
 * 调试模式下允许以非 root 用户运行，此时只能使用 process 运行时
 */
extern bool DEBUG;

void from_json(const nlohmann::json &j, pool_options &pool);

void from_json(const nlohmann::json &j, daemon_config &config);

/**
 * @brief 读取守护进程配置，path 为空时返回默认配置
 * @throw std::invalid_argument 若配置文件格式不正确
 */
daemon_config load_daemon_config(const std::filesystem::path &path);

}  // namespace grader
