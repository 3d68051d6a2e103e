#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>

namespace grader {

/**
 * @brief 沙箱或单个命令的资源限制
 * 所有数值字段小于 0 表示不限制
 */
struct resource_limits {
    /**
     * @brief CPU 时间限制，单位为秒
     */
    double cpu_time = -1;

    /**
     * @brief 墙上时间限制，单位为秒
     */
    double wall_time = -1;

    /**
     * @brief 内存限制，单位为字节
     */
    int64_t memory = -1;

    /**
     * @brief 同时存在的进程数限制
     */
    int proc_limit = -1;

    /**
     * @brief 捕获的 stdout、stderr 各自的最大字节数，超出部分会被截断
     */
    int64_t output_limit = -1;

    /**
     * @brief 单个文件的最大字节数
     */
    int64_t file_limit = -1;

    /**
     * @brief 是否允许访问网络
     */
    bool network = false;

    /**
     * @brief 将本限制（沙箱限制）与 step 的限制合并
     * 每一项取两者中更严格的值，因此 step 只能收紧沙箱的限制而不能放宽
     */
    resource_limits tighten(const resource_limits &step) const;
};

/**
 * @brief 取两个限制中更严格的一个，小于 0 表示不限制
 */
template <typename T>
T stricter_limit(T a, T b) {
    if (a < 0) return b;
    if (b < 0) return a;
    return a < b ? a : b;
}

void from_json(const nlohmann::json &j, resource_limits &limits);
void to_json(nlohmann::json &j, const resource_limits &limits);

}  // namespace grader
