#pragma once

#include <chrono>
#include <string>

namespace grader {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 生成一个随机的 uuid 字符串，用于沙箱名和结果记录编号
 */
std::string random_uuid();

/**
 * @brief 将秒数转换为 steady_clock 的时长
 */
std::chrono::steady_clock::duration seconds_to_duration(double seconds);

struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    /**
     * @brief 经过的时间，单位为秒
     */
    double seconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace grader
