#pragma once

#include <functional>
#include <optional>
#include <string>
#include "executor/command.hpp"
#include "grading/config.hpp"
#include "grading/result.hpp"

namespace grader {

/**
 * @brief 读取沙箱中的文件，文件不存在时返回 std::nullopt
 */
using artifact_lookup = std::function<std::optional<std::string>(const std::string &path)>;

/**
 * @brief 根据步骤的匹配要求和分数设置评判命令的执行结果
 * 步骤是否通过与之前步骤的得分无关
 * @param step 步骤配置
 * @param result 命令执行结果
 * @param lookup 用于检查编译产物以及读取 diff 步骤的输出文件，文件过大时抛出 file_too_large_error
 */
step_outcome judge_step(const step_config &step, const command_result &result, const artifact_lookup &lookup);

/**
 * @brief 生成被跳过步骤的结果
 */
step_outcome skipped_step(const step_config &step, const std::string &reason);

/**
 * @brief 根据可见性设置判断学生能否看到该步骤
 */
bool is_visible(feedback_visibility visibility, bool passed);

}  // namespace grader
