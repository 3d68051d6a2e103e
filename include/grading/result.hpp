#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "executor/command.hpp"

namespace grader {

/**
 * @brief 一个步骤的评测结果
 */
struct step_outcome {
    std::string name;

    /**
     * @brief 命令执行结果，被跳过的步骤没有执行命令
     */
    command_result result;

    /**
     * @brief 是否满足步骤的所有要求，决定依赖本步骤的步骤是否被跳过
     */
    bool passed = false;

    /**
     * @brief 是否因为依赖的步骤没有通过或者时间预算用完而被跳过
     */
    bool skipped = false;

    /**
     * @brief 本步骤获得的分数，扣分时为负数
     */
    int points_awarded = 0;

    /**
     * @brief 本步骤的满分
     */
    int points_possible = 0;

    std::string feedback_text;

    /**
     * @brief 学生是否能看到本步骤的结果
     */
    bool visible = true;
};

/**
 * @brief 一次评测尝试的结果，持久化后不再修改
 */
struct grading_result {
    std::string submission_id;

    std::string grading_config_id;

    /**
     * @brief 第几次评测尝试，从 1 开始
     */
    int attempt = 0;

    std::vector<step_outcome> steps;

    /**
     * @brief 总分，在 [0, max_points] 范围内
     */
    int total_points = 0;

    int max_points = 0;

    grading_status status = grading_status::COMPLETED;

    /**
     * @brief 基础设施错误的说明，不会包含调用栈
     */
    std::string error_log;

    /**
     * @brief 沙箱销毁后仍有进程存活，需要人工检查本次评测
     */
    bool flagged_for_review = false;
};

/**
 * @brief 计算总分：所有步骤得分之和，限制在 [0, max_points] 内
 */
int total_points(const std::vector<step_outcome> &steps, int max_points);

void to_json(nlohmann::json &j, const step_outcome &outcome);
void from_json(const nlohmann::json &j, step_outcome &outcome);
void to_json(nlohmann::json &j, const grading_result &result);
void from_json(const nlohmann::json &j, grading_result &result);

}  // namespace grader
