#pragma once

#include <string>

namespace grader {

/**
 * @brief 表示一次评测尝试的最终状态
 */
enum class grading_status {
    /**
     * @brief 所有步骤都已执行（或因依赖不满足而跳过）
     * 编译失败、答案错误都属于这一状态，这是学生的正常评测结果
     */
    COMPLETED = 0,

    /**
     * @brief 所有步骤的总运行时间超出了提交的时间预算
     * 已经完成的步骤的得分仍然保留
     */
    TIMED_OUT = 1,

    /**
     * @brief 评测基础设施出错，与学生代码无关
     * web 层会据此提示学生重新提交
     */
    INFRASTRUCTURE_ERROR = 2,

    /**
     * @brief 评测被取消
     */
    CANCELLED = 3
};

/**
 * @brief 调度器中一个 ticket 的状态
 * 状态转移：QUEUED -> RUNNING -> {终止状态}，QUEUED 和 RUNNING 都可以直接转为 CANCELLED。
 * 终止状态不能再转移。
 */
enum class ticket_state {
    QUEUED = 0,
    RUNNING = 1,
    COMPLETED = 2,
    TIMED_OUT = 3,
    INFRASTRUCTURE_ERROR = 4,
    CANCELLED = 5
};

const char *get_display_message(grading_status stat);

const char *get_display_message(ticket_state state);

/**
 * @brief 将评测状态转换为对应的 ticket 终止状态
 */
ticket_state to_ticket_state(grading_status stat);

bool is_terminal(ticket_state state);

/**
 * @brief 解析 get_display_message 输出的状态字符串
 * @throw std::invalid_argument 若字符串不对应任何状态
 */
grading_status parse_grading_status(const std::string &str);

}  // namespace grader
