#pragma once

#include <atomic>
#include <vector>
#include "executor/executor.hpp"
#include "grading/config.hpp"
#include "grading/result.hpp"
#include "sandbox/sandbox.hpp"

namespace grader {

/**
 * @brief 在一个沙箱中按照评测配置依次执行所有步骤，得到评测结果
 * 
 * 学生文件只拷贝一次；步骤严格按照配置顺序执行，步骤是否被跳过只取决于
 * 配置中声明的 skip_if_failed。
 * 总时间预算用完后剩余的步骤被跳过，结果状态为 TIMED_OUT，已经完成的步骤的得分保留。
 * 基础设施出错时结果状态为 INFRASTRUCTURE_ERROR，同样保留已经完成的步骤。
 */
struct evaluator {
    evaluator(sandbox_runtime &runtime, command_executor &executor);

    /**
     * @brief 评测一份提交
     * @param handle 本次评测独占的沙箱
     * @param config 评测配置
     * @param files 学生提交的文件
     * @param cancelled 每个步骤结束后检查，为 true 时停止评测，结果状态为 CANCELLED
     * @return 评测结果，submission_id 和 attempt 由调用方填写
     */
    grading_result evaluate(sandbox_handle &handle, const grading_config &config,
                            const std::vector<submission_file> &files,
                            const std::atomic<bool> &cancelled) const;

private:
    sandbox_runtime &runtime;
    command_executor &executor;
};

}  // namespace grader
