#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "grading/result.hpp"
#include "results/result_store.hpp"

namespace grader {

/**
 * @brief 将评测结果写入持久化存储，并决定基础设施错误是否需要自动重试
 */
struct result_aggregator {
    /**
     * @param store 结果存储
     * @param max_infrastructure_retries 基础设施错误最多额外重试的次数
     */
    result_aggregator(result_store &store, int max_infrastructure_retries = 2);

    /**
     * @brief 为一份提交分配新的尝试次数
     * 新的尝试次数大于所有已经持久化或者已经分配的尝试次数
     */
    int begin_attempt(const std::string &submission_id);

    /**
     * @brief 持久化一次评测尝试的结果
     * 以 (submission_id, attempt) 为键，重复调用不会产生重复的记录，返回已有记录的编号
     * @return 持久化记录的编号
     * @throw std::system_error 若写入失败
     */
    std::string finalize(const std::string &submission_id, int attempt, grading_result result);

    /**
     * @brief 基础设施错误时判断调度器是否应当重新排队
     * @param result 本次尝试的结果
     * @param retries 已经重试的次数
     */
    bool should_retry(const grading_result &result, int retries) const;

    /**
     * @brief 一份提交已经持久化的所有评测结果
     */
    std::vector<persisted_result> history(const std::string &submission_id);

private:
    result_store &results;
    const int max_infrastructure_retries;
    std::mutex mut;
    /**
     * @brief 已经分配但还没有持久化的最大尝试次数，持久化后删除
     */
    std::map<std::string, int> allocated;
};

}  // namespace grader
