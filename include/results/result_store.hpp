#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "grading/result.hpp"

namespace grader {

/**
 * @brief 持久化的评测结果
 */
struct persisted_result {
    /**
     * @brief 记录编号，同一次评测尝试重复写入时返回同一个编号
     */
    std::string id;

    grading_result result;
};

/**
 * @brief 评测结果的持久化存储，只追加，不修改
 * 以 (submission_id, attempt) 为键，第一个写入者获胜
 */
struct result_store {
    virtual ~result_store();

    /**
     * @brief 写入一次评测尝试的结果
     * 若该尝试已经存在结果，不做任何修改并返回已有记录的编号
     * @return 记录编号
     * @throw std::system_error 若写入失败
     */
    virtual std::string put(const grading_result &result) = 0;

    /**
     * @brief 读取一次评测尝试的结果
     */
    virtual std::optional<persisted_result> get(const std::string &submission_id, int attempt) = 0;

    /**
     * @brief 按照尝试次数从小到大返回一份提交的所有评测结果
     */
    virtual std::vector<persisted_result> results(const std::string &submission_id) = 0;

    /**
     * @brief 已经持久化的最大尝试次数，没有结果时返回 0
     */
    virtual int last_attempt(const std::string &submission_id) = 0;
};

/**
 * @brief 以文件保存评测结果，路径为 <root>/<submission>/attempt-<n>.json
 * 先写入临时文件再通过 link(2) 创建目标文件，link 在目标已存在时失败，
 * 因此并发写入同一次尝试时不需要加锁就能保证只有一个写入者成功。
 */
struct file_result_store : public result_store {
    explicit file_result_store(const std::filesystem::path &root);

    std::string put(const grading_result &result) override;

    std::optional<persisted_result> get(const std::string &submission_id, int attempt) override;

    std::vector<persisted_result> results(const std::string &submission_id) override;

    int last_attempt(const std::string &submission_id) override;

private:
    std::filesystem::path submission_dir(const std::string &submission_id) const;

    std::filesystem::path root;
};

}  // namespace grader
