#pragma once

#include <filesystem>
#include "scheduler/submission_store.hpp"

namespace grader::server {

/**
 * @brief 从本地目录读取提交和评测配置
 * 
 * config_dir
 * └── <grading_config_id>.json // 评测配置
 * 
 * submission_dir
 * └── <submission_id>
 *     ├── submission.json // 提交信息，可以为空对象
 *     └── files // 学生提交的文件，按原目录结构拷贝进沙箱
 * 
 * submission.json 中可以用 "files" 数组补充文件，格式与评测配置的 files 相同。
 */
struct directory_submission_store : public submission_store {
    directory_submission_store(const std::filesystem::path &config_dir,
                               const std::filesystem::path &submission_dir);

    grading_config load_config(const std::string &config_id) override;

    submission load_submission(const std::string &submission_id) override;

private:
    std::filesystem::path config_dir, submission_dir;
};

}  // namespace grader::server
