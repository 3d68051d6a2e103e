#pragma once

#include <string>
#include <vector>
#include "grading/config.hpp"
#include "sandbox/sandbox.hpp"

namespace grader {

/**
 * @brief 一份学生提交，评测引擎只读
 */
struct submission {
    std::string id;

    std::vector<submission_file> files;
};

/**
 * @brief 提交和评测配置的来源
 * 由外部的 web 层创建并校验，评测引擎只读取
 */
struct submission_store {
    virtual ~submission_store();

    /**
     * @brief 读取并校验评测配置
     * @throw not_found_error 若评测配置不存在
     * @throw config_error 若评测配置不合法
     */
    virtual grading_config load_config(const std::string &config_id) = 0;

    /**
     * @brief 读取提交的文件
     * @throw not_found_error 若提交不存在
     */
    virtual submission load_submission(const std::string &submission_id) = 0;
};

}  // namespace grader
