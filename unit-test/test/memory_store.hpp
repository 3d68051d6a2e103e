#pragma once

#include <map>
#include <mutex>
#include "common/exceptions.hpp"
#include "scheduler/submission_store.hpp"

namespace grader::test {

/**
 * 测试用的提交来源，所有提交和评测配置都保存在内存中
 */
struct memory_store : public submission_store {
    grading_config load_config(const std::string &config_id) override {
        std::lock_guard<std::mutex> guard(mut);
        auto it = configs.find(config_id);
        if (it == configs.end()) throw not_found_error(config_id);
        return it->second;
    }

    submission load_submission(const std::string &submission_id) override {
        std::lock_guard<std::mutex> guard(mut);
        auto it = submissions.find(submission_id);
        if (it == submissions.end()) throw not_found_error(submission_id);
        return it->second;
    }

    void add_config(const grading_config &config) {
        std::lock_guard<std::mutex> guard(mut);
        configs[config.id] = config;
    }

    void add_submission(const submission &submit) {
        std::lock_guard<std::mutex> guard(mut);
        submissions[submit.id] = submit;
    }

private:
    std::mutex mut;
    std::map<std::string, grading_config> configs;
    std::map<std::string, submission> submissions;
};

}  // namespace grader::test
