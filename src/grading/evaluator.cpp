#include "grading/evaluator.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "grading/policy.hpp"

namespace grader {
using namespace std;

evaluator::evaluator(sandbox_runtime &runtime, command_executor &executor)
    : runtime(runtime), executor(executor) {}

/**
 * @brief 若依赖的步骤有未通过的，返回第一个未通过的步骤下标
 */
static optional<size_t> failed_dependency(const step_common &step, const vector<step_outcome> &outcomes) {
    for (size_t dep : step.dependencies)
        if (!outcomes[dep].passed) return dep;
    return nullopt;
}

grading_result evaluator::evaluate(sandbox_handle &handle, const grading_config &config,
                                   const vector<submission_file> &files,
                                   const atomic<bool> &cancelled) const {
    grading_result result;
    result.grading_config_id = config.id;
    result.max_points = config.max_points;
    result.status = grading_status::COMPLETED;

    elapsed_time timer;
    auto skip_rest = [&](size_t from, const string &reason) {
        for (size_t j = from; j < config.steps.size(); ++j)
            result.steps.push_back(skipped_step(config.steps[j], reason));
    };

    // 读取学生程序写出的文件时使用当前步骤的输出限制
    int64_t artifact_limit = -1;
    artifact_lookup lookup = [&](const string &path) -> optional<string> {
        try {
            return runtime.copy_out(handle, {path}, artifact_limit).at(path);
        } catch (not_found_error &) {
            return nullopt;
        }
    };

    try {
        vector<submission_file> all_files = files;
        all_files.insert(all_files.end(), config.files.begin(), config.files.end());
        runtime.copy_in(handle, all_files);

        for (size_t i = 0; i < config.steps.size(); ++i) {
            if (cancelled) {
                LOG(INFO) << "Grading of config " << config.id << " cancelled before step " << i;
                result.status = grading_status::CANCELLED;
                skip_rest(i, "Grading was cancelled");
                break;
            }

            auto &step = common_of(config.steps[i]);
            if (auto dep = failed_dependency(step, result.steps)) {
                DLOG(INFO) << "Skipping step " << step.name << " since " << result.steps[*dep].name << " did not pass";
                result.steps.push_back(skipped_step(config.steps[i], "Skipped because " + result.steps[*dep].name + " did not pass"));
                continue;
            }

            command cmd;
            cmd.argv = step.argv;
            cmd.working_dir = step.working_dir;
            cmd.input = step.input;
            cmd.env = step.env;
            cmd.limits = step.limits;

            // 步骤的墙上时间不能超过剩余的总时间预算
            bool budget_bound = false;
            if (config.time_limit >= 0) {
                double remaining = config.time_limit - timer.seconds();
                if (remaining <= 0) {
                    LOG(WARNING) << "Time budget of config " << config.id << " exhausted before step " << step.name;
                    result.status = grading_status::TIMED_OUT;
                    skip_rest(i, "Total time limit exceeded");
                    break;
                }
                double step_wall = handle.limits.tighten(step.limits).wall_time;
                if (step_wall < 0 || remaining < step_wall) {
                    cmd.limits.wall_time = remaining;
                    budget_bound = true;
                }
            }

            DLOG(INFO) << "Running step " << step.name << " in sandbox " << handle.id;
            command_result cmd_result = executor.run(handle, cmd);
            artifact_limit = executor.output_limit(handle, cmd.limits);
            result.steps.push_back(judge_step(config.steps[i], cmd_result, lookup));

            if (cmd_result.timed_out && budget_bound) {
                LOG(WARNING) << "Time budget of config " << config.id << " exhausted during step " << step.name;
                result.status = grading_status::TIMED_OUT;
                skip_rest(i + 1, "Total time limit exceeded");
                break;
            }

            // 取消请求会杀死沙箱中的进程，正在执行的步骤的结果已经不可信
            if (cancelled) {
                LOG(INFO) << "Grading of config " << config.id << " cancelled during step " << step.name;
                result.status = grading_status::CANCELLED;
                skip_rest(i + 1, "Grading was cancelled");
                break;
            }
        }
    } catch (infrastructure_error &ex) {
        LOG(ERROR) << "Infrastructure error while grading config " << config.id << " in sandbox " << handle.id << ": " << ex;
        result.status = grading_status::INFRASTRUCTURE_ERROR;
        result.error_log = ex.what();
        skip_rest(result.steps.size(), "Not run because of an infrastructure error");
    }

    result.total_points = total_points(result.steps, config.max_points);
    return result;
}

}  // namespace grader
