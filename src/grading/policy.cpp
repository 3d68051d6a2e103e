#include "grading/policy.hpp"
#include <fmt/core.h>
#include <stdexcept>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;

bool is_visible(feedback_visibility visibility, bool passed) {
    switch (visibility) {
        case feedback_visibility::ALWAYS:
            return true;
        case feedback_visibility::ON_FAILURE:
            return !passed;
        case feedback_visibility::NEVER:
        default:
            return false;
    }
}

/**
 * @brief 超时、资源超限的命令一定不能通过
 */
static bool check_termination(const command_result &result, vector<string> &feedback) {
    if (result.timed_out) {
        feedback.push_back(fmt::format("Timed out after {:.2f} seconds", result.wall_time));
        return false;
    }
    if (result.resource_killed) {
        feedback.push_back("Killed for exceeding resource limits");
        return false;
    }
    return true;
}

static bool check_return_code(expected_return_code expected, const command_result &result, vector<string> &feedback) {
    switch (expected) {
        case expected_return_code::ZERO:
            if (result.exit_status == 0) return true;
            feedback.push_back(fmt::format("Expected return code 0, got {}", result.exit_status));
            return false;
        case expected_return_code::NONZERO:
            if (result.exit_status != 0) return true;
            feedback.push_back("Expected a nonzero return code, got 0");
            return false;
        case expected_return_code::NONE:
        default:
            return true;
    }
}

static bool check_match(const output_match &match, const string &actual, bool truncated, const char *stream, vector<string> &feedback) {
    bool ok;
    switch (match.type) {
        case output_match::mode::EXACT:
            ok = !truncated && actual == match.expected;
            break;
        case output_match::mode::PATTERN:
            try {
                ok = boost::regex_search(actual, *match.pattern);
            } catch (std::runtime_error &e) {
                // 超出匹配复杂度上限，视为不匹配
                feedback.push_back(fmt::format("{} is too complex to match against the pattern {}: {}", stream, match.expected, e.what()));
                return false;
            }
            break;
        case output_match::mode::NONE:
        default:
            return true;
    }
    if (!ok) {
        if (match.type == output_match::mode::EXACT)
            feedback.push_back(fmt::format("{} did not match the expected output\n{}", stream,
                                           format_diff(compare_output(match.expected, actual, {}))));
        else
            feedback.push_back(fmt::format("{} did not match the pattern {}", stream, match.expected));
        if (truncated) feedback.push_back(fmt::format("{} was truncated", stream));
    }
    return ok;
}

static step_outcome make_outcome(const step_common &step, const command_result &result, bool passed, int deduction, const vector<string> &feedback) {
    step_outcome outcome;
    outcome.name = step.name;
    outcome.result = result;
    outcome.passed = passed;
    outcome.points_possible = step.points;
    outcome.points_awarded = passed ? step.points : -deduction;
    outcome.visible = is_visible(step.feedback, passed);
    for (auto &line : feedback) {
        if (!outcome.feedback_text.empty()) outcome.feedback_text += '\n';
        outcome.feedback_text += line;
    }
    return outcome;
}

static step_outcome judge(const compile_step &step, const command_result &result, const artifact_lookup &lookup) {
    vector<string> feedback;
    bool passed = check_termination(result, feedback);
    if (passed && result.exit_status != 0) {
        feedback.push_back(fmt::format("Compilation failed with return code {}", result.exit_status));
        passed = false;
    }
    if (passed) {
        for (auto &artifact : step.artifacts) {
            // 编译没有生成可执行文件是学生的评测结果，不是错误
            bool exists;
            try {
                exists = lookup(artifact).has_value();
            } catch (file_too_large_error &) {
                exists = true;
            }
            if (!exists) {
                feedback.push_back("Missing artifact " + artifact);
                passed = false;
            }
        }
    }
    if (passed) feedback.push_back("Compilation succeeded");
    return make_outcome(step, result, passed, 0, feedback);
}

static step_outcome judge(const test_step &step, const command_result &result, const artifact_lookup &) {
    vector<string> feedback;
    bool passed = check_termination(result, feedback);
    passed = check_return_code(step.return_code, result, feedback) && passed;
    passed = check_match(step.stdout_match, result.stdout_text, result.stdout_truncated, "stdout", feedback) && passed;
    passed = check_match(step.stderr_match, result.stderr_text, result.stderr_truncated, "stderr", feedback) && passed;
    if (passed) feedback.push_back("Passed");
    return make_outcome(step, result, passed, step.deduction, feedback);
}

static step_outcome judge(const diff_step &step, const command_result &result, const artifact_lookup &lookup) {
    vector<string> feedback;
    bool passed = check_termination(result, feedback);

    optional<string> actual;
    if (step.output_file.empty()) {
        actual = result.stdout_text;
        if (result.stdout_truncated) {
            feedback.push_back("stdout was truncated");
            passed = false;
        }
    } else {
        try {
            actual = lookup(step.output_file);
            if (!actual) feedback.push_back("Output file " + step.output_file + " was not produced");
        } catch (file_too_large_error &e) {
            feedback.push_back(fmt::format("Output file {} is larger than {} bytes", step.output_file, e.limit));
        }
    }

    if (actual) {
        diff_result diff = compare_output(step.expected, *actual, step.options);
        if (!diff.identical) {
            feedback.push_back("Output differs from the expected output\n" + format_diff(diff));
            passed = false;
        }
    } else {
        passed = false;
    }
    if (passed) feedback.push_back("Output matches");
    return make_outcome(step, result, passed, step.deduction, feedback);
}

step_outcome judge_step(const step_config &step, const command_result &result, const artifact_lookup &lookup) {
    return visit([&](auto &s) { return judge(s, result, lookup); }, step);
}

step_outcome skipped_step(const step_config &step, const string &reason) {
    auto &common = common_of(step);
    step_outcome outcome;
    outcome.name = common.name;
    outcome.skipped = true;
    outcome.passed = false;
    outcome.points_possible = common.points;
    outcome.points_awarded = 0;
    outcome.feedback_text = reason;
    outcome.visible = is_visible(common.feedback, false);
    return outcome;
}

}  // namespace grader
