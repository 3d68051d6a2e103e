#pragma once

#include <string>
#include <vector>

namespace grader {

/**
 * @brief 比较输出时忽略的差异
 */
struct diff_options {
    /**
     * @brief 忽略大小写
     */
    bool ignore_case = false;

    /**
     * @brief 忽略所有空白字符
     */
    bool ignore_whitespace = false;

    /**
     * @brief 忽略空白字符数量的变化，以及行尾的空白字符
     */
    bool ignore_whitespace_changes = false;

    /**
     * @brief 忽略空行
     */
    bool ignore_blank_lines = false;
};

struct diff_line {
    enum class kind { SAME, EXPECTED_ONLY, ACTUAL_ONLY };

    kind type;
    std::string text;
};

struct diff_result {
    bool identical = true;

    /**
     * @brief 逐行的差异，按照输出顺序排列
     * 输出过大时只包含第一处不同的行
     */
    std::vector<diff_line> lines;
};

/**
 * @brief 按行比较期望输出与实际输出
 */
diff_result compare_output(const std::string &expected, const std::string &actual, const diff_options &options);

/**
 * @brief 将差异格式化为 "- 期望"、"+ 实际"、"  相同" 的文本
 */
std::string format_diff(const diff_result &diff);

}  // namespace grader
