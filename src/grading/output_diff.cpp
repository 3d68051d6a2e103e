#include "grading/output_diff.hpp"
#include <boost/algorithm/string.hpp>
#include <algorithm>

namespace grader {
using namespace std;

// 超过该规模时不计算最长公共子序列，只报告第一处不同
static const size_t MAX_LCS_CELLS = 4000000;

struct normalized_line {
    string key;
    string text;
};

static vector<normalized_line> normalize(const string &output, const diff_options &options) {
    vector<string> lines;
    boost::split(lines, output, boost::is_any_of("\n"));
    // 以换行结尾的输出会多出一个空行
    if (!lines.empty() && lines.back().empty()) lines.pop_back();

    vector<normalized_line> result;
    for (auto &line : lines) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        string key = line;
        if (options.ignore_case) boost::to_lower(key);
        if (options.ignore_whitespace) {
            key.erase(std::remove_if(key.begin(), key.end(), boost::is_space()), key.end());
        } else if (options.ignore_whitespace_changes) {
            boost::trim_right(key);
            vector<string> parts;
            boost::split(parts, key, boost::is_space(), boost::token_compress_on);
            key = boost::join(parts, " ");
        }
        if (options.ignore_blank_lines && boost::trim_copy(key).empty()) continue;
        result.push_back({key, line});
    }
    return result;
}

diff_result compare_output(const string &expected, const string &actual, const diff_options &options) {
    auto exp = normalize(expected, options);
    auto act = normalize(actual, options);
    size_t n = exp.size(), m = act.size();

    diff_result result;
    result.identical = n == m;
    for (size_t i = 0; result.identical && i < n; ++i)
        if (exp[i].key != act[i].key) result.identical = false;
    if (result.identical) return result;

    if ((n + 1) * (m + 1) > MAX_LCS_CELLS) {
        size_t i = 0;
        while (i < n && i < m && exp[i].key == act[i].key) ++i;
        if (i < n) result.lines.push_back({diff_line::kind::EXPECTED_ONLY, exp[i].text});
        if (i < m) result.lines.push_back({diff_line::kind::ACTUAL_ONLY, act[i].text});
        return result;
    }

    // lcs[i][j] 为 exp[i..] 与 act[j..] 的最长公共子序列长度
    vector<vector<unsigned>> lcs(n + 1, vector<unsigned>(m + 1, 0));
    for (size_t i = n; i-- > 0;)
        for (size_t j = m; j-- > 0;)
            lcs[i][j] = exp[i].key == act[j].key ? lcs[i + 1][j + 1] + 1 : max(lcs[i + 1][j], lcs[i][j + 1]);

    size_t i = 0, j = 0;
    while (i < n || j < m) {
        if (i < n && j < m && exp[i].key == act[j].key) {
            result.lines.push_back({diff_line::kind::SAME, act[j].text});
            ++i, ++j;
        } else if (i < n && (j == m || lcs[i + 1][j] >= lcs[i][j + 1])) {
            result.lines.push_back({diff_line::kind::EXPECTED_ONLY, exp[i].text});
            ++i;
        } else {
            result.lines.push_back({diff_line::kind::ACTUAL_ONLY, act[j].text});
            ++j;
        }
    }
    return result;
}

string format_diff(const diff_result &diff) {
    string text;
    for (auto &line : diff.lines) {
        switch (line.type) {
            case diff_line::kind::SAME:
                text += "  ";
                break;
            case diff_line::kind::EXPECTED_ONLY:
                text += "- ";
                break;
            case diff_line::kind::ACTUAL_ONLY:
                text += "+ ";
                break;
        }
        text += line.text;
        text += '\n';
    }
    return text;
}

}  // namespace grader
