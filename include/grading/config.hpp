#pragma once

#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <boost/regex.hpp>
#include <string>
#include <variant>
#include <vector>
#include "grading/output_diff.hpp"
#include "sandbox/limits.hpp"
#include "sandbox/sandbox.hpp"

namespace grader {

/**
 * @brief 步骤结果对学生的可见性
 */
enum class feedback_visibility {
    ALWAYS,
    ON_FAILURE,
    NEVER
};

/**
 * @brief 对命令退出码的要求
 */
enum class expected_return_code {
    NONE,
    ZERO,
    NONZERO
};

/**
 * @brief 对一个输出流的匹配要求
 */
struct output_match {
    enum class mode { NONE, EXACT, PATTERN };

    mode type = mode::NONE;

    /**
     * @brief 精确匹配的文本，或者正则表达式的原文
     */
    std::string expected;

    /**
     * @brief 加载配置时编译好的正则表达式，只在 PATTERN 模式下有效
     * boost::regex 的匹配不使用递归，且在匹配过于复杂时抛出异常，不会因为学生的输出过长而栈溢出
     */
    std::shared_ptr<const boost::regex> pattern;
};

/**
 * @brief 所有步骤共有的字段
 */
struct step_common {
    /**
     * @brief 步骤名，在一个评测配置中唯一
     */
    std::string name;

    std::vector<std::string> argv;

    std::string working_dir;

    /**
     * @brief 标准输入，也可以通过 stdin_file 从评测配置所在目录读取
     */
    std::string input;

    std::vector<std::string> env;

    /**
     * @brief 步骤的资源限制，只能收紧沙箱的限制
     */
    resource_limits limits;

    feedback_visibility feedback = feedback_visibility::ALWAYS;

    /**
     * @brief 若这些步骤没有通过，则跳过本步骤
     * 只能引用在本步骤之前的步骤，因此依赖关系不会成环
     */
    std::vector<std::string> skip_if_failed;

    /**
     * @brief skip_if_failed 对应的步骤下标，加载时计算
     */
    std::vector<std::size_t> dependencies;

    /**
     * @brief 步骤通过时获得的分数
     */
    int points = 0;
};

/**
 * @brief 编译步骤
 * 退出码为 0 且所有声明的产物都存在时视为通过
 */
struct compile_step : step_common {
    /**
     * @brief 编译后必须存在的文件
     */
    std::vector<std::string> artifacts;
};

/**
 * @brief 测试步骤，检查退出码以及 stdout、stderr 的精确或正则匹配
 */
struct test_step : step_common {
    expected_return_code return_code = expected_return_code::NONE;

    output_match stdout_match;

    output_match stderr_match;

    /**
     * @brief 步骤未通过时扣除的分数
     */
    int deduction = 0;
};

/**
 * @brief 差异比较步骤，将 stdout 或者命令生成的文件与期望内容逐行比较
 */
struct diff_step : step_common {
    std::string expected;

    /**
     * @brief 要比较的文件，为空时比较 stdout
     */
    std::string output_file;

    diff_options options;

    /**
     * @brief 步骤未通过时扣除的分数
     */
    int deduction = 0;
};

using step_config = std::variant<compile_step, test_step, diff_step>;

const step_common &common_of(const step_config &step);

/**
 * @brief 评测配置，评测开始后不可修改
 */
struct grading_config {
    std::string id;

    std::vector<step_config> steps;

    /**
     * @brief 总分上限，所有步骤得分之和不会超过该值
     */
    int max_points = 0;

    /**
     * @brief 所有步骤的总墙上时间预算，单位为秒，小于 0 表示不限制
     */
    double time_limit = -1;

    /**
     * @brief 使用的资源池
     */
    std::string resource_class = "default";

    /**
     * @brief 沙箱整体的资源限制
     */
    resource_limits sandbox;

    /**
     * @brief 评测前和学生文件一起拷贝进沙箱的文件，比如测试数据
     */
    std::vector<submission_file> files;
};

/**
 * @brief 解析并校验评测配置
 * @param base_dir 配置中引用的文件的相对路径的基准目录
 * @throw config_error 若配置不合法
 */
grading_config parse_grading_config(const nlohmann::json &j, const std::filesystem::path &base_dir = {});

/**
 * @brief 从文件加载评测配置，配置中的相对路径以配置文件所在目录为基准
 * @throw config_error 若文件无法读取或配置不合法
 */
grading_config load_grading_config(const std::filesystem::path &path);

}  // namespace grader
