#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <cstdint>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace grader {

/**
 * @brief 评测引擎所有异常的基类
 * 构造时会记录调用栈，通过 operator<< 输出到日志中便于排查基础设施问题
 */
struct grader_exception : std::exception {
    grader_exception();
    explicit grader_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const grader_exception &ex);

    const char *what() const noexcept override;

protected:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测基础设施出错（不是学生代码造成的）
 * 只有这一类错误会作为硬错误跨越组件边界传播，最终表现为
 * grading_status::INFRASTRUCTURE_ERROR，web 层会据此提示学生重新提交
 */
struct infrastructure_error : public grader_exception {
    infrastructure_error();
    explicit infrastructure_error(const std::string &message);
};

/**
 * @brief 沙箱无法创建或无法连接
 * 比如宿主机资源耗尽导致 cgroup 创建失败。调度器认为该错误可以重试
 */
struct provisioning_error : public infrastructure_error {
    provisioning_error();
    explicit provisioning_error(const std::string &message);
};

/**
 * @brief 已经获得的沙箱在使用过程中出错
 * 比如 fork 失败、文件拷贝失败、拷贝超时
 */
struct sandbox_error : public infrastructure_error {
    sandbox_error();
    explicit sandbox_error(const std::string &message);
};

/**
 * @brief 沙箱内找不到要求的文件
 * 比如编译没有生成可执行文件，评测器会把它当成学生的评测结果而非错误
 */
struct not_found_error : public grader_exception {
    explicit not_found_error(const std::string &path);

    const std::string path;
};

/**
 * @brief 从沙箱中读取的文件超过了大小限制
 * 学生程序写出的文件过大，同样是学生的评测结果
 */
struct file_too_large_error : public grader_exception {
    file_too_large_error(const std::string &path, std::int64_t limit);

    const std::string path;
    const std::int64_t limit;
};

/**
 * @brief 沙箱销毁后仍有进程存活
 * 这是资源泄漏，不能重试，需要运维人员介入
 */
struct leak_detected_error : public grader_exception {
    leak_detected_error(const std::string &sandbox_id, std::size_t survivors);

    const std::string sandbox_id;
    const std::size_t survivors;
};

/**
 * @brief 评测配置不合法，在加载评测配置时抛出
 */
struct config_error : public grader_exception {
    config_error();
    explicit config_error(const std::string &message);

    template <typename T>
    config_error operator<<(const T &t) const {
        return config_error(message + boost::lexical_cast<std::string>(t));
    }
};

}  // namespace grader
