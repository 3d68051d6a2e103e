#pragma once

#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将 content 写入文件，文件已存在时覆盖
 * @throw std::system_error 若文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 是一个不会逃出父目录的相对路径
 * 这里用于确保计算目录时不会出现目录遍历攻击，由于评测系统
 * 运行时需要 root 权限，如果拿到的文件名是绝对路径或者包含 ".."，
 * 那么最后有可能导致系统重要文件被覆盖导致安全问题。
 * @param subpath 被检查的文件名
 * @return subpath 本身
 * @throw std::invalid_argument 若路径不安全
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 检查 subpath 是否是安全的相对路径，规则同 assert_safe_path
 */
bool is_safe_path(const std::string &subpath);

/**
 * @brief 持有一个文件描述符，析构时关闭
 */
struct scoped_fd {
    scoped_fd();
    explicit scoped_fd(int fd);
    scoped_fd(scoped_fd &&other);
    scoped_fd(const scoped_fd &) = delete;
    ~scoped_fd();

    scoped_fd &operator=(scoped_fd &&other);

    int get() const;

    /**
     * @brief 放弃所有权并返回文件描述符
     */
    int release();

    void reset(int fd = -1);

    explicit operator bool() const;

private:
    int fd;
};

}  // namespace grader
