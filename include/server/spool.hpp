#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "scheduler/scheduler.hpp"

namespace grader::server {

/**
 * @brief 通过目录接收 web 层的评测请求
 * 
 * spool_dir
 * ├── requests // web 层写入的请求，按文件名顺序处理
 * ├── responses // 与请求同名的回复
 * └── processed // 处理完的请求
 * 
 * 请求格式：
 * {"action": "enqueue", "submission_id": "...", "grading_config_id": "..."}
 * {"action": "cancel", "ticket": 1}
 * {"action": "status", "ticket": 1}
 * {"action": "results", "submission_id": "..."}
 * 
 * 已经结束很久的 ticket 会被调度器丢弃，此时只能通过 results 查询持久化的评测结果。
 * 
 * web 层应该先写入临时文件（不以 .json 结尾）再重命名，避免读到写了一半的请求。
 */
struct spool {
    spool(const std::filesystem::path &spool_dir, scheduler &sched);

    /**
     * @brief 处理当前所有待处理的请求
     * @return 处理的请求数
     */
    std::size_t poll();

    /**
     * @brief 不断处理请求直到 stopping 为真
     */
    void run(const std::atomic<bool> &stopping, std::chrono::milliseconds interval);

    /**
     * @brief 处理一个请求，返回回复
     * 请求不合法时回复中包含 error 字段，不抛出异常
     */
    nlohmann::json handle(const nlohmann::json &request);

private:
    void process(const std::filesystem::path &request_path);

    std::filesystem::path requests_dir, responses_dir, processed_dir;
    scheduler &sched;
};

}  // namespace grader::server
