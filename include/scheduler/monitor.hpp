#pragma once

#include <cstdint>
#include <string>
#include "grading/result.hpp"

namespace grader {

enum class worker_state {
    IDLE,
    RUNNING,
    CRASHED,
    STOPPED
};

/**
 * @brief 一个评测任务的基本信息，用于监控上报
 */
struct job_info {
    std::uint64_t ticket;
    std::string submission_id;
    std::string grading_config_id;
    std::string pool;
    int attempt;
};

/**
 * @brief 执行监控行为
 * 所有方法都可能在工作线程中并发调用
 */
struct monitor {
    virtual ~monitor();

    /**
     * @brief 监控上报某个工作线程开始评测一个任务
     */
    virtual void start_job(int worker_id, const job_info &job);

    /**
     * @brief 监控上报某个工作线程完成了一个任务的一次评测尝试
     * @param persisted_id 持久化记录的编号，持久化失败时为空
     */
    virtual void end_job(int worker_id, const job_info &job, const grading_result &result, const std::string &persisted_id);

    /**
     * @brief 监控上报当前某个工作线程的状态
     * @param information 如果工作线程崩溃，则为错误原因，用于日志记录
     */
    virtual void worker_state_changed(const std::string &pool, int worker_id, worker_state state, const std::string &information);

    /**
     * @brief 上报需要运维人员处理的错误，比如沙箱进程泄漏
     */
    virtual void report_error(const std::string &message);
};

/**
 * @brief 将监控信息写入日志
 */
struct log_monitor : public monitor {
    void start_job(int worker_id, const job_info &job) override;
    void end_job(int worker_id, const job_info &job, const grading_result &result, const std::string &persisted_id) override;
    void worker_state_changed(const std::string &pool, int worker_id, worker_state state, const std::string &information) override;
    void report_error(const std::string &message) override;
};

}  // namespace grader
