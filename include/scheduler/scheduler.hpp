#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/concurrent_queue.hpp"
#include "common/status.hpp"
#include "common/watchdog.hpp"
#include "executor/executor.hpp"
#include "grading/evaluator.hpp"
#include "results/aggregator.hpp"
#include "sandbox/pool.hpp"
#include "scheduler/monitor.hpp"
#include "scheduler/submission_store.hpp"

namespace grader {

using ticket_id = std::uint64_t;

/**
 * @brief 一个资源池的配置
 */
struct pool_options {
    std::string name;

    /**
     * @brief 沙箱槽位数，也是该资源池的工作线程数
     */
    std::size_t slots = 1;

    /**
     * @brief 排队等待的最长时间，单位为秒，必须为正数
     * 超时的任务被标记为基础设施错误
     */
    double queue_wait_limit = 600;
};

struct scheduler_options {
    std::vector<pool_options> pools;

    provision_policy provisioning;

    /**
     * @brief 最多保留多少个已经结束的 ticket 供 status 查询
     * 超过时最早结束的 ticket 被丢弃，之后只能通过 results 查询持久化的结果
     */
    std::size_t retained_tickets = 1024;
};

/**
 * @brief 一个 ticket 的状态快照
 */
struct ticket_status {
    ticket_id ticket = 0;
    std::string submission_id;
    std::string grading_config_id;
    std::string pool;
    ticket_state state = ticket_state::QUEUED;

    /**
     * @brief 已经完成的评测尝试次数
     */
    int attempts = 0;

    /**
     * @brief 每次评测尝试持久化记录的编号
     */
    std::vector<std::string> persisted_ids;

    bool cancel_requested = false;

    /**
     * @brief 最近一次评测尝试的结果
     */
    std::optional<grading_result> result;
};

void to_json(nlohmann::json &j, const ticket_status &status);

/**
 * @brief 评测任务调度器
 * 
 * 每个资源池有一个严格先进先出的队列和与槽位数相同的工作线程，资源池之间互不影响。
 * 同一份提交对同一个评测配置同时最多只有一次评测在进行：队头任务与正在评测的任务
 * 相同时整个队列等待，而不是让后面的任务插队。
 * 
 * ticket 的状态转移：QUEUED -> RUNNING -> {COMPLETED, TIMED_OUT, INFRASTRUCTURE_ERROR, CANCELLED}，
 * QUEUED 和 RUNNING 都可以转为 CANCELLED，终止状态不再转移。
 * 基础设施错误自动重试时 ticket 保持 RUNNING 并重新排到队尾。
 */
struct scheduler {
    scheduler(const scheduler_options &options, sandbox_runtime &runtime,
              submission_store &store, result_aggregator &aggregator);

    /**
     * @brief 停止所有工作线程
     */
    ~scheduler();

    scheduler(const scheduler &) = delete;
    scheduler &operator=(const scheduler &) = delete;

    /**
     * @brief 注册监控，必须在 start 之前调用
     */
    void register_monitor(std::unique_ptr<monitor> &&monitor);

    /**
     * @brief 启动所有资源池的工作线程
     */
    void start();

    /**
     * @brief 提交一个评测请求
     * 评测配置在这里加载并校验，评测开始后不再改变
     * @return 用于查询和取消的 ticket
     * @throw config_error 若评测配置不合法
     * @throw not_found_error 若评测配置不存在
     * @throw std::invalid_argument 若评测配置使用的资源池不存在
     * @throw std::runtime_error 若调度器已经停止
     */
    ticket_id enqueue(const std::string &submission_id, const std::string &grading_config_id);

    /**
     * @brief 尽力取消一个评测请求
     * 还在排队的请求直接移除，保证不会开始评测；正在评测的请求会销毁沙箱中的进程，
     * 但如果评测在取消生效前已经完成，结果仍然会被交付。
     * @return true 若 ticket 尚未进入终止状态
     */
    bool cancel(ticket_id ticket);

    /**
     * @brief 查询 ticket 的状态
     * @return std::nullopt 若 ticket 不存在或者已经被丢弃
     */
    std::optional<ticket_status> status(ticket_id ticket);

    /**
     * @brief 等待 ticket 进入终止状态
     * @return true 若 ticket 在超时前进入终止状态，false 若超时或者 ticket 不存在
     */
    bool wait(ticket_id ticket, std::chrono::milliseconds timeout);

    /**
     * @brief 按照尝试次数从小到大返回一份提交已经持久化的所有评测结果
     */
    std::vector<persisted_result> results(const std::string &submission_id);

    /**
     * @brief 停止接受新的请求，取消所有排队的请求，等待正在评测的请求完成
     */
    void stop();

private:
    struct job;
    struct pool_state;

    void worker_loop(pool_state &pool, int worker_id);
    void run_job(pool_state &pool, int worker_id, const std::shared_ptr<job> &j);
    void schedule_queue_timer(pool_state &pool, const std::shared_ptr<job> &j);
    void expire(pool_state &pool, const std::shared_ptr<job> &j);
    void expiry_loop();
    void persist_expired(const std::shared_ptr<job> &j);
    void finish(job &j, ticket_state state);
    grading_result infrastructure_failure(const job &j, const std::string &message) const;
    void call_monitor(int worker_id, const std::function<void(monitor &)> &callback);

    sandbox_runtime &runtime;
    submission_store &store;
    result_aggregator &aggregator;

    std::vector<std::unique_ptr<monitor>> monitors;
    std::map<std::string, std::unique_ptr<pool_state>> pools;

    const std::size_t retained_tickets;

    std::mutex mut;
    std::condition_variable changed;
    std::map<ticket_id, std::shared_ptr<job>> jobs;

    /**
     * @brief 按照结束顺序排列的已结束 ticket，用于丢弃最早结束的 ticket
     */
    std::deque<ticket_id> finished;

    /**
     * @brief 排队超时的任务，由 expirer 线程持久化，看门狗线程不做 I/O
     */
    concurrent_queue<std::shared_ptr<job>> expired;
    std::thread expirer;

    /**
     * @brief 正在评测的 (submission_id, grading_config_id)
     */
    std::set<std::pair<std::string, std::string>> running_keys;

    ticket_id next_ticket = 1;
    bool started = false;
    bool stopped = false;

    // 看门狗的定时器引用了上面的成员，因此看门狗最先析构
    watchdog dog;
    command_executor executor;
    evaluator eval;
};

}  // namespace grader
