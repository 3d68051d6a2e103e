#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace grader {

/**
 * @brief 看门狗线程
 * 所有的超时（命令超时、提交总时间超时、排队超时）都由一个独立于
 * 执行路径的线程来触发，这样挂起或者恶意的学生进程无法阻止自己超时。
 *
 * 回调在看门狗线程中执行，必须尽快返回，且不能在回调中调用 cancel。
 */
struct watchdog {
    using clock = std::chrono::steady_clock;
    using timer_id = std::uint64_t;

    watchdog();

    /**
     * @brief 停止看门狗线程，未触发的定时器将被丢弃
     */
    ~watchdog();

    watchdog(const watchdog &) = delete;
    watchdog &operator=(const watchdog &) = delete;

    /**
     * @brief 注册一个在 deadline 触发的定时器
     * @return 定时器编号，用于取消
     */
    timer_id schedule(clock::time_point deadline, std::function<void()> callback);

    /**
     * @brief 取消定时器
     * 如果回调正在执行，会阻塞到回调执行完毕，因此返回后可以安全地销毁回调引用的对象
     * @return true 若定时器在触发前被取消
     */
    bool cancel(timer_id id);

    /**
     * @brief 尚未触发的定时器数量
     */
    std::size_t pending();

private:
    void loop();

    std::multimap<clock::time_point, std::pair<timer_id, std::function<void()>>> timers;
    timer_id next_id = 1;
    timer_id running_id = 0;
    bool stopped = false;
    std::mutex mut;
    std::condition_variable cond;
    std::condition_variable finished;
    std::thread thd;
};

}  // namespace grader
