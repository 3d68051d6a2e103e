#pragma once

#include <condition_variable>
#include <mutex>

namespace grader {

/**
 * @brief 计数信号量
 * 沙箱槽位池通过计数信号量来限制同时存活的沙箱数量
 */
struct counting_semaphore {
    explicit counting_semaphore(std::size_t count);

    /**
     * @brief 获取一个计数，没有可用计数时阻塞
     */
    void acquire();

    /**
     * @brief 归还一个计数
     */
    void release();

    /**
     * @brief 当前可用的计数
     */
    std::size_t available();

    /**
     * @brief 信号量的总容量
     */
    std::size_t capacity() const;

private:
    const std::size_t total;
    std::size_t count;
    std::mutex mut;
    std::condition_variable cond;
};

}  // namespace grader
