#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>

namespace grader {

/**
 * @brief 并发队列，写者读者模型，严格先进先出
 * 与普通的阻塞队列不同，出队时可以要求队头元素满足条件，
 * 队头不满足条件时整个队列都要等待，而不会让后面的元素插队。
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @brief 等待队头元素满足条件后将其弹出
     * ready 在队列锁内调用，可以带有副作用（比如占用资源），
     * 只有 ready 返回 true 时元素才会出队。
     * 外部条件变化时需要调用 notify_all 让等待的线程重新检查队头。
     * @param element 保存弹出的队头元素
     * @param ready 判断队头元素是否可以出队
     * @return false 若队列已经关闭
     */
    template <typename Pred>
    bool pop_front_if(T &element, Pred ready) {
        std::unique_lock<std::mutex> mlock(mut);
        while (!stopped && (q.empty() || !ready(q.front()))) cond.wait(mlock);
        if (stopped) return false;
        element = q.front();
        q.pop_front();
        return true;
    }

    /**
     * @brief 向队尾插入一个新元素
     * @return false 若队列已经关闭，元素不会入队
     */
    bool push(const T &value) {
        std::unique_lock<std::mutex> mlock(mut);
        if (stopped) return false;
        q.push_back(value);
        mlock.unlock();
        cond.notify_all();
        return true;
    }

    /**
     * @brief 删除所有满足条件的元素，不改变剩余元素的相对顺序
     * @return 被删除的元素
     */
    template <typename Pred>
    std::deque<T> remove_if(Pred pred) {
        std::deque<T> removed;
        {
            std::unique_lock<std::mutex> mlock(mut);
            for (auto it = q.begin(); it != q.end();) {
                if (pred(*it)) {
                    removed.push_back(*it);
                    it = q.erase(it);
                } else {
                    ++it;
                }
            }
        }
        if (!removed.empty()) cond.notify_all();
        return removed;
    }

    /**
     * @brief 唤醒所有等待的线程重新检查队头元素
     */
    void notify_all() {
        std::unique_lock<std::mutex> mlock(mut);
        cond.notify_all();
    }

    /**
     * @brief 关闭队列，之后 push 失败，pop_front_if 立即返回 false
     * @return 关闭时仍在队列中的元素
     */
    std::deque<T> close() {
        std::deque<T> rest;
        {
            std::unique_lock<std::mutex> mlock(mut);
            stopped = true;
            rest.swap(q);
        }
        cond.notify_all();
        return rest;
    }

    std::size_t size() {
        std::unique_lock<std::mutex> mlock(mut);
        return q.size();
    }

private:
    std::deque<T> q;
    bool stopped = false;
    std::mutex mut;
    std::condition_variable cond;
};

}  // namespace grader
