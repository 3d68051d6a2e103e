#pragma once

#include <chrono>
#include <memory>
#include <string>
#include "common/semaphore.hpp"
#include "sandbox/sandbox.hpp"

namespace grader {

/**
 * @brief 创建沙箱失败时的重试策略
 */
struct provision_policy {
    /**
     * @brief 最多尝试的次数
     */
    int attempts = 3;

    /**
     * @brief 第一次重试前等待的时间，之后每次翻倍
     */
    std::chrono::milliseconds backoff{100};
};

struct sandbox_pool;

/**
 * @brief 占用一个沙箱槽位的沙箱
 * 离开作用域时（包括异常）保证销毁沙箱并归还槽位
 */
struct scoped_sandbox {
    scoped_sandbox(sandbox_pool &pool, std::shared_ptr<sandbox_handle> handle);
    scoped_sandbox(scoped_sandbox &&other);
    scoped_sandbox(const scoped_sandbox &) = delete;
    ~scoped_sandbox();

    sandbox_handle &operator*() const;
    sandbox_handle *operator->() const;
    const std::shared_ptr<sandbox_handle> &handle() const;

    /**
     * @brief 销毁沙箱并归还槽位，可以重复调用
     * 无论销毁是否成功，槽位都会被归还
     * @throw leak_detected_error 若销毁后仍有进程存活
     * @throw sandbox_error 若销毁失败
     */
    void release();

private:
    sandbox_pool *pool;
    std::shared_ptr<sandbox_handle> sandbox;
};

/**
 * @brief 一个资源池的沙箱槽位
 * 通过计数信号量限制同时存活的沙箱数量，每个存活的沙箱占用一个槽位
 */
struct sandbox_pool {
    sandbox_pool(const std::string &name, sandbox_runtime &runtime, std::size_t slots, const provision_policy &policy = {});

    /**
     * @brief 等待空闲槽位并创建沙箱
     * 创建失败时按照退避策略重试
     * @throw provisioning_error 若重试次数用完仍然无法创建
     */
    scoped_sandbox acquire(const resource_limits &limits);

    const std::string &name() const;

    /**
     * @brief 空闲的槽位数量
     */
    std::size_t available();

    std::size_t capacity() const;

private:
    friend struct scoped_sandbox;

    void give_back(sandbox_handle &handle);

    const std::string pool_name;
    sandbox_runtime &rt;
    counting_semaphore slots;
    const provision_policy policy;
};

}  // namespace grader
