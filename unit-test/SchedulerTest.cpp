#include <algorithm>
#include <thread>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "results/aggregator.hpp"
#include "results/result_store.hpp"
#include "scheduler/scheduler.hpp"
#include "test/environment.hpp"
#include "test/fault_runtime.hpp"
#include "test/memory_store.hpp"
#include "test/recording_monitor.hpp"

using namespace std;
using namespace grader;

static const chrono::milliseconds WAIT_TIMEOUT(20000);

class SchedulerTest : public ::testing::Test {
protected:
    SchedulerTest()
        : sandbox_dir("scheduler-sandbox"),
          result_dir("scheduler-result"),
          runtime(make_options(sandbox_dir)),
          results(result_dir.path()),
          aggregator(results, 2),
          log(make_shared<test::recording_monitor::shared_log>()) {
        // 每个配置只有一个执行 argv 的步骤
        add_config("quick", {"true"});
        add_config("slow", {"sleep", "1"});
        add_config("fail", {"false"});
        for (auto &id : {"A", "B", "C"})
            store.add_submission({id, {{"main.sh", "echo hello", {}}}});
    }

    static runtime_options make_options(const test::temp_dir &dir) {
        runtime_options options;
        options.sandbox_dir = dir.path();
        return options;
    }

    void add_config(const string &id, const vector<string> &argv, int steps = 1) {
        grading_config config;
        config.id = id;
        config.max_points = steps;
        for (int i = 0; i < steps; ++i) {
            test_step step;
            step.name = "run " + to_string(i);
            step.argv = argv;
            step.return_code = expected_return_code::ZERO;
            step.points = 1;
            config.steps.push_back(step);
        }
        store.add_config(config);
    }

    unique_ptr<scheduler> make_scheduler(size_t slots, double queue_wait_limit = 600, int provision_attempts = 3) {
        return make_scheduler(slots, queue_wait_limit, provision_attempts, aggregator);
    }

    unique_ptr<scheduler> make_scheduler(size_t slots, double queue_wait_limit, int provision_attempts, result_aggregator &target, size_t retained_tickets = 1024) {
        scheduler_options options;
        options.retained_tickets = retained_tickets;
        pool_options pool;
        pool.name = "default";
        pool.slots = slots;
        pool.queue_wait_limit = queue_wait_limit;
        options.pools.push_back(pool);
        options.provisioning.attempts = provision_attempts;
        options.provisioning.backoff = chrono::milliseconds(1);

        auto sched = make_unique<scheduler>(options, runtime, store, target);
        sched->register_monitor(make_unique<test::recording_monitor>(log));
        return sched;
    }

    ticket_state state_of(scheduler &sched, ticket_id ticket) {
        auto status = sched.status(ticket);
        EXPECT_TRUE(status.has_value());
        return status ? status->state : ticket_state::QUEUED;
    }

    bool started(ticket_id ticket) {
        lock_guard<mutex> guard(log->mut);
        return any_of(log->started.begin(), log->started.end(), [&](const job_info &job) { return job.ticket == ticket; });
    }

    test::temp_dir sandbox_dir, result_dir;
    test::fault_runtime runtime;
    test::memory_store store;
    file_result_store results;
    result_aggregator aggregator;
    shared_ptr<test::recording_monitor::shared_log> log;
};

TEST_F(SchedulerTest, CompletedTest) {
    auto sched = make_scheduler(1);
    sched->start();
    ticket_id ticket = sched->enqueue("A", "quick");
    ASSERT_TRUE(sched->wait(ticket, WAIT_TIMEOUT));

    auto status = sched->status(ticket);
    ASSERT_TRUE(status);
    EXPECT_EQ(status->state, ticket_state::COMPLETED);
    EXPECT_EQ(status->attempts, 1);
    ASSERT_EQ(status->persisted_ids.size(), 1u);
    ASSERT_TRUE(status->result);
    EXPECT_EQ(status->result->total_points, 1);

    auto persisted = results.get("A", status->result->attempt);
    ASSERT_TRUE(persisted);
    EXPECT_EQ(persisted->id, status->persisted_ids[0]);
    EXPECT_EQ(runtime.live_sandboxes(), 0u);
}

TEST_F(SchedulerTest, FifoOrderTest) {
    auto sched = make_scheduler(1);
    ticket_id a = sched->enqueue("A", "quick");
    ticket_id b = sched->enqueue("B", "quick");
    ticket_id c = sched->enqueue("C", "quick");
    sched->start();
    ASSERT_TRUE(sched->wait(c, WAIT_TIMEOUT));
    ASSERT_TRUE(sched->wait(a, WAIT_TIMEOUT));
    ASSERT_TRUE(sched->wait(b, WAIT_TIMEOUT));

    lock_guard<mutex> guard(log->mut);
    ASSERT_EQ(log->started.size(), 3u);
    EXPECT_EQ(log->started[0].ticket, a);
    EXPECT_EQ(log->started[1].ticket, b);
    EXPECT_EQ(log->started[2].ticket, c);
}

TEST_F(SchedulerTest, CancelQueuedTest) {
    auto sched = make_scheduler(1);
    ticket_id a = sched->enqueue("A", "quick");
    ticket_id b = sched->enqueue("B", "quick");
    EXPECT_TRUE(sched->cancel(b));
    EXPECT_EQ(state_of(*sched, b), ticket_state::CANCELLED);

    sched->start();
    ASSERT_TRUE(sched->wait(a, WAIT_TIMEOUT));
    ASSERT_TRUE(sched->wait(b, WAIT_TIMEOUT));
    EXPECT_FALSE(started(b));
    EXPECT_EQ(sched->status(b)->attempts, 0);

    // 终止状态不能再取消
    EXPECT_FALSE(sched->cancel(a));
    EXPECT_FALSE(sched->cancel(b));
    EXPECT_EQ(state_of(*sched, a), ticket_state::COMPLETED);
}

TEST_F(SchedulerTest, CancelRunningTest) {
    auto sched = make_scheduler(1);
    add_config("very slow", {"sleep", "30"});
    sched->start();
    ticket_id ticket = sched->enqueue("A", "very slow");
    for (int i = 0; i < 200 && !started(ticket); ++i)
        this_thread::sleep_for(chrono::milliseconds(10));
    this_thread::sleep_for(chrono::milliseconds(200));

    elapsed_time timer;
    EXPECT_TRUE(sched->cancel(ticket));
    ASSERT_TRUE(sched->wait(ticket, WAIT_TIMEOUT));
    EXPECT_LT(timer.seconds(), 10);
    EXPECT_EQ(state_of(*sched, ticket), ticket_state::CANCELLED);
    EXPECT_EQ(runtime.live_sandboxes(), 0u);
}

TEST_F(SchedulerTest, SameSubmissionSerializedTest) {
    auto sched = make_scheduler(2);
    ticket_id first = sched->enqueue("A", "slow");
    ticket_id second = sched->enqueue("A", "slow");
    sched->start();
    ASSERT_TRUE(sched->wait(first, WAIT_TIMEOUT));
    ASSERT_TRUE(sched->wait(second, WAIT_TIMEOUT));

    lock_guard<mutex> guard(log->mut);
    vector<string> expected = {"start " + to_string(first), "end " + to_string(first),
                               "start " + to_string(second), "end " + to_string(second)};
    EXPECT_EQ(log->events, expected);
}

TEST_F(SchedulerTest, DifferentSubmissionsInParallelTest) {
    auto sched = make_scheduler(2);
    ticket_id a = sched->enqueue("A", "slow");
    ticket_id b = sched->enqueue("B", "slow");

    elapsed_time timer;
    sched->start();
    ASSERT_TRUE(sched->wait(a, WAIT_TIMEOUT));
    ASSERT_TRUE(sched->wait(b, WAIT_TIMEOUT));
    EXPECT_LT(timer.seconds(), 1.9);
}

TEST_F(SchedulerTest, QueueWaitTimeoutTest) {
    auto sched = make_scheduler(1, 0.5);
    add_config("very slow", {"sleep", "3"});
    ticket_id a = sched->enqueue("A", "very slow");
    ticket_id b = sched->enqueue("B", "quick");
    sched->start();

    ASSERT_TRUE(sched->wait(b, WAIT_TIMEOUT));
    auto status = sched->status(b);
    EXPECT_EQ(status->state, ticket_state::INFRASTRUCTURE_ERROR);
    EXPECT_EQ(status->attempts, 1);
    EXPECT_EQ(status->persisted_ids.size(), 1u);
    ASSERT_TRUE(status->result);
    EXPECT_FALSE(status->result->error_log.empty());
    EXPECT_FALSE(started(b));

    ASSERT_TRUE(sched->wait(a, WAIT_TIMEOUT));
    EXPECT_EQ(state_of(*sched, a), ticket_state::COMPLETED);
    EXPECT_EQ(results.results("B").size(), 1u);
}

TEST_F(SchedulerTest, RetryProvisioningFailureTest) {
    auto sched = make_scheduler(1, 600, 1);
    runtime.fail_acquire = 1;
    sched->start();
    ticket_id ticket = sched->enqueue("A", "quick");
    ASSERT_TRUE(sched->wait(ticket, WAIT_TIMEOUT));

    auto status = sched->status(ticket);
    EXPECT_EQ(status->state, ticket_state::COMPLETED);
    EXPECT_EQ(status->attempts, 2);
    EXPECT_EQ(status->persisted_ids.size(), 2u);

    auto history = results.results("A");
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].result.status, grading_status::INFRASTRUCTURE_ERROR);
    EXPECT_EQ(history[1].result.status, grading_status::COMPLETED);
    EXPECT_LT(history[0].result.attempt, history[1].result.attempt);
}

TEST_F(SchedulerTest, RetryLimitTest) {
    auto sched = make_scheduler(1, 600, 1);
    runtime.fail_acquire = 100;
    sched->start();
    ticket_id ticket = sched->enqueue("A", "quick");
    ASSERT_TRUE(sched->wait(ticket, WAIT_TIMEOUT));

    auto status = sched->status(ticket);
    EXPECT_EQ(status->state, ticket_state::INFRASTRUCTURE_ERROR);
    // 第一次评测加上两次重试
    EXPECT_EQ(status->attempts, 3);
    EXPECT_EQ(results.results("A").size(), 3u);
}

TEST_F(SchedulerTest, FaultInjectionNoLeakTest) {
    auto sched = make_scheduler(2, 600, 1);
    add_config("three steps", {"true"}, 3);
    sched->start();

    for (int step = 1; step <= 3; ++step) {
        runtime.spawned = 0;
        runtime.fail_spawn_at = step;
        ticket_id ticket = sched->enqueue("A", "three steps");
        ASSERT_TRUE(sched->wait(ticket, WAIT_TIMEOUT));
        EXPECT_EQ(runtime.live_sandboxes(), 0u) << "spawn failure at " << step;
        EXPECT_EQ(state_of(*sched, ticket), ticket_state::COMPLETED);
        EXPECT_EQ(sched->status(ticket)->attempts, 2);
    }

    runtime.fail_spawn_at = 0;
    runtime.fail_copy_in = 1;
    ticket_id ticket = sched->enqueue("B", "quick");
    ASSERT_TRUE(sched->wait(ticket, WAIT_TIMEOUT));
    EXPECT_EQ(state_of(*sched, ticket), ticket_state::COMPLETED);
    EXPECT_EQ(sched->status(ticket)->attempts, 2);

    sched->stop();
    EXPECT_EQ(runtime.live_sandboxes(), 0u);
    EXPECT_EQ(runtime.acquired.load(), runtime.released.load());
}

TEST_F(SchedulerTest, StudentFailureNotRetriedTest) {
    auto sched = make_scheduler(1);
    sched->start();
    ticket_id ticket = sched->enqueue("A", "fail");
    ASSERT_TRUE(sched->wait(ticket, WAIT_TIMEOUT));

    auto status = sched->status(ticket);
    EXPECT_EQ(status->state, ticket_state::COMPLETED);
    EXPECT_EQ(status->attempts, 1);
    EXPECT_EQ(status->result->total_points, 0);
}

TEST_F(SchedulerTest, MissingSubmissionTest) {
    auto sched = make_scheduler(1);
    sched->start();
    ticket_id ticket = sched->enqueue("missing", "quick");
    ASSERT_TRUE(sched->wait(ticket, WAIT_TIMEOUT));
    EXPECT_EQ(state_of(*sched, ticket), ticket_state::INFRASTRUCTURE_ERROR);
}

TEST_F(SchedulerTest, InvalidRequestTest) {
    auto sched = make_scheduler(1);
    EXPECT_THROW(sched->enqueue("A", "missing"), not_found_error);
    EXPECT_THROW(sched->enqueue("../A", "quick"), invalid_argument);

    grading_config config;
    config.id = "gpu";
    config.resource_class = "gpu";
    store.add_config(config);
    EXPECT_THROW(sched->enqueue("A", "gpu"), invalid_argument);

    EXPECT_FALSE(sched->status(12345).has_value());
    EXPECT_FALSE(sched->cancel(12345));
}

TEST_F(SchedulerTest, StopCancelsQueuedTest) {
    auto sched = make_scheduler(1);
    ticket_id a = sched->enqueue("A", "quick");
    ticket_id b = sched->enqueue("B", "quick");
    sched->stop();

    EXPECT_EQ(state_of(*sched, a), ticket_state::CANCELLED);
    EXPECT_EQ(state_of(*sched, b), ticket_state::CANCELLED);
    EXPECT_THROW(sched->enqueue("C", "quick"), runtime_error);
}

TEST_F(SchedulerTest, QueueWaitLimitRequiredTest) {
    EXPECT_DOUBLE_EQ(pool_options().queue_wait_limit, 600);
    EXPECT_THROW(make_scheduler(1, -1), invalid_argument);
    EXPECT_THROW(make_scheduler(1, 0), invalid_argument);
}

TEST_F(SchedulerTest, ReleaseFailureKeepsResultTest) {
    auto sched = make_scheduler(1);
    runtime.fail_release = 1;
    sched->start();
    ticket_id ticket = sched->enqueue("A", "quick");
    ASSERT_TRUE(sched->wait(ticket, WAIT_TIMEOUT));

    auto status = sched->status(ticket);
    ASSERT_TRUE(status);
    EXPECT_EQ(status->state, ticket_state::COMPLETED);
    EXPECT_EQ(status->attempts, 1);
    ASSERT_TRUE(status->result);
    EXPECT_EQ(status->result->total_points, 1);
    EXPECT_TRUE(status->result->flagged_for_review);
    EXPECT_EQ(runtime.live_sandboxes(), 0u);

    lock_guard<mutex> guard(log->mut);
    EXPECT_FALSE(log->errors.empty());
}

TEST_F(SchedulerTest, EvictFinishedTicketsTest) {
    auto sched = make_scheduler(1, 600, 3, aggregator, 1);
    sched->start();
    ticket_id a = sched->enqueue("A", "quick");
    ASSERT_TRUE(sched->wait(a, WAIT_TIMEOUT));
    ticket_id b = sched->enqueue("B", "quick");
    ASSERT_TRUE(sched->wait(b, WAIT_TIMEOUT));

    // 只保留最近一个结束的评测任务
    EXPECT_FALSE(sched->status(a).has_value());
    EXPECT_FALSE(sched->wait(a, chrono::milliseconds(10)));
    EXPECT_EQ(state_of(*sched, b), ticket_state::COMPLETED);

    // 被清除的评测任务仍然可以从结果存储中查询
    auto history = sched->results("A");
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].result.total_points, 1);

    ticket_id again = sched->enqueue("A", "quick");
    ASSERT_TRUE(sched->wait(again, WAIT_TIMEOUT));
    history = sched->results("A");
    ASSERT_EQ(history.size(), 2u);
    EXPECT_LT(history[0].result.attempt, history[1].result.attempt);
}

/**
 * 写入指定提交的结果时阻塞一段时间
 */
struct slow_result_store : public result_store {
    slow_result_store(result_store &inner, string slow_submission, chrono::milliseconds delay)
        : inner(inner), slow_submission(move(slow_submission)), delay(delay) {}

    string put(const grading_result &result) override {
        if (result.submission_id == slow_submission) this_thread::sleep_for(delay);
        return inner.put(result);
    }

    optional<persisted_result> get(const string &submission_id, int attempt) override {
        return inner.get(submission_id, attempt);
    }

    vector<persisted_result> results(const string &submission_id) override {
        return inner.results(submission_id);
    }

    int last_attempt(const string &submission_id) override {
        return inner.last_attempt(submission_id);
    }

private:
    result_store &inner;
    string slow_submission;
    chrono::milliseconds delay;
};

TEST_F(SchedulerTest, SlowExpiryDoesNotDelayDeadlinesTest) {
    slow_result_store slow(results, "B", chrono::milliseconds(3000));
    result_aggregator slow_aggregator(slow, 2);
    auto sched = make_scheduler(1, 0.5, 3, slow_aggregator);

    grading_config config;
    config.id = "sleepy";
    config.max_points = 1;
    test_step step;
    step.name = "sleep";
    step.argv = {"sleep", "10"};
    step.limits.wall_time = 1;
    step.points = 1;
    config.steps.push_back(step);
    store.add_config(config);

    elapsed_time timer;
    ticket_id a = sched->enqueue("A", "sleepy");
    ticket_id b = sched->enqueue("B", "quick");
    sched->start();

    // B 在队列中超时，写入结果很慢，A 的时间限制仍然要按时生效
    ASSERT_TRUE(sched->wait(a, WAIT_TIMEOUT));
    EXPECT_LT(timer.seconds(), 1.8);
    EXPECT_EQ(state_of(*sched, a), ticket_state::COMPLETED);
    EXPECT_EQ(sched->status(a)->result->total_points, 0);

    ASSERT_TRUE(sched->wait(b, WAIT_TIMEOUT));
    EXPECT_EQ(state_of(*sched, b), ticket_state::INFRASTRUCTURE_ERROR);
    EXPECT_FALSE(started(b));
    EXPECT_EQ(results.results("B").size(), 1u);
}
