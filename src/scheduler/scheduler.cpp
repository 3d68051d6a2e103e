#include "scheduler/scheduler.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <stdexcept>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "grading/policy.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

submission_store::~submission_store() = default;

void to_json(json &j, const ticket_status &status) {
    j = {{"ticket", status.ticket},
         {"submission_id", status.submission_id},
         {"grading_config_id", status.grading_config_id},
         {"pool", status.pool},
         {"state", get_display_message(status.state)},
         {"attempts", status.attempts},
         {"persisted_ids", status.persisted_ids},
         {"cancel_requested", status.cancel_requested}};
    if (status.result) j["result"] = *status.result;
}

/**
 * @brief 一个评测请求在调度器中的状态，除 cancel_requested 外都由 scheduler::mut 保护
 */
struct scheduler::job {
    ticket_id ticket;
    string submission_id;
    string config_id;
    grading_config config;
    string pool;

    ticket_state state = ticket_state::QUEUED;

    /**
     * @brief 是否在队列中等待，被取消或者排队超时的任务出队时直接丢弃
     */
    bool waiting = true;

    int attempts = 0;
    int retries = 0;
    vector<string> persisted_ids;
    optional<grading_result> result;

    atomic<bool> cancel_requested{false};

    /**
     * @brief 正在使用的沙箱，用于取消时杀死沙箱中的进程
     */
    shared_ptr<sandbox_handle> active;

    watchdog::timer_id queue_timer = 0;

    job_info info(int attempt) const {
        return {ticket, submission_id, config_id, pool, attempt};
    }
};

struct scheduler::pool_state {
    pool_options options;
    unique_ptr<sandbox_pool> sandboxes;
    concurrent_queue<shared_ptr<job>> queue;
    vector<thread> workers;
};

scheduler::scheduler(const scheduler_options &options, sandbox_runtime &runtime,
                     submission_store &store, result_aggregator &aggregator)
    : runtime(runtime), store(store), aggregator(aggregator), retained_tickets(options.retained_tickets),
      executor(runtime, dog), eval(runtime, executor) {
    for (auto &pool_opt : options.pools) {
        if (pool_opt.slots == 0) throw invalid_argument("Pool " + pool_opt.name + " has no slots");
        if (!(pool_opt.queue_wait_limit > 0)) throw invalid_argument("Pool " + pool_opt.name + " must have a positive queue wait limit");
        if (pools.count(pool_opt.name)) throw invalid_argument("Duplicate pool " + pool_opt.name);
        auto pool = make_unique<pool_state>();
        pool->options = pool_opt;
        pool->sandboxes = make_unique<sandbox_pool>(pool_opt.name, runtime, pool_opt.slots, options.provisioning);
        pools[pool_opt.name] = move(pool);
    }
}

scheduler::~scheduler() {
    stop();
}

void scheduler::register_monitor(unique_ptr<monitor> &&monitor) {
    monitors.push_back(move(monitor));
}

void scheduler::call_monitor(int worker_id, const function<void(monitor &)> &callback) {
    try {
        for (auto &monitor : monitors) callback(*monitor);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Worker " << worker_id << " has crashed when reporting monitoring information, " << ex.what();
    }
}

void scheduler::start() {
    {
        lock_guard<mutex> guard(mut);
        if (started || stopped) return;
        started = true;
    }
    for (auto &[name, pool] : pools) {
        for (size_t i = 0; i < pool->options.slots; ++i) {
            pool_state &p = *pool;
            int worker_id = (int)i;
            pool->workers.emplace_back([this, &p, worker_id] { worker_loop(p, worker_id); });
        }
        LOG(INFO) << "Started pool " << name << " with " << pool->options.slots << " worker(s)";
    }
    expirer = thread([this] { expiry_loop(); });
}

ticket_id scheduler::enqueue(const string &submission_id, const string &grading_config_id) {
    if (!is_safe_path(submission_id)) throw invalid_argument("Invalid submission id " + submission_id);

    auto j = make_shared<job>();
    j->submission_id = submission_id;
    j->config_id = grading_config_id;
    j->config = store.load_config(grading_config_id);

    auto it = pools.find(j->config.resource_class);
    if (it == pools.end())
        throw invalid_argument(fmt::format("Grading config {} uses unknown resource class {}", grading_config_id, j->config.resource_class));
    pool_state &pool = *it->second;
    j->pool = pool.options.name;

    {
        lock_guard<mutex> guard(mut);
        if (stopped) throw runtime_error("Scheduler has been stopped");
        j->ticket = next_ticket++;
        jobs[j->ticket] = j;
    }

    schedule_queue_timer(pool, j);
    if (!pool.queue.push(j)) {
        // stop 在入队前关闭了队列
        lock_guard<mutex> guard(mut);
        j->waiting = false;
        finish(*j, ticket_state::CANCELLED);
    }
    LOG(INFO) << "Enqueued ticket " << j->ticket << " (submission " << submission_id << ", config " << grading_config_id << ") into pool " << j->pool;
    return j->ticket;
}

void scheduler::schedule_queue_timer(pool_state &pool, const shared_ptr<job> &j) {
    weak_ptr<job> weak = j;
    auto deadline = watchdog::clock::now() + seconds_to_duration(pool.options.queue_wait_limit);
    auto timer = dog.schedule(deadline, [this, &pool, weak] {
        if (auto j = weak.lock()) expire(pool, j);
    });
    lock_guard<mutex> guard(mut);
    j->queue_timer = timer;
}

grading_result scheduler::infrastructure_failure(const job &j, const string &message) const {
    grading_result result;
    result.grading_config_id = j.config_id;
    result.max_points = j.config.max_points;
    result.status = grading_status::INFRASTRUCTURE_ERROR;
    result.error_log = message;
    for (auto &step : j.config.steps)
        result.steps.push_back(skipped_step(step, "Not run because of an infrastructure error"));
    return result;
}

void scheduler::finish(job &j, ticket_state state) {
    j.state = state;
    finished.push_back(j.ticket);
    while (finished.size() > retained_tickets) {
        jobs.erase(finished.front());
        finished.pop_front();
    }
}

void scheduler::expire(pool_state &pool, const shared_ptr<job> &j) {
    {
        lock_guard<mutex> guard(mut);
        if (!j->waiting) return;
        j->waiting = false;
    }
    pool.queue.remove_if([&](const shared_ptr<job> &other) { return other == j; });
    // 调度器已经停止时 expirer 线程不再运行，只能在这里写入
    if (!expired.push(j)) persist_expired(j);
}

void scheduler::expiry_loop() {
    shared_ptr<job> j;
    while (expired.pop_front_if(j, [](const shared_ptr<job> &) { return true; }))
        persist_expired(j);
}

void scheduler::persist_expired(const shared_ptr<job> &j) {
    auto &options = pools.at(j->pool)->options;
    string message = fmt::format("Waited in queue {} longer than {} seconds", options.name, options.queue_wait_limit);
    LOG(ERROR) << "Ticket " << j->ticket << ": " << message;

    grading_result result = infrastructure_failure(*j, message);
    string persisted_id;
    try {
        int attempt = aggregator.begin_attempt(j->submission_id);
        persisted_id = aggregator.finalize(j->submission_id, attempt, result);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to persist queue timeout of ticket " << j->ticket << ": " << ex.what();
    }

    {
        lock_guard<mutex> guard(mut);
        j->attempts++;
        if (!persisted_id.empty()) j->persisted_ids.push_back(persisted_id);
        j->result = result;
        finish(*j, ticket_state::INFRASTRUCTURE_ERROR);
    }
    changed.notify_all();
    call_monitor(-1, [&](monitor &m) { m.report_error(fmt::format("Ticket {} (submission {}): {}", j->ticket, j->submission_id, message)); });
}

bool scheduler::cancel(ticket_id ticket) {
    shared_ptr<job> j;
    shared_ptr<sandbox_handle> active;
    bool dequeued = false;
    {
        lock_guard<mutex> guard(mut);
        auto it = jobs.find(ticket);
        if (it == jobs.end()) return false;
        j = it->second;
        if (is_terminal(j->state)) return false;

        j->cancel_requested = true;
        if (j->waiting) {
            // 还在队列中（包括等待重试），保证不会再开始评测
            j->waiting = false;
            finish(*j, ticket_state::CANCELLED);
            dequeued = true;
        } else {
            active = j->active;
        }
    }

    if (dequeued) {
        pools.at(j->pool)->queue.remove_if([&](const shared_ptr<job> &other) { return other == j; });
        changed.notify_all();
        LOG(INFO) << "Cancelled queued ticket " << ticket;
    } else {
        LOG(INFO) << "Cancellation requested for running ticket " << ticket;
        if (active) runtime.terminate(*active);
    }
    return true;
}

optional<ticket_status> scheduler::status(ticket_id ticket) {
    lock_guard<mutex> guard(mut);
    auto it = jobs.find(ticket);
    if (it == jobs.end()) return nullopt;
    auto &j = *it->second;
    ticket_status s;
    s.ticket = j.ticket;
    s.submission_id = j.submission_id;
    s.grading_config_id = j.config_id;
    s.pool = j.pool;
    s.state = j.state;
    s.attempts = j.attempts;
    s.persisted_ids = j.persisted_ids;
    s.cancel_requested = j.cancel_requested;
    s.result = j.result;
    return s;
}

vector<persisted_result> scheduler::results(const string &submission_id) {
    return aggregator.history(submission_id);
}

bool scheduler::wait(ticket_id ticket, chrono::milliseconds timeout) {
    unique_lock<mutex> lock(mut);
    auto it = jobs.find(ticket);
    if (it == jobs.end()) return false;
    auto j = it->second;
    return changed.wait_for(lock, timeout, [&] { return is_terminal(j->state); });
}

void scheduler::worker_loop(pool_state &pool, int worker_id) {
    call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(pool.options.name, worker_id, worker_state::IDLE, ""); });

    while (true) {
        shared_ptr<job> j;
        bool claimed = false;
        // 在队列锁内判断队头能否出队，保证同一份提交对同一个评测配置不会同时评测，
        // 队头不能出队时后面的任务也不能插队
        bool popped = pool.queue.pop_front_if(j, [&](const shared_ptr<job> &front) {
            lock_guard<mutex> guard(mut);
            claimed = false;
            if (!front->waiting) return true;  // 已取消或排队超时，直接丢弃
            auto key = make_pair(front->submission_id, front->config_id);
            if (running_keys.count(key)) return false;
            running_keys.insert(key);
            front->waiting = false;
            front->state = ticket_state::RUNNING;
            claimed = true;
            return true;
        });
        if (!popped) break;
        if (!claimed) continue;

        try {
            run_job(pool, worker_id, j);
        } catch (std::exception &ex) {
            // run_job 已经处理了所有评测相关的错误，这里只可能是调度器自身的错误
            LOG(ERROR) << "Worker " << worker_id << " of pool " << pool.options.name << " crashed: "
                       << boost::diagnostic_information(ex);
            call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(pool.options.name, worker_id, worker_state::CRASHED, ex.what()); });
        }
    }

    call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(pool.options.name, worker_id, worker_state::STOPPED, ""); });
}

void scheduler::run_job(pool_state &pool, int worker_id, const shared_ptr<job> &j) {
    watchdog::timer_id queue_timer;
    {
        lock_guard<mutex> guard(mut);
        queue_timer = j->queue_timer;
        j->queue_timer = 0;
    }
    if (queue_timer) dog.cancel(queue_timer);

    bool requeue = false;
    // 无论评测以何种方式结束都要释放 running_keys，否则同一份提交再也无法评测
    defer {
        {
            lock_guard<mutex> guard(mut);
            running_keys.erase(make_pair(j->submission_id, j->config_id));
            j->active.reset();
            if (!requeue && !is_terminal(j->state)) {
                // 持久化失败等异常情况，ticket 不能永远停留在 RUNNING
                finish(*j, ticket_state::INFRASTRUCTURE_ERROR);
            }
        }
        changed.notify_all();
        pool.queue.notify_all();
    };

    int attempt = aggregator.begin_attempt(j->submission_id);
    call_monitor(worker_id, [&](monitor &m) {
        m.start_job(worker_id, j->info(attempt));
        m.worker_state_changed(pool.options.name, worker_id, worker_state::RUNNING, "");
    });

    grading_result result;
    try {
        submission sub = store.load_submission(j->submission_id);
        scoped_sandbox sandbox = pool.sandboxes->acquire(j->config.sandbox);
        {
            lock_guard<mutex> guard(mut);
            j->active = sandbox.handle();
        }
        // 取消请求可能在沙箱登记之前到达
        if (j->cancel_requested) runtime.terminate(*sandbox);

        result = eval.evaluate(*sandbox, j->config, sub.files, j->cancel_requested);

        {
            lock_guard<mutex> guard(mut);
            j->active.reset();
        }
        try {
            sandbox.release();
        } catch (leak_detected_error &ex) {
            // 进程泄漏不影响返回结果，但需要人工检查
            result.flagged_for_review = true;
            call_monitor(worker_id, [&](monitor &m) {
                m.report_error(fmt::format("Ticket {} (submission {}, attempt {}): {}", j->ticket, j->submission_id, attempt, ex.what()));
            });
        } catch (infrastructure_error &ex) {
            // 评测已经完成，销毁沙箱失败同样不影响结果
            LOG(ERROR) << "Ticket " << j->ticket << " attempt " << attempt << " failed to release its sandbox: " << ex;
            result.flagged_for_review = true;
            call_monitor(worker_id, [&](monitor &m) {
                m.report_error(fmt::format("Ticket {} (submission {}, attempt {}): {}", j->ticket, j->submission_id, attempt, ex.what()));
            });
        }
    } catch (infrastructure_error &ex) {
        LOG(ERROR) << "Ticket " << j->ticket << " attempt " << attempt << " failed: " << ex;
        result = infrastructure_failure(*j, ex.what());
    } catch (not_found_error &ex) {
        LOG(ERROR) << "Ticket " << j->ticket << " references missing submission " << ex.path;
        result = infrastructure_failure(*j, string("Submission not found: ") + ex.path);
    } catch (leak_detected_error &ex) {
        // 评测前释放沙箱时发现的泄漏，只可能来自 scoped_sandbox 的提前销毁
        result = infrastructure_failure(*j, ex.what());
        result.flagged_for_review = true;
        call_monitor(worker_id, [&](monitor &m) { m.report_error(ex.what()); });
    } catch (std::system_error &ex) {
        LOG(ERROR) << "Ticket " << j->ticket << " attempt " << attempt << " failed: " << ex.what();
        result = infrastructure_failure(*j, ex.what());
    }

    string persisted_id = aggregator.finalize(j->submission_id, attempt, result);
    result.submission_id = j->submission_id;
    result.attempt = attempt;

    bool stopping;
    {
        lock_guard<mutex> guard(mut);
        stopping = stopped;
        j->attempts++;
        j->persisted_ids.push_back(persisted_id);
        j->result = result;
        if (!j->cancel_requested && !stopping && aggregator.should_retry(result, j->retries)) {
            j->retries++;
            j->waiting = true;
            requeue = true;
        } else {
            finish(*j, to_ticket_state(result.status));
        }
    }

    call_monitor(worker_id, [&](monitor &m) {
        m.end_job(worker_id, j->info(attempt), result, persisted_id);
        m.worker_state_changed(pool.options.name, worker_id, worker_state::IDLE, "");
    });

    if (requeue) {
        LOG(WARNING) << "Requeueing ticket " << j->ticket << " after infrastructure error (retry " << j->retries << ")";
        schedule_queue_timer(pool, j);
        if (!pool.queue.push(j)) {
            lock_guard<mutex> guard(mut);
            j->waiting = false;
            finish(*j, ticket_state::INFRASTRUCTURE_ERROR);
        }
    }
}

void scheduler::stop() {
    {
        lock_guard<mutex> guard(mut);
        if (stopped) return;
        stopped = true;
    }

    for (auto &[name, pool] : pools) {
        auto rest = pool->queue.close();
        lock_guard<mutex> guard(mut);
        for (auto &j : rest) {
            if (!j->waiting) continue;
            j->waiting = false;
            j->cancel_requested = true;
            finish(*j, ticket_state::CANCELLED);
        }
    }
    changed.notify_all();

    for (auto &[name, pool] : pools) {
        for (auto &worker : pool->workers)
            if (worker.joinable()) worker.join();
        LOG(INFO) << "Stopped pool " << name;
    }

    auto rest = expired.close();
    if (expirer.joinable()) expirer.join();
    for (auto &j : rest) persist_expired(j);
}

}  // namespace grader
